#pragma once

#include "core/TransportConfig.hpp"
#include "process/ISupervisedProcess.hpp"
#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace mcp_gw {

using json = nlohmann::json;

/**
 * @brief Abstract interface for MCP transport mechanisms
 *
 * Implementations carry JSON-RPC messages to and from one capability
 * server over a concrete wire (child process stdio, websocket).
 * read_message() is called from a single reader thread while
 * write_message() may be called from any thread.
 */
class ITransport {
public:
    using StderrHandler = std::function<void(const std::string& chunk)>;

    virtual ~ITransport() = default;

    /**
     * @brief Read next JSON-RPC message from transport (blocking)
     *
     * Malformed input is logged and skipped.
     * @return JSON message or null json on EOF/closed transport
     */
    virtual json read_message() = 0;

    /**
     * @brief Write JSON-RPC message to transport
     * @param message JSON message to write
     * @throws SendError if the transport cannot accept the message
     */
    virtual void write_message(const json& message) = 0;

    /**
     * @brief Check if transport is still open
     * @return true if transport can read/write, false otherwise
     */
    virtual bool is_open() const = 0;

    /**
     * @brief Close the wire immediately, without any grace period
     */
    virtual void close() = 0;

    virtual TransportKind kind() const = 0;

    /**
     * @brief Process behind the transport, if it owns one
     * @return nullptr for network transports
     */
    virtual std::shared_ptr<ISupervisedProcess> process() const { return nullptr; }

    /**
     * @brief Route diagnostic output (child stderr) to a handler
     *
     * Transports without a diagnostic stream ignore the handler.
     */
    virtual void set_stderr_handler(StderrHandler handler) { (void)handler; }
};

} // namespace mcp_gw
