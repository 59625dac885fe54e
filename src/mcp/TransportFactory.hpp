#pragma once

#include "ITransport.hpp"
#include "core/TransportConfig.hpp"
#include <chrono>
#include <memory>

namespace mcp_gw {

/**
 * @brief Turns a TransportConfig into a live transport
 *
 * stdio spawns the configured command, websocket opens a connection.
 * HTTP endpoint transports (sse, streamable) are recognised but not
 * supported.
 */
class TransportFactory {
public:
    explicit TransportFactory(std::chrono::milliseconds connect_timeout = std::chrono::milliseconds(10000));
    virtual ~TransportFactory() = default;

    /**
     * @brief Create a transport for config
     * @throws ValidationError for unsupported transport kinds
     * @throws ConnectionError if the process or connection cannot be started
     */
    virtual std::unique_ptr<ITransport> create(const TransportConfig& config);

private:
    std::chrono::milliseconds connect_timeout_;
};

} // namespace mcp_gw
