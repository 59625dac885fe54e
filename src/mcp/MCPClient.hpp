#pragma once

#include "ITransport.hpp"
#include "core/TimerQueue.hpp"
#include "process/ShutdownSupervisor.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcp_gw {

using json = nlohmann::json;

enum class ConnectionStatus {
    Connecting,
    Connected,
    Error,
    Disconnected
};

std::string to_string(ConnectionStatus status);

struct ClientOptions {
    std::string client_name = "mcp-sse-gateway";
    std::string client_version = "1.0.0";
    std::chrono::milliseconds handshake_timeout{30000};
    ShutdownPolicy shutdown;
    std::shared_ptr<TimerQueue> timers;  // Escalation timers for stdio shutdown
    std::size_t stderr_tail_lines = 50;
};

/**
 * @brief Callbacks of one consumer of a client's traffic
 *
 * Any member may be empty. Callbacks run on the client's reader thread
 * (or the process stderr thread for on_stderr) and must not block.
 */
struct Subscriber {
    std::function<void(const json& message)> on_message;
    std::function<void(const std::string& chunk)> on_stderr;
    std::function<void()> on_close;
};

/// Tool-call timeouts in (possibly fractional) seconds
using ToolTimeout = std::chrono::duration<double>;

/// Longest tool timeout accepted; larger values do not fit in milliseconds
constexpr double kMaxToolTimeoutSeconds = 365.0 * 24 * 3600;

/**
 * @brief Outcome of call_tool()
 */
struct ToolCallResult {
    bool success = false;
    json data;                // result on success
    std::string error;
    std::string error_type;   // "timeout" for timeouts
    std::string progress_token;
    std::string tool_name;
    double timeout_seconds = -1;
    int status_code = 200;

    json to_json() const;
};

/**
 * @brief Connection to one capability server
 *
 * Performs the MCP initialize handshake over a transport, then reads
 * messages on a background thread. Responses to requests issued through
 * request()/call() are delivered to the waiting caller; every other
 * message is fanned out to the primary handler and all subscribers in
 * arrival order.
 *
 * Must be owned by a std::shared_ptr. The reader thread keeps the client
 * alive until the transport reaches end of stream.
 */
class MCPClient : public std::enable_shared_from_this<MCPClient> {
public:
    using MessageHandler = std::function<void(const json& message)>;
    using SubscriptionId = std::uint64_t;

    static constexpr std::chrono::milliseconds kNoTimeout{-1};

    MCPClient(std::string name, std::unique_ptr<ITransport> transport, ClientOptions options);
    ~MCPClient();

    MCPClient(const MCPClient&) = delete;
    MCPClient& operator=(const MCPClient&) = delete;

    /**
     * @brief Start reading and perform the initialize handshake
     *
     * Sends initialize, waits for a result carrying protocolVersion, then
     * sends notifications/initialized. On failure the transport is torn
     * down and the status becomes Error.
     * @throws ConnectionError on handshake failure or timeout
     */
    void connect();

    /**
     * @brief Send a message without waiting for anything
     * @throws SendError if the client is not connected or the write fails
     */
    void send(const json& message);

    /**
     * @brief Send a request and wait for the response with the same id
     * @param message JSON-RPC request carrying an id
     * @param timeout kNoTimeout waits indefinitely
     * @return The full response message (result or error)
     * @throws RequestTimeoutError when no response arrives in time
     * @throws TransportRuntimeError if the transport closes first
     * @throws SendError if the request cannot be written
     */
    json request(const json& message, std::chrono::milliseconds timeout);

    /**
     * @brief Build a request with a gateway id and run request()
     */
    json call(const std::string& method, const json& params, std::chrono::milliseconds timeout);

    /**
     * @brief Set the primary message handler, replacing the previous one
     */
    void on_message(MessageHandler handler);

    SubscriptionId subscribe(Subscriber subscriber);

    /**
     * @brief Remove a subscriber; unknown ids are ignored
     */
    void unsubscribe(SubscriptionId id);

    std::size_t subscriber_count() const;

    /**
     * @brief tools/list, reduced to name, description and inputSchema
     * @throws TransportRuntimeError if the server answers with an error
     */
    json list_tools(std::chrono::milliseconds timeout);

    /**
     * @brief tools/call with a fresh progress token
     *
     * A timeout of std::nullopt or a negative value waits indefinitely;
     * fractional seconds are honoured to the millisecond. On
     * timeout a cancellation is sent, a TOOL_TIMEOUT_ERROR line is logged
     * and a result with status 408 is returned.
     */
    ToolCallResult call_tool(const std::string& tool, const json& arguments,
                             std::optional<ToolTimeout> timeout);

    /**
     * @brief Send notifications/cancelled for a progress token
     * @throws SendError if the notification cannot be written
     */
    void cancel(const std::string& progress_token, const std::string& reason);

    /**
     * @brief Begin closing; idempotent
     *
     * Stdio servers get the escalating shutdown (stdin close, SIGTERM,
     * SIGKILL); network transports are closed at once.
     */
    void close();

    /**
     * @brief Wait until the reader has seen end of stream
     * @return false on timeout
     */
    bool wait_closed(std::chrono::milliseconds timeout);

    const std::string& name() const { return name_; }
    TransportKind transport_kind() const { return transport_->kind(); }
    ConnectionStatus status() const;
    std::string last_error() const;
    json server_info() const;
    std::vector<std::string> recent_stderr() const;
    bool is_closing() const { return closing_; }

    /**
     * @brief Shutdown supervisor started by close(), if any
     */
    std::shared_ptr<ShutdownSupervisor> supervisor() const;

private:
    void reader_loop();
    void dispatch(const json& message);
    void handle_stderr(const std::string& chunk);
    void fail_pending(const std::string& reason);
    void set_status(ConnectionStatus status, const std::string& error = {});
    void write(const json& message);
    std::string next_request_id();

    const std::string name_;
    std::unique_ptr<ITransport> transport_;
    ClientOptions options_;

    mutable std::mutex state_mutex_;
    ConnectionStatus status_ = ConnectionStatus::Connecting;
    std::string last_error_;
    json server_info_;
    std::deque<std::string> stderr_tail_;
    std::shared_ptr<ShutdownSupervisor> supervisor_;

    mutable std::mutex handlers_mutex_;
    MessageHandler primary_handler_;
    std::map<SubscriptionId, Subscriber> subscribers_;
    SubscriptionId next_subscription_ = 1;

    std::mutex pending_mutex_;
    std::map<std::string, std::shared_ptr<std::promise<json>>> pending_;

    std::atomic<std::uint64_t> request_counter_{0};
    std::atomic<bool> started_{false};
    std::atomic<bool> closing_{false};
    std::promise<void> closed_promise_;
    std::shared_future<void> closed_future_;
    std::thread reader_;
};

} // namespace mcp_gw
