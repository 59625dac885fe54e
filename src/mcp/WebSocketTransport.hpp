#pragma once

#include "ITransport.hpp"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace mcp_gw {

/**
 * @brief Components of a ws:// URL
 */
struct WebSocketUrl {
    std::string host;
    std::string port;
    std::string target;  // Path and query, at least "/"
};

/**
 * @brief Parse a ws:// URL
 * @throws ValidationError for other schemes or a missing host
 */
WebSocketUrl parse_websocket_url(const std::string& url);

/**
 * @brief Transport over a websocket connection (subprotocol "mcp")
 *
 * All socket operations run on a private io_context thread. Incoming
 * text frames are parsed and queued for read_message(); writes are posted
 * to the io thread and waited for.
 */
class WebSocketTransport : public ITransport {
public:
    /**
     * @brief Resolve, connect and complete the websocket handshake
     * @throws ValidationError for malformed URLs
     * @throws ConnectionError if the server cannot be reached in time
     */
    static std::unique_ptr<WebSocketTransport> connect(const std::string& url,
                                                       std::chrono::milliseconds timeout);

    /// Only constructible through connect()
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

    explicit WebSocketTransport(PrivateTag);
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    json read_message() override;
    void write_message(const json& message) override;
    bool is_open() const override;

    /**
     * @brief Start the close handshake and wait for the socket to shut
     *
     * Returns once the socket is closed or kCloseTimeout has passed; in the
     * latter case the socket is torn down without the handshake. is_open()
     * is false on return.
     */
    void close() override;
    TransportKind kind() const override { return TransportKind::WebSocket; }

private:
    struct Outgoing {
        std::string payload;
        std::promise<void> done;
    };

    static constexpr std::chrono::milliseconds kCloseTimeout{2000};

    void start_io();
    void do_read();
    void do_write();
    void do_close(std::shared_ptr<std::promise<void>> done);
    void mark_closed(const std::string& reason);

    boost::asio::io_context ioc_;
    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    boost::beast::flat_buffer read_buffer_;
    std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    std::thread io_thread_;

    // io thread only
    std::deque<std::shared_ptr<Outgoing>> outbox_;
    bool writing_ = false;
    bool close_sent_ = false;

    mutable std::mutex inbox_mutex_;
    std::condition_variable inbox_cv_;
    std::deque<json> inbox_;
    std::atomic<bool> closed_{false};
    std::atomic<bool> close_requested_{false};
};

} // namespace mcp_gw
