#pragma once

#include "SessionEndpoint.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace mcp_gw {

/**
 * @brief Blocking HTTP/1.1 server, one thread per connection
 *
 * Plain requests are answered by SessionEndpoint::route(). GET /sse keeps
 * the connection open and pumps the session's events until either side
 * ends the stream.
 */
class HttpServer {
public:
    HttpServer(SessionEndpoint& endpoint, std::string host, unsigned short port);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Bind, listen and start accepting
     * @throws std::runtime_error if the address cannot be bound
     */
    void start();

    /**
     * @brief Stop accepting, shut down open connections and wait for them
     */
    void stop();

    /**
     * @brief Bound port (useful when constructed with port 0)
     */
    unsigned short port() const { return bound_port_; }

    bool is_running() const { return running_; }

private:
    using Socket = boost::asio::ip::tcp::socket;

    void accept_loop();
    void serve_connection(std::uint64_t id, std::shared_ptr<Socket> socket);
    void serve_stream(Socket& socket, const HttpRequest& request, unsigned version);
    void connection_finished(std::uint64_t id);

    SessionEndpoint& endpoint_;
    std::string host_;
    unsigned short port_;
    unsigned short bound_port_ = 0;

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::thread accept_thread_;
    std::atomic<bool> running_{false};

    std::mutex connections_mutex_;
    std::condition_variable connections_cv_;
    std::map<std::uint64_t, std::shared_ptr<Socket>> connections_;
    std::uint64_t next_connection_ = 1;
};

} // namespace mcp_gw
