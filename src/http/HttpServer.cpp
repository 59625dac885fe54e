#include "HttpServer.hpp"
#include "SocketSseSink.hpp"
#include "core/Ids.hpp"
#include "core/Url.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <poll.h>
#include <sys/socket.h>

namespace mcp_gw {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

constexpr const char* kServerHeader = "mcp-sse-gateway";
constexpr auto kPumpInterval = std::chrono::milliseconds(250);
constexpr auto kKeepaliveInterval = std::chrono::seconds(15);
constexpr auto kStopTimeout = std::chrono::seconds(5);

/**
 * @brief Non-blocking check whether the peer closed its end
 */
bool peer_closed(int fd) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN | POLLRDHUP;
    int rc = ::poll(&pfd, 1, 0);
    if (rc < 0) {
        return true;
    }
    if (rc == 0) {
        return false;
    }
    if (pfd.revents & (POLLRDHUP | POLLHUP | POLLERR | POLLNVAL)) {
        return true;
    }
    char byte;
    ssize_t n = ::recv(fd, &byte, 1, MSG_PEEK | MSG_DONTWAIT);
    return n == 0;
}

HttpRequest to_request(const http::request<http::string_body>& req) {
    HttpRequest request;
    request.id = make_uuid();
    request.method = std::string(req.method_string());
    std::string query;
    split_target(std::string(req.target()), request.path, query);
    request.query = parse_query(query);
    request.body = req.body();
    return request;
}

} // namespace

HttpServer::HttpServer(SessionEndpoint& endpoint, std::string host, unsigned short port)
    : endpoint_(endpoint), host_(std::move(host)), port_(port), acceptor_(ioc_) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start() {
    beast::error_code ec;
    auto address = net::ip::make_address(host_, ec);
    if (ec) {
        throw std::runtime_error("Invalid listen address '" + host_ + "': " + ec.message());
    }
    tcp::endpoint endpoint{address, port_};

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor_.bind(endpoint, ec);
    }
    if (!ec) {
        acceptor_.listen(net::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        throw std::runtime_error("Failed to listen on " + host_ + ":" + std::to_string(port_) + ": " + ec.message());
    }

    bound_port_ = acceptor_.local_endpoint().port();
    running_ = true;
    accept_thread_ = std::thread(&HttpServer::accept_loop, this);
    spdlog::info("HTTP server listening on {}:{}", host_, bound_port_);
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    spdlog::info("HTTP server stopping");

    // Wake the blocking accept() with a throwaway connection
    {
        beast::error_code ec;
        Socket waker(ioc_);
        auto address = acceptor_.local_endpoint(ec).address();
        if (!ec && address.is_unspecified()) {
            address = address.is_v6() ? net::ip::address(net::ip::address_v6::loopback())
                                      : net::ip::address(net::ip::address_v4::loopback());
        }
        if (!ec) {
            waker.connect(tcp::endpoint{address, bound_port_}, ec);
        }
        if (ec) {
            spdlog::warn("Could not wake acceptor: {}", ec.message());
        }
    }
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    beast::error_code ignored;
    acceptor_.close(ignored);

    endpoint_.close_all_sessions("gateway shutting down");

    std::unique_lock<std::mutex> lock(connections_mutex_);
    for (auto& [id, socket] : connections_) {
        ::shutdown(socket->native_handle(), SHUT_RDWR);
    }
    if (!connections_cv_.wait_for(lock, kStopTimeout, [this] { return connections_.empty(); })) {
        spdlog::warn("{} connections still open at shutdown", connections_.size());
    }
}

void HttpServer::accept_loop() {
    while (running_) {
        auto socket = std::make_shared<Socket>(ioc_);
        beast::error_code ec;
        acceptor_.accept(*socket, ec);
        if (!running_) {
            break;
        }
        if (ec) {
            spdlog::error("Accept failed: {}", ec.message());
            continue;
        }

        std::uint64_t id;
        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            id = next_connection_++;
            connections_[id] = socket;
        }
        std::thread(&HttpServer::serve_connection, this, id, socket).detach();
    }
}

void HttpServer::serve_connection(std::uint64_t id, std::shared_ptr<Socket> socket) {
    beast::flat_buffer buffer;
    beast::error_code ec;

    while (running_) {
        http::request<http::string_body> req;
        http::read(*socket, buffer, req, ec);
        if (ec == http::error::end_of_stream) {
            break;
        }
        if (ec) {
            spdlog::debug("HTTP read failed: {}", ec.message());
            break;
        }

        HttpRequest request = to_request(req);
        spdlog::info("[{}] {} {}", request.id, request.method, request.path);

        if (SessionEndpoint::is_stream_route(request)) {
            serve_stream(*socket, request, req.version());
            break;
        }

        HttpResponse response;
        try {
            response = endpoint_.route(request);
        } catch (const std::exception& e) {
            spdlog::error("[{}] Unhandled error: {}", request.id, e.what());
            response = HttpResponse::text(500, std::string("Internal server error: ") + e.what());
        }

        http::response<http::string_body> res{static_cast<http::status>(response.status), req.version()};
        res.set(http::field::server, kServerHeader);
        res.set(http::field::content_type, response.content_type);
        res.set(http::field::cache_control, "no-cache");
        res.keep_alive(req.keep_alive());
        res.body() = std::move(response.body);
        res.prepare_payload();

        http::write(*socket, res, ec);
        if (ec) {
            spdlog::debug("[{}] HTTP write failed: {}", request.id, ec.message());
            break;
        }
        if (!res.keep_alive()) {
            break;
        }
    }

    socket->shutdown(tcp::socket::shutdown_send, ec);
    connection_finished(id);
}

void HttpServer::serve_stream(Socket& socket, const HttpRequest& request, unsigned version) {
    beast::error_code ec;
    auto sink = std::make_shared<SocketSseSink>();

    SessionEndpoint::OpenResult opened;
    try {
        opened = endpoint_.open_session(request, sink);
    } catch (const std::exception& e) {
        spdlog::error("[{}] Failed to open session: {}", request.id, e.what());
        opened.response = HttpResponse::text(500, std::string("Failed to get or create client: ") + e.what());
    }

    if (!opened.session) {
        http::response<http::string_body> res{static_cast<http::status>(opened.response.status), version};
        res.set(http::field::server, kServerHeader);
        res.set(http::field::content_type, opened.response.content_type);
        res.set(http::field::cache_control, "no-cache");
        res.keep_alive(false);
        res.body() = opened.response.body;
        res.prepare_payload();
        http::write(socket, res, ec);
        return;
    }

    http::response<http::empty_body> res{http::status::ok, version};
    res.set(http::field::server, kServerHeader);
    res.set(http::field::content_type, "text/event-stream");
    res.set(http::field::cache_control, "no-cache");
    res.keep_alive(false);
    http::response_serializer<http::empty_body> serializer{res};
    http::write_header(socket, serializer, ec);

    std::string reason = "stream closed";
    if (ec) {
        reason = "failed to write headers: " + ec.message();
    }

    auto last_write = std::chrono::steady_clock::now();
    while (!ec) {
        std::string frame;
        auto polled = sink->next(frame, kPumpInterval);
        if (polled == SocketSseSink::Poll::Closed) {
            break;
        }
        if (polled == SocketSseSink::Poll::Timeout) {
            if (peer_closed(socket.native_handle())) {
                reason = "client disconnected";
                break;
            }
            if (!running_) {
                reason = "gateway shutting down";
                break;
            }
            if (std::chrono::steady_clock::now() - last_write < kKeepaliveInterval) {
                continue;
            }
            frame = ": keepalive\n\n";
        }

        net::write(socket, net::buffer(frame), ec);
        if (ec) {
            reason = "client disconnected (" + ec.message() + ")";
        }
        last_write = std::chrono::steady_clock::now();
    }

    endpoint_.end_session(opened.session, reason);
}

void HttpServer::connection_finished(std::uint64_t id) {
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_.erase(id);
    }
    connections_cv_.notify_all();
}

} // namespace mcp_gw
