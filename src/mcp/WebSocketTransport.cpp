#include "WebSocketTransport.hpp"
#include "core/Errors.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/http/field.hpp>
#include <spdlog/spdlog.h>

namespace mcp_gw {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

namespace {

constexpr const char* kSubprotocol = "mcp";
constexpr const char* kUserAgent = "mcp-sse-gateway";

} // namespace

WebSocketUrl parse_websocket_url(const std::string& url) {
    const std::string scheme = "ws://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        if (url.compare(0, 6, "wss://") == 0) {
            throw ValidationError("Secure websocket URLs are not supported: " + url);
        }
        throw ValidationError("Invalid websocket URL: " + url);
    }

    std::string rest = url.substr(scheme.size());
    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    WebSocketUrl result;
    result.target = slash == std::string::npos ? "/" : rest.substr(slash);

    auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']', colon) == std::string::npos) {
        result.host = authority.substr(0, colon);
        result.port = authority.substr(colon + 1);
    } else {
        result.host = authority;
        result.port = "80";
    }
    if (result.host.size() > 2 && result.host.front() == '[' && result.host.back() == ']') {
        result.host = result.host.substr(1, result.host.size() - 2);
    }

    if (result.host.empty()) {
        throw ValidationError("Missing host in websocket URL: " + url);
    }
    if (result.port.empty() || result.port.find_first_not_of("0123456789") != std::string::npos) {
        throw ValidationError("Invalid port in websocket URL: " + url);
    }
    return result;
}

WebSocketTransport::WebSocketTransport(PrivateTag)
    : ws_(ioc_) {}

std::unique_ptr<WebSocketTransport> WebSocketTransport::connect(const std::string& url,
                                                                std::chrono::milliseconds timeout) {
    WebSocketUrl parts = parse_websocket_url(url);
    auto transport = std::make_unique<WebSocketTransport>(PrivateTag{});
    auto& ws = transport->ws_;

    tcp::resolver resolver(transport->ioc_);
    beast::error_code result;
    bool done = false;
    std::string host_header = parts.host + ":" + parts.port;

    beast::get_lowest_layer(ws).expires_after(timeout);
    resolver.async_resolve(parts.host, parts.port,
        [&](beast::error_code ec, tcp::resolver::results_type endpoints) {
            if (ec) {
                result = ec;
                done = true;
                return;
            }
            beast::get_lowest_layer(ws).async_connect(endpoints,
                [&](beast::error_code ec, const tcp::endpoint&) {
                    if (ec) {
                        result = ec;
                        done = true;
                        return;
                    }
                    ws.set_option(websocket::stream_base::decorator(
                        [](websocket::request_type& req) {
                            req.set(beast::http::field::user_agent, kUserAgent);
                            req.set(beast::http::field::sec_websocket_protocol, kSubprotocol);
                        }));
                    ws.async_handshake(host_header, parts.target, [&](beast::error_code ec) {
                        result = ec;
                        done = true;
                    });
                });
        });

    transport->ioc_.run_for(timeout);
    if (!done) {
        resolver.cancel();
        beast::get_lowest_layer(ws).close();
        transport->ioc_.restart();
        transport->ioc_.run();
        throw ConnectionError("Timed out connecting to " + url);
    }
    if (result) {
        throw ConnectionError("Failed to connect to " + url + ": " + result.message());
    }

    beast::get_lowest_layer(ws).expires_never();
    ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws.text(true);

    transport->ioc_.restart();
    transport->start_io();
    spdlog::info("WebSocket connected to {}", url);
    return transport;
}

WebSocketTransport::~WebSocketTransport() {
    if (work_) {
        net::post(ioc_, [this] {
            beast::error_code ignored;
            beast::get_lowest_layer(ws_).socket().close(ignored);
        });
        work_.reset();
    }
    if (io_thread_.joinable()) {
        if (io_thread_.get_id() == std::this_thread::get_id()) {
            io_thread_.detach();
        } else {
            io_thread_.join();
        }
    }
}

void WebSocketTransport::start_io() {
    work_ = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(
        net::make_work_guard(ioc_));
    do_read();
    io_thread_ = std::thread([this] { ioc_.run(); });
}

void WebSocketTransport::do_read() {
    ws_.async_read(read_buffer_, [this](beast::error_code ec, std::size_t) {
        if (ec) {
            if (ec != websocket::error::closed && ec != net::error::operation_aborted) {
                spdlog::error("WebSocket read failed: {}", ec.message());
            }
            mark_closed(ec.message());
            return;
        }

        std::string text = beast::buffers_to_string(read_buffer_.data());
        read_buffer_.consume(read_buffer_.size());
        try {
            json message = json::parse(text);
            spdlog::debug("Read message: {}", text);
            {
                std::lock_guard<std::mutex> lock(inbox_mutex_);
                inbox_.push_back(std::move(message));
            }
            inbox_cv_.notify_one();
        } catch (const json::parse_error& e) {
            spdlog::error("JSON parse error on websocket: {}", e.what());
        }
        do_read();
    });
}

void WebSocketTransport::do_write() {
    if (writing_ || outbox_.empty() || closed_) {
        return;
    }
    writing_ = true;
    auto next = outbox_.front();
    ws_.async_write(net::buffer(next->payload), [this, next](beast::error_code ec, std::size_t) {
        writing_ = false;
        outbox_.pop_front();
        if (ec) {
            next->done.set_exception(std::make_exception_ptr(
                SendError("WebSocket write failed: " + ec.message())));
            mark_closed(ec.message());
            return;
        }
        next->done.set_value();
        do_write();
    });
}

void WebSocketTransport::do_close(std::shared_ptr<std::promise<void>> done) {
    mark_closed("closed by gateway");
    beast::error_code ignored;
    if (close_sent_) {
        done->set_value();
        return;
    }
    close_sent_ = true;

    // A close frame cannot overlap an in-flight write; drop the socket instead
    if (!ws_.is_open() || writing_) {
        beast::get_lowest_layer(ws_).socket().close(ignored);
        done->set_value();
        return;
    }
    ws_.async_close(websocket::close_code::normal, [this, done](beast::error_code ec) {
        if (ec) {
            spdlog::debug("WebSocket close handshake failed: {}", ec.message());
        }
        beast::error_code ignored;
        beast::get_lowest_layer(ws_).socket().close(ignored);
        done->set_value();
    });
}

void WebSocketTransport::mark_closed(const std::string& reason) {
    if (closed_.exchange(true)) {
        return;
    }
    spdlog::info("WebSocket closed: {}", reason);
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
    }
    inbox_cv_.notify_all();

    // Queued writes can never complete; the in-flight one fails in its handler
    std::deque<std::shared_ptr<Outgoing>> in_flight;
    if (writing_ && !outbox_.empty()) {
        in_flight.push_back(outbox_.front());
        outbox_.pop_front();
    }
    for (auto& pending : outbox_) {
        pending->done.set_exception(std::make_exception_ptr(SendError("WebSocket is closed")));
    }
    outbox_.swap(in_flight);
}

json WebSocketTransport::read_message() {
    std::unique_lock<std::mutex> lock(inbox_mutex_);
    inbox_cv_.wait(lock, [this] { return !inbox_.empty() || closed_.load(); });
    if (inbox_.empty()) {
        return json();
    }
    json message = std::move(inbox_.front());
    inbox_.pop_front();
    return message;
}

void WebSocketTransport::write_message(const json& message) {
    if (!is_open()) {
        throw SendError("WebSocket is closed");
    }

    auto outgoing = std::make_shared<Outgoing>();
    outgoing->payload = message.dump();
    auto done = outgoing->done.get_future();
    net::post(ioc_, [this, outgoing] {
        if (closed_) {
            outgoing->done.set_exception(std::make_exception_ptr(SendError("WebSocket is closed")));
            return;
        }
        outbox_.push_back(outgoing);
        do_write();
    });

    done.get();
    spdlog::debug("Wrote message: {}", outgoing->payload);
}

bool WebSocketTransport::is_open() const {
    return !closed_ && !close_requested_;
}

void WebSocketTransport::close() {
    if (close_requested_.exchange(true) || !work_) {
        return;
    }

    auto done = std::make_shared<std::promise<void>>();
    auto finished = done->get_future();
    if (io_thread_.get_id() == std::this_thread::get_id()) {
        do_close(done);
        return;
    }
    net::post(ioc_, [this, done] { do_close(done); });

    if (finished.wait_for(kCloseTimeout) != std::future_status::ready) {
        spdlog::warn("WebSocket close handshake did not finish within {}ms, dropping socket",
                     kCloseTimeout.count());
        net::post(ioc_, [this] {
            beast::error_code ignored;
            beast::get_lowest_layer(ws_).socket().close(ignored);
        });
    }
}

} // namespace mcp_gw
