#include "EventBridge.hpp"
#include "core/Url.hpp"
#include "mcp/JsonRpc.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcp_gw {

std::string to_string(BridgeState state) {
    switch (state) {
        case BridgeState::Init: return "init";
        case BridgeState::Streaming: return "streaming";
        case BridgeState::Closing: return "closing";
        case BridgeState::Closed: return "closed";
    }
    return "unknown";
}

EventBridge::EventBridge(std::shared_ptr<MCPClient> client,
                         std::shared_ptr<ISseSink> sink,
                         std::string session_id,
                         std::string origin,
                         bool owns_connection)
    : client_(std::move(client)),
      sink_(std::move(sink)),
      session_id_(std::move(session_id)),
      origin_(std::move(origin)),
      owns_connection_(owns_connection),
      classifier_(client_ ? client_->name() : std::string()) {
    if (!client_) {
        throw std::invalid_argument("Client cannot be null");
    }
    if (!sink_) {
        throw std::invalid_argument("Sink cannot be null");
    }
}

EventBridge::~EventBridge() {
    close("session destroyed");
}

std::string EventBridge::endpoint_url() const {
    return origin_ + "/api/mcp/message?serverName=" + url_encode(session_id_);
}

void EventBridge::start() {
    BridgeState expected = BridgeState::Init;
    if (!state_.compare_exchange_strong(expected, BridgeState::Streaming)) {
        throw std::logic_error("EventBridge already started");
    }

    sink_->send({
        {"type", "endpoint"},
        {"endpoint", endpoint_url()}
    });

    std::weak_ptr<EventBridge> weak = shared_from_this();
    Subscriber subscriber;
    subscriber.on_message = [weak](const json& message) {
        if (auto self = weak.lock()) {
            self->handle_message(message);
        }
    };
    subscriber.on_stderr = [weak](const std::string& chunk) {
        if (auto self = weak.lock()) {
            self->handle_stderr(chunk);
        }
    };
    subscriber.on_close = [weak] {
        if (auto self = weak.lock()) {
            self->close("server closed the connection");
        }
    };

    {
        std::lock_guard<std::mutex> lock(subscription_mutex_);
        subscription_ = client_->subscribe(std::move(subscriber));
    }
    spdlog::info("[{}] Streaming server '{}' ({})", session_id_, client_->name(),
                 owns_connection_ ? "owned" : "shared");

    // The server may have gone away before the subscription existed
    auto status = client_->status();
    if (status == ConnectionStatus::Disconnected || status == ConnectionStatus::Error) {
        close("server is " + to_string(status));
    }
}

void EventBridge::close(const std::string& reason) {
    BridgeState current = state_.load();
    do {
        if (current == BridgeState::Closing || current == BridgeState::Closed) {
            return;
        }
    } while (!state_.compare_exchange_weak(current, BridgeState::Closing));

    spdlog::info("[{}] Closing session: {}", session_id_, reason);

    {
        std::lock_guard<std::mutex> lock(subscription_mutex_);
        if (subscription_) {
            client_->unsubscribe(*subscription_);
            subscription_.reset();
        }
    }

    if (owns_connection_) {
        client_->close();
    }

    sink_->close();
    state_ = BridgeState::Closed;
}

void EventBridge::handle_message(const json& message) {
    if (state_ != BridgeState::Streaming) {
        return;
    }

    sink_->send(message);
    if (jsonrpc::is_notification(message)) {
        sink_->send(message.contains("params") ? message["params"] : json::object());
    }
}

void EventBridge::handle_stderr(const std::string& chunk) {
    if (state_ != BridgeState::Streaming) {
        return;
    }

    StderrClassification result = classifier_.classify(chunk);
    switch (result.kind) {
        case StderrClass::Suppressed:
            spdlog::debug("[{}] Suppressed stderr from '{}'", session_id_, client_->name());
            return;
        case StderrClass::MalformedMarker:
            spdlog::warn("[{}] Malformed timeout marker from '{}'", session_id_, client_->name());
            break;
        case StderrClass::Marker:
        case StderrClass::Fatal:
            break;
    }
    sink_->send(result.event);
}

} // namespace mcp_gw
