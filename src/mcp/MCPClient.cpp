#include "MCPClient.hpp"
#include "JsonRpc.hpp"
#include "core/Errors.hpp"
#include "core/Ids.hpp"
#include "core/StderrClassifier.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace mcp_gw {

std::string to_string(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::Connecting: return "connecting";
        case ConnectionStatus::Connected: return "connected";
        case ConnectionStatus::Error: return "error";
        case ConnectionStatus::Disconnected: return "disconnected";
    }
    return "unknown";
}

namespace {

// 5 -> "5", 0.5 -> "0.5"
std::string format_seconds(double seconds) {
    if (std::floor(seconds) == seconds && std::fabs(seconds) < 1e15) {
        return std::to_string(static_cast<long long>(seconds));
    }
    return fmt::format("{}", seconds);
}

json seconds_to_json(double seconds) {
    if (std::floor(seconds) == seconds && std::fabs(seconds) < 1e15) {
        return static_cast<long long>(seconds);
    }
    return seconds;
}

} // namespace

json ToolCallResult::to_json() const {
    json out = {{"success", success}};
    if (success) {
        out["data"] = data;
    } else {
        out["error"] = error;
        if (!error_type.empty()) {
            out["errorType"] = error_type;
            out["toolName"] = tool_name;
            out["timeout"] = seconds_to_json(timeout_seconds);
        }
        out["statusCode"] = status_code;
    }
    if (!progress_token.empty()) {
        out["progressToken"] = progress_token;
    }
    return out;
}

MCPClient::MCPClient(std::string name, std::unique_ptr<ITransport> transport, ClientOptions options)
    : name_(std::move(name)),
      transport_(std::move(transport)),
      options_(std::move(options)),
      closed_future_(closed_promise_.get_future().share()) {
    if (!transport_) {
        throw std::invalid_argument("Transport cannot be null");
    }
}

MCPClient::~MCPClient() {
    if (reader_.joinable()) {
        if (reader_.get_id() == std::this_thread::get_id()) {
            reader_.detach();
        } else {
            reader_.join();
        }
    }
}

void MCPClient::connect() {
    if (started_.exchange(true)) {
        throw ConnectionError("Client '" + name_ + "' was already connected");
    }

    spdlog::info("Connecting to server '{}' over {}", name_, mcp_gw::to_string(transport_->kind()));
    set_status(ConnectionStatus::Connecting);

    std::weak_ptr<MCPClient> weak = shared_from_this();
    transport_->set_stderr_handler([weak](const std::string& chunk) {
        if (auto self = weak.lock()) {
            self->handle_stderr(chunk);
        }
    });

    auto self = shared_from_this();
    reader_ = std::thread([self] { self->reader_loop(); });

    json init = jsonrpc::make_request(next_request_id(), "initialize", {
        {"protocolVersion", jsonrpc::kProtocolVersion},
        {"capabilities", {
            {"resources", json::object()},
            {"tools", json::object()}
        }},
        {"clientInfo", {
            {"name", options_.client_name},
            {"version", options_.client_version}
        }}
    });

    std::string failure;
    try {
        json response = request(init, options_.handshake_timeout);
        if (response.contains("error")) {
            failure = "initialize failed: " + response["error"].value("message", std::string("unknown error"));
        } else if (!response.contains("result") || !response["result"].is_object() ||
                   !response["result"].contains("protocolVersion")) {
            failure = "initialize response has no protocolVersion";
        } else {
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                server_info_ = response["result"];
            }
            write(jsonrpc::make_notification("notifications/initialized", json()));
        }
    } catch (const GatewayError& e) {
        failure = e.what();
    }

    if (!failure.empty()) {
        spdlog::error("Handshake with server '{}' failed: {}", name_, failure);
        set_status(ConnectionStatus::Error, failure);
        close();
        throw ConnectionError("Failed to connect to server '" + name_ + "': " + failure);
    }

    set_status(ConnectionStatus::Connected);
    spdlog::info("Connected to server '{}'", name_);
}

void MCPClient::send(const json& message) {
    if (status() != ConnectionStatus::Connected || closing_) {
        throw SendError("Server '" + name_ + "' is not connected");
    }
    write(message);
}

json MCPClient::request(const json& message, std::chrono::milliseconds timeout) {
    if (!message.is_object() || !message.contains("id")) {
        throw std::invalid_argument("Request must carry an id");
    }
    if (closing_) {
        throw SendError("Server '" + name_ + "' is closing");
    }

    std::string key = jsonrpc::id_key(message["id"]);
    auto promise = std::make_shared<std::promise<json>>();
    auto response = promise->get_future();
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (pending_.count(key) > 0) {
            throw SendError("Request id " + key + " is already in flight");
        }
        pending_[key] = promise;
    }

    auto forget = [this, &key] {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_.erase(key);
    };

    try {
        write(message);
    } catch (const GatewayError&) {
        forget();
        throw;
    }

    if (timeout >= std::chrono::milliseconds::zero()) {
        if (response.wait_for(timeout) != std::future_status::ready) {
            forget();
            throw RequestTimeoutError("Request " + key + " to server '" + name_ +
                                      "' timed out after " + std::to_string(timeout.count()) + " ms");
        }
    }
    return response.get();
}

json MCPClient::call(const std::string& method, const json& params, std::chrono::milliseconds timeout) {
    return request(jsonrpc::make_request(next_request_id(), method, params), timeout);
}

void MCPClient::on_message(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    primary_handler_ = std::move(handler);
}

MCPClient::SubscriptionId MCPClient::subscribe(Subscriber subscriber) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    SubscriptionId id = next_subscription_++;
    subscribers_.emplace(id, std::move(subscriber));
    return id;
}

void MCPClient::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    subscribers_.erase(id);
}

std::size_t MCPClient::subscriber_count() const {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    return subscribers_.size();
}

json MCPClient::list_tools(std::chrono::milliseconds timeout) {
    json response = call("tools/list", json::object(), timeout);
    if (response.contains("error")) {
        throw TransportRuntimeError("tools/list failed: " +
                                    response["error"].value("message", std::string("unknown error")));
    }

    json tools = json::array();
    for (const auto& tool : response["result"].value("tools", json::array())) {
        tools.push_back({
            {"name", tool.value("name", "")},
            {"description", tool.value("description", "")},
            {"inputSchema", tool.value("inputSchema", json::object())}
        });
    }
    return tools;
}

ToolCallResult MCPClient::call_tool(const std::string& tool, const json& arguments,
                                    std::optional<ToolTimeout> timeout) {
    ToolCallResult result;
    result.progress_token = make_uuid();
    result.tool_name = tool;
    if (timeout) {
        result.timeout_seconds = std::min(timeout->count(), kMaxToolTimeoutSeconds);
    }

    json params = {
        {"name", tool},
        {"arguments", arguments.is_null() ? json::object() : arguments},
        {"_meta", {{"progressToken", result.progress_token}}}
    };

    std::chrono::milliseconds wait = kNoTimeout;
    if (timeout && result.timeout_seconds >= 0) {
        wait = std::chrono::milliseconds(static_cast<long long>(std::llround(result.timeout_seconds * 1000)));
    }
    const std::string seconds = format_seconds(result.timeout_seconds);

    spdlog::info("Calling tool '{}' on server '{}' (timeout {})", tool, name_,
                 wait == kNoTimeout ? std::string("none") : seconds + "s");

    try {
        json response = call("tools/call", params, wait);
        if (response.contains("error")) {
            const json& error = response["error"];
            result.error = "Failed to call tool: " + error.value("message", std::string("unknown error")) +
                           " (Code: " + std::to_string(error.value("code", 0)) + ")";
            result.status_code = 500;
            return result;
        }
        result.success = true;
        result.data = response.value("result", json::object());
        return result;
    } catch (const RequestTimeoutError&) {
        std::string message = "Tool execution timed out after " + seconds + " seconds";
        try {
            cancel(result.progress_token, "Execution timed out after " + seconds + " seconds");
        } catch (const GatewayError& e) {
            spdlog::warn("Failed to cancel tool '{}' on server '{}': {}", tool, name_, e.what());
        }
        spdlog::error("{}", StderrClassifier::format_timeout_marker({
            {"type", "error"},
            {"source", "timeout"},
            {"message", message},
            {"toolName", tool},
            {"timeout", seconds_to_json(result.timeout_seconds)},
            {"progressToken", result.progress_token},
            {"serverName", name_}
        }));
        result.error = message;
        result.error_type = "timeout";
        result.status_code = 408;
        return result;
    } catch (const GatewayError& e) {
        result.error = std::string("Failed to call tool: ") + e.what();
        result.status_code = 500;
        return result;
    }
}

void MCPClient::cancel(const std::string& progress_token, const std::string& reason) {
    spdlog::info("Cancelling operation {} on server '{}': {}", progress_token, name_, reason);
    send(jsonrpc::make_cancelled_notification(progress_token, reason));
}

void MCPClient::close() {
    if (closing_.exchange(true)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (status_ == ConnectionStatus::Connecting || status_ == ConnectionStatus::Connected) {
            status_ = ConnectionStatus::Disconnected;
        }
    }

    auto process = transport_->process();
    if (!process) {
        spdlog::info("Closing connection to server '{}'", name_);
        transport_->close();
        return;
    }

    if (!options_.timers) {
        spdlog::warn("No timer queue for server '{}', closing stdin only", name_);
        process->close_stdin();
        return;
    }

    auto supervisor = std::make_shared<ShutdownSupervisor>(
        process, options_.timers, options_.shutdown, "server '" + name_ + "'");
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        supervisor_ = supervisor;
    }
    supervisor->start();
}

bool MCPClient::wait_closed(std::chrono::milliseconds timeout) {
    if (!started_) {
        return true;
    }
    return closed_future_.wait_for(timeout) == std::future_status::ready;
}

ConnectionStatus MCPClient::status() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return status_;
}

std::string MCPClient::last_error() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_error_;
}

json MCPClient::server_info() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return server_info_;
}

std::vector<std::string> MCPClient::recent_stderr() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return {stderr_tail_.begin(), stderr_tail_.end()};
}

std::shared_ptr<ShutdownSupervisor> MCPClient::supervisor() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return supervisor_;
}

void MCPClient::reader_loop() {
    spdlog::debug("Reader started for server '{}'", name_);

    while (true) {
        json message;
        try {
            message = transport_->read_message();
        } catch (const std::exception& e) {
            spdlog::error("Read from server '{}' failed: {}", name_, e.what());
            set_status(ConnectionStatus::Error, e.what());
            break;
        }
        if (message.is_null()) {
            break;
        }
        dispatch(message);
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (status_ != ConnectionStatus::Error) {
            status_ = ConnectionStatus::Disconnected;
        }
    }
    fail_pending("Connection to server '" + name_ + "' closed");

    std::vector<Subscriber> subscribers;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        for (const auto& [id, subscriber] : subscribers_) {
            subscribers.push_back(subscriber);
        }
    }
    for (const auto& subscriber : subscribers) {
        if (subscriber.on_close) {
            subscriber.on_close();
        }
    }

    spdlog::info("Server '{}' closed its stream", name_);
    closed_promise_.set_value();
}

void MCPClient::dispatch(const json& message) {
    if (jsonrpc::is_response(message)) {
        std::shared_ptr<std::promise<json>> waiter;
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            auto it = pending_.find(jsonrpc::id_key(message["id"]));
            if (it != pending_.end()) {
                waiter = it->second;
                pending_.erase(it);
            }
        }
        if (waiter) {
            waiter->set_value(message);
            return;
        }
    }

    MessageHandler primary;
    std::vector<Subscriber> subscribers;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        primary = primary_handler_;
        for (const auto& [id, subscriber] : subscribers_) {
            subscribers.push_back(subscriber);
        }
    }

    // A throwing callback is logged; delivery to the rest continues
    if (primary) {
        try {
            primary(message);
        } catch (const std::exception& e) {
            spdlog::error("Message handler for server '{}' failed: {}", name_, e.what());
        }
    }
    for (const auto& subscriber : subscribers) {
        if (!subscriber.on_message) {
            continue;
        }
        try {
            subscriber.on_message(message);
        } catch (const std::exception& e) {
            spdlog::error("Subscriber of server '{}' failed: {}", name_, e.what());
        }
    }
}

void MCPClient::handle_stderr(const std::string& chunk) {
    spdlog::info("Stderr output [{}]: {}", name_, chunk);

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        stderr_tail_.push_back(chunk);
        while (stderr_tail_.size() > options_.stderr_tail_lines) {
            stderr_tail_.pop_front();
        }
    }

    std::vector<Subscriber> subscribers;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        for (const auto& [id, subscriber] : subscribers_) {
            subscribers.push_back(subscriber);
        }
    }
    for (const auto& subscriber : subscribers) {
        if (!subscriber.on_stderr) {
            continue;
        }
        try {
            subscriber.on_stderr(chunk);
        } catch (const std::exception& e) {
            spdlog::error("Stderr handler for server '{}' failed: {}", name_, e.what());
        }
    }
}

void MCPClient::fail_pending(const std::string& reason) {
    std::map<std::string, std::shared_ptr<std::promise<json>>> pending;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending.swap(pending_);
    }
    for (auto& [key, waiter] : pending) {
        waiter->set_exception(std::make_exception_ptr(TransportRuntimeError(reason)));
    }
}

void MCPClient::set_status(ConnectionStatus status, const std::string& error) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    status_ = status;
    if (!error.empty()) {
        last_error_ = error;
    }
}

void MCPClient::write(const json& message) {
    try {
        transport_->write_message(message);
    } catch (const SendError&) {
        throw;
    } catch (const std::exception& e) {
        throw SendError("Failed to send to server '" + name_ + "': " + e.what());
    }
}

std::string MCPClient::next_request_id() {
    return "gw-" + std::to_string(++request_counter_);
}

} // namespace mcp_gw
