#include "SessionEndpoint.hpp"
#include "core/Errors.hpp"
#include "core/Ids.hpp"
#include "mcp/JsonRpc.hpp"
#include <spdlog/spdlog.h>
#include <cmath>

namespace mcp_gw {

namespace {

constexpr const char* kDisabledMessage = "SSE functionality temporarily disabled via feature flag";
constexpr const char* kDefaultCancelReason = "User cancelled operation";

std::string not_found_message(const std::string& name) {
    return "Server \"" + name + "\" not found or not connected";
}

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) {
            out += ", ";
        }
        out += item;
    }
    return out;
}

} // namespace

SessionEndpoint::SessionEndpoint(ConnectionRegistry& registry,
                                 TransportFactory& factory,
                                 ServerManager& manager,
                                 EndpointOptions options)
    : registry_(registry), factory_(factory), manager_(manager), options_(std::move(options)) {}

SessionEndpoint::~SessionEndpoint() {
    close_all_sessions("gateway shutting down");
}

bool SessionEndpoint::is_stream_route(const HttpRequest& request) {
    return request.method == "GET" && (request.path == "/sse" || request.path == "/api/sse");
}

SessionEndpoint::OpenResult SessionEndpoint::open_session(const HttpRequest& request,
                                                          std::shared_ptr<ISseSink> sink) {
    if (!options_.sse_enabled) {
        spdlog::info("[{}] SSE route disabled via feature flag", request.id);
        return {nullptr, HttpResponse::text(503, kDisabledMessage)};
    }

    const std::string server_name = request.query_value("serverName");
    const bool has_transport = request.has_query("transportType");
    spdlog::info("[{}] Opening SSE session (serverName='{}', transportType='{}')",
                 request.id, server_name, request.query_value("transportType"));

    std::shared_ptr<MCPClient> client;
    std::string session_name;
    bool owns_connection = false;

    if (!server_name.empty()) {
        client = registry_.get(server_name);
        if (client) {
            spdlog::info("[{}] Found existing client for server '{}'", request.id, server_name);
            session_name = server_name;
        } else if (!has_transport) {
            spdlog::warn("[{}] No client for server '{}'; available: [{}]",
                         request.id, server_name, join(registry_.list_available()));
            return {nullptr, HttpResponse::text(404, not_found_message(server_name))};
        }
    }

    if (!client) {
        if (!has_transport) {
            return {nullptr, HttpResponse::text(400, "Missing required parameters (transportType or serverName)")};
        }

        std::optional<TransportConfig> config;
        try {
            config = TransportConfig::from_query(request.query);
        } catch (const ValidationError& e) {
            spdlog::warn("[{}] Invalid transport parameters: {}", request.id, e.what());
            return {nullptr, HttpResponse::text(400, e.what())};
        }

        session_name = reserve_session_name(server_name, request.id);
        try {
            client = std::make_shared<MCPClient>(session_name, factory_.create(*config), manager_.client_options());
            client->connect();
        } catch (const ValidationError& e) {
            release_session_name(session_name, nullptr);
            spdlog::warn("[{}] Rejected transport: {}", request.id, e.what());
            return {nullptr, HttpResponse::text(400, e.what())};
        } catch (const GatewayError& e) {
            release_session_name(session_name, nullptr);
            spdlog::error("[{}] Failed to connect: {}", request.id, e.what());
            return {nullptr, HttpResponse::text(500, std::string("Failed to connect: ") + e.what())};
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            session_clients_[session_name] = client;
        }
        owns_connection = true;
    }

    auto bridge = std::make_shared<EventBridge>(client, std::move(sink), session_name,
                                                options_.public_origin, owns_connection);
    auto session = std::make_shared<SseSession>(request.id, bridge, owns_connection);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_[request.id] = session;
    }

    std::weak_ptr<SseSession> weak = session;
    session->signal().on_abort([this, weak, session_name, client] {
        auto self = weak.lock();
        if (self && self->owns_connection()) {
            release_session_name(session_name, client);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (self) {
            sessions_.erase(self->id());
        }
    });

    bridge->start();
    spdlog::info("[{}] SSE session open on '{}'", request.id, session_name);
    return {session, HttpResponse{}};
}

void SessionEndpoint::end_session(const std::shared_ptr<SseSession>& session, const std::string& reason) {
    if (!session) {
        return;
    }
    if (session->abort(reason)) {
        spdlog::info("[{}] SSE session ended: {}", session->id(), reason);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.erase(session->id());
}

HttpResponse SessionEndpoint::handle_message(const HttpRequest& request) {
    if (!options_.sse_enabled) {
        return HttpResponse::text(503, kDisabledMessage);
    }

    const std::string server_name = request.query_value("serverName");
    if (server_name.empty()) {
        spdlog::error("[{}] Missing serverName parameter", request.id);
        return HttpResponse::text(400, "Missing serverName parameter");
    }

    auto client = find_client(server_name);
    if (!client || client->status() != ConnectionStatus::Connected) {
        spdlog::error("[{}] Server '{}' not found or not connected", request.id, server_name);
        return HttpResponse::text(404, not_found_message(server_name));
    }

    json message;
    try {
        message = json::parse(request.body);
    } catch (const json::parse_error& e) {
        spdlog::error("[{}] Invalid JSON body: {}", request.id, e.what());
        return HttpResponse::text(400, "Invalid JSON body");
    }
    if (!message.is_object()) {
        return HttpResponse::text(400, "Invalid message format");
    }

    try {
        if (jsonrpc::is_request(message) && !message["id"].is_null()) {
            // Relay under a private id so concurrent sessions never collide
            json forwarded = message;
            forwarded["id"] = "relay-" + make_uuid();
            spdlog::debug("[{}] Relaying request {} to '{}'", request.id, message["id"].dump(), server_name);

            json response = client->request(forwarded, options_.request_timeout);
            response["id"] = message["id"];
            return HttpResponse::json_body(200, response);
        }
        if (message.contains("method") || jsonrpc::is_response(message)) {
            spdlog::debug("[{}] Relaying notification to '{}'", request.id, server_name);
            client->send(message);
            return HttpResponse::text(202, "Accepted");
        }
    } catch (const RequestTimeoutError& e) {
        spdlog::warn("[{}] {}", request.id, e.what());
        return HttpResponse::text(504, e.what());
    } catch (const GatewayError& e) {
        spdlog::error("[{}] Error relaying message: {}", request.id, e.what());
        return HttpResponse::text(500, std::string("Internal server error: ") + e.what());
    }

    spdlog::error("[{}] Invalid message format: {}", request.id, message.dump());
    return HttpResponse::text(400, "Invalid message format");
}

HttpResponse SessionEndpoint::handle_cancel(const HttpRequest& request) {
    const std::string server_name = request.query_value("serverName");
    if (server_name.empty()) {
        return HttpResponse::json_body(400, {{"error", "Missing serverName parameter"}});
    }

    auto client = find_client(server_name);
    if (!client) {
        spdlog::error("[{}] Server '{}' not found or not connected", request.id, server_name);
        return HttpResponse::json_body(404, {{"error", not_found_message(server_name)}});
    }

    std::string reason = kDefaultCancelReason;
    if (!request.body.empty()) {
        try {
            json body = json::parse(request.body);
            if (body.is_object() && body.contains("reason") && body["reason"].is_string() &&
                !body["reason"].get<std::string>().empty()) {
                reason = body["reason"].get<std::string>();
            }
        } catch (const json::parse_error& e) {
            spdlog::warn("[{}] Ignoring malformed cancel body: {}", request.id, e.what());
        }
    }

    try {
        const std::string token = request.query_value("token");
        if (!token.empty()) {
            client->cancel(token, reason);
        } else if (registry_.get(server_name) == client) {
            spdlog::info("[{}] Force-cancelling all operations for server '{}'", request.id, server_name);
            try {
                manager_.reconnect_server(server_name, options_.reconnect_wait);
                spdlog::info("[{}] Reconnected server '{}' after force-cancel", request.id, server_name);
            } catch (const GatewayError& e) {
                spdlog::warn("[{}] Could not reconnect server '{}' after force-cancel: {}",
                             request.id, server_name, e.what());
            }
        } else {
            spdlog::info("[{}] Force-cancelling session connection '{}'", request.id, server_name);
            client->close();
        }
        spdlog::info("[{}] Processed cancellation for server '{}'", request.id, server_name);
        return HttpResponse::json_body(200, {{"success", true}});
    } catch (const GatewayError& e) {
        spdlog::error("[{}] Error cancelling tool execution: {}", request.id, e.what());
        return HttpResponse::json_body(500, {{"error", std::string("Failed to cancel: ") + e.what()}});
    }
}

HttpResponse SessionEndpoint::handle_api_get(const HttpRequest& request) {
    const std::string action = request.query_value("action");
    const std::string server_name = request.query_value("server");
    if (action.empty()) {
        return HttpResponse::json_body(400, {{"success", false}, {"error", "Missing action parameter"}});
    }

    try {
        if (action == "loadConfigs") {
            json configs = json::object();
            for (const auto& definition : manager_.definitions()) {
                configs[definition.name] = {
                    {"transport", to_string(definition.transport.kind())},
                    {"description", definition.transport.describe()},
                    {"disabled", definition.disabled}
                };
            }
            return HttpResponse::json_body(200, {{"success", true}, {"configs", configs}});
        }

        if (action != "listTools" && action != "status") {
            return HttpResponse::json_body(400, {{"success", false}, {"error", "Invalid action"}});
        }
        if (server_name.empty()) {
            return HttpResponse::json_body(400, {{"success", false}, {"error", "Missing server parameter"}});
        }

        if (action == "listTools") {
            auto client = find_client(server_name);
            if (!client || client->status() != ConnectionStatus::Connected) {
                return HttpResponse::json_body(200, {{"success", false}, {"error", not_found_message(server_name)}});
            }
            try {
                json tools = client->list_tools(options_.request_timeout);
                return HttpResponse::json_body(200, {{"success", true}, {"tools", tools}});
            } catch (const GatewayError& e) {
                return HttpResponse::json_body(200, {{"success", false}, {"error", e.what()}});
            }
        }

        json status;
        try {
            status = manager_.server_status(server_name);
        } catch (const NotFoundError&) {
            auto client = find_client(server_name);
            status = client ? json{{"status", to_string(client->status())}}
                            : json{{"status", "disconnected"}, {"message", "Server not found"}};
        }
        status["success"] = true;
        return HttpResponse::json_body(200, status);
    } catch (const std::exception& e) {
        spdlog::error("[{}] API error in GET: {}", request.id, e.what());
        return HttpResponse::json_body(500, {{"success", false}, {"error", e.what()}});
    }
}

HttpResponse SessionEndpoint::handle_api_post(const HttpRequest& request) {
    json body;
    try {
        body = json::parse(request.body);
    } catch (const json::parse_error&) {
        return HttpResponse::json_body(400, {{"success", false}, {"error", "Invalid JSON body"}});
    }

    try {
        const std::string action = body.is_object() ? body.value("action", "") : "";
        const std::string server_name = body.is_object() ? body.value("serverName", "") : "";
        if (action.empty() || server_name.empty()) {
            return HttpResponse::json_body(400, {{"success", false}, {"error", "Missing required parameters"}});
        }

        if (action == "disconnect") {
            bool disconnected = manager_.disconnect_server(server_name);
            json result = {{"success", disconnected}};
            if (!disconnected) {
                result["error"] = "Server '" + server_name + "' is not connected";
            }
            return HttpResponse::json_body(200, result);
        }

        if (action == "callTool") {
            const std::string tool = body.value("toolName", "");
            if (tool.empty() || !body.contains("args") || body["args"].is_null()) {
                return HttpResponse::json_body(400, {{"success", false}, {"error", "Missing tool parameters"}});
            }

            std::optional<ToolTimeout> timeout;
            if (body.contains("timeout") && body["timeout"].is_number()) {
                double seconds = body["timeout"].get<double>();
                if (!std::isfinite(seconds) || seconds > kMaxToolTimeoutSeconds) {
                    return HttpResponse::json_body(400, {{"success", false}, {"error", "Invalid timeout"}});
                }
                timeout = ToolTimeout(seconds);
            }

            auto client = find_client(server_name);
            if (!client || client->status() != ConnectionStatus::Connected) {
                return HttpResponse::json_body(404, {{"success", false}, {"error", not_found_message(server_name)}});
            }

            ToolCallResult result = client->call_tool(tool, body["args"], timeout);
            return HttpResponse::json_body(result.status_code, result.to_json());
        }

        return HttpResponse::json_body(400, {{"success", false}, {"error", "Invalid action"}});
    } catch (const std::exception& e) {
        spdlog::error("[{}] API error in POST: {}", request.id, e.what());
        return HttpResponse::json_body(500, {{"success", false}, {"error", e.what()}});
    }
}

HttpResponse SessionEndpoint::route(const HttpRequest& request) {
    const std::string& path = request.path;

    if (path == "/sse" || path == "/api/sse" || path == "/api/mcp/message") {
        if (request.method == "POST") {
            return handle_message(request);
        }
        return HttpResponse::text(405, "Method not allowed");
    }
    if (path == "/api/mcp/cancel") {
        if (request.method == "POST") {
            return handle_cancel(request);
        }
        return HttpResponse::text(405, "Method not allowed");
    }
    if (path == "/api/mcp") {
        if (request.method == "GET") {
            return handle_api_get(request);
        }
        if (request.method == "POST") {
            return handle_api_post(request);
        }
        return HttpResponse::text(405, "Method not allowed");
    }
    if (path == "/api/health" && request.method == "GET") {
        return HttpResponse::json_body(200, {
            {"status", "ok"},
            {"servers", registry_.size()},
            {"sessions", session_count()}
        });
    }
    return HttpResponse::text(404, "Not found");
}

std::shared_ptr<MCPClient> SessionEndpoint::find_client(const std::string& name) const {
    if (auto client = registry_.get(name)) {
        return client;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = session_clients_.find(name);
    return it == session_clients_.end() ? nullptr : it->second;
}

std::size_t SessionEndpoint::session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

void SessionEndpoint::close_all_sessions(const std::string& reason) {
    std::map<std::string, std::shared_ptr<SseSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions = sessions_;
    }
    for (auto& [id, session] : sessions) {
        end_session(session, reason);
    }
}

std::string SessionEndpoint::reserve_session_name(const std::string& preferred, const std::string& fallback) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string name = preferred;
    if (name.empty() || session_clients_.count(name) > 0) {
        name = fallback;
    }
    session_clients_[name] = nullptr;
    return name;
}

void SessionEndpoint::release_session_name(const std::string& name, const std::shared_ptr<MCPClient>& client) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = session_clients_.find(name);
    if (it != session_clients_.end() && it->second == client) {
        session_clients_.erase(it);
    }
}

} // namespace mcp_gw
