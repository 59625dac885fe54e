#include "core/TransportConfig.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>

namespace mcp_gw {

std::string to_string(TransportKind kind) {
    switch (kind) {
        case TransportKind::Stdio:      return "stdio";
        case TransportKind::WebSocket:  return "websocket";
        case TransportKind::Sse:        return "sse";
        case TransportKind::Streamable: return "streamable";
    }
    return "unknown";
}

std::optional<TransportKind> parse_transport_kind(const std::string& name) {
    if (name == "stdio") return TransportKind::Stdio;
    if (name == "websocket") return TransportKind::WebSocket;
    if (name == "sse") return TransportKind::Sse;
    if (name == "streamable") return TransportKind::Streamable;
    return std::nullopt;
}

std::vector<std::string> split_args(const std::string& args) {
    std::vector<std::string> result;
    std::istringstream iss(args);
    std::string token;
    while (iss >> token) {
        result.push_back(token);
    }
    return result;
}

TransportConfig::TransportConfig(TransportKind kind,
                                 std::variant<StdioParams, WebSocketParams, EndpointParams> params)
    : kind_(kind), params_(std::move(params)) {}

TransportConfig TransportConfig::stdio(StdioParams params) {
    if (params.command.empty()) {
        throw ValidationError("Missing command parameter for stdio transport");
    }
    return TransportConfig(TransportKind::Stdio, std::move(params));
}

TransportConfig TransportConfig::websocket(std::string url) {
    if (url.empty()) {
        throw ValidationError("Missing url parameter for websocket transport");
    }
    return TransportConfig(TransportKind::WebSocket, WebSocketParams{std::move(url)});
}

TransportConfig TransportConfig::endpoint(TransportKind kind, std::string endpoint) {
    if (kind != TransportKind::Sse && kind != TransportKind::Streamable) {
        throw std::invalid_argument("Endpoint transport must be sse or streamable");
    }
    if (endpoint.empty()) {
        throw ValidationError("Missing endpoint parameter for " + to_string(kind) + " transport");
    }
    return TransportConfig(kind, EndpointParams{std::move(endpoint)});
}

TransportConfig TransportConfig::from_query(const std::map<std::string, std::string>& query) {
    auto get = [&query](const std::string& key) -> std::string {
        auto it = query.find(key);
        return it == query.end() ? std::string() : it->second;
    };

    std::string type_name = get("transportType");
    if (type_name.empty()) {
        throw ValidationError("Missing required parameters (transportType or serverName)");
    }

    auto kind = parse_transport_kind(type_name);
    if (!kind) {
        throw ValidationError("Unsupported transport type: " + type_name);
    }

    switch (*kind) {
        case TransportKind::WebSocket:
            return websocket(get("url"));

        case TransportKind::Stdio: {
            StdioParams params;
            params.command = get("command");
            params.args = split_args(get("args"));

            std::string env_str = get("env");
            if (!env_str.empty()) {
                try {
                    json env = json::parse(env_str);
                    if (!env.is_object()) {
                        throw ValidationError("Invalid env JSON");
                    }
                    for (const auto& [key, value] : env.items()) {
                        if (!value.is_string()) {
                            throw ValidationError("Invalid env JSON: value of " + key + " is not a string");
                        }
                        params.env[key] = value.get<std::string>();
                    }
                } catch (const json::parse_error& e) {
                    spdlog::debug("env parameter is not valid JSON: {}", e.what());
                    throw ValidationError("Invalid env JSON");
                }
            }
            return stdio(std::move(params));
        }

        case TransportKind::Sse:
        case TransportKind::Streamable:
            return endpoint(*kind, get("url"));
    }
    throw ValidationError("Unsupported transport type: " + type_name);
}

TransportConfig TransportConfig::from_json(const json& entry) {
    if (!entry.is_object()) {
        throw ValidationError("Server entry must be a JSON object");
    }

    std::string type_name = entry.value("transport", std::string("stdio"));
    auto kind = parse_transport_kind(type_name);
    if (!kind) {
        throw ValidationError("Unsupported transport type: " + type_name);
    }

    try {
        if (*kind == TransportKind::WebSocket) {
            return websocket(entry.value("websocketUrl", entry.value("url", std::string())));
        }
        if (*kind != TransportKind::Stdio) {
            return endpoint(*kind, entry.value("endpoint", entry.value("url", std::string())));
        }

        StdioParams params;
        params.command = entry.value("command", std::string());
        params.args = entry.value("args", std::vector<std::string>{});
        params.cwd = entry.value("cwd", entry.value("rootPath", std::string()));

        if (entry.contains("env")) {
            for (const auto& [key, value] : entry["env"].items()) {
                if (value.is_string()) {
                    params.env[key] = value.get<std::string>();
                } else if (value.is_object() && value.contains("value")) {
                    params.env[key] = value["value"].get<std::string>();
                } else {
                    throw ValidationError("Invalid env value for " + key);
                }
            }
        }
        return stdio(std::move(params));
    } catch (const json::exception& e) {
        throw ValidationError(std::string("Malformed server entry: ") + e.what());
    }
}

const StdioParams& TransportConfig::stdio_params() const {
    if (kind_ != TransportKind::Stdio) {
        throw std::logic_error("Transport config is not stdio");
    }
    return std::get<StdioParams>(params_);
}

const WebSocketParams& TransportConfig::websocket_params() const {
    if (kind_ != TransportKind::WebSocket) {
        throw std::logic_error("Transport config is not websocket");
    }
    return std::get<WebSocketParams>(params_);
}

const EndpointParams& TransportConfig::endpoint_params() const {
    if (kind_ != TransportKind::Sse && kind_ != TransportKind::Streamable) {
        throw std::logic_error("Transport config is not an HTTP endpoint");
    }
    return std::get<EndpointParams>(params_);
}

std::string TransportConfig::describe() const {
    switch (kind_) {
        case TransportKind::Stdio: {
            const auto& p = stdio_params();
            std::string text = "stdio: " + p.command;
            for (const auto& arg : p.args) {
                text += " " + arg;
            }
            return text;
        }
        case TransportKind::WebSocket:
            return "websocket: " + websocket_params().url;
        case TransportKind::Sse:
        case TransportKind::Streamable:
            return to_string(kind_) + ": " + endpoint_params().endpoint;
    }
    return "unknown";
}

} // namespace mcp_gw
