#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcp_gw {

using json = nlohmann::json;

/**
 * @brief Wire transport used to reach a capability server
 */
enum class TransportKind {
    Stdio,
    WebSocket,
    Sse,
    Streamable
};

std::string to_string(TransportKind kind);

/**
 * @brief Parse a transport name ("stdio", "websocket", "sse", "streamable")
 * @return Kind, or std::nullopt for unknown names
 */
std::optional<TransportKind> parse_transport_kind(const std::string& name);

struct StdioParams {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;  // Overrides on top of the parent environment
    std::string cwd;                         // Empty means inherit
};

struct WebSocketParams {
    std::string url;
};

struct EndpointParams {
    std::string endpoint;
};

/**
 * @brief Immutable description of how to reach a capability server
 *
 * Tagged union over stdio, websocket and HTTP endpoint parameters. Factory
 * functions validate the required fields and throw ValidationError.
 */
class TransportConfig {
public:
    static TransportConfig stdio(StdioParams params);
    static TransportConfig websocket(std::string url);
    static TransportConfig endpoint(TransportKind kind, std::string endpoint);

    /**
     * @brief Build from GET /sse query parameters
     *
     * Reads transportType, command, args (space separated), env (JSON
     * object of strings) and url.
     * @throws ValidationError on missing or malformed parameters
     */
    static TransportConfig from_query(const std::map<std::string, std::string>& query);

    /**
     * @brief Build from a server entry of the gateway config file
     *
     * Accepts "transport", "command", "args", "env", "cwd"/"rootPath" and
     * "websocketUrl". Env values may be plain strings or
     * {"value": ..., "metadata": {...}} objects.
     * @throws ValidationError on missing or malformed fields
     */
    static TransportConfig from_json(const json& entry);

    TransportKind kind() const { return kind_; }

    /**
     * @throws std::logic_error if kind() is not Stdio
     */
    const StdioParams& stdio_params() const;

    /**
     * @throws std::logic_error if kind() is not WebSocket
     */
    const WebSocketParams& websocket_params() const;

    /**
     * @throws std::logic_error if kind() is not Sse or Streamable
     */
    const EndpointParams& endpoint_params() const;

    /**
     * @brief Short human-readable description for logs
     */
    std::string describe() const;

private:
    TransportConfig(TransportKind kind, std::variant<StdioParams, WebSocketParams, EndpointParams> params);

    TransportKind kind_;
    std::variant<StdioParams, WebSocketParams, EndpointParams> params_;
};

/**
 * @brief Split a space separated argument string, dropping empty tokens
 */
std::vector<std::string> split_args(const std::string& args);

} // namespace mcp_gw
