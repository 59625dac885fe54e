#pragma once

#include "http/SessionEndpoint.hpp"
#include "mcp/MCPClient.hpp"
#include "mcp/ServerManager.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcp_gw {

using json = nlohmann::json;

/**
 * @brief Runtime settings of the gateway
 *
 * Loaded from a JSON file, then overridden by command line options.
 */
struct GatewayConfig {
    std::string host = "127.0.0.1";
    unsigned short port = 3000;
    std::string public_origin;  // Empty: derived from host and port
    bool sse_enabled = true;
    std::string log_level = "info";

    std::chrono::milliseconds handshake_timeout{30000};
    std::chrono::milliseconds request_timeout{30000};
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds term_grace{5000};
    std::chrono::milliseconds kill_grace{5000};

    std::vector<ServerDefinition> servers;

    /**
     * @brief Apply the keys present in a config document
     *
     * Keys: host, port, publicOrigin, sseEnabled, logLevel,
     * handshakeTimeoutMs, requestTimeoutMs, connectTimeoutMs, termGraceMs,
     * killGraceMs and mcpServers.
     * @throws ValidationError on wrongly typed or out of range values
     */
    void merge_json(const json& document);

    /**
     * @brief Read and merge a config file
     * @throws ValidationError if the file cannot be read or parsed
     */
    void load_file(const std::string& path);

    std::string origin() const;

    ClientOptions client_options(std::shared_ptr<TimerQueue> timers) const;
    EndpointOptions endpoint_options() const;
};

} // namespace mcp_gw
