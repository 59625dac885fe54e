#pragma once

#include "ConnectionRegistry.hpp"
#include "MCPClient.hpp"
#include "TransportFactory.hpp"
#include "core/TransportConfig.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcp_gw {

using json = nlohmann::json;

/**
 * @brief A capability server declared in the gateway config
 */
struct ServerDefinition {
    std::string name;
    TransportConfig transport;
    bool disabled = false;

    /**
     * @brief Parse one entry of "mcpServers"
     * @throws ValidationError on malformed entries
     */
    static ServerDefinition from_json(const std::string& name, const json& entry);
};

/**
 * @brief Connects configured servers and keeps the registry up to date
 */
class ServerManager {
public:
    ServerManager(ConnectionRegistry& registry, TransportFactory& factory, ClientOptions options);

    void set_definitions(std::vector<ServerDefinition> definitions);
    std::vector<std::string> defined_names() const;
    std::vector<ServerDefinition> definitions() const;

    /**
     * @brief Connect a configured server by name
     *
     * Returns the registered client if it is already connected.
     * @throws NotFoundError if no server with that name is configured
     * @throws ConnectionError if the server cannot be reached
     */
    std::shared_ptr<MCPClient> connect_server(const std::string& name);

    /**
     * @brief Connect and register a server from an explicit definition
     */
    std::shared_ptr<MCPClient> connect_server(const ServerDefinition& definition);

    /**
     * @brief Unregister and close a server
     * @return false if it was not registered
     */
    bool disconnect_server(const std::string& name);

    /**
     * @brief disconnect_server() followed by connect_server()
     *
     * Waits up to `wait` for the old connection to finish closing.
     */
    std::shared_ptr<MCPClient> reconnect_server(const std::string& name, std::chrono::milliseconds wait);

    /**
     * @brief Connect every enabled server; failures are logged and kept for status()
     * @return Number of servers connected
     */
    std::size_t start_enabled_servers();

    /**
     * @brief {"status": ..., "message"?: ..., "stderrOutput"?: [...]}
     * @throws NotFoundError for unknown names
     */
    json server_status(const std::string& name) const;

    /**
     * @brief Close all registered servers and wait for them to exit
     */
    void shutdown(std::chrono::milliseconds wait);

    const ClientOptions& client_options() const { return options_; }

private:
    const ServerDefinition* find_definition(const std::string& name) const;

    ConnectionRegistry& registry_;
    TransportFactory& factory_;
    ClientOptions options_;

    mutable std::mutex mutex_;
    std::vector<ServerDefinition> definitions_;
    std::map<std::string, std::string> failures_;

    std::mutex connect_mutex_;  // One connect attempt at a time
};

} // namespace mcp_gw
