#include "ServerManager.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>

namespace mcp_gw {

ServerDefinition ServerDefinition::from_json(const std::string& name, const json& entry) {
    if (name.empty()) {
        throw ValidationError("Server name cannot be empty");
    }
    if (!entry.is_object()) {
        throw ValidationError("Server entry '" + name + "' must be an object");
    }
    bool disabled = entry.contains("disabled") && entry["disabled"].is_boolean() && entry["disabled"].get<bool>();
    return ServerDefinition{name, TransportConfig::from_json(entry), disabled};
}

ServerManager::ServerManager(ConnectionRegistry& registry, TransportFactory& factory, ClientOptions options)
    : registry_(registry), factory_(factory), options_(std::move(options)) {
    registry_.clear();
}

void ServerManager::set_definitions(std::vector<ServerDefinition> definitions) {
    std::lock_guard<std::mutex> lock(mutex_);
    definitions_ = std::move(definitions);
    failures_.clear();
}

std::vector<std::string> ServerManager::defined_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& definition : definitions_) {
        names.push_back(definition.name);
    }
    return names;
}

std::vector<ServerDefinition> ServerManager::definitions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return definitions_;
}

const ServerDefinition* ServerManager::find_definition(const std::string& name) const {
    for (const auto& definition : definitions_) {
        if (definition.name == name) {
            return &definition;
        }
    }
    return nullptr;
}

std::shared_ptr<MCPClient> ServerManager::connect_server(const std::string& name) {
    std::optional<ServerDefinition> definition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (const auto* found = find_definition(name)) {
            definition = *found;
        }
    }
    if (!definition) {
        throw NotFoundError("Server '" + name + "' is not configured");
    }
    return connect_server(*definition);
}

std::shared_ptr<MCPClient> ServerManager::connect_server(const ServerDefinition& definition) {
    std::lock_guard<std::mutex> connect_lock(connect_mutex_);

    if (auto existing = registry_.get(definition.name)) {
        if (existing->status() == ConnectionStatus::Connected && !existing->is_closing()) {
            spdlog::debug("Server '{}' is already connected", definition.name);
            return existing;
        }
    }

    spdlog::info("Starting server '{}': {}", definition.name, definition.transport.describe());
    try {
        auto client = std::make_shared<MCPClient>(definition.name, factory_.create(definition.transport), options_);
        client->connect();
        if (!registry_.add(definition.name, client)) {
            client->close();
            throw ConnectionError("Server '" + definition.name + "' was registered concurrently");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        failures_.erase(definition.name);
        return client;
    } catch (const GatewayError& e) {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_[definition.name] = e.what();
        throw;
    }
}

bool ServerManager::disconnect_server(const std::string& name) {
    auto client = registry_.remove(name);
    if (!client) {
        return false;
    }
    spdlog::info("Disconnecting server '{}'", name);
    client->close();
    return true;
}

std::shared_ptr<MCPClient> ServerManager::reconnect_server(const std::string& name, std::chrono::milliseconds wait) {
    auto client = registry_.remove(name);
    if (client) {
        client->close();
        if (!client->wait_closed(wait)) {
            spdlog::warn("Server '{}' did not exit within {} ms, reconnecting anyway", name, wait.count());
        }
    }
    return connect_server(name);
}

std::size_t ServerManager::start_enabled_servers() {
    std::vector<ServerDefinition> definitions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        definitions = definitions_;
    }

    std::size_t connected = 0;
    for (const auto& definition : definitions) {
        if (definition.disabled) {
            spdlog::info("Server '{}' is disabled, skipping", definition.name);
            continue;
        }
        try {
            connect_server(definition);
            ++connected;
        } catch (const GatewayError& e) {
            spdlog::error("Failed to start server '{}': {}", definition.name, e.what());
        }
    }
    spdlog::info("Started {} of {} configured servers", connected, definitions.size());
    return connected;
}

json ServerManager::server_status(const std::string& name) const {
    if (auto client = registry_.get(name)) {
        json status = {{"status", to_string(client->status())}};
        std::string error = client->last_error();
        if (!error.empty()) {
            status["message"] = error;
        }
        auto stderr_tail = client->recent_stderr();
        if (!stderr_tail.empty()) {
            status["stderrOutput"] = stderr_tail;
        }
        json info = client->server_info();
        if (info.contains("serverInfo")) {
            status["serverInfo"] = info["serverInfo"];
        }
        return status;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto failure = failures_.find(name);
    if (failure != failures_.end()) {
        return {{"status", "error"}, {"message", failure->second}};
    }
    if (find_definition(name)) {
        return {{"status", "disconnected"}};
    }
    throw NotFoundError("Server '" + name + "' not found");
}

void ServerManager::shutdown(std::chrono::milliseconds wait) {
    auto clients = registry_.close_all();
    auto deadline = std::chrono::steady_clock::now() + wait;
    for (const auto& client : clients) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining < std::chrono::milliseconds::zero()) {
            remaining = std::chrono::milliseconds::zero();
        }
        if (!client->wait_closed(remaining)) {
            spdlog::warn("Server '{}' still running at shutdown", client->name());
        }
    }
}

} // namespace mcp_gw
