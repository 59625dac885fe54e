#include "ConnectionRegistry.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcp_gw {

namespace {

bool is_live(const MCPClient& client) {
    auto status = client.status();
    return !client.is_closing() &&
           (status == ConnectionStatus::Connecting || status == ConnectionStatus::Connected);
}

} // namespace

std::shared_ptr<MCPClient> ConnectionRegistry::get(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(name);
    return it == clients_.end() ? nullptr : it->second;
}

std::vector<std::string> ConnectionRegistry::list_available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> entries;
    entries.reserve(clients_.size());
    for (const auto& [name, client] : clients_) {
        entries.push_back(name + " (" + to_string(client->status()) + ")");
    }
    return entries;
}

std::vector<std::string> ConnectionRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(clients_.size());
    for (const auto& [name, client] : clients_) {
        result.push_back(name);
    }
    return result;
}

std::size_t ConnectionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.size();
}

bool ConnectionRegistry::add(const std::string& name, std::shared_ptr<MCPClient> client) {
    if (name.empty()) {
        throw std::invalid_argument("Server name cannot be empty");
    }
    if (!client) {
        throw std::invalid_argument("Client cannot be null");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(name);
    if (it != clients_.end()) {
        if (it->second == client) {
            return true;
        }
        if (is_live(*it->second)) {
            spdlog::warn("Server '{}' is already registered and live", name);
            return false;
        }
        spdlog::info("Replacing {} entry for server '{}'", to_string(it->second->status()), name);
    }
    clients_[name] = std::move(client);
    spdlog::debug("Registered server '{}'", name);
    return true;
}

std::shared_ptr<MCPClient> ConnectionRegistry::remove(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(name);
    if (it == clients_.end()) {
        return nullptr;
    }
    auto client = std::move(it->second);
    clients_.erase(it);
    spdlog::debug("Unregistered server '{}'", name);
    return client;
}

std::vector<std::shared_ptr<MCPClient>> ConnectionRegistry::close_all() {
    std::map<std::string, std::shared_ptr<MCPClient>> clients;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        clients.swap(clients_);
    }

    std::vector<std::shared_ptr<MCPClient>> closed;
    for (auto& [name, client] : clients) {
        spdlog::info("Closing server '{}'", name);
        client->close();
        closed.push_back(client);
    }
    return closed;
}

void ConnectionRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!clients_.empty()) {
        spdlog::warn("Dropping {} stale registry entries", clients_.size());
    }
    clients_.clear();
}

} // namespace mcp_gw
