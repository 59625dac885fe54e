#pragma once

#include "MCPClient.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mcp_gw {

/**
 * @brief Name -> client table shared by all HTTP handlers
 *
 * Lookups of the same name return the same client instance. All methods
 * are thread-safe.
 */
class ConnectionRegistry {
public:
    /**
     * @return The registered client, or nullptr
     */
    std::shared_ptr<MCPClient> get(const std::string& name) const;

    /**
     * @brief "name (status)" for every registered client, sorted by name
     */
    std::vector<std::string> list_available() const;

    std::vector<std::string> names() const;
    std::size_t size() const;

    /**
     * @brief Register a client under name
     *
     * An entry whose client is still connecting or connected is never
     * replaced; failed or disconnected entries are.
     * @return false if a live client already holds the name
     */
    bool add(const std::string& name, std::shared_ptr<MCPClient> client);

    /**
     * @return The removed client, or nullptr
     */
    std::shared_ptr<MCPClient> remove(const std::string& name);

    /**
     * @brief Close every client and empty the table
     * @return The clients that were closed
     */
    std::vector<std::shared_ptr<MCPClient>> close_all();

    /**
     * @brief Start from an empty table; entries are dropped, not closed
     */
    void clear();

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<MCPClient>> clients_;
};

} // namespace mcp_gw
