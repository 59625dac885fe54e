#pragma once

#include <map>
#include <string>

namespace mcp_gw {

/**
 * @brief Percent-encode a query value, keeping RFC 3986 unreserved characters
 */
std::string url_encode(const std::string& value);

/**
 * @brief Decode %XX escapes and '+' as space
 *
 * Malformed escapes are kept literally.
 */
std::string url_decode(const std::string& value);

/**
 * @brief Parse "a=1&b=2" into a map; the first occurrence of a key wins
 */
std::map<std::string, std::string> parse_query(const std::string& query);

/**
 * @brief Split a request target into path and query string (without '?')
 */
void split_target(const std::string& target, std::string& path, std::string& query);

} // namespace mcp_gw
