#pragma once

#include <string>

namespace mcp_gw {

/**
 * @brief Random RFC 4122 UUID string, used for request ids and progress tokens
 */
std::string make_uuid();

} // namespace mcp_gw
