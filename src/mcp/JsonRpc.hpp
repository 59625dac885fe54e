#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace mcp_gw {

using json = nlohmann::json;

namespace jsonrpc {

inline constexpr const char* kVersion = "2.0";
inline constexpr const char* kProtocolVersion = "2024-11-05";

/**
 * @brief Has "method" and "id"
 */
bool is_request(const json& message);

/**
 * @brief Has "method" and no "id"
 */
bool is_notification(const json& message);

/**
 * @brief Has "id", no "method", and "result" or "error"
 */
bool is_response(const json& message);

/**
 * @brief Map key for a request id; 1 and "1" stay distinct
 */
std::string id_key(const json& id);

json make_request(const json& id, const std::string& method, const json& params);
json make_notification(const std::string& method, const json& params);

/**
 * @brief notifications/cancelled for an in-flight operation
 */
json make_cancelled_notification(const std::string& request_id, const std::string& reason);

} // namespace jsonrpc
} // namespace mcp_gw
