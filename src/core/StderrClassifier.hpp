#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcp_gw {

using json = nlohmann::json;

/**
 * @brief Token a capability server (or the gateway) prints before an
 *        embedded JSON error object on stderr
 */
inline constexpr const char* kTimeoutMarker = "TOOL_TIMEOUT_ERROR";

enum class StderrClass {
    Marker,           // Marker with a parseable JSON object
    MalformedMarker,  // Marker present, payload missing or unparseable
    Fatal,            // Matched the fatal-pattern whitelist
    Suppressed        // Ordinary debug/info output
};

struct StderrClassification {
    StderrClass kind;
    json event;  // Event to forward; null when suppressed
};

/**
 * @brief Decides which stderr chunks of a capability server reach the user
 *
 * Servers routinely log debug output on stderr, so only the timeout marker
 * and a short whitelist of fatal-looking substrings are forwarded.
 */
class StderrClassifier {
public:
    explicit StderrClassifier(std::string server_name);

    StderrClassification classify(const std::string& chunk) const;

    /**
     * @brief Build {"type":"error","source":...,"message":...,"serverName":...}
     */
    static json make_error_event(const std::string& source,
                                 const std::string& message,
                                 const std::string& server_name);

    /**
     * @brief Render a marker line: "TOOL_TIMEOUT_ERROR <json>"
     */
    static std::string format_timeout_marker(const json& payload);

    static const std::vector<std::string>& fatal_patterns();

private:
    std::string server_name_;
};

} // namespace mcp_gw
