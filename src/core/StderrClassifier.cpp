#include "core/StderrClassifier.hpp"
#include <spdlog/spdlog.h>

namespace mcp_gw {

namespace {

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    auto begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return std::string();
    }
    auto end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

} // namespace

StderrClassifier::StderrClassifier(std::string server_name)
    : server_name_(std::move(server_name)) {}

const std::vector<std::string>& StderrClassifier::fatal_patterns() {
    static const std::vector<std::string> patterns = {
        "Error:", "Exception:", "Failed:", "timed out"
    };
    return patterns;
}

json StderrClassifier::make_error_event(const std::string& source,
                                        const std::string& message,
                                        const std::string& server_name) {
    return {
        {"type", "error"},
        {"source", source},
        {"message", message},
        {"serverName", server_name}
    };
}

std::string StderrClassifier::format_timeout_marker(const json& payload) {
    return std::string(kTimeoutMarker) + " " + payload.dump();
}

StderrClassification StderrClassifier::classify(const std::string& chunk) const {
    if (chunk.find(kTimeoutMarker) != std::string::npos) {
        auto json_start = chunk.find('{');
        auto json_end = chunk.rfind('}');

        if (json_start != std::string::npos && json_end != std::string::npos && json_end > json_start) {
            try {
                json parsed = json::parse(chunk.substr(json_start, json_end - json_start + 1));
                if (parsed.is_object()) {
                    return {StderrClass::Marker, std::move(parsed)};
                }
            } catch (const json::parse_error& e) {
                spdlog::debug("Timeout marker payload is not valid JSON: {}", e.what());
            }
        }

        return {StderrClass::MalformedMarker,
                make_error_event("stderr", trim(chunk), server_name_)};
    }

    for (const auto& pattern : fatal_patterns()) {
        if (chunk.find(pattern) != std::string::npos) {
            return {StderrClass::Fatal, make_error_event("stderr", trim(chunk), server_name_)};
        }
    }

    return {StderrClass::Suppressed, json()};
}

} // namespace mcp_gw
