#pragma once

#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace mcp_gw {

using json = nlohmann::json;

/**
 * @brief Transport-independent view of an HTTP request
 */
struct HttpRequest {
    std::string id;        // Per-request UUID used in logs
    std::string method;    // "GET", "POST", ...
    std::string path;
    std::map<std::string, std::string> query;
    std::string body;

    std::string query_value(const std::string& key) const {
        auto it = query.find(key);
        return it == query.end() ? std::string() : it->second;
    }

    bool has_query(const std::string& key) const {
        auto it = query.find(key);
        return it != query.end() && !it->second.empty();
    }
};

struct HttpResponse {
    int status = 200;
    std::string content_type = "application/json";
    std::string body;

    static HttpResponse json_body(int status, const json& body) {
        return HttpResponse{status, "application/json", body.dump()};
    }

    static HttpResponse text(int status, std::string body) {
        return HttpResponse{status, "text/plain", std::move(body)};
    }
};

} // namespace mcp_gw
