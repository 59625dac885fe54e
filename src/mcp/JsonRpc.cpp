#include "mcp/JsonRpc.hpp"

namespace mcp_gw {
namespace jsonrpc {

bool is_request(const json& message) {
    return message.is_object() && message.contains("method") && message.contains("id");
}

bool is_notification(const json& message) {
    return message.is_object() && message.contains("method") && !message.contains("id");
}

bool is_response(const json& message) {
    return message.is_object() && message.contains("id") && !message.contains("method") &&
           (message.contains("result") || message.contains("error"));
}

std::string id_key(const json& id) {
    return id.dump();
}

json make_request(const json& id, const std::string& method, const json& params) {
    return {
        {"jsonrpc", kVersion},
        {"id", id},
        {"method", method},
        {"params", params}
    };
}

json make_notification(const std::string& method, const json& params) {
    json message = {
        {"jsonrpc", kVersion},
        {"method", method}
    };
    if (!params.is_null()) {
        message["params"] = params;
    }
    return message;
}

json make_cancelled_notification(const std::string& request_id, const std::string& reason) {
    return make_notification("notifications/cancelled", {
        {"requestId", request_id},
        {"reason", reason}
    });
}

} // namespace jsonrpc
} // namespace mcp_gw
