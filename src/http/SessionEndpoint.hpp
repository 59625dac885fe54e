#pragma once

#include "HttpTypes.hpp"
#include "SseSession.hpp"
#include "bridge/ISseSink.hpp"
#include "mcp/ConnectionRegistry.hpp"
#include "mcp/ServerManager.hpp"
#include "mcp/TransportFactory.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace mcp_gw {

struct EndpointOptions {
    bool sse_enabled = true;
    std::string public_origin = "http://localhost:3000";
    std::chrono::milliseconds request_timeout{30000};
    std::chrono::milliseconds reconnect_wait{12000};
};

/**
 * @brief HTTP surface of the gateway, independent of the socket layer
 *
 * Opens SSE sessions (GET /sse), relays browser messages to servers
 * (POST /sse, /api/mcp/message) and serves the cancel and tool APIs.
 * Connections created for a single session are published in a session
 * table so the POST relay can reach them while the stream is open.
 */
class SessionEndpoint {
public:
    struct OpenResult {
        std::shared_ptr<SseSession> session;  // Set when the stream opened
        HttpResponse response;                // Error response otherwise
    };

    SessionEndpoint(ConnectionRegistry& registry,
                    TransportFactory& factory,
                    ServerManager& manager,
                    EndpointOptions options);

    ~SessionEndpoint();

    /**
     * @brief GET /sse
     *
     * On success the endpoint event has already been queued on sink and
     * the session is live until end_session().
     */
    OpenResult open_session(const HttpRequest& request, std::shared_ptr<ISseSink> sink);

    /**
     * @brief Abort a session and drop it from the session table
     */
    void end_session(const std::shared_ptr<SseSession>& session, const std::string& reason);

    /**
     * @brief POST /sse, /api/sse and /api/mcp/message
     */
    HttpResponse handle_message(const HttpRequest& request);

    /**
     * @brief POST /api/mcp/cancel
     */
    HttpResponse handle_cancel(const HttpRequest& request);

    /**
     * @brief GET /api/mcp?action=listTools|status|loadConfigs
     */
    HttpResponse handle_api_get(const HttpRequest& request);

    /**
     * @brief POST /api/mcp {action: callTool|disconnect}
     */
    HttpResponse handle_api_post(const HttpRequest& request);

    /**
     * @brief Dispatch every non-streaming request
     */
    HttpResponse route(const HttpRequest& request);

    static bool is_stream_route(const HttpRequest& request);

    /**
     * @brief Registry first, then connections owned by open sessions
     */
    std::shared_ptr<MCPClient> find_client(const std::string& name) const;

    std::size_t session_count() const;
    void close_all_sessions(const std::string& reason);

private:
    std::string reserve_session_name(const std::string& preferred, const std::string& fallback);
    void release_session_name(const std::string& name, const std::shared_ptr<MCPClient>& client);

    ConnectionRegistry& registry_;
    TransportFactory& factory_;
    ServerManager& manager_;
    EndpointOptions options_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<SseSession>> sessions_;        // By request id
    std::map<std::string, std::shared_ptr<MCPClient>> session_clients_;  // Session-owned, by endpoint name
};

} // namespace mcp_gw
