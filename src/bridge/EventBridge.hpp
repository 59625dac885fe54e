#pragma once

#include "ISseSink.hpp"
#include "core/StderrClassifier.hpp"
#include "mcp/MCPClient.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace mcp_gw {

enum class BridgeState {
    Init,
    Streaming,
    Closing,
    Closed
};

std::string to_string(BridgeState state);

/**
 * @brief Per-session pump between one client and one SSE stream
 *
 * start() announces the POST endpoint and subscribes to the client; from
 * then on each server message becomes one event, in arrival order, and
 * stderr is filtered through StderrClassifier. close() runs once: it
 * unsubscribes, tears down the connection if the session owns it, and
 * ends the stream.
 *
 * Must be owned by a std::shared_ptr; client callbacks hold weak references.
 */
class EventBridge : public std::enable_shared_from_this<EventBridge> {
public:
    /**
     * @param client Connection to bridge
     * @param sink Stream the events are written to
     * @param session_id Identifier placed in the endpoint URL
     * @param origin Public origin of the gateway, e.g. "http://localhost:3000"
     * @param owns_connection Close the client when the session ends
     */
    EventBridge(std::shared_ptr<MCPClient> client,
                std::shared_ptr<ISseSink> sink,
                std::string session_id,
                std::string origin,
                bool owns_connection);

    ~EventBridge();

    EventBridge(const EventBridge&) = delete;
    EventBridge& operator=(const EventBridge&) = delete;

    /**
     * @brief Emit the endpoint event and start streaming
     * @throws std::logic_error if called twice
     */
    void start();

    /**
     * @brief Tear the session down; only the first call has an effect
     */
    void close(const std::string& reason);

    BridgeState state() const { return state_; }
    const std::string& session_id() const { return session_id_; }
    std::string endpoint_url() const;
    std::shared_ptr<MCPClient> client() const { return client_; }

private:
    void handle_message(const json& message);
    void handle_stderr(const std::string& chunk);

    std::shared_ptr<MCPClient> client_;
    std::shared_ptr<ISseSink> sink_;
    const std::string session_id_;
    const std::string origin_;
    const bool owns_connection_;
    StderrClassifier classifier_;

    std::atomic<BridgeState> state_{BridgeState::Init};
    std::mutex subscription_mutex_;
    std::optional<MCPClient::SubscriptionId> subscription_;
};

} // namespace mcp_gw
