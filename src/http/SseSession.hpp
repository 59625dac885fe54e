#pragma once

#include "bridge/EventBridge.hpp"
#include "core/AbortSignal.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace mcp_gw {

/**
 * @brief One open GET /sse stream
 *
 * Binds the session's EventBridge to an abort signal. Whatever ends the
 * session first (peer disconnect, server exit, gateway shutdown) fires the
 * signal; the bridge is closed exactly once.
 */
class SseSession {
public:
    SseSession(std::string id, std::shared_ptr<EventBridge> bridge, bool owns_connection)
        : id_(std::move(id)), bridge_(std::move(bridge)), owns_connection_(owns_connection) {
        abort_.on_abort([this] {
            std::string reason;
            {
                std::lock_guard<std::mutex> lock(reason_mutex_);
                reason = abort_reason_;
            }
            bridge_->close(reason);
        });
    }

    /**
     * @brief Fire the abort signal
     * @return true only for the call that actually aborted the session
     */
    bool abort(const std::string& reason) {
        {
            std::lock_guard<std::mutex> lock(reason_mutex_);
            if (abort_reason_.empty()) {
                abort_reason_ = reason;
            }
        }
        return abort_.fire();
    }

    AbortSignal& signal() { return abort_; }
    const std::string& id() const { return id_; }
    bool owns_connection() const { return owns_connection_; }
    std::shared_ptr<EventBridge> bridge() const { return bridge_; }
    std::shared_ptr<MCPClient> client() const { return bridge_->client(); }

private:
    const std::string id_;
    std::shared_ptr<EventBridge> bridge_;
    const bool owns_connection_;
    std::mutex reason_mutex_;
    std::string abort_reason_;
    AbortSignal abort_;
};

} // namespace mcp_gw
