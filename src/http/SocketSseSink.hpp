#pragma once

#include "bridge/ISseSink.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>

namespace mcp_gw {

/**
 * @brief ISseSink backed by a frame queue drained by the connection thread
 */
class SocketSseSink : public ISseSink {
public:
    enum class Poll {
        Frame,
        Closed,
        Timeout
    };

    void send(const json& event) override;
    void close() override;

    /**
     * @brief Take the next encoded frame
     *
     * Frames queued before close() are still delivered; Closed is only
     * returned once the queue is empty.
     */
    Poll next(std::string& frame, std::chrono::milliseconds timeout);

    /**
     * @brief Encode one event as "data: <json>\n\n"
     */
    static std::string encode(const json& event);

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> frames_;
    bool closed_ = false;
};

} // namespace mcp_gw
