#pragma once

#include "bridge/ISseSink.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <vector>

namespace mcp_gw {

/**
 * @brief SSE sink that keeps every event in memory
 */
class RecordingSink : public ISseSink {
public:
    void send(const json& event) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            events_.push_back(event);
        }
        cv_.notify_all();
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            ++close_count_;
        }
        cv_.notify_all();
    }

    std::vector<json> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    bool wait_for_events(std::size_t count, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return events_.size() >= count; });
    }

    bool wait_closed(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return closed_; });
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    int close_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return close_count_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<json> events_;
    bool closed_ = false;
    int close_count_ = 0;
};

} // namespace mcp_gw
