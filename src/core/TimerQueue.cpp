#include "core/TimerQueue.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcp_gw {

TimerQueue::TimerQueue() {
    worker_ = std::thread(&TimerQueue::run, this);
}

TimerQueue::~TimerQueue() {
    shutdown();
}

TimerQueue::TimerId TimerQueue::schedule(std::chrono::milliseconds delay, Callback callback) {
    if (!callback) {
        throw std::invalid_argument("Timer callback cannot be null");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
        throw std::logic_error("TimerQueue is shut down");
    }

    TimerId id = next_id_++;
    auto deadline = Clock::now() + delay;
    queue_.emplace(std::make_pair(deadline, id), std::move(callback));
    deadlines_[id] = deadline;
    cv_.notify_all();
    return id;
}

bool TimerQueue::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = deadlines_.find(id);
    if (it == deadlines_.end()) {
        return false;
    }
    queue_.erase(std::make_pair(it->second, id));
    deadlines_.erase(it);
    cv_.notify_all();
    return true;
}

std::size_t TimerQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void TimerQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && !worker_.joinable()) {
            return;
        }
        stopping_ = true;
        queue_.clear();
        deadlines_.clear();
    }
    cv_.notify_all();

    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

void TimerQueue::run() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (!stopping_) {
        if (queue_.empty()) {
            cv_.wait(lock);
            continue;
        }

        auto next = queue_.begin();
        auto deadline = next->first.first;
        if (Clock::now() < deadline) {
            cv_.wait_until(lock, deadline);
            continue;
        }

        Callback callback = std::move(next->second);
        deadlines_.erase(next->first.second);
        queue_.erase(next);

        lock.unlock();
        try {
            callback();
        } catch (const std::exception& e) {
            spdlog::error("Timer callback failed: {}", e.what());
        }
        lock.lock();
    }
}

} // namespace mcp_gw
