#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace mcp_gw {

/**
 * @brief Single background thread running one-shot timers
 *
 * Callbacks run on the timer thread, one at a time, in deadline order.
 * A timer cancelled before its deadline never runs. Cancelling a timer
 * whose callback is already executing has no effect on that execution.
 */
class TimerQueue {
public:
    using Clock = std::chrono::steady_clock;
    using Callback = std::function<void()>;
    using TimerId = std::uint64_t;

    TimerQueue();

    /**
     * @brief Stop the worker; pending timers are dropped without running
     */
    ~TimerQueue();

    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    /**
     * @brief Schedule a callback after a delay
     * @return Id usable with cancel()
     * @throws std::logic_error after shutdown()
     */
    TimerId schedule(std::chrono::milliseconds delay, Callback callback);

    /**
     * @brief Cancel a pending timer
     * @return true if the timer was pending and will not run
     */
    bool cancel(TimerId id);

    /**
     * @brief Number of timers waiting for their deadline
     */
    std::size_t pending() const;

    /**
     * @brief Stop the worker thread and drop pending timers
     */
    void shutdown();

private:
    void run();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::pair<Clock::time_point, TimerId>, Callback> queue_;
    std::map<TimerId, Clock::time_point> deadlines_;
    TimerId next_id_ = 1;
    bool stopping_ = false;
    std::thread worker_;
};

} // namespace mcp_gw
