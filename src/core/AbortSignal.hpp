#pragma once

#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace mcp_gw {

/**
 * @brief One-shot cancellation signal
 *
 * fire() may be called any number of times from any thread; listeners run
 * exactly once, on the thread of the first fire() call.
 */
class AbortSignal {
public:
    using Listener = std::function<void()>;

    /**
     * @brief Register a listener; runs immediately if already fired
     */
    void on_abort(Listener listener) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!fired_) {
                listeners_.push_back(std::move(listener));
                return;
            }
        }
        listener();
    }

    /**
     * @return true for the call that actually fired the signal
     */
    bool fire() {
        std::vector<Listener> listeners;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (fired_) {
                return false;
            }
            fired_ = true;
            listeners.swap(listeners_);
        }
        for (auto& listener : listeners) {
            listener();
        }
        return true;
    }

private:
    std::mutex mutex_;
    std::vector<Listener> listeners_;
    bool fired_ = false;
};

} // namespace mcp_gw
