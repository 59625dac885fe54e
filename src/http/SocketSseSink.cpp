#include "SocketSseSink.hpp"

namespace mcp_gw {

std::string SocketSseSink::encode(const json& event) {
    return "data: " + event.dump() + "\n\n";
}

void SocketSseSink::send(const json& event) {
    std::string frame = encode(event);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        frames_.push_back(std::move(frame));
    }
    cv_.notify_one();
}

void SocketSseSink::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

SocketSseSink::Poll SocketSseSink::next(std::string& frame, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !frames_.empty() || closed_; });
    if (!frames_.empty()) {
        frame = std::move(frames_.front());
        frames_.pop_front();
        return Poll::Frame;
    }
    return closed_ ? Poll::Closed : Poll::Timeout;
}

} // namespace mcp_gw
