#include "process/ShutdownSupervisor.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcp_gw {

std::string to_string(ShutdownState state) {
    switch (state) {
        case ShutdownState::Running:     return "running";
        case ShutdownState::StdinClosed: return "stdin_closed";
        case ShutdownState::SigtermSent: return "sigterm_sent";
        case ShutdownState::SigkillSent: return "sigkill_sent";
        case ShutdownState::Exited:      return "exited";
    }
    return "unknown";
}

ShutdownSupervisor::ShutdownSupervisor(std::shared_ptr<ISupervisedProcess> process,
                                       std::shared_ptr<TimerQueue> timers,
                                       ShutdownPolicy policy,
                                       std::string label)
    : process_(std::move(process)),
      timers_(std::move(timers)),
      policy_(policy),
      label_(std::move(label)) {
    if (!process_) {
        throw std::invalid_argument("Supervised process cannot be null");
    }
    if (!timers_) {
        throw std::invalid_argument("Timer queue cannot be null");
    }
}

ShutdownSupervisor::~ShutdownSupervisor() {
    std::lock_guard<std::mutex> lock(mutex_);
    cancel_timers_locked();
}

void ShutdownSupervisor::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_) {
            spdlog::debug("Shutdown of {} already in progress", label_);
            return;
        }
        started_ = true;
    }

    // May run on_process_exit synchronously, so no lock is held here
    std::weak_ptr<ShutdownSupervisor> weak_self = weak_from_this();
    process_->on_exit([weak_self](int status) {
        if (auto self = weak_self.lock()) {
            self->on_process_exit(status);
        }
    });

    std::lock_guard<std::mutex> lock(mutex_);
    if (exited_) {
        spdlog::debug("Process of {} already exited, nothing to shut down", label_);
        return;
    }

    spdlog::info("Initiating shutdown sequence for {}", label_);
    try {
        if (process_->close_stdin()) {
            spdlog::debug("Closed stdin for graceful shutdown of {}", label_);
        } else {
            spdlog::debug("Stdin of {} was already closed", label_);
        }
    } catch (const std::exception& e) {
        spdlog::warn("Error closing stdin of {}: {}", label_, e.what());
    }
    state_ = ShutdownState::StdinClosed;

    auto self = shared_from_this();
    try {
        term_timer_ = timers_->schedule(policy_.term_grace, [self] { self->on_term_timer(); });
    } catch (const std::logic_error& e) {
        spdlog::error("Cannot schedule SIGTERM for {}: {}", label_, e.what());
        kill_now_locked();
    }
}

void ShutdownSupervisor::on_term_timer() {
    std::lock_guard<std::mutex> lock(mutex_);
    term_timer_.reset();
    if (exited_ || process_->has_exited()) {
        return;
    }

    spdlog::warn("Process of {} did not exit gracefully, sending SIGTERM", label_);
    try {
        if (process_->terminate()) {
            state_ = ShutdownState::SigtermSent;
        }
    } catch (const std::exception& e) {
        spdlog::error("Error sending SIGTERM to {}: {}", label_, e.what());
    }

    // Escalate even if SIGTERM could not be delivered
    auto self = shared_from_this();
    try {
        kill_timer_ = timers_->schedule(policy_.kill_grace, [self] { self->on_kill_timer(); });
    } catch (const std::logic_error& e) {
        spdlog::error("Cannot schedule SIGKILL for {}: {}", label_, e.what());
        kill_now_locked();
    }
}

void ShutdownSupervisor::on_kill_timer() {
    std::lock_guard<std::mutex> lock(mutex_);
    kill_timer_.reset();
    if (exited_ || process_->has_exited()) {
        return;
    }

    spdlog::warn("Process of {} did not respond to SIGTERM, sending SIGKILL", label_);
    kill_now_locked();
}

void ShutdownSupervisor::kill_now_locked() {
    try {
        if (process_->kill()) {
            state_ = ShutdownState::SigkillSent;
        }
    } catch (const std::exception& e) {
        spdlog::error("Error sending SIGKILL to {}: {}", label_, e.what());
    }
}

void ShutdownSupervisor::on_process_exit(int status) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (exited_) {
        return;
    }
    exited_ = true;
    cancel_timers_locked();
    if (started_) {
        spdlog::info("Process of {} exited (status {}) during shutdown from state {}",
                     label_, status, to_string(state_));
    }
    state_ = ShutdownState::Exited;
}

void ShutdownSupervisor::cancel_timers_locked() {
    if (term_timer_) {
        timers_->cancel(*term_timer_);
        term_timer_.reset();
    }
    if (kill_timer_) {
        timers_->cancel(*kill_timer_);
        kill_timer_.reset();
    }
}

ShutdownState ShutdownSupervisor::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool ShutdownSupervisor::started() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_;
}

} // namespace mcp_gw
