#pragma once

#include "process/ISupervisedProcess.hpp"
#include "core/TimerQueue.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace mcp_gw {

/**
 * @brief Teardown progress of a supervised process
 */
enum class ShutdownState {
    Running,
    StdinClosed,
    SigtermSent,
    SigkillSent,
    Exited
};

std::string to_string(ShutdownState state);

/**
 * @brief Grace periods between escalation steps
 */
struct ShutdownPolicy {
    std::chrono::milliseconds term_grace{5000};  // stdin close -> SIGTERM
    std::chrono::milliseconds kill_grace{5000};  // SIGTERM -> SIGKILL
};

/**
 * @brief Escalating shutdown of a child process
 *
 * start() closes stdin, then arms a timer that sends SIGTERM after
 * term_grace, which in turn arms a timer sending SIGKILL after kill_grace.
 * The moment the process reports exit both timers are cancelled and the
 * supervisor becomes inert. No step ever signals an exited process.
 *
 * Must be owned by a std::shared_ptr; pending timers keep it alive.
 * Failures are logged and never thrown back to the caller.
 */
class ShutdownSupervisor : public std::enable_shared_from_this<ShutdownSupervisor> {
public:
    /**
     * @param process Process to shut down
     * @param timers Timer thread the escalation steps run on
     * @param policy Grace periods
     * @param label Name used in log messages
     */
    ShutdownSupervisor(std::shared_ptr<ISupervisedProcess> process,
                       std::shared_ptr<TimerQueue> timers,
                       ShutdownPolicy policy,
                       std::string label);

    ~ShutdownSupervisor();

    ShutdownSupervisor(const ShutdownSupervisor&) = delete;
    ShutdownSupervisor& operator=(const ShutdownSupervisor&) = delete;

    /**
     * @brief Begin the sequence; later calls are no-ops
     */
    void start();

    ShutdownState state() const;

    bool started() const;

private:
    void on_term_timer();
    void on_kill_timer();
    void on_process_exit(int status);
    void kill_now_locked();
    void cancel_timers_locked();

    std::shared_ptr<ISupervisedProcess> process_;
    std::shared_ptr<TimerQueue> timers_;
    ShutdownPolicy policy_;
    std::string label_;

    mutable std::mutex mutex_;
    ShutdownState state_ = ShutdownState::Running;
    bool started_ = false;
    bool exited_ = false;
    std::optional<TimerQueue::TimerId> term_timer_;
    std::optional<TimerQueue::TimerId> kill_timer_;
};

} // namespace mcp_gw
