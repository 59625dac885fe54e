#pragma once

#include "process/ISupervisedProcess.hpp"
#include "core/TransportConfig.hpp"
#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <sys/types.h>

namespace mcp_gw {

/**
 * @brief POSIX child process with piped stdin, stdout and stderr
 *
 * Owns the three pipe ends plus two background threads: one draining
 * stderr into the registered handler and one waiting for the process to
 * exit. The exit is observed before the child is reaped, so signals can
 * never reach a recycled pid.
 */
class ChildProcess : public ISupervisedProcess {
public:
    using StderrHandler = std::function<void(const std::string& chunk)>;

    /**
     * @brief Spawn a process
     *
     * The environment is the gateway's own environment with params.env
     * applied on top. stderr is always captured through a pipe.
     * @throws ConnectionError if pipes cannot be created, fork fails or
     *         the command cannot be executed
     */
    static std::shared_ptr<ChildProcess> spawn(const StdioParams& params);

    /// Only constructible through spawn()
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

    ChildProcess(PrivateTag, pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd);

    /**
     * @brief Kills the process if still running and joins helper threads
     */
    ~ChildProcess() override;

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    int pid() const override { return static_cast<int>(pid_); }
    bool close_stdin() override;
    bool terminate() override;
    bool kill() override;
    bool has_exited() const override;
    void on_exit(ExitListener listener) override;
    std::shared_future<int> exit_future() const override { return exit_future_; }

    /**
     * @brief Write raw bytes to the child's stdin
     * @throws SendError if stdin is closed or the write fails
     */
    void write_stdin(const std::string& data);

    /**
     * @brief Blocking read from the child's stdout
     * @return Number of bytes read; 0 at end of stream
     */
    std::size_t read_stdout(char* buffer, std::size_t size);

    /**
     * @brief Route stderr chunks to a handler (replaces the previous one)
     */
    void set_stderr_handler(StderrHandler handler);

    /**
     * @brief Exit status: exit code, or 128 + signal number; -1 while running
     */
    int exit_status() const;

private:
    void watch_exit();
    void drain_stderr();
    bool send_signal(int signal, const char* name);

    /**
     * @brief Wait until fd is readable
     * @return true if readable or hung up, false if the stream should be
     *         treated as finished
     */
    bool wait_readable(int fd, const std::atomic<bool>& stop);

    pid_t pid_;

    std::mutex stdin_mutex_;
    int stdin_fd_;
    int stdout_fd_;
    int stderr_fd_;

    mutable std::mutex state_mutex_;
    bool exited_ = false;
    int exit_status_ = -1;
    std::vector<ExitListener> exit_listeners_;
    std::promise<int> exit_promise_;
    std::shared_future<int> exit_future_;

    std::mutex stderr_mutex_;
    StderrHandler stderr_handler_;

    std::atomic<bool> stopping_{false};
    std::thread exit_thread_;
    std::thread stderr_thread_;
};

} // namespace mcp_gw
