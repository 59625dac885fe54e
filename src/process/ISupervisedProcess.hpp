#pragma once

#include <functional>
#include <future>

namespace mcp_gw {

/**
 * @brief Abstract handle to a child process that can be shut down
 *
 * Keeps teardown logic independent of how a transport spawned its process.
 */
class ISupervisedProcess {
public:
    using ExitListener = std::function<void(int exit_status)>;

    virtual ~ISupervisedProcess() = default;

    virtual int pid() const = 0;

    /**
     * @brief Close the write end of the child's standard input
     * @return false if stdin was already closed
     */
    virtual bool close_stdin() = 0;

    /**
     * @brief Send SIGTERM
     * @return false if the process already exited (nothing is sent)
     * @throws ShutdownError if signal delivery fails
     */
    virtual bool terminate() = 0;

    /**
     * @brief Send SIGKILL
     * @return false if the process already exited (nothing is sent)
     * @throws ShutdownError if signal delivery fails
     */
    virtual bool kill() = 0;

    virtual bool has_exited() const = 0;

    /**
     * @brief Register a listener for process exit
     *
     * Runs on the exit-watching thread, or immediately on the calling thread
     * if the process has already exited.
     */
    virtual void on_exit(ExitListener listener) = 0;

    /**
     * @brief Future resolved with the exit status
     */
    virtual std::shared_future<int> exit_future() const = 0;
};

} // namespace mcp_gw
