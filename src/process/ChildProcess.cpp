#include "process/ChildProcess.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <map>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace mcp_gw {

namespace {

constexpr int kPollIntervalMs = 100;

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void close_pipe(int fds[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string item(*entry);
        auto eq = item.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        merged[item.substr(0, eq)] = item.substr(eq + 1);
    }
    for (const auto& [key, value] : overrides) {
        merged[key] = value;
    }

    std::vector<std::string> result;
    result.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        result.push_back(key + "=" + value);
    }
    return result;
}

void join_or_detach(std::thread& worker) {
    if (!worker.joinable()) {
        return;
    }
    if (worker.get_id() == std::this_thread::get_id()) {
        worker.detach();
    } else {
        worker.join();
    }
}

int decode_wait_status(int raw) {
    if (WIFEXITED(raw)) {
        return WEXITSTATUS(raw);
    }
    if (WIFSIGNALED(raw)) {
        return 128 + WTERMSIG(raw);
    }
    return -1;
}

} // namespace

std::shared_ptr<ChildProcess> ChildProcess::spawn(const StdioParams& params) {
    if (params.command.empty()) {
        throw ValidationError("Missing command parameter for stdio transport");
    }

    // A capability server that dies mid-write must not take the gateway down
    static std::once_flag sigpipe_once;
    std::call_once(sigpipe_once, [] { std::signal(SIGPIPE, SIG_IGN); });

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    if (::pipe2(in_pipe, O_CLOEXEC) != 0 || ::pipe2(out_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(err_pipe, O_CLOEXEC) != 0 || ::pipe2(status_pipe, O_CLOEXEC) != 0) {
        int error = errno;
        close_pipe(in_pipe);
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        close_pipe(status_pipe);
        throw ConnectionError(std::string("Failed to create pipes: ") + std::strerror(error));
    }

    // Everything the child needs is prepared before fork
    std::vector<std::string> argv_storage;
    argv_storage.push_back(params.command);
    argv_storage.insert(argv_storage.end(), params.args.begin(), params.args.end());
    std::vector<char*> argv;
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage = build_environment(params.env);
    std::vector<char*> envp;
    for (auto& entry : env_storage) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    const char* cwd = params.cwd.empty() ? nullptr : params.cwd.c_str();

    pid_t pid = ::fork();
    if (pid < 0) {
        int error = errno;
        close_pipe(in_pipe);
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        close_pipe(status_pipe);
        throw ConnectionError(std::string("fork failed: ") + std::strerror(error));
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);

        if (cwd && ::chdir(cwd) != 0) {
            int error = errno;
            ssize_t ignored = ::write(status_pipe[1], &error, sizeof(error));
            (void)ignored;
            ::_exit(127);
        }

        ::execvpe(argv[0], argv.data(), envp.data());

        int error = errno;
        ssize_t ignored = ::write(status_pipe[1], &error, sizeof(error));
        (void)ignored;
        ::_exit(127);
    }

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(status_pipe[1]);

    // The status pipe closes on successful exec; a payload means exec failed
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (n > 0) {
        ::waitpid(pid, nullptr, 0);
        close_fd(in_pipe[1]);
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        throw ConnectionError("Failed to spawn '" + params.command + "': " + std::strerror(child_errno));
    }

    spdlog::info("Spawned process '{}' (pid {})", params.command, pid);
    return std::make_shared<ChildProcess>(PrivateTag{}, pid, in_pipe[1], out_pipe[0], err_pipe[0]);
}

ChildProcess::ChildProcess(PrivateTag, pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd)
    : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {
    exit_future_ = exit_promise_.get_future().share();
    exit_thread_ = std::thread(&ChildProcess::watch_exit, this);
    stderr_thread_ = std::thread(&ChildProcess::drain_stderr, this);
}

ChildProcess::~ChildProcess() {
    if (!has_exited()) {
        spdlog::warn("Process {} still running on destruction, sending SIGKILL", pid_);
        try {
            send_signal(SIGKILL, "SIGKILL");
        } catch (const ShutdownError& e) {
            spdlog::error("{}", e.what());
        }
    }

    join_or_detach(exit_thread_);
    stopping_ = true;
    join_or_detach(stderr_thread_);

    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

bool ChildProcess::close_stdin() {
    std::lock_guard<std::mutex> lock(stdin_mutex_);
    if (stdin_fd_ < 0) {
        return false;
    }
    if (::close(stdin_fd_) != 0) {
        spdlog::warn("Error closing stdin of process {}: {}", pid_, std::strerror(errno));
    }
    stdin_fd_ = -1;
    return true;
}

bool ChildProcess::terminate() {
    return send_signal(SIGTERM, "SIGTERM");
}

bool ChildProcess::kill() {
    return send_signal(SIGKILL, "SIGKILL");
}

bool ChildProcess::send_signal(int signal, const char* name) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (exited_) {
        return false;
    }
    if (::kill(pid_, signal) != 0) {
        throw ShutdownError(std::string("Error sending ") + name + " to process " +
                            std::to_string(pid_) + ": " + std::strerror(errno));
    }
    spdlog::debug("Sent {} to process {}", name, pid_);
    return true;
}

bool ChildProcess::has_exited() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return exited_;
}

int ChildProcess::exit_status() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return exit_status_;
}

void ChildProcess::on_exit(ExitListener listener) {
    int status;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!exited_) {
            exit_listeners_.push_back(std::move(listener));
            return;
        }
        status = exit_status_;
    }
    listener(status);
}

void ChildProcess::set_stderr_handler(StderrHandler handler) {
    std::lock_guard<std::mutex> lock(stderr_mutex_);
    stderr_handler_ = std::move(handler);
}

void ChildProcess::write_stdin(const std::string& data) {
    std::lock_guard<std::mutex> lock(stdin_mutex_);
    if (stdin_fd_ < 0) {
        throw SendError("stdin of process " + std::to_string(pid_) + " is closed");
    }

    std::size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(stdin_fd_, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw SendError("Failed to write to process " + std::to_string(pid_) + ": " +
                            std::strerror(errno));
        }
        written += static_cast<std::size_t>(n);
    }
}

std::size_t ChildProcess::read_stdout(char* buffer, std::size_t size) {
    while (wait_readable(stdout_fd_, stopping_)) {
        ssize_t n = ::read(stdout_fd_, buffer, size);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            spdlog::error("Error reading stdout of process {}: {}", pid_, std::strerror(errno));
            return 0;
        }
        return static_cast<std::size_t>(n);
    }
    return 0;
}

bool ChildProcess::wait_readable(int fd, const std::atomic<bool>& stop) {
    while (!stop) {
        pollfd pfd{fd, POLLIN, 0};
        int ready = ::poll(&pfd, 1, kPollIntervalMs);
        if (ready > 0) {
            return true;
        }
        if (ready < 0 && errno != EINTR) {
            return false;
        }
        // Nothing buffered and the child is gone: a grandchild may still
        // hold the pipe open, but nothing more belongs to this process
        if (ready == 0 && has_exited()) {
            return false;
        }
    }
    return false;
}

void ChildProcess::drain_stderr() {
    char buffer[4096];

    while (wait_readable(stderr_fd_, stopping_)) {
        ssize_t n = ::read(stderr_fd_, buffer, sizeof(buffer));
        if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
            continue;
        }
        if (n <= 0) {
            break;
        }

        std::string chunk(buffer, static_cast<std::size_t>(n));
        StderrHandler handler;
        {
            std::lock_guard<std::mutex> lock(stderr_mutex_);
            handler = stderr_handler_;
        }

        if (!handler) {
            spdlog::debug("Stderr of process {} (no handler): {}", pid_, chunk);
            continue;
        }
        try {
            handler(chunk);
        } catch (const std::exception& e) {
            spdlog::error("Stderr handler for process {} failed: {}", pid_, e.what());
        }
    }
    spdlog::debug("Stderr reader for process {} finished", pid_);
}

void ChildProcess::watch_exit() {
    // Observe the exit without reaping so the pid cannot be recycled while
    // a signal is being sent under state_mutex_
    siginfo_t info{};
    while (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) != 0) {
        if (errno != EINTR) {
            spdlog::error("waitid failed for process {}: {}", pid_, std::strerror(errno));
            break;
        }
    }

    std::vector<ExitListener> listeners;
    int status = -1;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        int raw = 0;
        pid_t reaped;
        do {
            reaped = ::waitpid(pid_, &raw, 0);
        } while (reaped < 0 && errno == EINTR);

        if (reaped == pid_) {
            status = decode_wait_status(raw);
        }
        exited_ = true;
        exit_status_ = status;
        listeners.swap(exit_listeners_);
    }

    spdlog::info("Process {} exited with status {}", pid_, status);
    exit_promise_.set_value(status);

    for (auto& listener : listeners) {
        try {
            listener(status);
        } catch (const std::exception& e) {
            spdlog::error("Exit listener for process {} failed: {}", pid_, e.what());
        }
    }
}

} // namespace mcp_gw
