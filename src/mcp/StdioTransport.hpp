#pragma once

#include "ITransport.hpp"
#include "process/ChildProcess.hpp"
#include <atomic>
#include <memory>
#include <string>

namespace mcp_gw {

/**
 * @brief Transport over the standard streams of a spawned child process
 *
 * Writes one JSON message per line to the child's stdin and reads
 * newline-delimited JSON from its stdout. Stderr is forwarded verbatim to
 * the registered stderr handler.
 */
class StdioTransport : public ITransport {
public:
    /**
     * @brief Wrap an already spawned process
     */
    explicit StdioTransport(std::shared_ptr<ChildProcess> process);

    /**
     * @brief Spawn the command described by params and wrap it
     * @throws ConnectionError if the process cannot be started
     */
    static std::unique_ptr<StdioTransport> launch(const StdioParams& params);

    json read_message() override;
    void write_message(const json& message) override;
    bool is_open() const override;

    /**
     * @brief Closes the child's stdin; the process itself is left running
     */
    void close() override;

    TransportKind kind() const override { return TransportKind::Stdio; }
    std::shared_ptr<ISupervisedProcess> process() const override { return process_; }
    void set_stderr_handler(StderrHandler handler) override;

private:
    std::shared_ptr<ChildProcess> process_;
    std::string buffer_;  // Reader thread only
    std::atomic<bool> eof_{false};
};

} // namespace mcp_gw
