#include "StdioTransport.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcp_gw {

namespace {

constexpr std::size_t kReadChunk = 4096;

} // namespace

StdioTransport::StdioTransport(std::shared_ptr<ChildProcess> process)
    : process_(std::move(process)) {
    if (!process_) {
        throw std::invalid_argument("Process cannot be null");
    }
    spdlog::debug("StdioTransport attached to pid {}", process_->pid());
}

std::unique_ptr<StdioTransport> StdioTransport::launch(const StdioParams& params) {
    return std::make_unique<StdioTransport>(ChildProcess::spawn(params));
}

json StdioTransport::read_message() {
    while (true) {
        auto newline = buffer_.find('\n');
        if (newline == std::string::npos) {
            if (eof_) {
                if (!buffer_.empty()) {
                    spdlog::warn("Discarding {} bytes of unterminated output from pid {}",
                                 buffer_.size(), process_->pid());
                    buffer_.clear();
                }
                return json();
            }

            char chunk[kReadChunk];
            std::size_t n = process_->read_stdout(chunk, sizeof(chunk));
            if (n == 0) {
                spdlog::debug("Reached end of stdout for pid {}", process_->pid());
                eof_ = true;
            } else {
                buffer_.append(chunk, n);
            }
            continue;
        }

        std::string line = buffer_.substr(0, newline);
        buffer_.erase(0, newline + 1);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }

        try {
            json message = json::parse(line);
            spdlog::debug("Read message: {}", line);
            return message;
        } catch (const json::parse_error& e) {
            // Servers sometimes print banners to stdout; skip the line
            spdlog::error("JSON parse error from pid {}: {}", process_->pid(), e.what());
        }
    }
}

void StdioTransport::write_message(const json& message) {
    std::string serialized = message.dump();
    process_->write_stdin(serialized + "\n");
    spdlog::debug("Wrote message: {}", serialized);
}

bool StdioTransport::is_open() const {
    return !eof_ && !process_->has_exited();
}

void StdioTransport::close() {
    process_->close_stdin();
}

void StdioTransport::set_stderr_handler(StderrHandler handler) {
    process_->set_stderr_handler(std::move(handler));
}

} // namespace mcp_gw
