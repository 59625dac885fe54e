#include "TransportFactory.hpp"
#include "StdioTransport.hpp"
#include "WebSocketTransport.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>

namespace mcp_gw {

TransportFactory::TransportFactory(std::chrono::milliseconds connect_timeout)
    : connect_timeout_(connect_timeout) {}

std::unique_ptr<ITransport> TransportFactory::create(const TransportConfig& config) {
    spdlog::info("Creating transport: {}", config.describe());

    switch (config.kind()) {
        case TransportKind::Stdio:
            return StdioTransport::launch(config.stdio_params());
        case TransportKind::WebSocket:
            return WebSocketTransport::connect(config.websocket_params().url, connect_timeout_);
        case TransportKind::Sse:
        case TransportKind::Streamable:
            break;
    }
    throw ValidationError("Transport type '" + to_string(config.kind()) + "' is not supported");
}

} // namespace mcp_gw
