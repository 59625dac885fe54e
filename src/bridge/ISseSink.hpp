#pragma once

#include <nlohmann/json.hpp>

namespace mcp_gw {

using json = nlohmann::json;

/**
 * @brief Outbound half of one server-sent-events stream
 *
 * Implementations must accept calls from any thread and preserve call
 * order. Sending after close() is a no-op.
 */
class ISseSink {
public:
    virtual ~ISseSink() = default;

    /**
     * @brief Queue one event ("data: <json>\n\n")
     */
    virtual void send(const json& event) = 0;

    /**
     * @brief End the stream
     */
    virtual void close() = 0;
};

} // namespace mcp_gw
