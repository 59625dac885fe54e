#pragma once

#include <stdexcept>
#include <string>

namespace mcp_gw {

/**
 * @brief Base class for all errors raised by the gateway
 */
class GatewayError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Missing or invalid transport/request parameters (HTTP 400)
 */
class ValidationError : public GatewayError {
public:
    using GatewayError::GatewayError;
};

/**
 * @brief Unknown server name (HTTP 404)
 */
class NotFoundError : public GatewayError {
public:
    using GatewayError::GatewayError;
};

/**
 * @brief Spawn, connect or handshake failure (HTTP 500)
 */
class ConnectionError : public GatewayError {
public:
    using GatewayError::GatewayError;
};

/**
 * @brief Failure writing an envelope to a transport
 */
class SendError : public GatewayError {
public:
    using GatewayError::GatewayError;
};

/**
 * @brief Failure reported while a connection is live
 *
 * Delivered in-band once a stream is open; also raised when a correlated
 * request times out or its transport closes underneath it.
 */
class TransportRuntimeError : public GatewayError {
public:
    using GatewayError::GatewayError;
};

/**
 * @brief A correlated request received no response in time
 */
class RequestTimeoutError : public TransportRuntimeError {
public:
    using TransportRuntimeError::TransportRuntimeError;
};

/**
 * @brief Signal delivery failure during teardown. Logged, never surfaced.
 */
class ShutdownError : public GatewayError {
public:
    using GatewayError::GatewayError;
};

} // namespace mcp_gw
