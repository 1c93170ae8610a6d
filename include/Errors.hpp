#pragma once

/**
 * @file Errors.hpp
 * @brief Exception hierarchy and the absorb-vs-surface policy for device sessions
 */

#include <exception>
#include <stdexcept>
#include <string>

namespace zkfleet {

class FleetError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Connect / ping failures. Retried with back-off.
class ConnectionError : public FleetError {
public:
    using FleetError::FleetError;
};

// Raised once every connect attempt is exhausted.
class DeviceOfflineError : public ConnectionError {
public:
    using ConnectionError::ConnectionError;
};

// Socket failure in the middle of a session (peer closed, reset, interrupted).
class TransportError : public FleetError {
public:
    using FleetError::FleetError;
};

// Malformed or unrecognised packet content.
class DecodeError : public FleetError {
public:
    using FleetError::FleetError;
};

// Bad caller input. Never retried.
class ValidationError : public FleetError {
public:
    using FleetError::FleetError;
};

class UnknownOperationError : public ValidationError {
public:
    using ValidationError::ValidationError;
};

// Webhook delivery failure.
class DeliveryError : public FleetError {
public:
    using FleetError::FleetError;
};

// The device (or the driver) rejected a command.
class DriverError : public FleetError {
public:
    using FleetError::FleetError;
};

/**
 * @brief Error categories used to decide what happens to a failure
 */
enum class ErrorCategory {
    TransientConnectivity,  // connect/ping/socket failures
    ProtocolDecode,         // malformed event packets
    Validation,             // caller input rejected before any device I/O
    DownstreamDelivery,     // webhook forwarding
    DeviceFailure,          // device refused a command
    Unknown
};

/**
 * @brief Where a failure was observed
 */
enum class ErrorSite {
    ConnectAttempt,  // one attempt inside DeviceLink::connect()
    LiveCapture,     // LiveEventReader read loop
    HealthProbe,     // DeviceLink::is_healthy()
    Forwarding,      // EventForwarder::forward()
    Command,         // a typed DeviceLink operation called by an external caller
    FanOut,          // one device's task inside FleetDispatcher
    Supervisor       // DeviceSupervisor start/monitor/restart
};

ErrorCategory classify_error(const std::exception& error);

/**
 * @brief Decide whether a failure of @p category observed at @p site is
 *        propagated to the caller (true) or absorbed and logged (false).
 */
bool should_surface(ErrorCategory category, ErrorSite site);

const char* to_string(ErrorCategory category);
const char* to_string(ErrorSite site);

} // namespace zkfleet
