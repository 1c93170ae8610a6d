#include "Errors.hpp"
#include <nlohmann/json.hpp>

namespace zkfleet {

ErrorCategory classify_error(const std::exception& error) {
    if (dynamic_cast<const ValidationError*>(&error)) return ErrorCategory::Validation;
    if (dynamic_cast<const ConnectionError*>(&error)) return ErrorCategory::TransientConnectivity;
    if (dynamic_cast<const TransportError*>(&error)) return ErrorCategory::TransientConnectivity;
    if (dynamic_cast<const DecodeError*>(&error)) return ErrorCategory::ProtocolDecode;
    if (dynamic_cast<const DeliveryError*>(&error)) return ErrorCategory::DownstreamDelivery;
    if (dynamic_cast<const DriverError*>(&error)) return ErrorCategory::DeviceFailure;
    // Bad argument types from JSON args are caller errors too
    if (dynamic_cast<const nlohmann::json::exception*>(&error)) return ErrorCategory::Validation;
    return ErrorCategory::Unknown;
}

bool should_surface(ErrorCategory category, ErrorSite site) {
    switch (site) {
        case ErrorSite::Command:
            // The caller asked for this operation; every failure is theirs to see
            return true;

        case ErrorSite::ConnectAttempt:
            // Attempts are retried and exhaustion is reported by connect() returning
            // false. A bad device address will never succeed, so it ends the loop.
            return category == ErrorCategory::Validation;

        case ErrorSite::LiveCapture:
        case ErrorSite::HealthProbe:
        case ErrorSite::Forwarding:
        case ErrorSite::Supervisor:
            return false;

        case ErrorSite::FanOut:
            // Captured into the device's own result entry, never the batch
            return false;
    }
    return false;
}

const char* to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::TransientConnectivity: return "transient_connectivity";
        case ErrorCategory::ProtocolDecode:        return "protocol_decode";
        case ErrorCategory::Validation:            return "validation";
        case ErrorCategory::DownstreamDelivery:    return "downstream_delivery";
        case ErrorCategory::DeviceFailure:         return "device_failure";
        case ErrorCategory::Unknown:               return "unknown";
    }
    return "unknown";
}

const char* to_string(ErrorSite site) {
    switch (site) {
        case ErrorSite::ConnectAttempt: return "connect";
        case ErrorSite::LiveCapture:    return "live_capture";
        case ErrorSite::HealthProbe:    return "health_probe";
        case ErrorSite::Forwarding:     return "forwarding";
        case ErrorSite::Command:        return "command";
        case ErrorSite::FanOut:         return "fan_out";
        case ErrorSite::Supervisor:     return "supervisor";
    }
    return "unknown";
}

} // namespace zkfleet
