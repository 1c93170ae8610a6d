#pragma once

#include "DeviceConfig.hpp"
#include "DeviceDriver.hpp"
#include "DeviceSupervisor.hpp"
#include "EventForwarder.hpp"
#include "FleetDispatcher.hpp"
#include <memory>

namespace zkfleet {

/**
 * @brief Everything the service needs, built once at start-up
 *
 * Owns the configuration, the event forwarder, the live-capture supervisor
 * and the command dispatcher. Components get what they need from here
 * instead of reaching for globals.
 */
class ServiceContext {
public:
    /**
     * @param config  loaded fleet configuration
     * @param factory driver factory; defaults to the ZK socket driver
     * @param sink    event sink; defaults to an EventForwarder on config.backend_url
     */
    explicit ServiceContext(FleetConfig config,
                            DriverFactory factory = nullptr,
                            std::unique_ptr<EventSink> sink = nullptr);
    ~ServiceContext();

    ServiceContext(const ServiceContext&) = delete;
    ServiceContext& operator=(const ServiceContext&) = delete;

    /**
     * @brief Start live capture on every device
     */
    bool start();

    /**
     * @brief Stop the supervisor and the dispatcher. Idempotent.
     */
    void shutdown();

    const FleetConfig& config() const { return config_; }
    EventSink& sink() { return *sink_; }
    DeviceSupervisor& supervisor() { return *supervisor_; }
    FleetDispatcher& dispatcher() { return *dispatcher_; }

private:
    FleetConfig config_;
    DriverFactory factory_;
    std::unique_ptr<EventSink> sink_;
    std::unique_ptr<DeviceSupervisor> supervisor_;
    std::unique_ptr<FleetDispatcher> dispatcher_;
};

} // namespace zkfleet
