#pragma once

/**
 * @file DeviceSupervisor.hpp
 * @brief Keeps one live-capture session per configured device
 *
 * Starts every device concurrently, then runs a monitor thread that probes
 * each session and replaces unhealthy ones. The registry (device id to
 * session) is only touched under registry_mutex_. A device is in at most one
 * of registry_, pending_ and stopping_, so a session is fully stopped before
 * its replacement is started.
 */

#include "DeviceConfig.hpp"
#include "DeviceDriver.hpp"
#include "DeviceLink.hpp"
#include "EventForwarder.hpp"
#include "StopSignal.hpp"
#include "WorkerPool.hpp"
#include <atomic>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

namespace zkfleet {

enum class ServiceStatus {
    Starting,
    Running,
    Stopping,
    Stopped,
    Error
};

const char* to_string(ServiceStatus status);

class DeviceSupervisor {
public:
    DeviceSupervisor(std::vector<DeviceConfig> devices,
                     DriverFactory factory,
                     LinkSettings link_settings,
                     SupervisorSettings settings,
                     EventSink* sink);

    /**
     * @brief Destructor - calls shutdown()
     */
    ~DeviceSupervisor();

    DeviceSupervisor(const DeviceSupervisor&) = delete;
    DeviceSupervisor& operator=(const DeviceSupervisor&) = delete;

    /**
     * @brief Start every device and launch the monitor
     *
     * Each device start is awaited up to init_timeout; slow devices keep
     * starting in the background. Devices that fail are retried by the
     * monitor.
     *
     * @return false if no device is configured or none came up
     */
    bool start();

    /**
     * @brief Stop all sessions and the monitor. Idempotent.
     */
    void shutdown();

    /**
     * @brief One monitor pass: replace unhealthy sessions, start missing ones
     */
    void check_devices();

    /**
     * @brief Stop the device's session (if any) and start a new one
     * @throws ValidationError if @p device_id is not configured
     */
    std::future<bool> restart_device(int device_id);

    /**
     * @brief {status, total_devices, active_devices, devices: {id: {...}}}
     */
    nlohmann::json status_json();

    ServiceStatus status() const { return status_; }
    size_t total_devices() const { return devices_.size(); }
    size_t active_devices() const;
    bool is_active(int device_id) const;
    std::shared_ptr<DeviceLink> session(int device_id) const;

private:
    bool start_device(const DeviceConfig& config);
    bool run_start(const DeviceConfig& config, std::shared_ptr<DeviceLink> link);
    std::shared_ptr<DeviceLink> claim_start(const DeviceConfig& config);
    void retire(int device_id, const std::shared_ptr<DeviceLink>& link);
    bool occupied(int device_id) const;
    void schedule_start(const DeviceConfig& config);
    void monitor_loop();
    const DeviceConfig* find_config(int device_id) const;

    std::vector<DeviceConfig> devices_;
    DriverFactory factory_;
    LinkSettings link_settings_;
    SupervisorSettings settings_;
    EventSink* sink_;

    mutable std::mutex registry_mutex_;
    std::map<int, std::shared_ptr<DeviceLink>> registry_;  // connected sessions
    std::map<int, std::shared_ptr<DeviceLink>> pending_;   // sessions still connecting
    std::map<int, std::shared_ptr<DeviceLink>> stopping_;  // sessions being torn down

    std::unique_ptr<WorkerPool> pool_;
    std::unique_ptr<std::thread> monitor_thread_;
    StopSignal shutdown_signal_;
    std::atomic<bool> shutdown_{false};
    std::atomic<ServiceStatus> status_{ServiceStatus::Stopped};
};

} // namespace zkfleet
