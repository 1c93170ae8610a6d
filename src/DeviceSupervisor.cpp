#include "DeviceSupervisor.hpp"
#include "Errors.hpp"
#include "Utils.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>

namespace zkfleet {

const char* to_string(ServiceStatus status) {
    switch (status) {
        case ServiceStatus::Starting: return "starting";
        case ServiceStatus::Running:  return "running";
        case ServiceStatus::Stopping: return "stopping";
        case ServiceStatus::Stopped:  return "stopped";
        case ServiceStatus::Error:    return "error";
    }
    return "unknown";
}

DeviceSupervisor::DeviceSupervisor(std::vector<DeviceConfig> devices,
                                   DriverFactory factory,
                                   LinkSettings link_settings,
                                   SupervisorSettings settings,
                                   EventSink* sink)
    : devices_(std::move(devices)),
      factory_(std::move(factory)),
      link_settings_(link_settings),
      settings_(settings),
      sink_(sink),
      pool_(std::make_unique<WorkerPool>(std::max<size_t>(1, devices_.size()))) {}

DeviceSupervisor::~DeviceSupervisor() {
    shutdown();
}

bool DeviceSupervisor::start() {
    status_ = ServiceStatus::Starting;
    std::cout << "🚀 Starting live capture for " << devices_.size() << " device(s)..." << std::endl;

    if (devices_.empty()) {
        std::cerr << "❌ No devices configured" << std::endl;
        status_ = ServiceStatus::Error;
        return false;
    }

    std::vector<std::pair<const DeviceConfig*, std::future<bool>>> starts;
    for (const auto& config : devices_) {
        starts.emplace_back(&config, pool_->submit([this, config] { return start_device(config); }));
    }

    // Every device shares one deadline since they all start at once
    auto deadline = std::chrono::steady_clock::now() + settings_.init_timeout;
    for (auto& entry : starts) {
        const DeviceConfig& config = *entry.first;
        if (entry.second.wait_until(deadline) != std::future_status::ready) {
            std::cerr << "⚠️ " << utils::device_tag(config.id) << " still starting after "
                      << std::chrono::duration_cast<std::chrono::seconds>(settings_.init_timeout).count()
                      << "s, continuing in background" << std::endl;
            continue;
        }
        try {
            if (entry.second.get()) {
                std::cout << "✅ " << utils::device_tag(config.id) << " " << config.name << " started" << std::endl;
            } else {
                std::cerr << "❌ " << utils::device_tag(config.id) << " " << config.name << " failed to start" << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "❌ " << utils::device_tag(config.id) << " initialization error: " << e.what() << std::endl;
        }
    }

    if (shutdown_) {
        return false;
    }

    monitor_thread_ = std::make_unique<std::thread>(&DeviceSupervisor::monitor_loop, this);
    status_ = ServiceStatus::Running;

    size_t active = active_devices();
    std::cout << "📡 Live capture service running with " << active << "/" << devices_.size()
              << " active device(s)" << std::endl;
    if (active == 0) {
        std::cerr << "⚠️ No device came up; the monitor will keep retrying" << std::endl;
        return false;
    }
    return true;
}

void DeviceSupervisor::shutdown() {
    if (shutdown_.exchange(true)) {
        return;
    }

    status_ = ServiceStatus::Stopping;
    std::cout << "🛑 Shutting down live capture service..." << std::endl;
    shutdown_signal_.request_stop();

    std::vector<std::shared_ptr<DeviceLink>> links;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        // Wake connects that are sleeping in back-off
        for (auto& entry : pending_) {
            entry.second->request_stop();
        }
        for (auto& entry : registry_) {
            links.push_back(entry.second);
        }
        registry_.clear();
    }

    for (auto& link : links) {
        std::cout << "🔌 " << utils::device_tag(link->device_id()) << " stopping " << link->config().name << std::endl;
        link->stop();
    }

    if (monitor_thread_ && monitor_thread_->joinable()) {
        monitor_thread_->join();
    }
    // Drains in-flight starts; they see shutdown_ and stop their own links
    pool_.reset();

    status_ = ServiceStatus::Stopped;
    std::cout << "✅ Live capture service stopped" << std::endl;
}

bool DeviceSupervisor::start_device(const DeviceConfig& config) {
    if (shutdown_) {
        return false;
    }

    std::shared_ptr<DeviceLink> link;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        if (registry_.count(config.id)) {
            return true;
        }
        try {
            link = claim_start(config);
        } catch (const std::exception& e) {
            std::cerr << "❌ " << utils::device_tag(config.id) << " failed to create session: " << e.what() << std::endl;
            return false;
        }
    }
    if (!link) {
        // Another task is starting or stopping this device
        return false;
    }
    return run_start(config, std::move(link));
}

bool DeviceSupervisor::run_start(const DeviceConfig& config, std::shared_ptr<DeviceLink> link) {
    bool connected = false;
    try {
        connected = link->connect(true);
    } catch (const std::exception& e) {
        if (should_surface(classify_error(e), ErrorSite::Supervisor)) {
            throw;
        }
        std::cerr << "❌ " << utils::device_tag(config.id) << " start failed: " << e.what() << std::endl;
    }

    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        pending_.erase(config.id);
        if (connected && !shutdown_) {
            registry_[config.id] = link;
            return true;
        }
    }

    link->stop();
    return false;
}

// Caller holds registry_mutex_
bool DeviceSupervisor::occupied(int device_id) const {
    return registry_.count(device_id) || pending_.count(device_id) || stopping_.count(device_id);
}

// Caller holds registry_mutex_. Returns null if the device already has a session in any state.
std::shared_ptr<DeviceLink> DeviceSupervisor::claim_start(const DeviceConfig& config) {
    if (occupied(config.id)) {
        return nullptr;
    }
    auto link = std::make_shared<DeviceLink>(config, factory_(config), link_settings_, sink_);
    pending_[config.id] = link;
    return link;
}

void DeviceSupervisor::retire(int device_id, const std::shared_ptr<DeviceLink>& link) {
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto it = registry_.find(device_id);
        if (it == registry_.end() || it->second != link) {
            // Already taken out by a restart
            return;
        }
        registry_.erase(it);
        stopping_[device_id] = link;
    }

    link->stop();

    std::lock_guard<std::mutex> lock(registry_mutex_);
    stopping_.erase(device_id);
}

void DeviceSupervisor::schedule_start(const DeviceConfig& config) {
    if (shutdown_ || !pool_) {
        return;
    }
    try {
        // Outcome is logged by start_device; the monitor retries on failure
        pool_->submit([this, config] { return start_device(config); });
    } catch (const std::exception& e) {
        std::cerr << "❌ " << utils::device_tag(config.id) << " could not schedule start: " << e.what() << std::endl;
    }
}

void DeviceSupervisor::check_devices() {
    if (shutdown_) {
        return;
    }

    std::vector<std::pair<int, std::shared_ptr<DeviceLink>>> snapshot;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        snapshot.assign(registry_.begin(), registry_.end());
    }

    for (auto& entry : snapshot) {
        if (shutdown_) {
            return;
        }
        if (entry.second->is_healthy()) {
            continue;
        }

        std::cerr << "⚠️ " << utils::device_tag(entry.first) << " " << entry.second->config().name
                  << " is unhealthy, restarting" << std::endl;
        retire(entry.first, entry.second);
    }

    // Covers devices just torn down and devices that never came up
    for (const auto& config : devices_) {
        bool missing;
        {
            std::lock_guard<std::mutex> lock(registry_mutex_);
            missing = !occupied(config.id);
        }
        if (missing) {
            std::cout << "🔄 " << utils::device_tag(config.id) << " starting " << config.name << std::endl;
            schedule_start(config);
        }
    }
}

std::future<bool> DeviceSupervisor::restart_device(int device_id) {
    const DeviceConfig* config = find_config(device_id);
    if (!config) {
        throw ValidationError("device " + std::to_string(device_id) + " not configured");
    }
    if (shutdown_ || !pool_) {
        throw ValidationError("supervisor is shut down");
    }

    DeviceConfig copy = *config;
    return pool_->submit([this, copy] {
        std::shared_ptr<DeviceLink> old;
        {
            std::lock_guard<std::mutex> lock(registry_mutex_);
            if (pending_.count(copy.id) || stopping_.count(copy.id)) {
                std::cerr << "⚠️ " << utils::device_tag(copy.id) << " restart skipped, session already changing"
                          << std::endl;
                return false;
            }
            auto it = registry_.find(copy.id);
            if (it != registry_.end()) {
                old = it->second;
                registry_.erase(it);
                stopping_[copy.id] = old;
            }
        }
        if (old) {
            old->stop();
        }

        // The slot moves from stopping_ to pending_ under one lock
        std::shared_ptr<DeviceLink> link;
        {
            std::lock_guard<std::mutex> lock(registry_mutex_);
            if (old) {
                stopping_.erase(copy.id);
            }
            if (!shutdown_) {
                try {
                    link = claim_start(copy);
                } catch (const std::exception& e) {
                    std::cerr << "❌ " << utils::device_tag(copy.id) << " failed to create session: "
                              << e.what() << std::endl;
                }
            }
        }

        bool ok = link && run_start(copy, link);
        if (ok) {
            std::cout << "✅ " << utils::device_tag(copy.id) << " " << copy.name << " restarted" << std::endl;
        } else {
            std::cerr << "❌ " << utils::device_tag(copy.id) << " " << copy.name << " failed to restart" << std::endl;
        }
        return ok;
    });
}

void DeviceSupervisor::monitor_loop() {
    std::cout << "🔍 Device monitor started (every "
              << std::chrono::duration_cast<std::chrono::seconds>(settings_.monitor_interval).count()
              << "s)" << std::endl;

    do {
        try {
            check_devices();
        } catch (const std::exception& e) {
            std::cerr << "❌ Device monitor error (" << to_string(classify_error(e)) << "): "
                      << e.what() << std::endl;
        }
    } while (!shutdown_signal_.wait_for(settings_.monitor_interval));

    std::cout << "🔍 Device monitor stopped" << std::endl;
}

nlohmann::json DeviceSupervisor::status_json() {
    std::map<int, std::shared_ptr<DeviceLink>> active;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        active = registry_;
    }

    nlohmann::json devices = nlohmann::json::object();
    for (const auto& config : devices_) {
        auto it = active.find(config.id);
        bool is_up = it != active.end();
        devices[std::to_string(config.id)] = {
            {"name", config.name},
            {"ip", config.ip},
            {"port", config.port},
            {"active", is_up},
            {"healthy", is_up && it->second->is_healthy()}
        };
    }

    return nlohmann::json{
        {"status", to_string(status_.load())},
        {"total_devices", devices_.size()},
        {"active_devices", active.size()},
        {"devices", devices}
    };
}

size_t DeviceSupervisor::active_devices() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return registry_.size();
}

bool DeviceSupervisor::is_active(int device_id) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return registry_.count(device_id) != 0;
}

std::shared_ptr<DeviceLink> DeviceSupervisor::session(int device_id) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = registry_.find(device_id);
    return it == registry_.end() ? nullptr : it->second;
}

const DeviceConfig* DeviceSupervisor::find_config(int device_id) const {
    for (const auto& config : devices_) {
        if (config.id == device_id) {
            return &config;
        }
    }
    return nullptr;
}

} // namespace zkfleet
