#include "FleetDispatcher.hpp"
#include "Errors.hpp"
#include "Utils.hpp"
#include "WorkerPool.hpp"
#include <algorithm>
#include <future>
#include <iostream>
#include <utility>

namespace zkfleet {

void to_json(nlohmann::json& j, const OperationResult& result) {
    j = nlohmann::json{
        {"success", result.success},
        {"device_name", result.device_name}
    };
    if (result.success) {
        j["data"] = result.data;
    } else {
        j["error"] = result.error;
    }
}

nlohmann::json results_to_json(const FleetResults& results) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& entry : results) {
        j[std::to_string(entry.first)] = entry.second;
    }
    return j;
}

FleetDispatcher::FleetDispatcher(const std::vector<DeviceConfig>& devices,
                                 DriverFactory factory,
                                 LinkSettings settings) {
    for (const auto& device : devices) {
        if (links_.count(device.id)) {
            continue;
        }
        try {
            links_.emplace(device.id, std::make_unique<DeviceLink>(device, factory(device), settings));
            std::cout << "🔧 " << utils::device_tag(device.id) << " registered " << device.name
                      << " at " << device.ip << ":" << device.port << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "❌ " << utils::device_tag(device.id) << " failed to set up command link: "
                      << e.what() << std::endl;
        }
    }
}

FleetDispatcher::~FleetDispatcher() {
    shutdown();
}

FleetResults FleetDispatcher::dispatch_all(const std::string& operation, const nlohmann::json& args) {
    return run(device_ids(), operation, args);
}

FleetResults FleetDispatcher::dispatch_selected(const std::vector<int>& device_ids,
                                                const std::string& operation,
                                                const nlohmann::json& args) {
    std::vector<int> targets;
    for (int id : device_ids) {
        if (!has_device(id)) {
            std::cerr << "⚠️ " << utils::device_tag(id) << " not configured, skipped" << std::endl;
            continue;
        }
        if (std::find(targets.begin(), targets.end(), id) == targets.end()) {
            targets.push_back(id);
        }
    }
    return run(targets, operation, args);
}

nlohmann::json FleetDispatcher::dispatch_one(int device_id,
                                             const std::string& operation,
                                             const nlohmann::json& args) {
    auto it = links_.find(device_id);
    if (it == links_.end()) {
        throw ValidationError("device " + std::to_string(device_id) + " not found");
    }
    return it->second->invoke(operation, args);
}

nlohmann::json FleetDispatcher::available_devices() {
    FleetResults probes = dispatch_all("get_device_status");

    nlohmann::json devices = nlohmann::json::array();
    for (const auto& entry : links_) {
        const DeviceConfig& config = entry.second->config();
        auto probe = probes.find(entry.first);
        bool online = probe != probes.end() && probe->second.success;
        devices.push_back(nlohmann::json{
            {"id", config.id},
            {"name", config.name},
            {"ip", config.ip},
            {"port", config.port},
            {"status", online ? "online" : "offline"}
        });
    }
    return devices;
}

bool FleetDispatcher::has_device(int device_id) const {
    return links_.count(device_id) != 0;
}

std::vector<int> FleetDispatcher::device_ids() const {
    std::vector<int> ids;
    ids.reserve(links_.size());
    for (const auto& entry : links_) {
        ids.push_back(entry.first);
    }
    return ids;
}

void FleetDispatcher::shutdown() {
    for (auto& entry : links_) {
        entry.second->stop();
    }
}

FleetResults FleetDispatcher::run(const std::vector<int>& targets,
                                  const std::string& operation,
                                  const nlohmann::json& args) {
    FleetResults results;
    if (targets.empty()) {
        return results;
    }

    std::vector<std::pair<int, std::future<OperationResult>>> pending;
    {
        // One thread per target; joined when the pool goes out of scope
        WorkerPool pool(targets.size());
        for (int id : targets) {
            pending.emplace_back(id, pool.submit([this, id, &operation, &args] {
                return run_on(id, operation, args);
            }));
        }

        for (auto& task : pending) {
            OperationResult result;
            try {
                result = task.second.get();
            } catch (const std::exception& e) {
                // run_on catches everything it can; this is the pool itself failing
                result.device_id = task.first;
                result.device_name = links_.at(task.first)->config().name;
                result.error = e.what();
            }
            results[task.first] = std::move(result);
        }
    }

    size_t failed = 0;
    for (const auto& entry : results) {
        if (!entry.second.success) ++failed;
    }
    std::cout << "📡 " << operation << " on " << results.size() << " device(s): "
              << results.size() - failed << " ok, " << failed << " failed" << std::endl;
    return results;
}

OperationResult FleetDispatcher::run_on(int device_id,
                                        const std::string& operation,
                                        const nlohmann::json& args) {
    DeviceLink& link = *links_.at(device_id);

    OperationResult result;
    result.device_id = device_id;
    result.device_name = link.config().name;

    try {
        result.data = link.invoke(operation, args);
        result.success = true;
    } catch (const std::exception& e) {
        ErrorCategory category = classify_error(e);
        if (should_surface(category, ErrorSite::FanOut)) {
            throw;
        }
        result.success = false;
        result.error = e.what();
        std::cerr << "❌ " << utils::device_tag(device_id) << " operation '" << operation << "' failed ("
                  << to_string(category) << "): " << e.what() << std::endl;
    }
    return result;
}

} // namespace zkfleet
