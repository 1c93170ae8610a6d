#pragma once

#include "DeviceConfig.hpp"
#include "DeviceDriver.hpp"
#include "DeviceLink.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace zkfleet {

/**
 * @brief Outcome of one operation on one device
 */
struct OperationResult {
    int device_id = 0;
    std::string device_name;
    bool success = false;
    nlohmann::json data;   // set when success
    std::string error;     // set when !success
};

using FleetResults = std::map<int, OperationResult>;

void to_json(nlohmann::json& j, const OperationResult& result);

/** {"<device_id>": {success, device_name, data|error}, ...} */
nlohmann::json results_to_json(const FleetResults& results);

/**
 * @brief Runs named operations across many devices at once
 *
 * Each device gets its own command link, separate from the supervisor's
 * live-capture session, so commands never share a socket with a reader.
 * A failure on one device only ever lands in that device's result entry.
 */
class FleetDispatcher {
public:
    FleetDispatcher(const std::vector<DeviceConfig>& devices,
                    DriverFactory factory,
                    LinkSettings settings);
    ~FleetDispatcher();

    FleetDispatcher(const FleetDispatcher&) = delete;
    FleetDispatcher& operator=(const FleetDispatcher&) = delete;

    /**
     * @brief Run @p operation on every configured device concurrently
     */
    FleetResults dispatch_all(const std::string& operation,
                              const nlohmann::json& args = nlohmann::json::object());

    /**
     * @brief Run @p operation on the listed devices
     *
     * Ids that are not configured are skipped and do not appear in the result.
     */
    FleetResults dispatch_selected(const std::vector<int>& device_ids,
                                   const std::string& operation,
                                   const nlohmann::json& args = nlohmann::json::object());

    /**
     * @brief Run @p operation on one device, propagating its errors
     * @throws ValidationError if @p device_id is not configured
     */
    nlohmann::json dispatch_one(int device_id,
                                const std::string& operation,
                                const nlohmann::json& args = nlohmann::json::object());

    /**
     * @brief Configured devices with an online/offline probe each
     */
    nlohmann::json available_devices();

    bool has_device(int device_id) const;
    std::vector<int> device_ids() const;

    /**
     * @brief Stop every command link. Idempotent.
     */
    void shutdown();

private:
    FleetResults run(const std::vector<int>& targets,
                     const std::string& operation,
                     const nlohmann::json& args);
    OperationResult run_on(int device_id, const std::string& operation, const nlohmann::json& args);

    std::map<int, std::unique_ptr<DeviceLink>> links_;
};

} // namespace zkfleet
