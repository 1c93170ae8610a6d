#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace zkfleet {

constexpr int DEFAULT_DEVICE_PORT = 4370;

/**
 * @brief One attendance terminal, as configured. Never mutated after loading.
 */
struct DeviceConfig {
    int id = 0;
    std::string name;
    std::string ip;
    int port = DEFAULT_DEVICE_PORT;
    int password = 0;
    std::optional<int> timeout_seconds;
    bool force_udp = false;
};

/**
 * @brief Connection lifecycle tuning for one DeviceLink
 */
struct LinkSettings {
    int max_retries = 10;
    std::chrono::milliseconds base_delay{std::chrono::seconds(6)};
    std::chrono::milliseconds max_delay{std::chrono::seconds(60)};
    std::chrono::milliseconds ping_interval{std::chrono::seconds(15)};
    std::chrono::milliseconds read_timeout{1000};
    std::chrono::milliseconds stop_timeout{std::chrono::seconds(5)};
};

struct SupervisorSettings {
    std::chrono::milliseconds monitor_interval{std::chrono::seconds(30)};
    std::chrono::milliseconds init_timeout{std::chrono::seconds(30)};
};

struct FleetConfig {
    std::vector<DeviceConfig> devices;
    LinkSettings live_link;     // supervisor sessions
    LinkSettings command_link;  // dispatcher sessions
    SupervisorSettings supervisor;
    std::string backend_url;
    std::string log_file;
};

/**
 * @brief Load devices and settings from the environment and the config file
 *
 * Device sources, first non-empty wins: DEVICES_CONFIG, the "devices" array
 * of $ZKFLEET_CONFIG (default /etc/zkfleet/config.json), DEVICE_<n>_*,
 * then DEVICE_IP.
 */
FleetConfig load_fleet_config();

/**
 * @brief Parse a JSON array of device objects
 * @throws ValidationError if an entry is not an object or lacks id/ip
 * @throws nlohmann::json::exception on malformed JSON or mistyped fields
 */
std::vector<DeviceConfig> parse_devices_json(const nlohmann::json& devices);

std::vector<DeviceConfig> load_numbered_devices();
std::optional<DeviceConfig> load_single_device();

/** Drop entries whose id was already seen, keeping the first */
std::vector<DeviceConfig> dedupe_devices(std::vector<DeviceConfig> devices);

/**
 * @brief strtobool semantics: 1/0, true/false, yes/no, on/off, y/n, t/f
 * @return nullopt if the value is not recognised
 */
std::optional<bool> parse_bool(const std::string& value);

void to_json(nlohmann::json& j, const DeviceConfig& config);

} // namespace zkfleet
