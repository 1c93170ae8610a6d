#include "DeviceConfig.hpp"
#include "Errors.hpp"
#include "Utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <set>

namespace zkfleet {

static const char* DEFAULT_CONFIG_PATH = "/etc/zkfleet/config.json";

std::optional<bool> parse_bool(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on" ||
        lower == "y" || lower == "t") {
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off" ||
        lower == "n" || lower == "f") {
        return false;
    }
    return std::nullopt;
}

static int env_int(const char* name, int fallback) {
    std::string text = utils::env_or(name, "");
    if (text.empty()) return fallback;
    try {
        size_t pos = 0;
        int value = std::stoi(text, &pos);
        if (pos != text.size()) throw std::invalid_argument(text);
        return value;
    } catch (const std::exception&) {
        std::cerr << "⚠️ " << name << "='" << text << "' is not a number, using " << fallback << std::endl;
        return fallback;
    }
}

static std::optional<int> env_optional_int(const char* name) {
    if (utils::env_or(name, "").empty()) return std::nullopt;
    return env_int(name, 0);
}

static bool env_bool(const char* name, bool fallback) {
    std::string text = utils::env_or(name, "");
    if (text.empty()) return fallback;
    auto value = parse_bool(text);
    if (!value) {
        std::cerr << "⚠️ " << name << "='" << text << "' is not a boolean, using "
                  << (fallback ? "true" : "false") << std::endl;
        return fallback;
    }
    return *value;
}

std::vector<DeviceConfig> parse_devices_json(const nlohmann::json& devices) {
    if (!devices.is_array()) {
        throw ValidationError("device list must be a JSON array");
    }

    std::vector<DeviceConfig> result;
    for (const auto& entry : devices) {
        if (!entry.is_object() || !entry.contains("id") || !entry.contains("ip")) {
            throw ValidationError("device entry needs at least 'id' and 'ip': " + entry.dump());
        }

        DeviceConfig config;
        config.id = entry.at("id").get<int>();
        config.ip = entry.at("ip").get<std::string>();
        config.name = entry.value("name", "Device " + std::to_string(config.id));
        config.port = entry.value("port", DEFAULT_DEVICE_PORT);
        config.password = entry.value("password", 0);
        if (entry.contains("timeout") && !entry["timeout"].is_null()) {
            config.timeout_seconds = entry["timeout"].get<int>();
        }
        if (entry.contains("force_udp")) {
            const auto& flag = entry["force_udp"];
            if (flag.is_string()) {
                auto parsed = parse_bool(flag.get<std::string>());
                if (!parsed) throw ValidationError("force_udp is not a boolean: " + flag.dump());
                config.force_udp = *parsed;
            } else {
                config.force_udp = flag.get<bool>();
            }
        }
        result.push_back(config);
    }
    return result;
}

std::vector<DeviceConfig> load_numbered_devices() {
    std::vector<DeviceConfig> devices;

    for (int device_id = 1;; ++device_id) {
        std::string prefix = "DEVICE_" + std::to_string(device_id) + "_";
        std::string ip = utils::env_or((prefix + "IP").c_str(), "");
        if (ip.empty()) break;

        DeviceConfig config;
        config.id = device_id;
        config.ip = ip;
        config.name = utils::env_or((prefix + "NAME").c_str(), "Device " + std::to_string(device_id));
        config.port = env_int((prefix + "PORT").c_str(), DEFAULT_DEVICE_PORT);
        config.password = env_int((prefix + "PASSWORD").c_str(), 0);
        config.timeout_seconds = env_optional_int((prefix + "TIMEOUT").c_str());
        config.force_udp = env_bool((prefix + "FORCE_UDP").c_str(), false);
        devices.push_back(config);
    }
    return devices;
}

std::optional<DeviceConfig> load_single_device() {
    std::string ip = utils::env_or("DEVICE_IP", "");
    if (ip.empty()) return std::nullopt;

    DeviceConfig config;
    config.id = 1;
    config.name = "Default Device";
    config.ip = ip;
    config.port = env_int("DEVICE_PORT", DEFAULT_DEVICE_PORT);
    config.password = env_int("DEVICE_PASSWORD", 0);
    config.timeout_seconds = env_optional_int("DEVICE_TIMEOUT");
    config.force_udp = env_bool("DEVICE_FORCE_UDP", false);
    return config;
}

std::vector<DeviceConfig> dedupe_devices(std::vector<DeviceConfig> devices) {
    std::set<int> seen;
    std::vector<DeviceConfig> unique;
    for (auto& device : devices) {
        if (!seen.insert(device.id).second) {
            std::cerr << "⚠️ Duplicate device id " << device.id << " (" << device.name
                      << ") ignored" << std::endl;
            continue;
        }
        unique.push_back(std::move(device));
    }
    return unique;
}

static std::vector<DeviceConfig> load_devices_from_env_json() {
    std::string text = utils::env_or("DEVICES_CONFIG", "");
    if (text.empty()) return {};

    try {
        return parse_devices_json(nlohmann::json::parse(text));
    } catch (const std::exception& e) {
        std::cerr << "❌ Invalid DEVICES_CONFIG: " << e.what() << std::endl;
        return {};
    }
}

static std::vector<DeviceConfig> load_devices_from_file(const std::string& path) {
    std::ifstream config_file(path);
    if (!config_file.is_open()) return {};

    try {
        nlohmann::json config;
        config_file >> config;
        if (config.contains("devices")) {
            return parse_devices_json(config["devices"]);
        }
    } catch (const std::exception& e) {
        std::cerr << "❌ Invalid config file " << path << ": " << e.what() << std::endl;
    }
    return {};
}

FleetConfig load_fleet_config() {
    FleetConfig config;

    std::vector<DeviceConfig> devices = load_devices_from_env_json();
    if (devices.empty()) {
        devices = load_devices_from_file(utils::env_or("ZKFLEET_CONFIG", DEFAULT_CONFIG_PATH));
    }
    if (devices.empty()) {
        devices = load_numbered_devices();
    }
    if (devices.empty()) {
        if (auto single = load_single_device()) {
            devices.push_back(*single);
        }
    }
    config.devices = dedupe_devices(std::move(devices));

    config.backend_url = utils::env_or("BACKEND_URL", "");
    config.log_file = utils::env_or("ZKFLEET_LOG_FILE", "");

    LinkSettings& live = config.live_link;
    live.max_retries = env_int("DEVICE_CONNECT_RETRIES", 10);
    live.base_delay = std::chrono::seconds(env_int("DEVICE_RETRY_DELAY", 6));
    live.ping_interval = std::chrono::seconds(env_int("DEVICE_PING_INTERVAL", 15));
    live.read_timeout = std::chrono::milliseconds(env_int("LIVE_READ_TIMEOUT_MS", 1000));

    // Command sessions give up sooner; a REST caller is waiting on them
    config.command_link = live;
    config.command_link.max_retries = env_int("DEVICE_COMMAND_RETRIES", 3);
    config.command_link.max_delay = std::chrono::seconds(30);

    config.supervisor.monitor_interval = std::chrono::seconds(env_int("MONITOR_INTERVAL", 30));
    config.supervisor.init_timeout = std::chrono::seconds(env_int("DEVICE_INIT_TIMEOUT", 30));

    std::cout << "📋 Loaded " << config.devices.size() << " device configurations" << std::endl;
    return config;
}

void to_json(nlohmann::json& j, const DeviceConfig& config) {
    j = nlohmann::json{
        {"id", config.id},
        {"name", config.name},
        {"ip", config.ip},
        {"port", config.port},
        {"force_udp", config.force_udp}
    };
    if (config.timeout_seconds) {
        j["timeout"] = *config.timeout_seconds;
    } else {
        j["timeout"] = nullptr;
    }
}

} // namespace zkfleet
