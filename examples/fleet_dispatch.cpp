#include "DeviceConfig.hpp"
#include "FleetDispatcher.hpp"
#include "ZkSocketDriver.hpp"
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <csignal>

using namespace zkfleet;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <operation> [args-json] [device-ids]\n"
              << "       " << program << " devices\n\n"
              << "  operation   create_user, get_all_users, get_user, user_exists, delete_user,\n"
              << "              enroll_user, cancel_enroll_user, delete_user_template,\n"
              << "              get_user_template, set_user_template, get_attendance,\n"
              << "              get_device_info, get_device_status\n"
              << "  args-json   JSON object, e.g. '{\"user_id\": 17, \"temp_id\": 0}'\n"
              << "  device-ids  comma separated, e.g. 1,2 (default: all devices)\n\n"
              << "Devices are read from DEVICES_CONFIG / ZKFLEET_CONFIG / DEVICE_<n>_IP / DEVICE_IP."
              << std::endl;
}

std::vector<int> parse_device_ids(const std::string& text) {
    std::vector<int> ids;
    std::stringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (item.empty()) continue;
        ids.push_back(std::stoi(item));
    }
    return ids;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 2;
    }
    signal(SIGPIPE, SIG_IGN);

    std::string operation = argv[1];
    nlohmann::json args = nlohmann::json::object();
    std::vector<int> device_ids;

    try {
        if (argc >= 3) {
            args = nlohmann::json::parse(argv[2]);
        }
        if (argc >= 4) {
            device_ids = parse_device_ids(argv[3]);
        }
    } catch (const std::exception& e) {
        std::cerr << "❌ Invalid arguments: " << e.what() << std::endl;
        print_usage(argv[0]);
        return 2;
    }

    FleetConfig config = load_fleet_config();
    if (config.devices.empty()) {
        std::cerr << "❌ No devices configured" << std::endl;
        return 1;
    }

    FleetDispatcher dispatcher(config.devices, make_socket_driver, config.command_link);

    if (operation == "devices") {
        std::cout << dispatcher.available_devices().dump(2) << std::endl;
        return 0;
    }

    FleetResults results = device_ids.empty()
        ? dispatcher.dispatch_all(operation, args)
        : dispatcher.dispatch_selected(device_ids, operation, args);

    std::cout << results_to_json(results).dump(2) << std::endl;

    for (const auto& entry : results) {
        if (!entry.second.success) {
            return 1;
        }
    }
    return 0;
}
