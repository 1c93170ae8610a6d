#include "DeviceDriver.hpp"
#include "Utils.hpp"

namespace zkfleet {

void to_json(nlohmann::json& j, const DeviceUser& user) {
    // Password is write-only
    j = nlohmann::json{
        {"uid", user.uid},
        {"user_id", user.user_id},
        {"name", user.name},
        {"privilege", user.privilege},
        {"group_id", user.group_id},
        {"card", user.card}
    };
}

void to_json(nlohmann::json& j, const FingerTemplate& finger) {
    j = nlohmann::json{
        {"uid", finger.uid},
        {"fid", finger.finger_index},
        {"valid", finger.valid},
        {"size", finger.data.size()},
        {"template", utils::base64_encode(finger.data)}
    };
}

void to_json(nlohmann::json& j, const AttendanceRecord& record) {
    j = nlohmann::json{
        {"uid", record.uid},
        {"user_id", record.user_id},
        {"timestamp", utils::format_device_time(record.timestamp)},
        {"status", record.status},
        {"punch", record.punch}
    };
}

} // namespace zkfleet
