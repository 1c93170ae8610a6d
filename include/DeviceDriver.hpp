#pragma once

/**
 * @file DeviceDriver.hpp
 * @brief Capability interface of an attendance-terminal protocol driver
 *
 * One driver instance talks to one device and is exclusively owned by the
 * DeviceLink for that device. Calls throw ConnectionError / TransportError /
 * DriverError on failure.
 */

#include "DeviceConfig.hpp"
#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace zkfleet {

constexpr uint32_t EF_ATTLOG = 1;  // reg_event flag for attendance events
constexpr int USER_DEFAULT = 0;
constexpr int USER_ADMIN = 14;

struct DeviceUser {
    int uid = 0;              // device-internal slot
    std::string user_id;      // external identifier
    std::string name;
    int privilege = USER_DEFAULT;
    std::string password;
    std::string group_id;
    uint32_t card = 0;
};

struct FingerTemplate {
    int uid = 0;
    int finger_index = 0;
    bool valid = true;
    std::vector<uint8_t> data;
};

struct AttendanceRecord {
    int uid = 0;
    std::string user_id;
    std::time_t timestamp = 0;  // device wall clock, no zone
    int status = 0;
    int punch = 0;
};

/**
 * @brief Device table sizes (CMD_GET_FREE_SIZES)
 */
struct DeviceCapacity {
    int users = 0;
    int fingers = 0;
    int records = 0;
    int users_capacity = 0;
    int fingers_capacity = 0;
    int records_capacity = 0;
};

/**
 * @brief Raw access to the session socket for live capture
 */
class RawTransport {
public:
    virtual ~RawTransport() = default;

    /**
     * @brief Receive at most @p max_bytes
     * @return nullopt on read timeout / would-block
     * @throws TransportError when the peer closed or the socket failed
     */
    virtual std::optional<std::vector<uint8_t>> read(size_t max_bytes) = 0;

    virtual void write(const std::vector<uint8_t>& data) = 0;

    // nullopt = blocking, no timeout
    virtual void set_timeout(std::optional<std::chrono::milliseconds> timeout) = 0;

    // Unblock a pending read(); the transport is unusable afterwards
    virtual void interrupt() = 0;
};

class DeviceDriver {
public:
    virtual ~DeviceDriver() = default;

    // Session
    virtual void connect() = 0;
    virtual void disconnect() = 0;
    virtual bool is_connected() const = 0;
    virtual bool is_tcp() const = 0;
    virtual bool ping() = 0;
    virtual void enable_device() = 0;
    virtual void disable_device() = 0;

    // Live capture control
    virtual bool cancel_capture() = 0;
    virtual void verify_user() = 0;
    virtual void reg_event(uint32_t flags) = 0;
    virtual void ack_ok() = 0;
    virtual RawTransport& raw_transport() = 0;

    // Users
    virtual std::vector<DeviceUser> get_users() = 0;
    virtual void set_user(const DeviceUser& user) = 0;
    virtual void delete_user(int uid, const std::string& user_id) = 0;

    // Fingerprints
    virtual void enroll_user(int uid, int finger_index, const std::string& user_id) = 0;
    virtual void delete_user_template(int uid, int finger_index, const std::string& user_id) = 0;
    virtual std::optional<FingerTemplate> get_user_template(int uid, int finger_index) = 0;
    virtual void save_user_template(const DeviceUser& user, const FingerTemplate& finger) = 0;
    virtual std::vector<FingerTemplate> get_templates() = 0;

    // Attendance log
    virtual std::vector<AttendanceRecord> get_attendance() = 0;

    // Metadata
    virtual std::string get_device_name() = 0;
    virtual std::string get_firmware_version() = 0;
    virtual std::string get_platform() = 0;
    virtual std::string get_serial_number() = 0;
    virtual std::time_t get_time() = 0;
    virtual DeviceCapacity read_sizes() = 0;
};

using DriverFactory = std::function<std::unique_ptr<DeviceDriver>(const DeviceConfig&)>;

void to_json(nlohmann::json& j, const DeviceUser& user);
void to_json(nlohmann::json& j, const FingerTemplate& finger);
void to_json(nlohmann::json& j, const AttendanceRecord& record);

} // namespace zkfleet
