#pragma once

/**
 * @file DeviceLink.hpp
 * @brief One session to one attendance terminal
 *
 * Owns the protocol driver for a device: connect with linear back-off,
 * health probing, the live-capture reader and the command surface used by
 * the dispatcher. Commands run inside a DisabledScope so the terminal stops
 * scanning while its tables are touched.
 */

#include "DeviceConfig.hpp"
#include "DeviceDriver.hpp"
#include "EventForwarder.hpp"
#include "LiveEventReader.hpp"
#include "StopSignal.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace zkfleet {

constexpr size_t MIN_TEMPLATE_SIZE = 300;
constexpr size_t MAX_TEMPLATE_SIZE = 2000;

enum class LinkState {
    Disconnected,
    Connecting,
    Connected,
    Degraded
};

const char* to_string(LinkState state);

/**
 * @throws ValidationError unless MIN_TEMPLATE_SIZE <= size <= MAX_TEMPLATE_SIZE
 */
void validate_template_size(size_t size);

class DeviceLink {
public:
    /**
     * @param config   device identity and address
     * @param driver   protocol driver, exclusively owned by this link
     * @param settings retry/back-off/health tuning
     * @param sink     receiver for live events; null for command-only links
     */
    DeviceLink(DeviceConfig config,
               std::unique_ptr<DeviceDriver> driver,
               LinkSettings settings,
               EventSink* sink = nullptr);

    ~DeviceLink();

    DeviceLink(const DeviceLink&) = delete;
    DeviceLink& operator=(const DeviceLink&) = delete;

    /**
     * @brief Connect, retrying with linear back-off
     *
     * Returns true at once if the session is up and the device answers a
     * ping. Otherwise tries up to max_retries times, waiting
     * min(base_delay * attempt, max_delay) between attempts. The wait wakes
     * immediately on stop().
     *
     * @param enable_live_capture start the LiveEventReader once connected
     * @return false when every attempt failed or the link was stopped
     * @throws ValidationError when the device address itself is invalid
     */
    bool connect(bool enable_live_capture);

    /**
     * @brief Health probe used by the supervisor. Never throws.
     */
    bool is_healthy();

    /**
     * @brief Stop the reader (bounded wait) and close the session
     *
     * Terminal: a stopped link never reconnects. Idempotent.
     */
    void stop();

    /**
     * @brief Wake a pending back-off without waiting for the session to close
     */
    void request_stop();

    // Commands. Each throws DeviceOfflineError when the device cannot be reached.
    void create_user(int user_id,
                     const std::string& name,
                     int privilege = USER_DEFAULT,
                     const std::string& password = "",
                     const std::string& group_id = "",
                     uint32_t card = 0);
    std::vector<DeviceUser> get_all_users();
    std::optional<DeviceUser> get_user(int user_id);
    bool user_exists(int user_id);
    void delete_user(int user_id);
    void enroll_user(int user_id, int finger_index);
    void cancel_enroll_user();
    void delete_user_template(int user_id, int finger_index);
    std::optional<FingerTemplate> get_user_template(int user_id, int finger_index);

    /**
     * @brief Restore a fingerprint template
     *
     * The size window is checked before any device I/O. A missing user is
     * created as "user_<id>" first.
     */
    bool set_user_template(int user_id, int finger_index, const std::vector<uint8_t>& data);

    /**
     * @brief Attendance log, optionally limited to [from, to] (device time)
     */
    std::vector<AttendanceRecord> get_attendance(std::optional<std::time_t> from = std::nullopt,
                                                 std::optional<std::time_t> to = std::nullopt);
    nlohmann::json get_device_info();
    nlohmann::json get_device_status();

    /**
     * @brief Run a command by name with JSON arguments
     * @throws UnknownOperationError for names outside the command table
     * @throws ValidationError for missing or mistyped arguments
     */
    nlohmann::json invoke(const std::string& operation, const nlohmann::json& args);

    const DeviceConfig& config() const { return config_; }
    int device_id() const { return config_.id; }
    LinkState state() const { return state_; }
    bool is_stopped() const { return stopped_; }
    bool live_capture_running() const;
    uint64_t connect_attempts() const { return connect_attempts_; }

private:
    class DisabledScope;

    void ensure_connected();
    void start_live_capture();
    void drop_session();
    bool probe_ping();
    std::optional<DeviceUser> find_user(const std::string& user_id);

    DeviceConfig config_;
    std::unique_ptr<DeviceDriver> driver_;
    LinkSettings settings_;
    EventSink* sink_;

    // Held while the driver connects or the reader is created/stopped
    mutable std::mutex lifecycle_mutex_;
    std::unique_ptr<LiveEventReader> reader_;

    // Serializes commands on this link
    std::mutex command_mutex_;

    StopSignal stop_signal_;
    std::atomic<LinkState> state_{LinkState::Disconnected};
    std::atomic<bool> stopped_{false};
    std::atomic<uint64_t> connect_attempts_{0};
    std::atomic<int64_t> last_ping_ns_{0};
    std::atomic<int64_t> last_health_check_ns_{0};
};

} // namespace zkfleet
