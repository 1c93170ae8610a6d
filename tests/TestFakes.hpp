#pragma once

// In-memory stand-ins for a terminal, its socket and the webhook, shared by
// the test executables.

#include "DeviceDriver.hpp"
#include "Errors.hpp"
#include "EventForwarder.hpp"
#include "ZkProtocol.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace zkfleet {
namespace testing {

/**
 * Knobs shared by every driver a factory hands out, so a test can steer
 * drivers that are created (and replaced) inside a supervisor.
 */
struct FakeBehavior {
    std::atomic<int> connect_failures{0};         // fail this many connects, then succeed
    std::atomic<bool> connect_always_fails{false};
    std::atomic<bool> connect_invalid{false};     // connect throws ValidationError
    std::atomic<int> connect_delay_ms{0};
    std::atomic<bool> ping_ok{true};
    std::atomic<int> ping_delay_ms{0};
    std::atomic<int> connect_calls{0};
    std::atomic<int> drivers_created{0};
    std::string failing_command;                  // set before use; this command throws DriverError
};

class FakeDriver : public DeviceDriver, public RawTransport {
public:
    explicit FakeDriver(std::shared_ptr<FakeBehavior> behavior = std::make_shared<FakeBehavior>(),
                        bool tcp = true)
        : behavior_(std::move(behavior)), tcp_(tcp) {
        ++behavior_->drivers_created;
    }

    FakeBehavior& behavior() { return *behavior_; }

    // ---- scripting -------------------------------------------------------

    void push_packet(std::vector<uint8_t> bytes) {
        std::lock_guard<std::mutex> lock(mutex_);
        reads_.push_back({false, std::move(bytes)});
    }

    void push_read_error() {
        std::lock_guard<std::mutex> lock(mutex_);
        reads_.push_back({true, {}});
    }

    size_t pending_reads() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return reads_.size();
    }

    void add_user(int uid, const std::string& user_id, const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        DeviceUser user;
        user.uid = uid;
        user.user_id = user_id;
        user.name = name;
        users_.push_back(user);
    }

    void add_attendance(const std::string& user_id, std::time_t timestamp) {
        std::lock_guard<std::mutex> lock(mutex_);
        AttendanceRecord record;
        record.user_id = user_id;
        record.timestamp = timestamp;
        attendance_.push_back(record);
    }

    // ---- inspection ------------------------------------------------------

    std::vector<std::string> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    int count(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(std::count(calls_.begin(), calls_.end(), name));
    }

    std::vector<uint32_t> reg_event_flags() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return reg_flags_;
    }

    std::vector<DeviceUser> users() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return users_;
    }

    std::vector<std::pair<DeviceUser, FingerTemplate>> saved_templates() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return saved_;
    }

    bool timeout_cleared() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return timeout_set_ && !timeout_;
    }

    bool interrupted() const { return interrupted_; }
    int acks() const { return acks_; }

    // ---- DeviceDriver ----------------------------------------------------

    void connect() override {
        record("connect");
        ++behavior_->connect_calls;
        if (behavior_->connect_delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(behavior_->connect_delay_ms.load()));
        }
        if (behavior_->connect_invalid) {
            throw ValidationError("invalid device address");
        }
        if (behavior_->connect_always_fails) {
            throw ConnectionError("connection refused");
        }
        if (behavior_->connect_failures > 0) {
            --behavior_->connect_failures;
            throw ConnectionError("connection timed out");
        }
        connected_ = true;
        interrupted_ = false;
    }

    void disconnect() override {
        record("disconnect");
        connected_ = false;
    }

    bool is_connected() const override { return connected_; }
    bool is_tcp() const override { return tcp_; }

    bool ping() override {
        record("ping");
        if (behavior_->ping_delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(behavior_->ping_delay_ms.load()));
        }
        return behavior_->ping_ok;
    }

    void enable_device() override { command("enable_device"); }
    void disable_device() override { command("disable_device"); }

    bool cancel_capture() override {
        command("cancel_capture");
        return true;
    }

    void verify_user() override { command("verify_user"); }

    void reg_event(uint32_t flags) override {
        command("reg_event");
        std::lock_guard<std::mutex> lock(mutex_);
        reg_flags_.push_back(flags);
    }

    void ack_ok() override {
        ++acks_;
    }

    RawTransport& raw_transport() override { return *this; }

    std::vector<DeviceUser> get_users() override {
        command("get_users");
        std::lock_guard<std::mutex> lock(mutex_);
        return users_;
    }

    void set_user(const DeviceUser& user) override {
        command("set_user");
        std::lock_guard<std::mutex> lock(mutex_);
        users_.push_back(user);
    }

    void delete_user(int uid, const std::string& user_id) override {
        command("delete_user");
        std::lock_guard<std::mutex> lock(mutex_);
        users_.erase(std::remove_if(users_.begin(), users_.end(), [&](const DeviceUser& u) {
            return u.uid == uid || u.user_id == user_id;
        }), users_.end());
    }

    void enroll_user(int, int, const std::string&) override { command("enroll_user"); }
    void delete_user_template(int, int, const std::string&) override { command("delete_user_template"); }

    std::optional<FingerTemplate> get_user_template(int uid, int finger_index) override {
        command("get_user_template");
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : saved_) {
            if (entry.second.uid == uid && entry.second.finger_index == finger_index) {
                return entry.second;
            }
        }
        return std::nullopt;
    }

    void save_user_template(const DeviceUser& user, const FingerTemplate& finger) override {
        command("save_user_template");
        std::lock_guard<std::mutex> lock(mutex_);
        saved_.emplace_back(user, finger);
    }

    std::vector<FingerTemplate> get_templates() override {
        command("get_templates");
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<FingerTemplate> out;
        for (const auto& entry : saved_) out.push_back(entry.second);
        return out;
    }

    std::vector<AttendanceRecord> get_attendance() override {
        command("get_attendance");
        std::lock_guard<std::mutex> lock(mutex_);
        return attendance_;
    }

    std::string get_device_name() override { command("get_device_name"); return "FakeTerminal"; }
    std::string get_firmware_version() override { command("get_firmware_version"); return "Ver 6.60"; }
    std::string get_platform() override { command("get_platform"); return "ZMM220_TFT"; }
    std::string get_serial_number() override { command("get_serial_number"); return "FAKE0001"; }
    std::time_t get_time() override { command("get_time"); return 1700000000; }

    DeviceCapacity read_sizes() override {
        command("read_sizes");
        DeviceCapacity capacity;
        std::lock_guard<std::mutex> lock(mutex_);
        capacity.users = static_cast<int>(users_.size());
        return capacity;
    }

    // ---- RawTransport ----------------------------------------------------

    std::optional<std::vector<uint8_t>> read(size_t max_bytes) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (interrupted_) {
                throw TransportError("socket shut down");
            }
            if (!reads_.empty()) {
                ScriptedRead next = std::move(reads_.front());
                reads_.pop_front();
                if (next.error) {
                    throw TransportError("connection reset by peer");
                }
                if (next.bytes.size() > max_bytes) {
                    next.bytes.resize(max_bytes);
                }
                return next.bytes;
            }
        }
        // Idle socket: behave like a short read timeout
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        return std::nullopt;
    }

    void write(const std::vector<uint8_t>&) override { record("write"); }

    void set_timeout(std::optional<std::chrono::milliseconds> timeout) override {
        record("set_timeout");
        std::lock_guard<std::mutex> lock(mutex_);
        timeout_set_ = true;
        timeout_ = timeout;
    }

    void interrupt() override {
        record("interrupt");
        interrupted_ = true;
    }

private:
    struct ScriptedRead {
        bool error;
        std::vector<uint8_t> bytes;
    };

    void record(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(name);
    }

    void command(const std::string& name) {
        record(name);
        if (!behavior_->failing_command.empty() && behavior_->failing_command == name) {
            throw DriverError(name + " rejected by device");
        }
    }

    std::shared_ptr<FakeBehavior> behavior_;
    bool tcp_;
    std::atomic<bool> connected_{false};
    std::atomic<bool> interrupted_{false};
    std::atomic<int> acks_{0};

    mutable std::mutex mutex_;
    std::vector<std::string> calls_;
    std::deque<ScriptedRead> reads_;
    std::vector<uint32_t> reg_flags_;
    std::vector<DeviceUser> users_;
    std::vector<AttendanceRecord> attendance_;
    std::vector<std::pair<DeviceUser, FingerTemplate>> saved_;
    bool timeout_set_ = false;
    std::optional<std::chrono::milliseconds> timeout_;
};

/**
 * Collects forwarded events; wait_for() blocks until enough have arrived.
 */
class RecordingSink : public EventSink {
public:
    void forward(const AttendanceEvent& event) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(event);
        }
        cv_.notify_all();
    }

    bool wait_for(size_t count, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return events_.size() >= count; });
    }

    std::vector<AttendanceEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<AttendanceEvent> events_;
};

// ---- packet builders ------------------------------------------------------

inline std::vector<uint8_t> timehex(int year, int month, int day, int hour, int minute, int second) {
    return {static_cast<uint8_t>(year - 2000), static_cast<uint8_t>(month), static_cast<uint8_t>(day),
            static_cast<uint8_t>(hour), static_cast<uint8_t>(minute), static_cast<uint8_t>(second)};
}

/** 10-byte record: u16 id, status, punch, time */
inline std::vector<uint8_t> numeric_record(uint16_t id, uint8_t status = 1, uint8_t punch = 0) {
    std::vector<uint8_t> record;
    zk::put_u16(record, id);
    record.push_back(status);
    record.push_back(punch);
    auto t = timehex(2024, 5, 17, 8, 30, 0);
    record.insert(record.end(), t.begin(), t.end());
    return record;
}

/** Text-id record padded with @p extra zero bytes after the time (32 + extra) */
inline std::vector<uint8_t> text_record(const std::string& id, size_t extra = 0) {
    std::vector<uint8_t> record;
    zk::put_fixed_string(record, id, 24);
    record.push_back(1);
    record.push_back(0);
    auto t = timehex(2024, 5, 17, 8, 30, 0);
    record.insert(record.end(), t.begin(), t.end());
    record.insert(record.end(), extra, 0);
    return record;
}

/** Complete packet as read off the socket */
inline std::vector<uint8_t> live_packet(const std::vector<uint8_t>& payload,
                                        bool tcp = true,
                                        uint16_t command = 500) {
    auto packet = zk::create_header(command, payload, 0x1234, 0);
    return tcp ? zk::create_tcp_top(packet) : packet;
}

inline LinkSettings fast_settings() {
    LinkSettings settings;
    settings.max_retries = 3;
    settings.base_delay = std::chrono::milliseconds(20);
    settings.max_delay = std::chrono::milliseconds(100);
    settings.ping_interval = std::chrono::seconds(15);
    settings.read_timeout = std::chrono::milliseconds(50);
    settings.stop_timeout = std::chrono::milliseconds(500);
    return settings;
}

inline DeviceConfig make_device(int id) {
    DeviceConfig config;
    config.id = id;
    config.name = "Gate " + std::to_string(id);
    config.ip = "10.0.0." + std::to_string(id);
    return config;
}

} // namespace testing
} // namespace zkfleet
