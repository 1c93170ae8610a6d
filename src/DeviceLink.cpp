#include "DeviceLink.hpp"
#include "Errors.hpp"
#include "Utils.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace zkfleet {

namespace {

constexpr std::time_t END_OF_DAY = 23 * 3600 + 59 * 60 + 59;

int64_t steady_now_ns() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

bool is_digits(const std::string& text) {
    return !text.empty() && text.size() <= 9 &&
           std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

const nlohmann::json& require_arg(const nlohmann::json& args, const char* key) {
    if (!args.is_object() || !args.contains(key) || args.at(key).is_null()) {
        throw ValidationError(std::string("missing required argument '") + key + "'");
    }
    return args.at(key);
}

// Integer argument; numeric strings are accepted since ids often arrive as path segments
int int_arg(const nlohmann::json& value, const char* key) {
    if (value.is_number_integer()) {
        return value.get<int>();
    }
    if (value.is_string() && is_digits(value.get<std::string>())) {
        return std::stoi(value.get<std::string>());
    }
    throw ValidationError(std::string("argument '") + key + "' must be an integer");
}

int require_int(const nlohmann::json& args, const char* key) {
    return int_arg(require_arg(args, key), key);
}

int optional_int(const nlohmann::json& args, const char* key, int fallback) {
    if (!args.is_object() || !args.contains(key) || args.at(key).is_null()) {
        return fallback;
    }
    return int_arg(args.at(key), key);
}

std::string optional_string(const nlohmann::json& args, const char* key, const std::string& fallback) {
    if (!args.is_object() || !args.contains(key) || args.at(key).is_null()) {
        return fallback;
    }
    const auto& value = args.at(key);
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number_integer()) return std::to_string(value.get<long long>());
    throw ValidationError(std::string("argument '") + key + "' must be a string");
}

std::optional<std::time_t> optional_date(const nlohmann::json& args, const char* key) {
    std::string text = optional_string(args, key, "");
    if (text.empty()) {
        return std::nullopt;
    }
    auto date = utils::parse_date(text);
    if (!date) {
        throw ValidationError(std::string("argument '") + key + "' must be a YYYY-MM-DD date");
    }
    return date;
}

} // namespace

const char* to_string(LinkState state) {
    switch (state) {
        case LinkState::Disconnected: return "disconnected";
        case LinkState::Connecting:   return "connecting";
        case LinkState::Connected:    return "connected";
        case LinkState::Degraded:     return "degraded";
    }
    return "unknown";
}

void validate_template_size(size_t size) {
    if (size < MIN_TEMPLATE_SIZE || size > MAX_TEMPLATE_SIZE) {
        throw ValidationError("template size " + std::to_string(size) + " bytes outside [" +
                              std::to_string(MIN_TEMPLATE_SIZE) + ", " +
                              std::to_string(MAX_TEMPLATE_SIZE) + "]");
    }
}

/**
 * Pauses scanning on the terminal for the lifetime of a command.
 * enable_device() runs on every exit path; failures on either side are logged.
 */
class DeviceLink::DisabledScope {
public:
    explicit DisabledScope(DeviceLink& link) : link_(link) {
        try {
            link_.driver_->disable_device();
        } catch (const std::exception& e) {
            std::cerr << "⚠️ " << utils::device_tag(link_.config_.id) << " disable_device failed: "
                      << e.what() << std::endl;
        }
    }

    ~DisabledScope() {
        try {
            link_.driver_->enable_device();
        } catch (const std::exception& e) {
            std::cerr << "⚠️ " << utils::device_tag(link_.config_.id) << " enable_device failed: "
                      << e.what() << std::endl;
        }
    }

    DisabledScope(const DisabledScope&) = delete;
    DisabledScope& operator=(const DisabledScope&) = delete;

private:
    DeviceLink& link_;
};

DeviceLink::DeviceLink(DeviceConfig config,
                       std::unique_ptr<DeviceDriver> driver,
                       LinkSettings settings,
                       EventSink* sink)
    : config_(std::move(config)),
      driver_(std::move(driver)),
      settings_(settings),
      sink_(sink) {
    if (!driver_) {
        throw ValidationError("DeviceLink requires a driver");
    }
}

DeviceLink::~DeviceLink() {
    stop();
}

// ============================================================================
// Lifecycle
// ============================================================================

bool DeviceLink::connect(bool enable_live_capture) {
    if (stopped_) {
        return false;
    }

    // Fast path: live session that still answers
    bool connected;
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        connected = driver_->is_connected();
    }
    if (connected) {
        if (probe_ping()) {
            state_ = LinkState::Connected;
            if (enable_live_capture) {
                start_live_capture();
            }
            return true;
        }
        std::cerr << "⚠️ " << utils::device_tag(config_.id) << " session did not answer ping, reconnecting" << std::endl;
        drop_session();
    }

    state_ = LinkState::Connecting;
    const int max_retries = std::max(1, settings_.max_retries);

    for (int attempt = 1; attempt <= max_retries; ++attempt) {
        if (stop_signal_.stop_requested()) {
            break;
        }

        ++connect_attempts_;
        try {
            {
                std::lock_guard<std::mutex> lock(lifecycle_mutex_);
                driver_->connect();
            }
            last_ping_ns_ = steady_now_ns();

            if (stopped_) {
                // stop() raced with this attempt
                drop_session();
                state_ = LinkState::Disconnected;
                return false;
            }

            state_ = LinkState::Connected;
            std::cout << "✅ " << utils::device_tag(config_.id) << " connected to " << config_.name
                      << " (" << config_.ip << ":" << config_.port << ")" << std::endl;

            if (enable_live_capture) {
                start_live_capture();
            }
            return true;
        } catch (const std::exception& e) {
            ErrorCategory category = classify_error(e);
            std::cerr << "⚠️ " << utils::device_tag(config_.id) << " connect attempt " << attempt << "/"
                      << max_retries << " failed: " << e.what() << std::endl;
            if (should_surface(category, ErrorSite::ConnectAttempt)) {
                state_ = LinkState::Disconnected;
                throw;
            }
        }

        if (attempt < max_retries) {
            auto delay = std::min(settings_.base_delay * attempt, settings_.max_delay);
            std::cout << "🔄 " << utils::device_tag(config_.id) << " retrying in "
                      << std::chrono::duration_cast<std::chrono::milliseconds>(delay).count() << "ms" << std::endl;
            if (stop_signal_.wait_for(delay)) {
                break;
            }
        }
    }

    state_ = LinkState::Disconnected;
    std::cerr << "❌ " << utils::device_tag(config_.id) << " could not connect to " << config_.name
              << (stop_signal_.stop_requested() ? " (stopped)" : "") << std::endl;
    return false;
}

bool DeviceLink::is_healthy() {
    if (stopped_) {
        return false;
    }

    try {
        // ping() runs unlocked; stop() must not wait on it
        std::chrono::steady_clock::time_point last_packet;
        {
            std::lock_guard<std::mutex> lock(lifecycle_mutex_);
            last_health_check_ns_ = steady_now_ns();

            if (!driver_->is_connected()) {
                return false;
            }
            if (!reader_ || !reader_->is_running()) {
                return false;
            }
            last_packet = reader_->last_packet_time();
        }

        auto last_seen = std::max(
            std::chrono::steady_clock::time_point(std::chrono::nanoseconds(last_ping_ns_.load())),
            last_packet);
        if (std::chrono::steady_clock::now() - last_seen > settings_.ping_interval * 3) {
            std::cerr << "⚠️ " << utils::device_tag(config_.id) << " no ping or packet within "
                      << std::chrono::duration_cast<std::chrono::seconds>(settings_.ping_interval * 3).count()
                      << "s" << std::endl;
            state_ = LinkState::Degraded;
            return false;
        }

        if (!driver_->ping()) {
            state_ = LinkState::Degraded;
            return false;
        }
        if (stopped_) {
            return false;
        }
        last_ping_ns_ = steady_now_ns();
        state_ = LinkState::Connected;
        return true;
    } catch (const std::exception& e) {
        if (should_surface(classify_error(e), ErrorSite::HealthProbe)) {
            throw;
        }
        std::cerr << "⚠️ " << utils::device_tag(config_.id) << " health probe failed: " << e.what() << std::endl;
        state_ = LinkState::Degraded;
        return false;
    }
}

void DeviceLink::request_stop() {
    stop_signal_.request_stop();
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (reader_) {
        reader_->request_stop();
    }
}

void DeviceLink::stop() {
    if (stopped_.exchange(true)) {
        return;
    }

    request_stop();
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (reader_) {
            reader_->stop(settings_.stop_timeout);
        }
    }
    drop_session();
    state_ = LinkState::Disconnected;
    std::cout << "🔌 " << utils::device_tag(config_.id) << " link stopped" << std::endl;
}

bool DeviceLink::live_capture_running() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return reader_ && reader_->is_running();
}

void DeviceLink::start_live_capture() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (stopped_) {
        return;
    }
    if (!reader_) {
        reader_ = std::make_unique<LiveEventReader>(config_, *driver_, sink_, settings_.read_timeout);
    }
    if (!reader_->start()) {
        state_ = LinkState::Degraded;
    }
}

void DeviceLink::drop_session() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (reader_ && reader_->is_running()) {
        reader_->stop(settings_.stop_timeout);
    }
    try {
        if (driver_->is_connected()) {
            driver_->disconnect();
        }
    } catch (const std::exception& e) {
        std::cerr << "⚠️ " << utils::device_tag(config_.id) << " disconnect failed: " << e.what() << std::endl;
    }
}

bool DeviceLink::probe_ping() {
    try {
        if (driver_->ping()) {
            last_ping_ns_ = steady_now_ns();
            return true;
        }
    } catch (const std::exception& e) {
        std::cerr << "⚠️ " << utils::device_tag(config_.id) << " ping failed: " << e.what() << std::endl;
    }
    return false;
}

void DeviceLink::ensure_connected() {
    if (!connect(false)) {
        throw DeviceOfflineError("device " + std::to_string(config_.id) + " (" + config_.name + ") is offline");
    }
}

std::optional<DeviceUser> DeviceLink::find_user(const std::string& user_id) {
    for (auto& user : driver_->get_users()) {
        if (user.user_id == user_id) {
            return user;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Commands
// ============================================================================

void DeviceLink::create_user(int user_id,
                             const std::string& name,
                             int privilege,
                             const std::string& password,
                             const std::string& group_id,
                             uint32_t card) {
    std::lock_guard<std::mutex> lock(command_mutex_);
    ensure_connected();
    DisabledScope scope(*this);

    DeviceUser user;
    user.uid = user_id;
    user.user_id = std::to_string(user_id);
    user.name = name;
    user.privilege = privilege;
    user.password = password;
    user.group_id = group_id;
    user.card = card;
    driver_->set_user(user);
    std::cout << "✅ " << utils::device_tag(config_.id) << " user created: user_id=" << user_id << std::endl;
}

std::vector<DeviceUser> DeviceLink::get_all_users() {
    std::lock_guard<std::mutex> lock(command_mutex_);
    ensure_connected();
    DisabledScope scope(*this);
    return driver_->get_users();
}

std::optional<DeviceUser> DeviceLink::get_user(int user_id) {
    std::lock_guard<std::mutex> lock(command_mutex_);
    ensure_connected();
    DisabledScope scope(*this);
    return find_user(std::to_string(user_id));
}

bool DeviceLink::user_exists(int user_id) {
    return get_user(user_id).has_value();
}

void DeviceLink::delete_user(int user_id) {
    std::lock_guard<std::mutex> lock(command_mutex_);
    ensure_connected();
    DisabledScope scope(*this);
    driver_->delete_user(user_id, std::to_string(user_id));
    std::cout << "✅ " << utils::device_tag(config_.id) << " user deleted: user_id=" << user_id << std::endl;
}

void DeviceLink::enroll_user(int user_id, int finger_index) {
    std::lock_guard<std::mutex> lock(command_mutex_);
    ensure_connected();
    DisabledScope scope(*this);
    driver_->enroll_user(user_id, finger_index, std::to_string(user_id));
    std::cout << "👆 " << utils::device_tag(config_.id) << " enrollment started: user_id=" << user_id
              << ", finger=" << finger_index << std::endl;
}

void DeviceLink::cancel_enroll_user() {
    std::lock_guard<std::mutex> lock(command_mutex_);
    ensure_connected();
    {
        std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
        if (reader_) {
            reader_->end_capture();
        }
    }
    DisabledScope scope(*this);
    driver_->cancel_capture();
    std::cout << "🛑 " << utils::device_tag(config_.id) << " enrollment cancelled" << std::endl;
}

void DeviceLink::delete_user_template(int user_id, int finger_index) {
    std::lock_guard<std::mutex> lock(command_mutex_);
    ensure_connected();
    DisabledScope scope(*this);
    driver_->delete_user_template(user_id, finger_index, std::to_string(user_id));
    std::cout << "✅ " << utils::device_tag(config_.id) << " template deleted: user_id=" << user_id
              << ", finger=" << finger_index << std::endl;
}

std::optional<FingerTemplate> DeviceLink::get_user_template(int user_id, int finger_index) {
    std::lock_guard<std::mutex> lock(command_mutex_);
    ensure_connected();
    DisabledScope scope(*this);
    auto finger = driver_->get_user_template(user_id, finger_index);
    if (!finger) {
        std::cerr << "⚠️ " << utils::device_tag(config_.id) << " no template for user_id=" << user_id
                  << ", finger=" << finger_index << std::endl;
    }
    return finger;
}

bool DeviceLink::set_user_template(int user_id, int finger_index, const std::vector<uint8_t>& data) {
    validate_template_size(data.size());

    std::lock_guard<std::mutex> lock(command_mutex_);
    ensure_connected();
    DisabledScope scope(*this);

    const std::string external_id = std::to_string(user_id);
    auto user = find_user(external_id);
    if (!user) {
        DeviceUser placeholder;
        placeholder.uid = user_id;
        placeholder.user_id = external_id;
        placeholder.name = "user_" + external_id;
        driver_->set_user(placeholder);
        std::cout << "👤 " << utils::device_tag(config_.id) << " created placeholder user " << external_id << std::endl;
        user = find_user(external_id);
    }
    if (!user) {
        throw DriverError("user " + external_id + " not found on device after creation");
    }

    FingerTemplate finger;
    finger.uid = user->uid;
    finger.finger_index = finger_index;
    finger.valid = true;
    finger.data = data;
    driver_->save_user_template(*user, finger);

    std::cout << "✅ " << utils::device_tag(config_.id) << " template restored: user_id=" << user_id
              << ", finger=" << finger_index << ", size=" << data.size() << std::endl;
    return true;
}

std::vector<AttendanceRecord> DeviceLink::get_attendance(std::optional<std::time_t> from,
                                                         std::optional<std::time_t> to) {
    std::lock_guard<std::mutex> lock(command_mutex_);
    ensure_connected();
    DisabledScope scope(*this);

    auto records = driver_->get_attendance();
    if (from || to) {
        records.erase(std::remove_if(records.begin(), records.end(), [&](const AttendanceRecord& r) {
            return (from && r.timestamp < *from) || (to && r.timestamp > *to);
        }), records.end());
    }
    std::cout << "📋 " << utils::device_tag(config_.id) << " retrieved " << records.size()
              << " attendance records" << std::endl;
    return records;
}

nlohmann::json DeviceLink::get_device_info() {
    std::lock_guard<std::mutex> lock(command_mutex_);
    ensure_connected();

    nlohmann::json info;
    info["device_name"] = driver_->get_device_name();
    info["firmware_version"] = driver_->get_firmware_version();
    info["platform"] = driver_->get_platform();
    info["serial_number"] = driver_->get_serial_number();
    info["device_time"] = utils::format_device_time(driver_->get_time());
    info["users_count"] = driver_->get_users().size();
    info["templates_count"] = driver_->get_templates().size();
    return info;
}

nlohmann::json DeviceLink::get_device_status() {
    std::lock_guard<std::mutex> lock(command_mutex_);
    ensure_connected();
    DisabledScope scope(*this);

    return nlohmann::json{
        {"status", "online"},
        {"users_count", driver_->get_users().size()}
    };
}

nlohmann::json DeviceLink::invoke(const std::string& operation, const nlohmann::json& args) {
    if (operation == "create_user") {
        int user_id = require_int(args, "user_id");
        if (user_exists(user_id)) {
            throw ValidationError("user " + std::to_string(user_id) + " already exists");
        }
        create_user(user_id,
                    optional_string(args, "name", ""),
                    optional_int(args, "privilege", USER_DEFAULT),
                    optional_string(args, "password", ""),
                    optional_string(args, "group_id", ""),
                    static_cast<uint32_t>(optional_int(args, "card", 0)));
        return nullptr;
    }
    if (operation == "get_all_users") {
        return get_all_users();
    }
    if (operation == "get_user") {
        auto user = get_user(require_int(args, "user_id"));
        return user ? nlohmann::json(*user) : nlohmann::json(nullptr);
    }
    if (operation == "user_exists") {
        return user_exists(require_int(args, "user_id"));
    }
    if (operation == "delete_user") {
        delete_user(require_int(args, "user_id"));
        return nullptr;
    }
    if (operation == "enroll_user") {
        enroll_user(require_int(args, "user_id"), require_int(args, "temp_id"));
        return nullptr;
    }
    if (operation == "cancel_enroll_user") {
        cancel_enroll_user();
        return nullptr;
    }
    if (operation == "delete_user_template") {
        delete_user_template(require_int(args, "user_id"), require_int(args, "temp_id"));
        return nullptr;
    }
    if (operation == "get_user_template") {
        auto finger = get_user_template(require_int(args, "user_id"), require_int(args, "temp_id"));
        return finger ? nlohmann::json(*finger) : nlohmann::json(nullptr);
    }
    if (operation == "set_user_template") {
        int user_id = require_int(args, "user_id");
        int temp_id = require_int(args, "temp_id");
        const auto& encoded = require_arg(args, "template");
        if (!encoded.is_string()) {
            throw ValidationError("argument 'template' must be a base64 string");
        }
        return set_user_template(user_id, temp_id, utils::base64_decode(encoded.get<std::string>()));
    }
    if (operation == "get_attendance") {
        auto from = optional_date(args, "from");
        auto to = optional_date(args, "to");
        if (to) {
            *to += END_OF_DAY;
        }
        return get_attendance(from, to);
    }
    if (operation == "get_device_info") {
        return get_device_info();
    }
    if (operation == "get_device_status") {
        return get_device_status();
    }
    throw UnknownOperationError("operation '" + operation + "' not supported");
}

} // namespace zkfleet
