#include "LiveEventReader.hpp"
#include "Errors.hpp"
#include "LiveEventParser.hpp"
#include "Utils.hpp"
#include <iostream>
#include <system_error>

namespace zkfleet {

namespace {

constexpr std::chrono::seconds ERROR_PAUSE{1};

int64_t steady_now_ns() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

} // namespace

const char* to_string(ReaderState state) {
    switch (state) {
        case ReaderState::Idle:     return "idle";
        case ReaderState::Running:  return "running";
        case ReaderState::Stopping: return "stopping";
    }
    return "unknown";
}

LiveEventReader::LiveEventReader(const DeviceConfig& device,
                                 DeviceDriver& driver,
                                 EventSink* sink,
                                 std::chrono::milliseconds read_timeout)
    : device_(device), driver_(driver), sink_(sink), read_timeout_(read_timeout) {}

LiveEventReader::~LiveEventReader() {
    stop(std::chrono::seconds(5));
}

bool LiveEventReader::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (alive_ && state_ == ReaderState::Running) {
        return true;
    }

    // A previous run that is still winding down
    if (worker_ && worker_->joinable()) {
        worker_->join();
    }

    stop_signal_.reset();
    end_capture_ = false;
    {
        std::lock_guard<std::mutex> done(finished_mutex_);
        finished_ = false;
    }
    // Give the health check a full window before the first packet
    last_packet_ns_ = steady_now_ns();
    alive_ = true;
    state_ = ReaderState::Running;

    try {
        worker_ = std::make_unique<std::thread>(&LiveEventReader::capture_loop, this);
    } catch (const std::system_error& e) {
        std::cerr << "❌ " << utils::device_tag(device_.id) << " failed to spawn capture thread: "
                  << e.what() << std::endl;
        mark_finished();
        return false;
    }
    return true;
}

void LiveEventReader::request_stop() {
    stop_signal_.request_stop();
    if (alive_) {
        state_ = ReaderState::Stopping;
    }
}

void LiveEventReader::end_capture() {
    end_capture_ = true;
    if (alive_) {
        state_ = ReaderState::Stopping;
    }
}

bool LiveEventReader::wait_finished(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(finished_mutex_);
    return finished_cv_.wait_for(lock, timeout, [this] { return finished_; });
}

void LiveEventReader::stop(std::chrono::milliseconds timeout) {
    request_stop();

    if (!wait_finished(timeout)) {
        std::cerr << "⚠️ " << utils::device_tag(device_.id) << " capture thread did not stop within "
                  << timeout.count() << "ms, interrupting socket" << std::endl;
        driver_.raw_transport().interrupt();
    }

    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (worker_ && worker_->joinable()) {
        worker_->join();
    }
    worker_.reset();
}

std::chrono::steady_clock::time_point LiveEventReader::last_packet_time() const {
    return std::chrono::steady_clock::time_point(std::chrono::nanoseconds(last_packet_ns_.load()));
}

void LiveEventReader::arm() {
    driver_.cancel_capture();
    driver_.verify_user();
    driver_.enable_device();
    driver_.reg_event(EF_ATTLOG);
    driver_.raw_transport().set_timeout(read_timeout_);
}

void LiveEventReader::disarm() {
    try {
        driver_.raw_transport().set_timeout(std::nullopt);
    } catch (const std::exception& e) {
        std::cerr << "⚠️ " << utils::device_tag(device_.id) << " failed to restore socket timeout: "
                  << e.what() << std::endl;
    }

    try {
        driver_.reg_event(0);
    } catch (const std::exception& e) {
        std::cerr << "⚠️ " << utils::device_tag(device_.id) << " failed to deregister events: "
                  << e.what() << std::endl;
    }
}

void LiveEventReader::handle_packet(const std::vector<uint8_t>& raw) {
    auto packet = frame_packet(raw, driver_.is_tcp());
    if (!packet || packet->command != LIVE_EVENT_COMMAND || packet->payload.empty()) {
        return;
    }

    for (const auto& record : parse_records(packet->payload)) {
        if (stop_signal_.stop_requested()) {
            break;
        }

        AttendanceEvent event;
        event.subject_id = record.subject_id;
        event.device_id = device_.id;
        event.device_name = device_.name;
        event.observed_at_epoch = utils::epoch_now();

        std::cout << "👆 " << utils::device_tag(device_.id) << " attendance: member " << record.subject_id
                  << " status=" << static_cast<int>(record.status)
                  << " punch=" << static_cast<int>(record.punch)
                  << " device_time=" << utils::format_device_time(record.device_time) << std::endl;

        ++events_;
        if (sink_) {
            sink_->forward(event);
        }
    }
}

void LiveEventReader::capture_loop() {
    std::cout << "📡 " << utils::device_tag(device_.id) << " live capture started (" << device_.name << ")" << std::endl;

    bool armed = false;
    try {
        arm();
        armed = true;
    } catch (const std::exception& e) {
        std::cerr << "❌ " << utils::device_tag(device_.id) << " failed to arm live capture: " << e.what() << std::endl;
    }

    RawTransport& transport = driver_.raw_transport();
    while (armed && !stop_signal_.stop_requested() && !end_capture_) {
        try {
            auto data = transport.read(LIVE_READ_SIZE);
            if (!data) {
                continue;  // read timeout: idle
            }

            driver_.ack_ok();
            last_packet_ns_ = steady_now_ns();
            ++packets_;
            handle_packet(*data);
        } catch (const std::exception& e) {
            if (stop_signal_.stop_requested()) {
                break;
            }
            ErrorCategory category = classify_error(e);
            if (should_surface(category, ErrorSite::LiveCapture)) {
                std::cerr << "❌ " << utils::device_tag(device_.id) << " live capture aborted: " << e.what() << std::endl;
                break;
            }
            std::cerr << "⚠️ " << utils::device_tag(device_.id) << " live capture error (" << to_string(category)
                      << "): " << e.what() << std::endl;
            stop_signal_.wait_for(ERROR_PAUSE);
        }
    }

    state_ = ReaderState::Stopping;
    disarm();
    mark_finished();
    std::cout << "🛑 " << utils::device_tag(device_.id) << " live capture stopped" << std::endl;
}

void LiveEventReader::mark_finished() {
    state_ = ReaderState::Idle;
    alive_ = false;
    {
        std::lock_guard<std::mutex> lock(finished_mutex_);
        finished_ = true;
    }
    finished_cv_.notify_all();
}

} // namespace zkfleet
