#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace zkfleet {

/**
 * @brief One punch seen on a terminal
 */
struct AttendanceEvent {
    std::string subject_id;
    int device_id = 0;
    std::string device_name;
    double observed_at_epoch = 0.0;  // host clock when the packet arrived
};

/** Webhook body: {member_id, device_id, device_name, timestamp} */
void to_json(nlohmann::json& j, const AttendanceEvent& event);

/**
 * @brief Consumer of attendance events
 *
 * forward() is called from device reader threads and must not throw.
 */
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void forward(const AttendanceEvent& event) = 0;
};

/**
 * @brief Posts attendance events to <backend>/check-in
 *
 * Best effort: one attempt per event, failures are logged and dropped.
 */
class EventForwarder : public EventSink {
public:
    explicit EventForwarder(std::string backend_url,
                            std::chrono::milliseconds timeout = std::chrono::seconds(5));

    void forward(const AttendanceEvent& event) override;

    bool is_configured() const { return !endpoint_.empty(); }
    const std::string& endpoint() const { return endpoint_; }

    uint64_t delivered() const { return delivered_; }
    uint64_t failed() const { return failed_; }

private:
    /**
     * @throws DeliveryError on transport failure or a non-2xx status
     */
    void post(const std::string& body);

    std::string endpoint_;
    std::chrono::milliseconds timeout_;
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> failed_{0};
};

} // namespace zkfleet
