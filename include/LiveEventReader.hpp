#pragma once

/**
 * @file LiveEventReader.hpp
 * @brief Per-device live-capture worker
 *
 * Arms the device for event delivery, reads packets off the session socket,
 * acknowledges them and hands decoded punches to an EventSink. One worker
 * thread per device.
 */

#include "DeviceConfig.hpp"
#include "DeviceDriver.hpp"
#include "EventForwarder.hpp"
#include "StopSignal.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace zkfleet {

enum class ReaderState {
    Idle,
    Running,
    Stopping
};

const char* to_string(ReaderState state);

class LiveEventReader {
public:
    /**
     * @param device      identity stamped on every event
     * @param driver      connected driver; must outlive the reader
     * @param sink        event consumer (may be null: events are only logged)
     * @param read_timeout socket timeout so the loop can observe stop requests
     */
    LiveEventReader(const DeviceConfig& device,
                    DeviceDriver& driver,
                    EventSink* sink,
                    std::chrono::milliseconds read_timeout);

    /**
     * @brief Destructor - stops the worker
     */
    ~LiveEventReader();

    LiveEventReader(const LiveEventReader&) = delete;
    LiveEventReader& operator=(const LiveEventReader&) = delete;

    /**
     * @brief Spawn the worker. No-op returning true if already running.
     */
    bool start();

    /**
     * @brief Ask the worker to finish; does not wait
     */
    void request_stop();

    /**
     * @brief Request stop, wait up to @p timeout, then join
     *
     * If the worker misses the deadline the socket is interrupted so the
     * join cannot hang on a blocked read.
     */
    void stop(std::chrono::milliseconds timeout);

    /**
     * @brief Leave capture mode after the current packet (enrollment cancel)
     */
    void end_capture();

    /**
     * @brief Wait until the worker has finished its cleanup
     * @return true if finished within @p timeout
     */
    bool wait_finished(std::chrono::milliseconds timeout);

    bool is_running() const { return alive_; }
    ReaderState state() const { return state_; }

    std::chrono::steady_clock::time_point last_packet_time() const;
    uint64_t packets_received() const { return packets_; }
    uint64_t events_emitted() const { return events_; }

private:
    void capture_loop();
    void arm();
    void disarm();
    void handle_packet(const std::vector<uint8_t>& raw);
    void mark_finished();

    DeviceConfig device_;
    DeviceDriver& driver_;
    EventSink* sink_;
    std::chrono::milliseconds read_timeout_;

    std::mutex lifecycle_mutex_;
    std::unique_ptr<std::thread> worker_;
    StopSignal stop_signal_;
    std::atomic<ReaderState> state_{ReaderState::Idle};
    std::atomic<bool> alive_{false};
    std::atomic<bool> end_capture_{false};

    std::mutex finished_mutex_;
    std::condition_variable finished_cv_;
    bool finished_ = true;

    std::atomic<int64_t> last_packet_ns_{0};
    std::atomic<uint64_t> packets_{0};
    std::atomic<uint64_t> events_{0};
};

} // namespace zkfleet
