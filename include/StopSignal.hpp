#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace zkfleet {

/**
 * @brief One-shot cancellation flag with an interruptible wait
 *
 * Used by the connect back-off, the live-capture error pause and the
 * supervisor monitor so that a stop request wakes them immediately instead
 * of letting their timers run out.
 */
class StopSignal {
public:
    void request_stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
        }
        cv_.notify_all();
    }

    bool stop_requested() const {
        return stopped_.load();
    }

    // Returns true if a stop was requested before the timeout elapsed
    template<class Rep, class Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return stopped_.load(); });
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = false;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> stopped_{false};
};

} // namespace zkfleet
