#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace blockshare {

/**
 * Shared cancellation flag handed to every long-running loop.
 * Sleeps go through wait_for() so that request_stop() wakes them at once.
 */
class StopToken {
public:
    StopToken() : stopped_(false) {}

    StopToken(const StopToken&) = delete;
    StopToken& operator=(const StopToken&) = delete;

    void request_stop();

    bool stop_requested() const { return stopped_.load(); }

    /**
     * Sleep for up to duration, returning early on stop
     * @return true if a stop was requested
     */
    template <typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& duration) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, duration, [this] { return stopped_.load(); });
    }

    /**
     * Block until a stop is requested
     */
    void wait();

private:
    std::atomic<bool> stopped_;
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace blockshare
