#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace core {

// Cooperative stop signal shared by the producer and consumer loops.
// Set once, never reset.
class CancellationToken {
public:
    void request_stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_.store(true);
        }
        cv_.notify_all();
    }

    bool stop_requested() const { return stopped_.load(); }

    // Returns true if stop was requested before the timeout elapsed.
    template <typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return stopped_.load(); });
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::atomic<bool> stopped_{false};
};

}
