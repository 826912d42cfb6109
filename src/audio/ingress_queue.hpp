#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

#include "audio/audio_frame.hpp"
#include "core/config.hpp"

namespace audio {

// Bounded handoff between the capture callback and the processing thread.
// Design: the producer never waits for the consumer. When the queue is full a frame
//         is dropped (the arriving one, or the oldest with DropOldest) and counted.
//         The consumer waits with a timeout so it can look at the stop signal.
class IngressQueue {
public:
    enum class PushResult { Accepted, DroppedNewest, DroppedOldest, Closed };
    enum class PopResult { Item, Timeout, Closed };

    explicit IngressQueue(size_t capacity = 500,
                          core::OverflowPolicy policy = core::OverflowPolicy::DropNewest)
        : capacity_(capacity == 0 ? 1 : capacity), policy_(policy) {}

    // Called from the audio callback thread
    PushResult push(AudioFrame&& frame) {
        PushResult result = PushResult::Accepted;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return PushResult::Closed;
            }
            if (queue_.size() >= capacity_) {
                dropped_count_++;
                if (policy_ == core::OverflowPolicy::DropNewest) {
                    return PushResult::DroppedNewest;
                }
                queue_.pop_front();
                result = PushResult::DroppedOldest;
            }
            queue_.push_back(std::move(frame));
        }
        cv_pop_.notify_one();
        return result;
    }

    // Called from the processing thread. Waits at most `timeout` for a frame.
    template <typename Rep, typename Period>
    PopResult pop_for(AudioFrame& frame, const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_pop_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; })) {
            return PopResult::Timeout;
        }
        if (queue_.empty()) {
            return PopResult::Closed;
        }
        frame = std::move(queue_.front());
        queue_.pop_front();
        return PopResult::Item;
    }

    // No more frames will be accepted; pending ones can still be popped
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_pop_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t capacity() const { return capacity_; }

    size_t dropped_count() const { return dropped_count_.load(); }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_pop_;
    std::deque<AudioFrame> queue_;
    const size_t capacity_;
    const core::OverflowPolicy policy_;
    bool closed_ = false;
    std::atomic<size_t> dropped_count_{0};
};

}
