#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <mutex>
#include <thread>

#include "core/cancellation.hpp"

namespace core {

enum class PipelineState { Running, Stopping, Stopped };

enum class StopReason {
    None,
    Interrupt,      ///< Ctrl+C
    CaptureFatal,   ///< device could not be opened or failed for good
    EndOfStream     ///< finite source (synthetic file) ran out
};

const char* to_string(PipelineState state);
const char* to_string(StopReason reason);

/**
 * @brief Drives RUNNING -> STOPPING -> STOPPED
 *
 * - request_stop(): first call records the reason and sets the token
 * - finish(): waits a bounded time for the consumer, then runs the flush once
 *
 * Both may be called any number of times from any thread.
 */
class ShutdownCoordinator {
public:
    using FlushCallback = std::function<void()>;

    ShutdownCoordinator(CancellationToken& token, std::chrono::milliseconds join_timeout);

    /// @return true if this call moved the pipeline from RUNNING to STOPPING
    bool request_stop(StopReason reason);

    /**
     * @brief Join the consumer (bounded) and flush exactly once
     * @param consumer Consumer thread; detached if it does not finish in time
     * @param consumer_done Becomes ready when the consumer loop has returned
     * @param flush Export callback, invoked on the first call only
     * @return false if the consumer had to be abandoned
     */
    bool finish(std::thread& consumer, std::shared_future<void> consumer_done, const FlushCallback& flush);

    PipelineState state() const { return state_.load(); }
    StopReason reason() const;
    bool flushed() const { return flushed_.load(); }

private:
    CancellationToken& token_;
    const std::chrono::milliseconds join_timeout_;

    std::atomic<PipelineState> state_{PipelineState::Running};
    mutable std::mutex mutex_;
    StopReason reason_ = StopReason::None;
    std::once_flag flush_once_;
    std::atomic<bool> flushed_{false};
};

}
