#include "core/shutdown_coordinator.hpp"
#include "core/logging.hpp"

#include <exception>

namespace core {

const char* to_string(PipelineState state) {
    switch (state) {
    case PipelineState::Running: return "RUNNING";
    case PipelineState::Stopping: return "STOPPING";
    case PipelineState::Stopped: return "STOPPED";
    }
    return "?";
}

const char* to_string(StopReason reason) {
    switch (reason) {
    case StopReason::None: return "none";
    case StopReason::Interrupt: return "interrupt";
    case StopReason::CaptureFatal: return "capture failure";
    case StopReason::EndOfStream: return "end of stream";
    }
    return "?";
}

ShutdownCoordinator::ShutdownCoordinator(CancellationToken& token, std::chrono::milliseconds join_timeout)
    : token_(token), join_timeout_(join_timeout) {}

bool ShutdownCoordinator::request_stop(StopReason reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reason_ != StopReason::None) {
            return false;
        }
        reason_ = reason;
        PipelineState expected = PipelineState::Running;
        state_.compare_exchange_strong(expected, PipelineState::Stopping);
    }
    log_info(std::string("Stopping transcription (") + to_string(reason) + ")");
    token_.request_stop();
    return true;
}

StopReason ShutdownCoordinator::reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_;
}

bool ShutdownCoordinator::finish(std::thread& consumer, std::shared_future<void> consumer_done,
                                 const FlushCallback& flush) {
    // finish() without a prior trigger counts as a normal stop
    request_stop(StopReason::EndOfStream);

    bool joined = true;
    if (consumer.joinable()) {
        if (!consumer_done.valid() ||
            consumer_done.wait_for(join_timeout_) == std::future_status::ready) {
            consumer.join();
        } else {
            joined = false;
            log_warn("Processing thread did not stop within " + std::to_string(join_timeout_.count()) +
                     " ms; continuing shutdown without it");
            consumer.detach();
        }
    }

    std::call_once(flush_once_, [&] {
        if (flush) {
            try {
                flush();
            } catch (const std::exception& e) {
                log_error(std::string("Flushing transcript failed: ") + e.what());
            }
        }
        flushed_.store(true);
    });

    state_.store(PipelineState::Stopped);
    return joined;
}

}
