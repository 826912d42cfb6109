// Copyright (c) 2025 LiveScribe
// TranscriptionController - chunked real-time transcription
//
// Audio Thread (non-blocking):
//   - add_audio() called from the device callback
//   - Copies samples into an AudioFrame and pushes it to the IngressQueue
//   - A full queue drops the frame (counted, warned); it never waits
//
// Processing Thread (background):
//   - Pops frames with a 500ms timeout so the stop token is seen promptly
//   - ChunkAssembler fills the interim window and the overlapping chunk window
//   - Every emitted block goes through TranscriptionWorker in order
//   - Stop is checked after each pop and after each block, never mid-block
//
// Shutdown:
//   - request_stop() from Ctrl+C, a fatal device error or end of input
//   - stop() closes the queue, joins the thread within join_timeout and
//     hands all finalized results to on_flush exactly once

#include "core/transcription_controller.hpp"
#include "audio/chunk_assembler.hpp"
#include "audio/ingress_queue.hpp"
#include "core/cancellation.hpp"
#include "core/logging.hpp"

#include <future>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace core {

namespace {

// Everything the processing thread touches. Shared so that a processing thread
// abandoned at shutdown never outlives the objects it uses.
struct PipelineContext {
    using ResultCallback = TranscriptionController::ResultCallback;

    PipelineContext(const TranscriptionController::Config& cfg, std::unique_ptr<asr::IRecognizer> model)
        : config(cfg)
        , queue(cfg.pipeline.queue_capacity, cfg.pipeline.overflow_policy)
        , recognizer(std::move(model))
        , assembler(cfg.pipeline)
        , worker(*recognizer, transcript, cfg.recognizer, cfg.pipeline.rebase_timestamps) {}

    TranscriptionController::Config config;
    audio::IngressQueue queue;
    CancellationToken stop;
    SharedTranscript transcript;
    std::unique_ptr<asr::IRecognizer> recognizer;

    // Processing thread only
    audio::ChunkAssembler assembler;
    TranscriptionWorker worker;

    // Owner's result callback. Cleared once the processing thread is abandoned,
    // after which an in-flight block finishes without reporting.
    std::mutex callback_mutex;
    ResultCallback on_result;

    void deliver(const WorkerReport& report) {
        std::lock_guard<std::mutex> lock(callback_mutex);
        if (on_result) {
            on_result(report);
        }
    }

    void disconnect() {
        std::lock_guard<std::mutex> lock(callback_mutex);
        on_result = nullptr;
    }

    std::atomic<uint64_t> next_sequence{0};
    std::atomic<size_t> frames_received{0};

    mutable std::mutex metrics_mutex;
    size_t interim_blocks = 0;
    size_t full_chunks = 0;
    size_t malformed_results = 0;
    size_t frames_rejected = 0;
    double model_time_s = 0.0;
    double audio_time_s = 0.0;
};

constexpr size_t kDropWarningInterval = 50;

void processing_loop(std::shared_ptr<PipelineContext> ctx, std::promise<void> done) {
    const auto timeout = ctx->config.pipeline.pop_timeout;

    while (!ctx->stop.stop_requested()) {
        audio::AudioFrame frame;
        auto popped = ctx->queue.pop_for(frame, timeout);
        if (popped == audio::IngressQueue::PopResult::Timeout) {
            continue;   // no audio yet; look at the stop token again
        }
        if (popped == audio::IngressQueue::PopResult::Closed) {
            break;
        }
        if (ctx->stop.stop_requested()) {
            break;
        }

        try {
            auto emissions = ctx->assembler.push(frame);
            {
                std::lock_guard<std::mutex> lock(ctx->metrics_mutex);
                ctx->frames_rejected = ctx->assembler.rejected_frames();
            }
            for (const auto& emission : emissions) {
                WorkerReport report = ctx->worker.process(emission);
                {
                    std::lock_guard<std::mutex> lock(ctx->metrics_mutex);
                    if (report.status == WorkerReport::Status::Malformed) {
                        ctx->malformed_results++;
                    } else if (report.kind == audio::EmissionKind::Full) {
                        ctx->full_chunks++;
                    } else {
                        ctx->interim_blocks++;
                    }
                    ctx->model_time_s += report.processing_time_s;
                    ctx->audio_time_s += emission.duration_s;
                }
                if (ctx->stop.stop_requested()) {
                    break;
                }
            }
        } catch (const std::exception& e) {
            log_error(std::string("Error in audio processing: ") + e.what());
        }
    }

    log_debug("Processing thread finished");
    done.set_value();
}

} // namespace

/**
 * @brief Internal implementation of TranscriptionController (PIMPL pattern)
 */
class TranscriptionController::Impl {
public:
    std::shared_ptr<PipelineContext> ctx;
    std::unique_ptr<ShutdownCoordinator> coordinator;

    std::thread processing_thread;
    std::shared_future<void> processing_done;
    std::atomic<bool> running{false};

    void status(const std::string& message, bool is_error) const {
        if (ctx && ctx->config.on_status) {
            ctx->config.on_status(message, is_error);
        } else if (is_error) {
            log_error(message);
        } else {
            log_info(message);
        }
    }
};

// =============================================================================
// Public API Implementation
// =============================================================================

TranscriptionController::TranscriptionController()
    : impl_(std::make_unique<Impl>()) {
}

TranscriptionController::~TranscriptionController() {
    if (impl_->running.load()) {
        stop();
    }
}

bool TranscriptionController::initialize(const Config& config, std::unique_ptr<asr::IRecognizer> recognizer) {
    if (impl_->ctx) return false;
    if (!recognizer) {
        impl_->status("No recognition model supplied", true);
        return false;
    }

    try {
        validate(config.pipeline);
        impl_->ctx = std::make_shared<PipelineContext>(config, std::move(recognizer));
    } catch (const std::exception& e) {
        if (config.on_status) {
            config.on_status(std::string("Invalid configuration: ") + e.what(), true);
        } else {
            log_error(std::string("Invalid configuration: ") + e.what());
        }
        return false;
    }

    PipelineContext* ctx = impl_->ctx.get();
    ctx->on_result = config.on_result;
    ctx->worker.set_on_result([ctx](const WorkerReport& report) { ctx->deliver(report); });
    impl_->coordinator = std::make_unique<ShutdownCoordinator>(impl_->ctx->stop, config.pipeline.join_timeout);

    impl_->status("Transcription controller initialized (" + describe(config.pipeline) + ")", false);
    return true;
}

bool TranscriptionController::start() {
    if (!impl_->ctx || impl_->running.load()) return false;
    if (impl_->coordinator->state() != PipelineState::Running) return false;

    std::promise<void> done;
    impl_->processing_done = done.get_future().share();
    impl_->running.store(true);
    impl_->processing_thread = std::thread(processing_loop, impl_->ctx, std::move(done));

    impl_->status("Transcription started", false);
    return true;
}

void TranscriptionController::add_audio(const float* samples, size_t sample_count, int sample_rate, int channels) {
    auto& ctx = impl_->ctx;
    if (!ctx || !samples || sample_count == 0) return;
    if (ctx->stop.stop_requested()) return;

    audio::AudioFrame frame;
    frame.samples.assign(samples, samples + sample_count);
    frame.channels = channels;
    frame.sample_rate = sample_rate;
    frame.sequence = ctx->next_sequence.fetch_add(1);
    ctx->frames_received.fetch_add(1);

    auto pushed = ctx->queue.push(std::move(frame));
    if (pushed == audio::IngressQueue::PushResult::DroppedNewest ||
        pushed == audio::IngressQueue::PushResult::DroppedOldest) {
        size_t dropped = ctx->queue.dropped_count();
        if (dropped == 1 || dropped % kDropWarningInterval == 0) {
            log_warn("Audio queue is full, dropping data! (" + std::to_string(dropped) + " frames lost)");
        }
    }
}

void TranscriptionController::on_device_error(const std::string& message, bool is_fatal) {
    if (!is_fatal) {
        log_warn("Audio status: " + message);
        return;
    }
    impl_->status("Audio device failed: " + message, true);
    request_stop(StopReason::CaptureFatal);
}

bool TranscriptionController::request_stop(StopReason reason) {
    if (!impl_->coordinator) return false;
    bool first = impl_->coordinator->request_stop(reason);
    if (first) {
        impl_->ctx->queue.close();
    }
    return first;
}

bool TranscriptionController::stop_requested() const {
    return impl_->ctx && impl_->ctx->stop.stop_requested();
}

bool TranscriptionController::wait_for_stop_request(std::chrono::milliseconds timeout) const {
    if (!impl_->ctx) return true;
    return impl_->ctx->stop.wait_for(timeout);
}

bool TranscriptionController::stop() {
    if (!impl_->coordinator) return true;

    request_stop(StopReason::EndOfStream);

    auto ctx = impl_->ctx;
    bool joined = impl_->coordinator->finish(impl_->processing_thread, impl_->processing_done, [ctx] {
        if (ctx->config.on_flush) {
            ctx->config.on_flush(ctx->transcript.all_results());
        }
    });
    if (!joined) {
        ctx->disconnect();
    }
    if (impl_->running.exchange(false)) {
        impl_->status("Transcription stopped", false);
    }
    return joined;
}

PipelineState TranscriptionController::state() const {
    return impl_->coordinator ? impl_->coordinator->state() : PipelineState::Running;
}

StopReason TranscriptionController::stop_reason() const {
    return impl_->coordinator ? impl_->coordinator->reason() : StopReason::None;
}

TranscriptionState TranscriptionController::snapshot() const {
    if (!impl_->ctx) return {};
    return impl_->ctx->transcript.snapshot();
}

TranscriptionController::PerformanceMetrics TranscriptionController::get_performance_metrics() const {
    PerformanceMetrics metrics;
    auto& ctx = impl_->ctx;
    if (!ctx) return metrics;

    metrics.frames_received = ctx->frames_received.load();
    metrics.frames_dropped = ctx->queue.dropped_count();

    std::lock_guard<std::mutex> lock(ctx->metrics_mutex);
    metrics.model_time_s = ctx->model_time_s;
    metrics.audio_time_s = ctx->audio_time_s;
    metrics.realtime_factor = ctx->audio_time_s > 0.0 ? ctx->model_time_s / ctx->audio_time_s : 0.0;
    metrics.frames_rejected = ctx->frames_rejected;
    metrics.interim_blocks = ctx->interim_blocks;
    metrics.full_chunks = ctx->full_chunks;
    metrics.malformed_results = ctx->malformed_results;
    return metrics;
}

}
