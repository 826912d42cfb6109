// Copyright (c) 2025 LiveScribe
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "asr/aligned_result.hpp"
#include "asr/recognizer.hpp"
#include "core/config.hpp"
#include "core/shutdown_coordinator.hpp"
#include "core/transcript_state.hpp"
#include "core/transcription_worker.hpp"

namespace core {

/**
 * @brief Controller for real-time chunked transcription
 *
 * Audio thread: add_audio() copies the samples into a frame and pushes it to
 * the ingress queue. It never waits for processing.
 *
 * Processing thread: pops frames, feeds the chunk assembler and runs the
 * transcription worker on every emitted block, one at a time, in order.
 *
 * stop() drives the shutdown coordinator: bounded join of the processing
 * thread, then exactly one call of on_flush with all finalized results.
 */
class TranscriptionController {
public:
    using ResultCallback = TranscriptionWorker::ResultCallback;

    /// Receives every finalized result once, at shutdown
    using FlushCallback = std::function<void(const std::vector<asr::AlignedResult>&)>;

    /**
     * @brief Callback for status updates
     * @param message Status message
     * @param is_error True if this is an error message
     */
    using StatusCallback = std::function<void(const std::string& message, bool is_error)>;

    struct Config {
        PipelineConfig pipeline;
        asr::RecognizerOptions recognizer;

        ResultCallback on_result;   ///< Called on the processing thread for every recorded block
        FlushCallback on_flush;     ///< Called once when the pipeline stops
        StatusCallback on_status;   ///< Called for status messages
    };

    struct PerformanceMetrics {
        double realtime_factor = 0.0;   ///< <1.0 = faster than realtime
        double model_time_s = 0.0;      ///< Total model processing time
        double audio_time_s = 0.0;      ///< Audio submitted to the model
        size_t frames_received = 0;
        size_t frames_dropped = 0;      ///< Lost to a full ingress queue
        size_t frames_rejected = 0;     ///< Wrong channel count
        size_t interim_blocks = 0;
        size_t full_chunks = 0;
        size_t malformed_results = 0;
    };

    TranscriptionController();
    ~TranscriptionController();

    TranscriptionController(const TranscriptionController&) = delete;
    TranscriptionController& operator=(const TranscriptionController&) = delete;

    /**
     * @brief Validate the configuration and take ownership of the model
     * @return false if the configuration is invalid (reported via on_status)
     */
    bool initialize(const Config& config, std::unique_ptr<asr::IRecognizer> recognizer);

    /// Start the processing thread
    bool start();

    /**
     * @brief Producer side, called from the device callback thread
     * @param samples Interleaved float samples
     * @param sample_count Number of samples (frames * channels)
     */
    void add_audio(const float* samples, size_t sample_count, int sample_rate, int channels);

    /// Device error callback: warnings are logged, fatal errors stop the pipeline
    void on_device_error(const std::string& message, bool is_fatal);

    bool request_stop(StopReason reason);
    bool stop_requested() const;
    bool wait_for_stop_request(std::chrono::milliseconds timeout) const;

    /**
     * @brief Stop processing and flush the transcript
     * @return false if the processing thread had to be abandoned; on_result is
     *         not called again after that
     */
    bool stop();

    PipelineState state() const;
    StopReason stop_reason() const;

    TranscriptionState snapshot() const;
    PerformanceMetrics get_performance_metrics() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}
