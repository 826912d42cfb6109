#pragma once
#include <chrono>
#include <cstddef>
#include <string>

namespace core {

/// What the ingress queue does when a frame arrives and it is full
enum class OverflowPolicy {
    DropNewest,   ///< discard the arriving frame
    DropOldest    ///< discard the oldest queued frame to make room
};

/**
 * @brief Parameters of the capture -> chunking -> recognition pipeline
 *
 * Durations are in seconds of audio. Sample counts are derived from them
 * and are counted in frames (one sample per channel).
 */
struct PipelineConfig {
    int sample_rate = 16000;
    int channels = 1;

    double buffer_duration_s = 5.0;    ///< interim segment length
    double chunk_duration_s = 20.0;    ///< full chunk length
    double overlap_duration_s = 4.0;   ///< carry kept between full chunks
    bool enable_chunking = true;

    size_t queue_capacity = 500;
    OverflowPolicy overflow_policy = OverflowPolicy::DropNewest;
    std::chrono::milliseconds pop_timeout{500};
    std::chrono::milliseconds join_timeout{2000};

    bool rebase_timestamps = true;

    size_t buffer_frames() const;
    size_t chunk_frames() const;
    size_t overlap_frames() const;
};

/// Throws std::invalid_argument when the configuration cannot be used.
void validate(const PipelineConfig& config);

std::string describe(const PipelineConfig& config);

}
