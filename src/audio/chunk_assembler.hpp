#pragma once
#include <cstdint>
#include <vector>

#include "audio/audio_frame.hpp"
#include "core/config.hpp"

namespace audio {

enum class EmissionKind {
    Interim,   ///< short, non-overlapping segment for low-latency display
    Full       ///< long chunk with overlap carry, retained as final output
};

const char* to_string(EmissionKind kind);

/**
 * @brief A block of audio ready for recognition
 */
struct ChunkEmission {
    EmissionKind kind = EmissionKind::Interim;
    std::vector<float> samples;   ///< interleaved, `channels` per frame
    int channels = 1;
    int sample_rate = 16000;
    double start_s = 0.0;         ///< session audio time of the first frame
    double duration_s = 0.0;
    uint64_t index = 0;           ///< per-kind emission counter, starting at 0

    size_t frame_count() const {
        return channels > 0 ? samples.size() / static_cast<size_t>(channels) : 0;
    }
};

/**
 * @brief Turns a stream of arbitrary-length frames into fixed-size blocks
 *
 * Two windows are filled from the same input:
 * - short buffer: `buffer_frames` long, emitted as INTERIM and cleared
 * - long buffer: `chunk_frames` long, emitted as FULL, keeps the last
 *   `overlap_frames` as the start of the next chunk
 *
 * Owned by the processing thread. Not thread-safe.
 */
class ChunkAssembler {
public:
    /// Throws std::invalid_argument on an unusable configuration
    explicit ChunkAssembler(const core::PipelineConfig& config);

    /**
     * @brief Append one frame and return what became ready
     *
     * Frames at a different sample rate are resampled first. Frames with a
     * different channel count are rejected (see rejected_frames()).
     * When both windows fill on the same frame the INTERIM emission comes first.
     * Frames no longer than the short window yield at most one of each kind.
     */
    std::vector<ChunkEmission> push(const AudioFrame& frame);

    size_t short_buffered_frames() const;
    size_t long_buffered_frames() const;

    size_t buffer_frames() const { return buffer_frames_; }
    size_t chunk_frames() const { return chunk_frames_; }
    size_t overlap_frames() const { return overlap_frames_; }
    bool chunking_enabled() const { return chunking_; }

    uint64_t rejected_frames() const { return rejected_frames_; }
    uint64_t frames_consumed() const { return frames_consumed_; }

private:
    ChunkEmission slice(std::vector<float>& buffer, size_t frames, size_t keep_from,
                        EmissionKind kind, uint64_t index, uint64_t origin_frame) const;

    const int sample_rate_;
    const int channels_;
    const bool chunking_;
    const size_t buffer_frames_;
    const size_t chunk_frames_;
    const size_t overlap_frames_;

    std::vector<float> short_buffer_;
    std::vector<float> long_buffer_;
    uint64_t short_origin_ = 0;   // session frame index of short_buffer_[0]
    uint64_t long_origin_ = 0;    // session frame index of long_buffer_[0]
    uint64_t interim_count_ = 0;
    uint64_t full_count_ = 0;
    uint64_t rejected_frames_ = 0;
    uint64_t frames_consumed_ = 0;
};

}
