#include "audio/chunk_assembler.hpp"
#include "audio/resample.hpp"
#include "core/logging.hpp"

#include <sstream>

namespace audio {

const char* to_string(EmissionKind kind) {
    return kind == EmissionKind::Full ? "FULL" : "INTERIM";
}

ChunkAssembler::ChunkAssembler(const core::PipelineConfig& config)
    : sample_rate_(config.sample_rate)
    , channels_(config.channels)
    , chunking_(config.enable_chunking)
    , buffer_frames_(config.buffer_frames())
    , chunk_frames_(config.enable_chunking ? config.chunk_frames() : 0)
    , overlap_frames_(config.enable_chunking ? config.overlap_frames() : 0) {
    core::validate(config);
}

std::vector<ChunkEmission> ChunkAssembler::push(const AudioFrame& frame) {
    std::vector<ChunkEmission> out;
    if (frame.samples.empty()) return out;

    if (frame.channels != channels_) {
        rejected_frames_++;
        std::ostringstream oss;
        oss << "Frame " << frame.sequence << " has " << frame.channels
            << " channels, expected " << channels_ << "; dropped";
        core::log_warn(oss.str());
        return out;
    }

    std::vector<float> resampled;
    const std::vector<float>* samples = &frame.samples;
    if (frame.sample_rate != sample_rate_) {
        resampled = resample_linear(frame.samples, frame.channels, frame.sample_rate, sample_rate_);
        samples = &resampled;
    }
    frames_consumed_ += samples->size() / static_cast<size_t>(channels_);

    short_buffer_.insert(short_buffer_.end(), samples->begin(), samples->end());
    if (chunking_) {
        long_buffer_.insert(long_buffer_.end(), samples->begin(), samples->end());
    }

    // A frame longer than a window can fill it more than once
    while (short_buffered_frames() >= buffer_frames_) {
        out.push_back(slice(short_buffer_, buffer_frames_, buffer_frames_,
                            EmissionKind::Interim, interim_count_++, short_origin_));
        short_origin_ += buffer_frames_;
    }

    while (chunking_ && long_buffered_frames() >= chunk_frames_) {
        // Keep the last overlap_frames of the chunk as the start of the next one
        const size_t advance = chunk_frames_ - overlap_frames_;
        out.push_back(slice(long_buffer_, chunk_frames_, advance,
                            EmissionKind::Full, full_count_++, long_origin_));
        long_origin_ += advance;
    }

    return out;
}

ChunkEmission ChunkAssembler::slice(std::vector<float>& buffer, size_t frames, size_t keep_from,
                                    EmissionKind kind, uint64_t index, uint64_t origin_frame) const {
    const size_t ch = static_cast<size_t>(channels_);

    ChunkEmission emission;
    emission.kind = kind;
    emission.channels = channels_;
    emission.sample_rate = sample_rate_;
    emission.index = index;
    emission.start_s = static_cast<double>(origin_frame) / sample_rate_;
    emission.duration_s = static_cast<double>(frames) / sample_rate_;
    emission.samples.assign(buffer.begin(), buffer.begin() + frames * ch);

    buffer.erase(buffer.begin(), buffer.begin() + keep_from * ch);
    return emission;
}

size_t ChunkAssembler::short_buffered_frames() const {
    return short_buffer_.size() / static_cast<size_t>(channels_);
}

size_t ChunkAssembler::long_buffered_frames() const {
    return long_buffer_.size() / static_cast<size_t>(channels_);
}

}
