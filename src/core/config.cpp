#include "core/config.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace core {

namespace {
constexpr int kMaxSampleRate = 384000;
constexpr double kMaxWindowSeconds = 3600.0;

size_t seconds_to_frames(double seconds, int sample_rate) {
    if (!(seconds > 0.0) || sample_rate <= 0) return 0;
    return static_cast<size_t>(std::min(seconds, kMaxWindowSeconds) * sample_rate);
}

// Window durations are limited to one hour
void check_window(const char* name, double seconds, bool allow_zero) {
    if (!std::isfinite(seconds) || seconds < 0.0 || (!allow_zero && seconds == 0.0)) {
        throw std::invalid_argument(std::string(name) + (allow_zero ? " duration must not be negative"
                                                                   : " duration must be positive"));
    }
    if (seconds > kMaxWindowSeconds) {
        std::ostringstream oss;
        oss << name << " duration " << seconds << "s exceeds the " << kMaxWindowSeconds << "s limit";
        throw std::invalid_argument(oss.str());
    }
}
}

size_t PipelineConfig::buffer_frames() const { return seconds_to_frames(buffer_duration_s, sample_rate); }
size_t PipelineConfig::chunk_frames() const { return seconds_to_frames(chunk_duration_s, sample_rate); }
size_t PipelineConfig::overlap_frames() const { return seconds_to_frames(overlap_duration_s, sample_rate); }

void validate(const PipelineConfig& config) {
    if (config.sample_rate <= 0 || config.sample_rate > kMaxSampleRate) {
        throw std::invalid_argument("sample rate must be between 1 and " + std::to_string(kMaxSampleRate) + " Hz");
    }
    if (config.channels <= 0) {
        throw std::invalid_argument("channel count must be positive");
    }
    check_window("buffer", config.buffer_duration_s, false);
    if (config.buffer_frames() == 0) {
        throw std::invalid_argument("buffer duration must be positive");
    }
    if (config.queue_capacity == 0) {
        throw std::invalid_argument("queue capacity must be at least 1");
    }
    if (config.pop_timeout.count() <= 0 || config.join_timeout.count() <= 0) {
        throw std::invalid_argument("timeouts must be positive");
    }
    if (!config.enable_chunking) return;

    check_window("chunk", config.chunk_duration_s, false);
    check_window("overlap", config.overlap_duration_s, true);
    if (config.chunk_frames() == 0) {
        throw std::invalid_argument("chunk duration must be positive");
    }
    if (config.overlap_frames() >= config.chunk_frames()) {
        std::ostringstream oss;
        oss << "overlap (" << config.overlap_duration_s << "s) must be shorter than the chunk ("
            << config.chunk_duration_s << "s)";
        throw std::invalid_argument(oss.str());
    }
}

std::string describe(const PipelineConfig& config) {
    std::ostringstream oss;
    oss << config.sample_rate << " Hz, " << config.channels << "ch, interim "
        << config.buffer_duration_s << "s";
    if (config.enable_chunking) {
        oss << ", chunk " << config.chunk_duration_s << "s / overlap " << config.overlap_duration_s << "s";
    } else {
        oss << ", chunking off";
    }
    oss << ", queue " << config.queue_capacity
        << (config.overflow_policy == OverflowPolicy::DropOldest ? " (drop-oldest)" : " (drop-newest)");
    return oss.str();
}

}
