#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace audio {

// One block of captured audio as delivered by the device callback.
// Samples are interleaved floats in [-1, 1] (nominally; devices may overshoot).
struct AudioFrame {
    std::vector<float> samples;
    int channels = 1;
    int sample_rate = 16000;
    uint64_t sequence = 0;   // arrival order assigned by the producer

    size_t frame_count() const {
        return channels > 0 ? samples.size() / static_cast<size_t>(channels) : 0;
    }
};

}
