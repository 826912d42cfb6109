#pragma once
#include <cstddef>
#include <vector>

namespace audio {

// Linear interpolation resampler for interleaved float audio.
// Returns the input unchanged when the rates already match.
std::vector<float> resample_linear(const std::vector<float>& in, int channels, int in_hz, int out_hz);

}
