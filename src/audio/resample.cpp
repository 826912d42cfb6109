#include "audio/resample.hpp"
#include <algorithm>
#include <cmath>

namespace audio {

std::vector<float> resample_linear(const std::vector<float>& in, int channels, int in_hz, int out_hz) {
    if (in_hz == out_hz || in_hz <= 0 || out_hz <= 0 || channels <= 0 || in.empty()) {
        return in;
    }
    const size_t ch = static_cast<size_t>(channels);
    const size_t in_frames = in.size() / ch;
    if (in_frames == 0) return {};

    const double ratio = static_cast<double>(out_hz) / static_cast<double>(in_hz);
    const size_t out_frames = static_cast<size_t>(std::llround(in_frames * ratio));
    std::vector<float> out(out_frames * ch);
    for (size_t i = 0; i < out_frames; ++i) {
        double src_pos = i / ratio;
        size_t i0 = std::min(static_cast<size_t>(src_pos), in_frames - 1);
        size_t i1 = std::min(i0 + 1, in_frames - 1);
        double frac = src_pos - static_cast<double>(i0);
        for (size_t c = 0; c < ch; ++c) {
            double v = (1.0 - frac) * in[i0 * ch + c] + frac * in[i1 * ch + c];
            out[i * ch + c] = static_cast<float>(v);
        }
    }
    return out;
}

}
