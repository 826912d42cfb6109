#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace audio {

// WAV-backed capture that simulates a microphone by returning fixed-length chunks
class FileCapture {
public:
    bool start_from_wav(const std::string& path);
    void stop();
    // Rewind to the first sample without re-reading the file
    void rewind() { cursor_ = 0; }
    int sample_rate() const { return sample_rate_; }
    // Returns the next chunk of mono float frames at the original file sample rate.
    // Empty when no more data.
    std::vector<float> read_chunk(int chunk_ms = 20);

    // Length of the loaded file
    double duration_seconds() const { return duration_seconds_; }

private:
    std::vector<float> mono_; // decoded mono samples in [-1, 1]
    size_t cursor_ = 0;
    int sample_rate_ = 0;
    double duration_seconds_ = 0.0;
};

} // namespace audio
