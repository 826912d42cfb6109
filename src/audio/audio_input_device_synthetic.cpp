#include "audio_input_device_synthetic.hpp"
#include <chrono>
#include <thread>
#include <algorithm>

namespace audio {

AudioInputDevice_Synthetic::AudioInputDevice_Synthetic() = default;

AudioInputDevice_Synthetic::~AudioInputDevice_Synthetic() {
    stop();
}

bool AudioInputDevice_Synthetic::initialize(
    const AudioInputConfig& config,
    AudioCallback audio_callback,
    ErrorCallback error_callback
) {
    config_ = config;
    audio_callback_ = audio_callback;
    error_callback_ = error_callback;

    if (config_.synthetic_file_path.empty()) {
        config_.synthetic_file_path = AudioInputFactory::synthetic_path(config.device_id);
    }
    if (config_.synthetic_file_path.empty()) {
        if (error_callback_) {
            error_callback_("Synthetic device requires a WAV file (synthetic:<path>)", true);
        }
        return false;
    }

    if (!file_capture_.start_from_wav(config_.synthetic_file_path)) {
        if (error_callback_) {
            error_callback_("Failed to load WAV file: " + config_.synthetic_file_path, true);
        }
        return false;
    }

    // The file decides the format
    config_.sample_rate = file_capture_.sample_rate();
    config_.channels = 1;
    return true;
}

bool AudioInputDevice_Synthetic::start() {
    if (is_capturing_.load()) {
        return true;  // Already capturing
    }
    if (file_capture_.sample_rate() <= 0) {
        return false;  // not initialized
    }
    if (capture_thread_ && capture_thread_->joinable()) {
        capture_thread_->join();  // previous run reached end of file
    }

    should_stop_.store(false);
    is_capturing_.store(true);

    capture_thread_ = std::make_unique<std::thread>(
        &AudioInputDevice_Synthetic::capture_thread_func, this
    );

    return true;
}

void AudioInputDevice_Synthetic::stop() {
    should_stop_.store(true);

    // The thread may already have ended at end of file; it still has to be joined
    if (capture_thread_ && capture_thread_->joinable()) {
        capture_thread_->join();
    }

    is_capturing_.store(false);
    capture_thread_.reset();
}

void AudioInputDevice_Synthetic::capture_thread_func() {
    auto next_callback_time = std::chrono::steady_clock::now();

    while (!should_stop_.load()) {
        auto chunk = file_capture_.read_chunk(config_.buffer_size_ms);

        if (chunk.empty()) {
            if (config_.synthetic_loop && file_capture_.duration_seconds() > 0.0) {
                file_capture_.rewind();
                continue;
            }
            // End of file, stop capturing
            break;
        }

        if (audio_callback_) {
            audio_callback_(
                chunk.data(),
                chunk.size(),
                file_capture_.sample_rate(),
                1  // FileCapture returns mono
            );
        }

        if (config_.synthetic_realtime) {
            // Sleep based on actual chunk duration (simulate real-time capture)
            double chunk_duration_s = static_cast<double>(chunk.size()) / file_capture_.sample_rate();
            auto chunk_duration = std::chrono::duration<double>(chunk_duration_s);
            next_callback_time += std::chrono::duration_cast<std::chrono::steady_clock::duration>(chunk_duration);
            std::this_thread::sleep_until(next_callback_time);
        }
    }

    is_capturing_.store(false);
}

AudioDeviceInfo AudioInputDevice_Synthetic::get_device_info() const {
    AudioDeviceInfo info;
    info.id = "synthetic:" + config_.synthetic_file_path;
    info.name = "Synthetic Device (File: " + config_.synthetic_file_path + ")";
    info.driver = "Synthetic";
    info.default_sample_rate = file_capture_.sample_rate();
    info.max_channels = 1;  // FileCapture returns mono
    info.is_default = false;
    return info;
}

} // namespace audio
