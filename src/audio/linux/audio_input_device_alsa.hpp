#pragma once

#include "../audio_input_device.hpp"
#include <atomic>
#include <memory>
#include <thread>

typedef struct _snd_pcm snd_pcm_t;

namespace audio {

/**
 * @brief ALSA capture device
 *
 * Opens the PCM as interleaved S16_LE, reads one period per iteration on its
 * own thread and delivers float samples through the audio callback.
 * Overruns are recovered and reported as warnings; a read error that cannot
 * be recovered is reported as fatal and ends capture.
 */
class AudioInputDevice_Alsa : public IAudioInputDevice {
public:
    AudioInputDevice_Alsa();
    ~AudioInputDevice_Alsa() override;

    bool initialize(
        const AudioInputConfig& config,
        AudioCallback audio_callback,
        ErrorCallback error_callback
    ) override;

    bool start() override;
    void stop() override;
    bool is_capturing() const override { return is_capturing_.load(); }
    AudioDeviceInfo get_device_info() const override { return device_info_; }
    AudioInputConfig get_actual_config() const override { return actual_config_; }

    // Platform-specific: enumerate capture PCMs ("default" first, then hw:C,D as plughw:C,D)
    static std::vector<AudioDeviceInfo> enumerate_alsa_devices();

private:
    void capture_thread_func();
    void close_pcm();
    void report(const std::string& message, bool is_fatal);

    AudioInputConfig config_;
    AudioInputConfig actual_config_;
    AudioCallback audio_callback_;
    ErrorCallback error_callback_;

    snd_pcm_t* handle_ = nullptr;
    size_t period_frames_ = 0;

    // Threading
    std::unique_ptr<std::thread> capture_thread_;
    std::atomic<bool> is_capturing_{false};
    std::atomic<bool> should_stop_{false};

    // Device info cache
    AudioDeviceInfo device_info_;
};

} // namespace audio
