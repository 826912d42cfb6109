#include "audio_input_device_alsa.hpp"

#include <alsa/asoundlib.h>
#include <cerrno>
#include <cstdio>
#include <sstream>
#include <vector>

namespace audio {

namespace {

std::string alsa_error(int code, const std::string& context) {
    std::ostringstream oss;
    oss << context << ": " << snd_strerror(code);
    return oss.str();
}

// Frees hw params on every exit path of initialize()
struct HwParams {
    snd_pcm_hw_params_t* ptr = nullptr;
    HwParams() { snd_pcm_hw_params_malloc(&ptr); }
    ~HwParams() {
        if (ptr) snd_pcm_hw_params_free(ptr);
    }
};

} // namespace

AudioInputDevice_Alsa::AudioInputDevice_Alsa() = default;

AudioInputDevice_Alsa::~AudioInputDevice_Alsa() {
    stop();
    close_pcm();
}

std::vector<AudioDeviceInfo> AudioInputDevice_Alsa::enumerate_alsa_devices() {
    std::vector<AudioDeviceInfo> devices;

    AudioDeviceInfo def;
    def.id = "default";
    def.name = "Default ALSA capture device";
    def.driver = "ALSA";
    def.is_default = true;
    devices.push_back(def);

    int card = -1;
    if (snd_card_next(&card) < 0) {
        return devices;
    }

    while (card >= 0) {
        snd_ctl_t* ctl = nullptr;
        char card_name[32];
        std::snprintf(card_name, sizeof(card_name), "hw:%d", card);
        if (snd_ctl_open(&ctl, card_name, 0) < 0) {
            if (snd_card_next(&card) < 0) break;
            continue;
        }

        snd_pcm_info_t* pcm_info = nullptr;
        snd_pcm_info_malloc(&pcm_info);
        if (pcm_info) {
            int device = -1;
            while (snd_ctl_pcm_next_device(ctl, &device) >= 0 && device >= 0) {
                snd_pcm_info_set_device(pcm_info, static_cast<unsigned>(device));
                snd_pcm_info_set_subdevice(pcm_info, 0);
                snd_pcm_info_set_stream(pcm_info, SND_PCM_STREAM_CAPTURE);
                if (snd_ctl_pcm_info(ctl, pcm_info) < 0) continue;

                AudioDeviceInfo info;
                info.id = "plughw:" + std::to_string(card) + "," + std::to_string(device);
                const char* name = snd_pcm_info_get_name(pcm_info);
                const char* id = snd_pcm_info_get_id(pcm_info);
                info.name = name ? name : "Unknown device";
                if (id) info.name += std::string(" [") + id + "]";
                info.driver = "ALSA";
                info.is_default = false;
                devices.push_back(info);
            }
            snd_pcm_info_free(pcm_info);
        }

        snd_ctl_close(ctl);
        if (snd_card_next(&card) < 0) break;
    }

    return devices;
}

void AudioInputDevice_Alsa::report(const std::string& message, bool is_fatal) {
    if (error_callback_) {
        error_callback_(message, is_fatal);
    }
}

bool AudioInputDevice_Alsa::initialize(
    const AudioInputConfig& config,
    AudioCallback audio_callback,
    ErrorCallback error_callback
) {
    config_ = config;
    audio_callback_ = audio_callback;
    error_callback_ = error_callback;
    close_pcm();

    const std::string device = (config.device_id.empty()) ? "default" : config.device_id;

    int err = snd_pcm_open(&handle_, device.c_str(), SND_PCM_STREAM_CAPTURE, 0);
    if (err < 0) {
        handle_ = nullptr;
        report(alsa_error(err, "snd_pcm_open(" + device + ")"), true);
        return false;
    }

    HwParams hw;
    if (!hw.ptr) {
        close_pcm();
        report("Failed to allocate ALSA hw params", true);
        return false;
    }
    snd_pcm_hw_params_any(handle_, hw.ptr);

    auto fail = [&](int code, const char* what) {
        close_pcm();
        report(alsa_error(code, what), true);
        return false;
    };

    if ((err = snd_pcm_hw_params_set_access(handle_, hw.ptr, SND_PCM_ACCESS_RW_INTERLEAVED)) < 0) {
        return fail(err, "snd_pcm_hw_params_set_access");
    }
    if ((err = snd_pcm_hw_params_set_format(handle_, hw.ptr, SND_PCM_FORMAT_S16_LE)) < 0) {
        return fail(err, "snd_pcm_hw_params_set_format");
    }
    if ((err = snd_pcm_hw_params_set_channels(handle_, hw.ptr, static_cast<unsigned>(config.channels))) < 0) {
        return fail(err, "snd_pcm_hw_params_set_channels");
    }

    unsigned int rate = static_cast<unsigned int>(config.sample_rate);
    if ((err = snd_pcm_hw_params_set_rate_near(handle_, hw.ptr, &rate, nullptr)) < 0) {
        return fail(err, "snd_pcm_hw_params_set_rate_near");
    }

    snd_pcm_uframes_t frames = static_cast<snd_pcm_uframes_t>(rate) * static_cast<unsigned>(config.buffer_size_ms) / 1000;
    if (frames == 0) frames = 1;
    if ((err = snd_pcm_hw_params_set_period_size_near(handle_, hw.ptr, &frames, nullptr)) < 0) {
        return fail(err, "snd_pcm_hw_params_set_period_size_near");
    }

    if ((err = snd_pcm_hw_params(handle_, hw.ptr)) < 0) {
        return fail(err, "snd_pcm_hw_params");
    }
    if ((err = snd_pcm_prepare(handle_)) < 0) {
        return fail(err, "snd_pcm_prepare");
    }

    period_frames_ = static_cast<size_t>(frames);
    actual_config_ = config;
    actual_config_.device_id = device;
    actual_config_.sample_rate = static_cast<int>(rate);
    if (rate != static_cast<unsigned int>(config.sample_rate)) {
        report("sample rate adjusted to " + std::to_string(rate) + " Hz", false);
    }

    device_info_.id = device;
    device_info_.name = snd_pcm_name(handle_) ? snd_pcm_name(handle_) : device;
    device_info_.driver = "ALSA";
    device_info_.default_sample_rate = actual_config_.sample_rate;
    device_info_.max_channels = actual_config_.channels;
    device_info_.is_default = (device == "default");

    return true;
}

bool AudioInputDevice_Alsa::start() {
    if (is_capturing_.load()) {
        return true;  // Already capturing
    }
    if (!handle_) {
        return false;
    }
    if (capture_thread_ && capture_thread_->joinable()) {
        capture_thread_->join();  // previous run ended on a fatal error
    }

    int err = snd_pcm_start(handle_);
    if (err < 0 && err != -EBADFD) {
        report(alsa_error(err, "snd_pcm_start"), true);
        return false;
    }

    should_stop_.store(false);
    is_capturing_.store(true);

    capture_thread_ = std::make_unique<std::thread>(
        &AudioInputDevice_Alsa::capture_thread_func, this
    );

    return true;
}

void AudioInputDevice_Alsa::stop() {
    should_stop_.store(true);

    if (capture_thread_ && capture_thread_->joinable()) {
        capture_thread_->join();
    }
    capture_thread_.reset();

    if (handle_) {
        snd_pcm_drop(handle_);
    }
    is_capturing_.store(false);
}

void AudioInputDevice_Alsa::close_pcm() {
    if (handle_) {
        snd_pcm_close(handle_);
        handle_ = nullptr;
    }
}

void AudioInputDevice_Alsa::capture_thread_func() {
    const size_t channels = static_cast<size_t>(actual_config_.channels);
    std::vector<int16_t> pcm(period_frames_ * channels);
    std::vector<float> samples;
    constexpr float scale = 1.0f / 32768.0f;

    while (!should_stop_.load()) {
        snd_pcm_sframes_t frames = snd_pcm_readi(handle_, pcm.data(), period_frames_);
        if (frames < 0) {
            const int code = static_cast<int>(frames);
            if (code == -EPIPE) {
                report("input overflow (samples lost)", false);
            } else if (code == -ESTRPIPE) {
                report("stream suspended", false);
            }
            frames = snd_pcm_recover(handle_, code, 1);
            if (frames < 0) {
                report(alsa_error(static_cast<int>(frames), "snd_pcm_readi"), true);
                break;
            }
            continue;
        }
        if (frames == 0) continue;

        const size_t n = static_cast<size_t>(frames) * channels;
        samples.resize(n);
        for (size_t i = 0; i < n; ++i) {
            samples[i] = static_cast<float>(pcm[i]) * scale;
        }

        if (audio_callback_) {
            audio_callback_(samples.data(), n, actual_config_.sample_rate, actual_config_.channels);
        }
    }

    is_capturing_.store(false);
}

} // namespace audio
