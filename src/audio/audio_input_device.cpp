#include "audio_input_device.hpp"
#include "audio_input_device_synthetic.hpp"

#if defined(LIVESCRIBE_HAVE_ALSA)
#include "linux/audio_input_device_alsa.hpp"
#endif

namespace audio {

std::vector<AudioDeviceInfo> AudioInputFactory::enumerate_devices() {
    std::vector<AudioDeviceInfo> devices;

#if defined(LIVESCRIBE_HAVE_ALSA)
    auto alsa_devices = AudioInputDevice_Alsa::enumerate_alsa_devices();
    devices.insert(devices.end(), alsa_devices.begin(), alsa_devices.end());
#endif

    // Always add synthetic device
    AudioDeviceInfo synthetic;
    synthetic.id = "synthetic:<file.wav>";
    synthetic.name = "Synthetic Device (WAV File Playback)";
    synthetic.driver = "Synthetic";
    synthetic.default_sample_rate = 16000;
    synthetic.max_channels = 1;
    synthetic.is_default = false;
    devices.push_back(synthetic);

    return devices;
}

bool AudioInputFactory::is_synthetic(const std::string& device_id) {
    return device_id == "synthetic" || device_id.rfind("synthetic:", 0) == 0;
}

std::string AudioInputFactory::synthetic_path(const std::string& device_id) {
    const std::string prefix = "synthetic:";
    if (device_id.rfind(prefix, 0) != 0) return {};
    return device_id.substr(prefix.size());
}

std::unique_ptr<IAudioInputDevice> AudioInputFactory::create_device(const std::string& device_id) {
    if (is_synthetic(device_id)) {
        return std::make_unique<AudioInputDevice_Synthetic>();
    }

#if defined(LIVESCRIBE_HAVE_ALSA)
    return std::make_unique<AudioInputDevice_Alsa>();
#else
    return nullptr;  // built without a microphone backend
#endif
}

} // namespace audio
