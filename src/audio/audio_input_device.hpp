#pragma once

#include <string>
#include <vector>
#include <functional>
#include <memory>
#include <cstdint>

namespace audio {

/**
 * @brief Metadata about an audio input device
 */
struct AudioDeviceInfo {
    std::string id;              // Unique device identifier ("default", "plughw:1,0", "synthetic")
    std::string name;            // Human-readable name
    std::string driver;          // Driver/API name ("ALSA", "Synthetic")
    int default_sample_rate;     // Native sample rate (48000, 44100, etc.)
    int max_channels;            // Maximum supported channels
    bool is_default;             // Is this the system default device?

    AudioDeviceInfo()
        : default_sample_rate(48000)
        , max_channels(2)
        , is_default(false) {}
};

/**
 * @brief Configuration for audio input capture
 */
struct AudioInputConfig {
    std::string device_id;       // Device to use (empty = system default)
    int sample_rate = 16000;     // Requested sample rate
    int channels = 1;            // Mono = 1, Stereo = 2
    int buffer_size_ms = 100;    // Frame length in milliseconds (affects latency)

    // For synthetic device only
    std::string synthetic_file_path;    // Path to WAV file
    bool synthetic_loop = false;        // Loop playback?
    bool synthetic_realtime = true;     // Pace callbacks at the file's real duration?
};

/**
 * @brief Callback for audio data
 *
 * Called from the device's own thread when new samples are available.
 *
 * @param samples Float samples in [-1, 1] (interleaved if stereo)
 * @param sample_count Number of samples (not frames - for stereo, this is frames * 2)
 * @param sample_rate Actual sample rate of the data
 * @param channels Number of channels (1=mono, 2=stereo)
 */
using AudioCallback = std::function<void(
    const float* samples,
    size_t sample_count,
    int sample_rate,
    int channels
)>;

/**
 * @brief Error callback for device issues
 *
 * @param error_message Human-readable error description
 * @param is_fatal If true, device has stopped and needs restart
 */
using ErrorCallback = std::function<void(const std::string& error_message, bool is_fatal)>;

/**
 * @brief Abstract base class for audio input devices
 *
 * Implementations:
 * - AudioInputDevice_Alsa (Linux, ALSA)
 * - AudioInputDevice_Synthetic (file playback)
 */
class IAudioInputDevice {
public:
    virtual ~IAudioInputDevice() = default;

    /**
     * @brief Initialize the device with configuration
     * @param config Device configuration
     * @param audio_callback Called when audio data is ready
     * @param error_callback Called on errors
     * @return true if initialization succeeded
     */
    virtual bool initialize(
        const AudioInputConfig& config,
        AudioCallback audio_callback,
        ErrorCallback error_callback
    ) = 0;

    /**
     * @brief Start capturing audio
     * @return true if started successfully
     */
    virtual bool start() = 0;

    /**
     * @brief Stop capturing audio; no callbacks are made after this returns
     */
    virtual void stop() = 0;

    /**
     * @brief Check if device is currently capturing
     */
    virtual bool is_capturing() const = 0;

    /**
     * @brief Get device information
     */
    virtual AudioDeviceInfo get_device_info() const = 0;

    /**
     * @brief Get actual configuration being used (may differ from requested)
     */
    virtual AudioInputConfig get_actual_config() const = 0;
};

/**
 * @brief Factory for creating audio input devices
 */
class AudioInputFactory {
public:
    /**
     * @brief Enumerate all available audio input devices
     * @return List of available devices (always includes the synthetic device)
     */
    static std::vector<AudioDeviceInfo> enumerate_devices();

    /**
     * @brief Create an audio input device
     * @param device_id Device ID from AudioDeviceInfo, or empty for default
     *                  Special values:
     *                  - "" or "default" = system default microphone
     *                  - "synthetic:path/to/file.wav" = synthetic with file path
     * @return Device instance, or nullptr when no backend can serve the ID
     */
    static std::unique_ptr<IAudioInputDevice> create_device(const std::string& device_id = "");

    static bool is_synthetic(const std::string& device_id);

    /// File path part of "synthetic:<path>", empty for plain "synthetic"
    static std::string synthetic_path(const std::string& device_id);
};

} // namespace audio
