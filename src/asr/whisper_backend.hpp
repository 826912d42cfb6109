#pragma once
#include <string>
#include <vector>

#include "asr/recognizer.hpp"

struct whisper_context;
struct whisper_state;

namespace asr {

/**
 * @brief whisper.cpp implementation of the recognizer
 *
 * Segments become sentences, non-special tokens become tokens.
 * Not thread-safe: one instance serves the single processing thread.
 */
class WhisperBackend : public IRecognizer {
public:
    WhisperBackend() = default;
    ~WhisperBackend() override;

    WhisperBackend(const WhisperBackend&) = delete;
    WhisperBackend& operator=(const WhisperBackend&) = delete;

    /// Accepts a file path or a short name such as "base.en" looked up under models/
    bool load_model(const std::string& model_name);
    bool is_loaded() const { return ctx_ != nullptr; }
    const std::string& model_path() const { return model_path_; }

    RawRecognition transcribe(const std::vector<float>& mono, int sample_rate,
                              const RecognizerOptions& options) override;

    std::string name() const override { return "whisper.cpp"; }

    static std::string resolve_model_path(const std::string& model_name);

private:
    whisper_context* ctx_ = nullptr;
    whisper_state* state_ = nullptr;
    std::string model_path_;
};

}
