#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "asr/aligned_result.hpp"

namespace asr {

/**
 * @brief Decoding options handed to the model with every block
 */
struct RecognizerOptions {
    std::string language = "en";
    int n_threads = 0;        ///< 0 = auto
    bool translate = false;
};

/**
 * @brief One alignment as the model reports it, before validation
 *
 * `text` is empty (nullopt) when the model produced no usable transcript.
 */
struct RawAlignment {
    std::optional<std::string> text;
    std::vector<Sentence> sentences;
};

/// The model may return several alignments; the first one describes the block.
using RawRecognition = std::vector<RawAlignment>;

struct MalformedResult {
    std::string reason;
};

/// Valid result or malformed, decided once by validate_recognition()
using RecognitionOutcome = std::variant<AlignedResult, MalformedResult>;

RecognitionOutcome validate_recognition(RawRecognition raw);

inline bool is_valid(const RecognitionOutcome& outcome) {
    return std::holds_alternative<AlignedResult>(outcome);
}

/**
 * @brief Speech recognition model collaborator
 *
 * Implementations:
 * - WhisperBackend (whisper.cpp)
 */
class IRecognizer {
public:
    virtual ~IRecognizer() = default;

    /**
     * @brief Transcribe one block of audio
     * @param mono Mono float samples in [-1, 1]
     * @param sample_rate Rate of `mono` in Hz
     * @param options Decoding options
     */
    virtual RawRecognition transcribe(const std::vector<float>& mono, int sample_rate,
                                      const RecognizerOptions& options) = 0;

    virtual std::string name() const = 0;
};

}
