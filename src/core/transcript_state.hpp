#pragma once
#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "asr/aligned_result.hpp"

namespace core {

struct TranscriptionState {
    std::vector<asr::AlignedResult> all_results;   ///< finalized chunks, append-only
    std::string latest_text;                       ///< what the display shows
    size_t chunks_processed = 0;
    std::optional<std::chrono::system_clock::time_point> last_update;
};

/**
 * @brief The transcription state together with the lock that guards it
 *
 * Written only by the transcription worker. Readers get copies.
 */
class SharedTranscript {
public:
    /// FINAL: retain the result, count the chunk, update the display text
    void append_final(asr::AlignedResult result);

    /// INTERIM: update the display text only
    void update_interim(const std::string& text);

    TranscriptionState snapshot() const;
    std::vector<asr::AlignedResult> all_results() const;
    std::string latest_text() const;
    size_t chunks_processed() const;

private:
    mutable std::mutex mutex_;
    TranscriptionState state_;
};

}
