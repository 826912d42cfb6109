#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "asr/aligned_result.hpp"
#include "asr/recognizer.hpp"
#include "audio/chunk_assembler.hpp"
#include "core/transcript_state.hpp"

namespace core {

/// Average interleaved channels to mono and clip to [-1, 1]; NaN and infinities become 0
std::vector<float> normalize_block(const std::vector<float>& interleaved, int channels);

/**
 * @brief What happened to one emission
 */
struct WorkerReport {
    enum class Status { Recorded, Malformed };

    Status status = Status::Malformed;
    audio::EmissionKind kind = audio::EmissionKind::Interim;
    asr::AlignedResult result;        ///< valid when status == Recorded
    std::string reason;               ///< set when status == Malformed
    double processing_time_s = 0.0;
    double realtime_factor = 0.0;     ///< processing time / audio duration
};

/**
 * @brief Normalizes emitted blocks, runs the model and records results
 *
 * Runs on the processing thread only. Model anomalies never leave process():
 * they are logged, counted and the block is skipped.
 */
class TranscriptionWorker {
public:
    using ResultCallback = std::function<void(const WorkerReport&)>;

    TranscriptionWorker(asr::IRecognizer& recognizer, SharedTranscript& transcript,
                        asr::RecognizerOptions options, bool rebase_timestamps);

    void set_on_result(ResultCallback cb) { on_result_ = std::move(cb); }

    WorkerReport process(const audio::ChunkEmission& emission);

    size_t malformed_count() const { return malformed_count_; }
    size_t blocks_processed() const { return blocks_processed_; }
    double total_processing_time_s() const { return total_processing_time_s_; }
    double total_audio_time_s() const { return total_audio_time_s_; }

private:
    asr::IRecognizer& recognizer_;
    SharedTranscript& transcript_;
    asr::RecognizerOptions options_;
    bool rebase_timestamps_;
    ResultCallback on_result_;

    size_t malformed_count_ = 0;
    size_t blocks_processed_ = 0;
    double total_processing_time_s_ = 0.0;
    double total_audio_time_s_ = 0.0;
};

}
