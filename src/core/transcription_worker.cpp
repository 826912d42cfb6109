#include "core/transcription_worker.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <sstream>

namespace core {

std::vector<float> normalize_block(const std::vector<float>& interleaved, int channels) {
    const size_t ch = channels > 0 ? static_cast<size_t>(channels) : 1;
    const size_t frames = interleaved.size() / ch;
    std::vector<float> mono(frames);
    for (size_t i = 0; i < frames; ++i) {
        float sum = 0.0f;
        for (size_t c = 0; c < ch; ++c) {
            sum += interleaved[i * ch + c];
        }
        const float v = sum / static_cast<float>(ch);
        mono[i] = std::isfinite(v) ? std::clamp(v, -1.0f, 1.0f) : 0.0f;
    }
    return mono;
}

TranscriptionWorker::TranscriptionWorker(asr::IRecognizer& recognizer, SharedTranscript& transcript,
                                         asr::RecognizerOptions options, bool rebase_timestamps)
    : recognizer_(recognizer)
    , transcript_(transcript)
    , options_(std::move(options))
    , rebase_timestamps_(rebase_timestamps) {}

WorkerReport TranscriptionWorker::process(const audio::ChunkEmission& emission) {
    WorkerReport report;
    report.kind = emission.kind;

    std::vector<float> block = normalize_block(emission.samples, emission.channels);

    auto t_start = std::chrono::steady_clock::now();
    asr::RecognitionOutcome outcome = asr::MalformedResult{"not transcribed"};
    try {
        outcome = asr::validate_recognition(recognizer_.transcribe(block, emission.sample_rate, options_));
    } catch (const std::exception& e) {
        outcome = asr::MalformedResult{std::string("recognizer threw: ") + e.what()};
    }
    auto t_end = std::chrono::steady_clock::now();

    report.processing_time_s = std::chrono::duration<double>(t_end - t_start).count();
    report.realtime_factor = emission.duration_s > 0.0 ? report.processing_time_s / emission.duration_s : 0.0;
    blocks_processed_++;
    total_processing_time_s_ += report.processing_time_s;
    total_audio_time_s_ += emission.duration_s;

    if (auto* malformed = std::get_if<asr::MalformedResult>(&outcome)) {
        malformed_count_++;
        report.status = WorkerReport::Status::Malformed;
        report.reason = malformed->reason;
        std::ostringstream oss;
        oss << "Skipping " << audio::to_string(emission.kind) << " block #" << emission.index
            << ": " << malformed->reason;
        log_warn(oss.str());
        return report;
    }

    asr::AlignedResult result = std::get<asr::AlignedResult>(std::move(outcome));
    if (emission.kind == audio::EmissionKind::Full) {
        if (rebase_timestamps_) {
            result = asr::shifted(std::move(result), emission.start_s);
        }
        transcript_.append_final(result);
    } else {
        transcript_.update_interim(result.text);
    }

    std::ostringstream oss;
    oss << audio::to_string(emission.kind) << " block #" << emission.index << " at "
        << emission.start_s << "s: " << report.processing_time_s << "s (RTF " << report.realtime_factor << "x)";
    log_debug(oss.str());

    report.status = WorkerReport::Status::Recorded;
    report.result = std::move(result);
    if (on_result_) {
        on_result_(report);
    }
    return report;
}

}
