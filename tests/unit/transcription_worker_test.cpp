#include <cassert>
#include <cmath>
#include <deque>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>
#include "core/transcription_worker.hpp"

using asr::RawAlignment;
using asr::RawRecognition;
using audio::ChunkEmission;
using audio::EmissionKind;
using core::WorkerReport;

namespace {

// Replays scripted answers and remembers what it was given
class ScriptedRecognizer : public asr::IRecognizer {
public:
    std::deque<RawRecognition> answers;
    bool throw_next = false;
    std::vector<std::vector<float>> seen;

    RawRecognition transcribe(const std::vector<float>& mono, int, const asr::RecognizerOptions&) override {
        seen.push_back(mono);
        if (throw_next) {
            throw_next = false;
            throw std::runtime_error("decoder crashed");
        }
        if (answers.empty()) return {};
        RawRecognition next = answers.front();
        answers.pop_front();
        return next;
    }

    std::string name() const override { return "scripted"; }
};

RawAlignment alignment(const std::string& text, double start, double end) {
    RawAlignment a;
    a.text = text;
    asr::Sentence s;
    s.text = text;
    s.start = start;
    s.end = end;
    s.duration = end - start;
    asr::Token t;
    t.text = text;
    t.start = start;
    t.end = end;
    t.duration = end - start;
    s.tokens.push_back(t);
    a.sentences.push_back(s);
    return a;
}

ChunkEmission emission(EmissionKind kind, double start_s, std::vector<float> samples, int channels = 1) {
    ChunkEmission e;
    e.kind = kind;
    e.samples = std::move(samples);
    e.channels = channels;
    e.sample_rate = 16000;
    e.start_s = start_s;
    e.duration_s = static_cast<double>(e.frame_count()) / 16000.0;
    return e;
}

}

static void test_normalize_clips_and_downmixes() {
    auto mono = core::normalize_block({1.8f, -3.0f, 0.5f}, 1);
    assert(mono.size() == 3);
    assert(mono[0] == 1.0f);
    assert(mono[1] == -1.0f);
    assert(mono[2] == 0.5f);

    auto stereo = core::normalize_block({0.2f, 0.4f, 3.0f, 3.0f}, 2);
    assert(stereo.size() == 2);
    assert(std::fabs(stereo[0] - 0.3f) < 1e-6f);
    assert(stereo[1] == 1.0f);
}

static void test_normalize_zeroes_non_finite() {
    const float inf = std::numeric_limits<float>::infinity();
    auto mono = core::normalize_block({std::nanf(""), inf, -inf, 0.25f}, 1);
    assert(mono.size() == 4);
    assert(mono[0] == 0.0f);
    assert(mono[1] == 0.0f);
    assert(mono[2] == 0.0f);
    assert(mono[3] == 0.25f);
    for (float v : mono) assert(v >= -1.0f && v <= 1.0f);
}

static void test_model_sees_clipped_audio() {
    ScriptedRecognizer model;
    model.answers.push_back({alignment("hi", 0.0, 1.0)});
    core::SharedTranscript transcript;
    core::TranscriptionWorker worker(model, transcript, {}, true);

    worker.process(emission(EmissionKind::Full, 0.0, {2.0f, -2.0f, 0.0f}));
    assert(model.seen.size() == 1);
    for (float v : model.seen[0]) assert(v >= -1.0f && v <= 1.0f);
}

static void test_full_result_recorded_and_rebased() {
    ScriptedRecognizer model;
    model.answers.push_back({alignment("hello world", 0.5, 2.0), alignment("ignored", 0.0, 1.0)});
    core::SharedTranscript transcript;
    core::TranscriptionWorker worker(model, transcript, {}, true);

    int callbacks = 0;
    worker.set_on_result([&](const WorkerReport& r) {
        callbacks++;
        assert(r.status == WorkerReport::Status::Recorded);
    });

    WorkerReport r = worker.process(emission(EmissionKind::Full, 16.0, std::vector<float>(1600, 0.1f)));
    assert(r.status == WorkerReport::Status::Recorded);
    assert(r.result.text == "hello world");
    assert(callbacks == 1);

    auto state = transcript.snapshot();
    assert(state.chunks_processed == 1);
    assert(state.all_results.size() == 1);
    assert(state.latest_text == "hello world");
    assert(state.last_update.has_value());
    const auto& s = state.all_results[0].sentences[0];
    assert(std::fabs(s.start - 16.5) < 1e-9);
    assert(std::fabs(s.end - 18.0) < 1e-9);
    assert(std::fabs(s.duration - 1.5) < 1e-9);
    assert(std::fabs(s.tokens[0].start - 16.5) < 1e-9);
}

static void test_no_rebase_keeps_chunk_times() {
    ScriptedRecognizer model;
    model.answers.push_back({alignment("x", 0.5, 2.0)});
    core::SharedTranscript transcript;
    core::TranscriptionWorker worker(model, transcript, {}, false);

    worker.process(emission(EmissionKind::Full, 16.0, std::vector<float>(1600, 0.1f)));
    assert(transcript.all_results()[0].sentences[0].start == 0.5);
}

static void test_interim_updates_display_only() {
    ScriptedRecognizer model;
    model.answers.push_back({alignment("partial", 0.0, 1.0)});
    core::SharedTranscript transcript;
    core::TranscriptionWorker worker(model, transcript, {}, true);

    WorkerReport r = worker.process(emission(EmissionKind::Interim, 5.0, std::vector<float>(1600, 0.1f)));
    assert(r.status == WorkerReport::Status::Recorded);
    assert(transcript.latest_text() == "partial");
    assert(transcript.chunks_processed() == 0);
    assert(transcript.all_results().empty());
}

static void test_malformed_results_are_skipped() {
    ScriptedRecognizer model;
    RawAlignment no_text;
    model.answers.push_back({no_text});     // alignment without text
    model.answers.push_back({});            // no alignment at all
    model.throw_next = true;                // first call throws

    core::SharedTranscript transcript;
    core::TranscriptionWorker worker(model, transcript, {}, true);
    int callbacks = 0;
    worker.set_on_result([&](const WorkerReport&) { callbacks++; });

    for (int i = 0; i < 3; ++i) {
        WorkerReport r = worker.process(emission(EmissionKind::Full, 0.0, std::vector<float>(1600, 0.1f)));
        assert(r.status == WorkerReport::Status::Malformed);
        assert(!r.reason.empty());
    }
    assert(worker.malformed_count() == 3);
    assert(worker.blocks_processed() == 3);
    assert(callbacks == 0);
    assert(transcript.chunks_processed() == 0);
    assert(transcript.all_results().empty());

    // The worker keeps going after bad blocks
    model.answers.push_back({alignment("back", 0.0, 1.0)});
    WorkerReport ok = worker.process(emission(EmissionKind::Full, 0.0, std::vector<float>(1600, 0.1f)));
    assert(ok.status == WorkerReport::Status::Recorded);
    assert(transcript.chunks_processed() == 1);
}

static void test_empty_text_is_still_a_result() {
    ScriptedRecognizer model;
    model.answers.push_back({alignment("first", 0.0, 1.0)});
    RawAlignment silent;
    silent.text = std::string();
    model.answers.push_back({silent});

    core::SharedTranscript transcript;
    core::TranscriptionWorker worker(model, transcript, {}, true);
    worker.process(emission(EmissionKind::Full, 0.0, std::vector<float>(1600, 0.1f)));
    WorkerReport r = worker.process(emission(EmissionKind::Full, 0.0, std::vector<float>(1600, 0.1f)));
    assert(r.status == WorkerReport::Status::Recorded);
    assert(transcript.chunks_processed() == 2);
    assert(transcript.latest_text() == "first");
}

int main() {
    test_normalize_clips_and_downmixes();
    test_normalize_zeroes_non_finite();
    test_model_sees_clipped_audio();
    test_full_result_recorded_and_rebased();
    test_no_rebase_keeps_chunk_times();
    test_interim_updates_display_only();
    test_malformed_results_are_skipped();
    test_empty_text_is_still_a_result();
    return 0;
}
