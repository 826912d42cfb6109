// Synthetic microphone -> controller -> scripted model -> flush
#include <atomic>
#include <cassert>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "audio/audio_input_device.hpp"
#include "core/transcription_controller.hpp"

namespace fs = std::filesystem;

namespace {

void write_u32(std::ofstream& f, uint32_t v) { f.write(reinterpret_cast<const char*>(&v), 4); }
void write_u16(std::ofstream& f, uint16_t v) { f.write(reinterpret_cast<const char*>(&v), 2); }

// 16 kHz mono PCM16 sine
fs::path write_test_wav(const std::string& name, double seconds) {
    fs::path path = fs::temp_directory_path() / name;
    const uint32_t rate = 16000;
    const uint32_t frames = static_cast<uint32_t>(seconds * rate);
    std::ofstream f(path, std::ios::binary);
    f.write("RIFF", 4);
    write_u32(f, 36 + frames * 2);
    f.write("WAVE", 4);
    f.write("fmt ", 4);
    write_u32(f, 16);
    write_u16(f, 1);
    write_u16(f, 1);
    write_u32(f, rate);
    write_u32(f, rate * 2);
    write_u16(f, 2);
    write_u16(f, 16);
    f.write("data", 4);
    write_u32(f, frames * 2);
    for (uint32_t i = 0; i < frames; ++i) {
        int16_t s = static_cast<int16_t>(8000.0 * std::sin(2.0 * 3.14159265358979 * 440.0 * i / rate));
        write_u16(f, static_cast<uint16_t>(s));
    }
    return path;
}

class CountingRecognizer : public asr::IRecognizer {
public:
    explicit CountingRecognizer(std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : delay_(delay) {}

    asr::RawRecognition transcribe(const std::vector<float>& mono, int sample_rate,
                                   const asr::RecognizerOptions&) override {
        if (delay_.count() > 0) std::this_thread::sleep_for(delay_);
        const int n = calls_++;
        asr::RawAlignment a;
        a.text = "block " + std::to_string(n);
        asr::Sentence s;
        s.text = *a.text;
        s.start = 0.0;
        s.end = static_cast<double>(mono.size()) / sample_rate;
        s.duration = s.end;
        a.sentences.push_back(s);
        return {a};
    }

    std::string name() const override { return "counting"; }

private:
    std::chrono::milliseconds delay_;
    std::atomic<int> calls_{0};
};

core::PipelineConfig small_windows() {
    core::PipelineConfig cfg;
    cfg.buffer_duration_s = 1.0;
    cfg.chunk_duration_s = 2.0;
    cfg.overlap_duration_s = 0.5;
    return cfg;
}

struct FlushRecord {
    std::mutex mutex;
    int calls = 0;
    std::vector<asr::AlignedResult> results;
};

core::TranscriptionController::Config make_config(FlushRecord& record) {
    core::TranscriptionController::Config config;
    config.pipeline = small_windows();
    config.on_flush = [&record](const std::vector<asr::AlignedResult>& results) {
        std::lock_guard<std::mutex> lock(record.mutex);
        record.calls++;
        record.results = results;
    };
    return config;
}

bool wait_until(const std::function<bool()>& pred, std::chrono::seconds limit) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return pred();
}

}

static void test_file_runs_to_completion() {
    fs::path wav = write_test_wav("livescribe_pipeline_test.wav", 6.0);

    FlushRecord record;
    core::TranscriptionController controller;
    assert(controller.initialize(make_config(record), std::make_unique<CountingRecognizer>()));

    auto device = audio::AudioInputFactory::create_device("synthetic:" + wav.string());
    assert(device);
    audio::AudioInputConfig dev_cfg;
    dev_cfg.device_id = "synthetic:" + wav.string();
    dev_cfg.synthetic_realtime = false;
    assert(device->initialize(
        dev_cfg,
        [&controller](const float* s, size_t n, int rate, int ch) { controller.add_audio(s, n, rate, ch); },
        [&controller](const std::string& msg, bool fatal) { controller.on_device_error(msg, fatal); }));

    assert(device->get_actual_config().sample_rate == 16000);
    assert(device->get_actual_config().channels == 1);
    assert(controller.start());
    assert(device->start());

    // 6 s with 2 s chunks advancing 1.5 s: chunks start at 0, 1.5 and 3.0
    assert(wait_until([&] { return !device->is_capturing(); }, std::chrono::seconds(10)));
    assert(wait_until([&] {
        auto m = controller.get_performance_metrics();
        return m.full_chunks == 3 && m.interim_blocks == 6;
    }, std::chrono::seconds(10)));
    assert(controller.snapshot().chunks_processed == 3);

    assert(controller.request_stop(core::StopReason::EndOfStream));
    device->stop();
    assert(controller.stop());
    assert(controller.stop());   // second stop is a no-op

    assert(controller.state() == core::PipelineState::Stopped);
    assert(controller.stop_reason() == core::StopReason::EndOfStream);

    std::lock_guard<std::mutex> lock(record.mutex);
    assert(record.calls == 1);
    assert(record.results.size() == 3);
    const double starts[] = {0.0, 1.5, 3.0};
    for (size_t i = 0; i < 3; ++i) {
        const auto& sentence = record.results[i].sentences.at(0);
        assert(std::fabs(sentence.start - starts[i]) < 1e-6);
        assert(std::fabs(sentence.end - (starts[i] + 2.0)) < 1e-6);
    }

    auto metrics = controller.get_performance_metrics();
    assert(metrics.frames_received == 60);
    assert(metrics.frames_dropped == 0);
    assert(metrics.full_chunks == 3);
    assert(metrics.interim_blocks == 6);
    assert(metrics.malformed_results == 0);

    fs::remove(wav);
}

static void test_missing_file_is_capture_fatal() {
    FlushRecord record;
    core::TranscriptionController controller;
    assert(controller.initialize(make_config(record), std::make_unique<CountingRecognizer>()));

    auto device = audio::AudioInputFactory::create_device("synthetic:/nonexistent/livescribe.wav");
    assert(device);
    audio::AudioInputConfig dev_cfg;
    dev_cfg.device_id = "synthetic:/nonexistent/livescribe.wav";
    bool ok = device->initialize(
        dev_cfg,
        [&controller](const float* s, size_t n, int rate, int ch) { controller.add_audio(s, n, rate, ch); },
        [&controller](const std::string& msg, bool fatal) { controller.on_device_error(msg, fatal); });
    assert(!ok);
    assert(controller.stop_requested());
    assert(!controller.start());

    controller.stop();
    assert(controller.stop_reason() == core::StopReason::CaptureFatal);
    assert(record.calls == 1);
    assert(record.results.empty());
}

static void test_slow_model_does_not_block_shutdown() {
    fs::path wav = write_test_wav("livescribe_slow_model_test.wav", 3.0);

    FlushRecord record;
    auto config = make_config(record);
    config.pipeline.join_timeout = std::chrono::milliseconds(200);
    core::TranscriptionController controller;
    assert(controller.initialize(config, std::make_unique<CountingRecognizer>(std::chrono::milliseconds(1500))));

    auto device = audio::AudioInputFactory::create_device("synthetic:" + wav.string());
    audio::AudioInputConfig dev_cfg;
    dev_cfg.device_id = "synthetic:" + wav.string();
    dev_cfg.synthetic_realtime = false;
    assert(device->initialize(
        dev_cfg,
        [&controller](const float* s, size_t n, int rate, int ch) { controller.add_audio(s, n, rate, ch); },
        nullptr));
    assert(controller.start());
    assert(device->start());
    assert(wait_until([&] { return !device->is_capturing(); }, std::chrono::seconds(10)));
    device->stop();

    // Let the model get stuck inside the first block
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    controller.request_stop(core::StopReason::Interrupt);
    auto t0 = std::chrono::steady_clock::now();
    assert(!controller.stop());
    assert(std::chrono::steady_clock::now() - t0 < std::chrono::seconds(1));
    assert(controller.state() == core::PipelineState::Stopped);
    assert(record.calls == 1);

    // The abandoned thread finishes its block on its own
    std::this_thread::sleep_for(std::chrono::milliseconds(1800));
    fs::remove(wav);
}

// Owner-side object that must not be touched once stop() has given up on the thread
struct ResultSink {
    std::atomic<int> results{0};
    std::shared_ptr<std::atomic<bool>> released = std::make_shared<std::atomic<bool>>(false);
    std::shared_ptr<std::atomic<int>> calls_after_release = std::make_shared<std::atomic<int>>(0);

    void show(const core::WorkerReport&) { results++; }
};

static void test_abandoned_thread_stops_reporting() {
    fs::path wav = write_test_wav("livescribe_abandon_test.wav", 3.0);

    FlushRecord record;
    auto config = make_config(record);
    config.pipeline.join_timeout = std::chrono::milliseconds(100);

    auto sink = std::make_unique<ResultSink>();
    ResultSink* raw = sink.get();
    auto released = sink->released;
    auto late = sink->calls_after_release;
    config.on_result = [raw, released, late](const core::WorkerReport& report) {
        if (released->load()) {
            late->fetch_add(1);
            return;
        }
        raw->show(report);
    };

    core::TranscriptionController controller;
    assert(controller.initialize(config, std::make_unique<CountingRecognizer>(std::chrono::milliseconds(600))));

    auto device = audio::AudioInputFactory::create_device("synthetic:" + wav.string());
    audio::AudioInputConfig dev_cfg;
    dev_cfg.device_id = "synthetic:" + wav.string();
    dev_cfg.synthetic_realtime = false;
    assert(device->initialize(
        dev_cfg,
        [&controller](const float* s, size_t n, int rate, int ch) { controller.add_audio(s, n, rate, ch); },
        nullptr));
    assert(controller.start());
    assert(device->start());
    assert(wait_until([&] { return !device->is_capturing(); }, std::chrono::seconds(10)));
    device->stop();

    // The first block is now inside the 600 ms model call
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    controller.request_stop(core::StopReason::Interrupt);
    assert(!controller.stop());

    released->store(true);
    sink.reset();

    // Long enough for the in-flight block to finish and report
    std::this_thread::sleep_for(std::chrono::milliseconds(1000));
    assert(late->load() == 0);
    assert(record.calls == 1);
    fs::remove(wav);
}

static void test_idle_pipeline_stops_promptly() {
    FlushRecord record;
    core::TranscriptionController controller;
    assert(controller.initialize(make_config(record), std::make_unique<CountingRecognizer>()));
    assert(controller.start());

    // No audio at all: the processing thread sits in its timed pop
    std::this_thread::sleep_for(std::chrono::milliseconds(700));
    auto t0 = std::chrono::steady_clock::now();
    assert(controller.request_stop(core::StopReason::Interrupt));
    assert(controller.stop());
    assert(std::chrono::steady_clock::now() - t0 < std::chrono::seconds(1));
    assert(controller.stop_reason() == core::StopReason::Interrupt);
    assert(controller.state() == core::PipelineState::Stopped);
    assert(record.calls == 1);
    assert(record.results.empty());
}

static void test_wrong_channel_frames_are_counted() {
    FlushRecord record;
    core::TranscriptionController controller;
    assert(controller.initialize(make_config(record), std::make_unique<CountingRecognizer>()));
    assert(controller.start());

    std::vector<float> stereo(3200, 0.1f);
    for (int i = 0; i < 5; ++i) {
        controller.add_audio(stereo.data(), stereo.size(), 16000, 2);
    }
    assert(wait_until([&] { return controller.get_performance_metrics().frames_rejected == 5; },
                      std::chrono::seconds(5)));

    controller.stop();
    auto metrics = controller.get_performance_metrics();
    assert(metrics.frames_received == 5);
    assert(metrics.frames_rejected == 5);
    assert(metrics.interim_blocks == 0);
}

static void test_oversized_chunk_rejected_at_initialize() {
    FlushRecord record;
    auto config = make_config(record);
    config.pipeline.chunk_duration_s = 1e6;
    std::string status;
    config.on_status = [&status](const std::string& message, bool is_error) {
        if (is_error) status = message;
    };

    core::TranscriptionController controller;
    assert(!controller.initialize(config, std::make_unique<CountingRecognizer>()));
    assert(status.find("Invalid configuration") != std::string::npos);
    assert(!controller.start());
}

int main() {
    test_file_runs_to_completion();
    test_missing_file_is_capture_fatal();
    test_slow_model_does_not_block_shutdown();
    test_abandoned_thread_stops_reporting();
    test_idle_pipeline_stops_promptly();
    test_wrong_channel_frames_are_counted();
    test_oversized_chunk_rejected_at_initialize();
    return 0;
}
