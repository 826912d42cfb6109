// Copyright (c) 2025 LiveScribe
// livescribe: microphone (or WAV-backed simulated microphone) to text
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "asr/whisper_backend.hpp"
#include "audio/audio_input_device.hpp"
#include "console/cli_options.hpp"
#include "console/console_display.hpp"
#include "core/logging.hpp"
#include "core/transcription_controller.hpp"
#include "output/transcript_export.hpp"

namespace {

// Only the signal handler writes this; the main loop turns it into a stop request
volatile std::sig_atomic_t g_interrupted = 0;

void handle_sigint(int) {
    g_interrupted = 1;
}

int list_devices() {
    auto devices = audio::AudioInputFactory::enumerate_devices();
    std::cout << "Available audio input devices:" << std::endl;
    for (const auto& dev : devices) {
        std::cout << "  " << dev.id << (dev.is_default ? " (default)" : "") << "\n"
                  << "      " << dev.name << " [" << dev.driver << "]\n";
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    const std::string program = argc > 0 ? argv[0] : "livescribe";

    console::CliOptions opts;
    try {
        opts = console::parse_cli(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << console::usage(program);
        return 2;
    }
    if (opts.show_help) {
        std::cout << console::usage(program);
        return 0;
    }
    core::set_verbose(opts.verbose || core::is_verbose());

    if (opts.list_devices) {
        return list_devices();
    }

    // Model
    core::log_info("Loading whisper model '" + opts.model + "'...");
    auto t_load = std::chrono::steady_clock::now();
    auto whisper = std::make_unique<asr::WhisperBackend>();
    if (!whisper->load_model(opts.model)) {
        core::log_error("Failed to load whisper model: " + opts.model);
        return 1;
    }
    double load_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - t_load).count();
    core::log_info("Model loaded in " + std::to_string(load_s) + " seconds");

    // Pipeline
    console::ConsoleDisplay display(std::cout, opts.color);

    core::TranscriptionController controller;
    core::TranscriptionController::Config config;
    config.pipeline = opts.pipeline;
    config.recognizer = opts.recognizer;
    config.on_result = [&display](const core::WorkerReport& report) { display.show(report); };
    config.on_flush = [&opts](const std::vector<asr::AlignedResult>& results) {
        output::save_transcriptions(results, opts.output_dir, opts.formats);
    };
    config.on_status = [](const std::string& message, bool is_error) {
        if (is_error) core::log_error(message);
        else core::log_info(message);
    };

    if (!controller.initialize(config, std::move(whisper))) {
        return 2;
    }

    // Capture device
    auto device = audio::AudioInputFactory::create_device(opts.device_id);
    if (!device) {
        core::log_error("No capture backend available for device '" + opts.device_id + "'");
        core::log_error("Try listing available devices: " + program + " --list-devices");
        controller.stop();
        return 1;
    }

    audio::AudioInputConfig device_config;
    device_config.device_id = opts.device_id;
    device_config.sample_rate = opts.pipeline.sample_rate;
    device_config.channels = opts.pipeline.channels;
    device_config.synthetic_loop = opts.loop_file;

    bool device_ok = device->initialize(
        device_config,
        [&controller](const float* samples, size_t count, int sample_rate, int channels) {
            controller.add_audio(samples, count, sample_rate, channels);
        },
        [&controller](const std::string& message, bool is_fatal) {
            controller.on_device_error(message, is_fatal);
        });

    if (!device_ok || !controller.start() || !device->start()) {
        core::log_error("Failed to open audio stream. Try listing available devices:");
        core::log_error("  " + program + " --list-devices");
        controller.request_stop(core::StopReason::CaptureFatal);
        device->stop();
        controller.stop();
        return 1;
    }

    std::signal(SIGINT, handle_sigint);
    std::cout << "\n===== TRANSCRIPTION STARTED =====\n\n";
    const audio::AudioInputConfig actual = device->get_actual_config();
    core::log_info("Listening on " + device->get_device_info().name + " at " +
                   std::to_string(actual.sample_rate) + " Hz, " + std::to_string(actual.channels) +
                   " ch... (Press Ctrl+C to stop)");

    while (!controller.wait_for_stop_request(std::chrono::milliseconds(100))) {
        if (g_interrupted) {
            std::cout << "\nCTRL+C detected. Stopping transcription..." << std::endl;
            controller.request_stop(core::StopReason::Interrupt);
        } else if (!device->is_capturing()) {
            controller.request_stop(core::StopReason::EndOfStream);
        }
    }

    device->stop();
    controller.stop();

    auto metrics = controller.get_performance_metrics();
    core::log_info("Chunks: " + std::to_string(metrics.full_chunks) +
                   ", interim: " + std::to_string(metrics.interim_blocks) +
                   ", malformed: " + std::to_string(metrics.malformed_results) +
                   ", dropped frames: " + std::to_string(metrics.frames_dropped) +
                   ", RTF: " + std::to_string(metrics.realtime_factor));

    std::cout << "\n===== TRANSCRIPTION ENDED =====\n" << std::endl;
    return controller.stop_reason() == core::StopReason::CaptureFatal ? 1 : 0;
}
