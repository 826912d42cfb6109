#include "asr/whisper_backend.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <thread>

#include <whisper.h>

namespace {

bool whisper_verbose() {
    return core::is_verbose() || std::getenv("WHISPER_DEBUG") != nullptr;
}

// Filter whisper/ggml logs: keep errors/warnings always; info/debug only if verbose
void log_cb(ggml_log_level level, const char* text, void*) {
    switch (level) {
    case GGML_LOG_LEVEL_ERROR:
    case GGML_LOG_LEVEL_WARN:
        std::fputs(text, stderr);
        break;
    default:
        if (whisper_verbose()) std::fputs(text, stderr);
        break;
    }
}

std::string trim(const std::string& x) {
    size_t a = x.find_first_not_of(" \t\r\n");
    size_t b = x.find_last_not_of(" \t\r\n");
    if (a == std::string::npos) return {};
    return x.substr(a, b - a + 1);
}

// Single bracketed tokens such as [BLANK_AUDIO] or [ Silence ]
bool is_non_speech(const std::string& s) {
    return s.size() > 2 && s.front() == '[' && s.back() == ']';
}

} // anonymous namespace

namespace asr {

WhisperBackend::~WhisperBackend() {
    if (state_) {
        whisper_free_state(state_);
        state_ = nullptr;
    }
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

std::string WhisperBackend::resolve_model_path(const std::string& model_name) {
    auto exists = [](const std::string& p) { return std::filesystem::exists(std::filesystem::u8path(p)); };
    const bool has_ext = (model_name.find(".gguf") != std::string::npos) ||
                         (model_name.find(".bin") != std::string::npos);
    if (has_ext || exists(model_name)) return model_name;

    const std::vector<std::string> candidates = {
        "models/" + model_name + ".gguf",
        "models/ggml-" + model_name + "-q5_1.gguf",
        "models/ggml-" + model_name + ".gguf",
        "models/" + model_name + ".bin",
        "models/ggml-" + model_name + ".bin",
        "models/ggml-" + model_name + "-q5_1.bin",
    };
    for (const auto& c : candidates) {
        if (exists(c)) return c;
    }
    return candidates.front(); // fallback, may fail
}

bool WhisperBackend::load_model(const std::string& model_name) {
    if (ctx_) return true;

    model_path_ = resolve_model_path(model_name);

    // Set logging verbosity before creating context to suppress init spam when not verbose
    whisper_log_set(log_cb, nullptr);

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = false; // CPU path
    core::log_info("[whisper] init from: " + model_path_);
    ctx_ = whisper_init_from_file_with_params(model_path_.c_str(), cparams);
    if (!ctx_) {
        core::log_error("[whisper] init FAILED for path: " + model_path_);
        return false;
    }
    core::log_debug(std::string("[whisper] system: ") + whisper_print_system_info());

    // persistent state for repeated calls
    state_ = whisper_init_state(ctx_);
    if (!state_) {
        core::log_error("[whisper] could not allocate decoder state");
        whisper_free(ctx_);
        ctx_ = nullptr;
        return false;
    }
    return true;
}

RawRecognition WhisperBackend::transcribe(const std::vector<float>& mono, int sample_rate,
                                          const RecognizerOptions& options) {
    RawRecognition out;
    if (!ctx_ || !state_) {
        core::log_error("[whisper] transcribe called without a loaded model");
        return out;
    }
    if (sample_rate != WHISPER_SAMPLE_RATE) {
        std::ostringstream oss;
        oss << "[whisper] expected " << WHISPER_SAMPLE_RATE << " Hz input, got " << sample_rate;
        core::log_error(oss.str());
        return out;
    }
    if (mono.empty()) {
        out.push_back(RawAlignment{std::string(), {}});
        return out;
    }

    const bool verbose = whisper_verbose();
    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.print_realtime   = false;
    wparams.print_progress   = verbose;
    wparams.print_timestamps = verbose;
    wparams.print_special    = false;
    wparams.translate        = options.translate;
    wparams.language         = options.language.c_str();
    wparams.detect_language  = false;
    wparams.n_threads        = (options.n_threads <= 0)
                                   ? static_cast<int>(std::max(1u, std::thread::hardware_concurrency()))
                                   : options.n_threads;
    wparams.offset_ms        = 0;
    wparams.duration_ms      = 0; // process all
    wparams.token_timestamps = true;
    wparams.max_len          = 0;
    wparams.split_on_word    = false;
    wparams.no_context       = true;
    wparams.greedy.best_of   = 1;

    int ret = whisper_full_with_state(ctx_, state_, wparams, mono.data(), static_cast<int>(mono.size()));
    if (ret != 0) {
        core::log_error("[whisper] whisper_full FAILED, ret=" + std::to_string(ret));
        return out;
    }

    const whisper_token eot = whisper_token_eot(ctx_);
    RawAlignment alignment;
    std::string full_text;

    const int n_segments = whisper_full_n_segments_from_state(state_);
    for (int i = 0; i < n_segments; ++i) {
        const char* txt = whisper_full_get_segment_text_from_state(state_, i);
        std::string text = trim(txt ? txt : "");
        if (text.empty() || is_non_speech(text)) continue;

        Sentence sentence;
        sentence.text = text;
        // whisper timestamps are in units of 10 ms
        sentence.start = whisper_full_get_segment_t0_from_state(state_, i) * 0.01;
        sentence.end = whisper_full_get_segment_t1_from_state(state_, i) * 0.01;
        sentence.duration = sentence.end - sentence.start;

        const int n_tokens = whisper_full_n_tokens_from_state(state_, i);
        for (int j = 0; j < n_tokens; ++j) {
            whisper_token_data data = whisper_full_get_token_data_from_state(state_, i, j);
            if (data.id >= eot) continue; // special tokens
            const char* token_text = whisper_full_get_token_text_from_state(ctx_, state_, i, j);
            if (!token_text) continue;

            Token token;
            token.text = token_text;
            token.start = data.t0 * 0.01;
            token.end = data.t1 * 0.01;
            token.duration = token.end - token.start;
            sentence.tokens.push_back(std::move(token));
        }

        if (!full_text.empty()) full_text.push_back(' ');
        full_text += text;
        alignment.sentences.push_back(std::move(sentence));
    }
    alignment.text = full_text;

    if (verbose) whisper_print_timings(ctx_);
    out.push_back(std::move(alignment));
    return out;
}

}
