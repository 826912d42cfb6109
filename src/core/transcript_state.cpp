#include "core/transcript_state.hpp"

namespace core {

void SharedTranscript::append_final(asr::AlignedResult result) {
    auto now = std::chrono::system_clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    // empty text keeps the previous display line
    if (!result.text.empty()) {
        state_.latest_text = result.text;
    }
    state_.all_results.push_back(std::move(result));
    state_.chunks_processed++;
    state_.last_update = now;
}

void SharedTranscript::update_interim(const std::string& text) {
    auto now = std::chrono::system_clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    if (!text.empty()) {
        state_.latest_text = text;
    }
    state_.last_update = now;
}

TranscriptionState SharedTranscript::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::vector<asr::AlignedResult> SharedTranscript::all_results() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.all_results;
}

std::string SharedTranscript::latest_text() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.latest_text;
}

size_t SharedTranscript::chunks_processed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.chunks_processed;
}

}
