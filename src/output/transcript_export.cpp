#include "output/transcript_export.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace output {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& x) {
    size_t a = x.find_first_not_of(" \t");
    size_t b = x.find_last_not_of(" \t");
    if (a == std::string::npos) return {};
    return x.substr(a, b - a + 1);
}

// Whole milliseconds, truncated. The epsilon keeps 0.29 from becoming 289.
int64_t to_millis(double seconds) {
    if (!(seconds > 0.0)) return 0;
    return static_cast<int64_t>(std::floor(seconds * 1000.0 + 1e-6));
}

bool write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) return false;
    f << content;
    return static_cast<bool>(f);
}

} // namespace

std::set<Format> parse_formats(const std::string& list) {
    std::set<Format> formats;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        std::string name = lower(trim(item));
        if (name.empty()) continue;
        if (name == "all") {
            formats = {Format::Text, Format::Subtitle, Format::Structured};
        } else if (name == "txt" || name == "text") {
            formats.insert(Format::Text);
        } else if (name == "srt" || name == "subtitle") {
            formats.insert(Format::Subtitle);
        } else if (name == "json" || name == "structured") {
            formats.insert(Format::Structured);
        } else {
            throw std::invalid_argument("unknown output format: " + item);
        }
    }
    if (formats.empty()) {
        throw std::invalid_argument("no output format given");
    }
    return formats;
}

const char* extension(Format format) {
    switch (format) {
    case Format::Text: return "txt";
    case Format::Subtitle: return "srt";
    case Format::Structured: return "json";
    }
    return "out";
}

std::string format_clock(double seconds) {
    const int64_t total = to_millis(seconds) / 1000;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld",
                  static_cast<long long>(total / 60), static_cast<long long>(total % 60));
    return buf;
}

std::string format_srt_timestamp(double seconds) {
    const int64_t ms = to_millis(seconds);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld,%03lld",
                  static_cast<long long>(ms / 3600000),
                  static_cast<long long>((ms / 60000) % 60),
                  static_cast<long long>((ms / 1000) % 60),
                  static_cast<long long>(ms % 1000));
    return buf;
}

std::string to_plain_text(const std::vector<asr::AlignedResult>& results) {
    std::string out;
    for (const auto& result : results) {
        for (const auto& sentence : result.sentences) {
            out += "[" + format_clock(sentence.start) + " - " + format_clock(sentence.end) + "] " +
                   sentence.text + "\n";
        }
    }
    return out;
}

std::string to_srt(const std::vector<asr::AlignedResult>& results) {
    std::string out;
    int index = 1;
    for (const auto& result : results) {
        for (const auto& sentence : result.sentences) {
            out += std::to_string(index++) + "\n";
            out += format_srt_timestamp(sentence.start) + " --> " + format_srt_timestamp(sentence.end) + "\n";
            out += sentence.text + "\n\n";
        }
    }
    return out;
}

nlohmann::json to_json(const std::vector<asr::AlignedResult>& results) {
    nlohmann::json data = nlohmann::json::array();
    for (const auto& result : results) {
        nlohmann::json sentences = nlohmann::json::array();
        for (const auto& sentence : result.sentences) {
            nlohmann::json tokens = nlohmann::json::array();
            for (const auto& token : sentence.tokens) {
                tokens.push_back({
                    {"text", token.text},
                    {"start", token.start},
                    {"end", token.end},
                    {"duration", token.duration}
                });
            }
            sentences.push_back({
                {"text", sentence.text},
                {"start", sentence.start},
                {"end", sentence.end},
                {"duration", sentence.duration},
                {"tokens", tokens}
            });
        }
        data.push_back({
            {"text", result.text},
            {"sentences", sentences}
        });
    }
    return data;
}

std::string file_stem(std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    char buf[64];
    std::strftime(buf, sizeof(buf), "transcription_%Y%m%d_%H%M%S", &tm);
    return buf;
}

std::vector<std::filesystem::path> save_transcriptions(
    const std::vector<asr::AlignedResult>& results,
    const std::filesystem::path& dir,
    const std::set<Format>& formats,
    std::chrono::system_clock::time_point when) {
    std::vector<std::filesystem::path> written;
    if (results.empty()) {
        core::log_info("No transcriptions to save.");
        return written;
    }

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        core::log_error("Cannot create output directory " + dir.string() + ": " + ec.message());
        return written;
    }

    const std::string stem = file_stem(when);
    for (Format format : formats) {
        std::filesystem::path path = dir / (stem + "." + extension(format));
        std::string content;
        switch (format) {
        case Format::Text: content = to_plain_text(results); break;
        case Format::Subtitle: content = to_srt(results); break;
        case Format::Structured: content = to_json(results).dump(2); break;
        }
        if (!write_file(path, content)) {
            core::log_error("Failed to write " + path.string());
            continue;
        }
        core::log_info("Saved transcript to " + path.string());
        written.push_back(path);
    }
    return written;
}

}
