#pragma once
#include <chrono>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "asr/aligned_result.hpp"

namespace output {

enum class Format { Text, Subtitle, Structured };

/**
 * @brief Parse a comma separated format list
 *
 * Accepts txt|text, srt|subtitle, json|structured and all (case-insensitive).
 * Throws std::invalid_argument on an unknown name or an empty list.
 */
std::set<Format> parse_formats(const std::string& list);

const char* extension(Format format);

/// "MM:SS", minutes are not wrapped at 60
std::string format_clock(double seconds);

/// "HH:MM:SS,mmm", milliseconds truncated
std::string format_srt_timestamp(double seconds);

/// One "[MM:SS - MM:SS] text" line per sentence
std::string to_plain_text(const std::vector<asr::AlignedResult>& results);

/// SubRip: 1-based index, time range, text, blank line
std::string to_srt(const std::vector<asr::AlignedResult>& results);

nlohmann::json to_json(const std::vector<asr::AlignedResult>& results);

/// "transcription_YYYYMMDD_HHMMSS" in local time
std::string file_stem(std::chrono::system_clock::time_point when);

/**
 * @brief Write the selected formats to `<dir>/<file_stem>.<ext>`
 * @return Paths written; empty when there is nothing to save
 *
 * Creates `dir` if needed. I/O failures are reported and skipped per file.
 */
std::vector<std::filesystem::path> save_transcriptions(
    const std::vector<asr::AlignedResult>& results,
    const std::filesystem::path& dir,
    const std::set<Format>& formats,
    std::chrono::system_clock::time_point when = std::chrono::system_clock::now());

}
