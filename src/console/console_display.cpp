#include "console/console_display.hpp"
#include "output/transcript_export.hpp"

#include <iomanip>
#include <ostream>
#include <sstream>

namespace console {

namespace {
const char* const kHeader = "\033[95m";
const char* const kBlue = "\033[94m";
const char* const kCyan = "\033[96m";
const char* const kGreen = "\033[92m";
const char* const kYellow = "\033[93m";
const char* const kBold = "\033[1m";
const char* const kReset = "\033[0m";
}

ConsoleDisplay::ConsoleDisplay(std::ostream& out, bool color) : out_(out), color_(color) {}

std::string ConsoleDisplay::paint(const std::string& text, const char* code) const {
    if (!color_) return text;
    return code + text + kReset;
}

std::string ConsoleDisplay::render(const core::WorkerReport& report) const {
    const bool is_final = report.kind == audio::EmissionKind::Full;

    std::ostringstream rtf;
    rtf << std::fixed << std::setprecision(2) << "(RTF: " << report.realtime_factor << "x)";

    std::ostringstream oss;
    oss << "\n" << paint("Transcription:", kHeader) << " ["
        << (is_final ? paint("FINAL", kGreen) : paint("INTERIM", kYellow)) << "] "
        << paint(rtf.str(), kCyan) << "\n";

    const std::string& text = report.result.text;
    oss << paint(text.empty() ? "[No speech detected]" : text, kBold) << "\n";

    if (!report.result.sentences.empty()) {
        std::string words;
        for (const auto& token : report.result.sentences.back().tokens) {
            if (token.text.find_first_not_of(" \t") == std::string::npos) continue;
            words += paint(token.text, kBlue) + "[" + output::format_clock(token.start) + "] ";
        }
        if (!words.empty()) {
            oss << words << "\n";
        }
    }
    return oss.str();
}

void ConsoleDisplay::show(const core::WorkerReport& report) {
    std::string text = render(report);
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << text << std::flush;
}

}
