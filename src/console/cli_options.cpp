#include "console/cli_options.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace console {

namespace {

double parse_seconds(const std::string& flag, const std::string& value) {
    char* end = nullptr;
    double v = std::strtod(value.c_str(), &end);
    if (value.empty() || end == value.c_str() || *end != '\0') {
        throw std::invalid_argument(flag + " expects a number of seconds, got '" + value + "'");
    }
    return v;
}

long parse_count(const std::string& flag, const std::string& value, long min_value) {
    char* end = nullptr;
    long v = std::strtol(value.c_str(), &end, 10);
    if (value.empty() || end == value.c_str() || *end != '\0' || v < min_value) {
        throw std::invalid_argument(flag + " expects an integer >= " + std::to_string(min_value) +
                                    ", got '" + value + "'");
    }
    return v;
}

} // namespace

CliOptions parse_cli(int argc, char** argv) {
    CliOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument(a + " requires a value");
            return argv[++i];
        };

        if (a == "-h" || a == "--help") { opts.show_help = true; continue; }
        if (a == "-v" || a == "--verbose") { opts.verbose = true; continue; }
        if (a == "--list-devices") { opts.list_devices = true; continue; }
        if (a == "--device") { opts.device_id = value(); continue; }
        if (a == "--model") { opts.model = value(); continue; }
        if (a == "--no-chunking") { opts.pipeline.enable_chunking = false; continue; }
        if (a == "--chunk-duration") { opts.pipeline.chunk_duration_s = parse_seconds(a, value()); continue; }
        if (a == "--overlap-duration") { opts.pipeline.overlap_duration_s = parse_seconds(a, value()); continue; }
        if (a == "--buffer-duration") { opts.pipeline.buffer_duration_s = parse_seconds(a, value()); continue; }
        if (a == "--output-dir") { opts.output_dir = value(); continue; }
        if (a == "--output-format") { opts.formats = output::parse_formats(value()); continue; }
        if (a == "--queue-capacity") { opts.pipeline.queue_capacity = static_cast<size_t>(parse_count(a, value(), 1)); continue; }
        if (a == "--drop-oldest") { opts.pipeline.overflow_policy = core::OverflowPolicy::DropOldest; continue; }
        if (a == "--threads") { opts.recognizer.n_threads = static_cast<int>(parse_count(a, value(), 0)); continue; }
        if (a == "--language") { opts.recognizer.language = value(); continue; }
        if (a == "--no-rebase") { opts.pipeline.rebase_timestamps = false; continue; }
        if (a == "--loop") { opts.loop_file = true; continue; }
        if (a == "--no-color") { opts.color = false; continue; }

        throw std::invalid_argument("unknown option: " + a);
    }

    if (!opts.show_help && !opts.list_devices) {
        core::validate(opts.pipeline);
    }
    return opts;
}

std::string usage(const std::string& program) {
    const core::PipelineConfig defaults;
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n"
        << "\n"
        << "Real-time microphone transcription with chunked, overlapping windows.\n"
        << "\n"
        << "  --device ID            capture device (default: system default;\n"
        << "                         synthetic:<file.wav> plays a WAV file as a microphone)\n"
        << "  --list-devices         list capture devices and exit\n"
        << "  --model NAME           whisper model name or path (default: base.en)\n"
        << "  --no-chunking          interim segments only\n"
        << "  --chunk-duration S     full chunk length (default: " << defaults.chunk_duration_s << ")\n"
        << "  --overlap-duration S   overlap between chunks, < chunk (default: " << defaults.overlap_duration_s << ")\n"
        << "  --buffer-duration S    interim segment length (default: " << defaults.buffer_duration_s << ")\n"
        << "  --output-dir DIR       where transcripts are saved (default: transcriptions)\n"
        << "  --output-format LIST   txt,srt,json or all (default: all)\n"
        << "  --queue-capacity N     frames buffered before dropping (default: " << defaults.queue_capacity << ")\n"
        << "  --drop-oldest          on overflow drop the oldest frame instead of the newest\n"
        << "  --threads N            model threads, 0 = auto\n"
        << "  --language CODE        spoken language (default: en)\n"
        << "  --no-rebase            keep timestamps relative to each chunk\n"
        << "  --loop                 loop the synthetic WAV file\n"
        << "  --no-color             plain console output\n"
        << "  -v, --verbose          debug logging\n"
        << "  -h, --help             show this help\n";
    return oss.str();
}

}
