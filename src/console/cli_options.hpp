#pragma once
#include <set>
#include <string>

#include "asr/recognizer.hpp"
#include "core/config.hpp"
#include "output/transcript_export.hpp"

namespace console {

struct CliOptions {
    std::string device_id;              ///< empty = default capture device
    bool list_devices = false;
    bool show_help = false;
    std::string model = "base.en";

    core::PipelineConfig pipeline;
    asr::RecognizerOptions recognizer;

    std::string output_dir = "transcriptions";
    std::set<output::Format> formats = {output::Format::Text, output::Format::Subtitle,
                                        output::Format::Structured};

    bool loop_file = false;             ///< synthetic device only
    bool color = true;
    bool verbose = false;
};

/**
 * @brief Parse argv
 *
 * Throws std::invalid_argument for unknown flags, missing or malformed values,
 * and configurations rejected by core::validate.
 */
CliOptions parse_cli(int argc, char** argv);

std::string usage(const std::string& program);

}
