#pragma once
#include <iosfwd>
#include <mutex>
#include <string>

#include "core/transcription_worker.hpp"

namespace console {

// Prints INTERIM/FINAL results with RTF and word timestamps of the last sentence
class ConsoleDisplay {
public:
    ConsoleDisplay(std::ostream& out, bool color);

    void show(const core::WorkerReport& report);

    std::string render(const core::WorkerReport& report) const;

private:
    std::string paint(const std::string& text, const char* code) const;

    std::ostream& out_;
    bool color_;
    std::mutex mutex_;
};

}
