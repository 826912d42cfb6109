#pragma once
#include <string>
#include <vector>

namespace asr {

// Times are seconds from the start of the audio block the model saw,
// or from the session start once a result has been re-based.
struct Token {
    std::string text;
    double start = 0.0;
    double end = 0.0;
    double duration = 0.0;
};

struct Sentence {
    std::string text;
    double start = 0.0;
    double end = 0.0;
    double duration = 0.0;
    std::vector<Token> tokens;
};

struct AlignedResult {
    std::string text;
    std::vector<Sentence> sentences;
};

// Shift every sentence and token by `offset_s` seconds
AlignedResult shifted(AlignedResult result, double offset_s);

}
