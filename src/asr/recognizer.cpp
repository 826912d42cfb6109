#include "asr/recognizer.hpp"

namespace asr {

AlignedResult shifted(AlignedResult result, double offset_s) {
    if (offset_s == 0.0) return result;
    for (auto& sentence : result.sentences) {
        sentence.start += offset_s;
        sentence.end += offset_s;
        for (auto& token : sentence.tokens) {
            token.start += offset_s;
            token.end += offset_s;
        }
    }
    return result;
}

RecognitionOutcome validate_recognition(RawRecognition raw) {
    if (raw.empty()) {
        return MalformedResult{"model returned no alignment"};
    }
    RawAlignment& first = raw.front();
    if (!first.text) {
        return MalformedResult{"alignment has no text field"};
    }

    AlignedResult result;
    result.text = std::move(*first.text);
    result.sentences = std::move(first.sentences);
    return result;
}

}
