#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "asr/speech_engine.hpp"
#include "audio/signal.hpp"
#include "core/errors.hpp"

namespace asr {

struct Recognition {
    std::string text;
    std::optional<core::ErrorKind> error;  ///< NoSpeechDetected or ServiceUnavailable

    bool ok() const { return !error.has_value(); }
};

/**
 * @brief Normalizes engine outcomes into Success / NoSpeechDetected /
 * ServiceUnavailable. No retries.
 */
class RecognitionAdapter {
public:
    explicit RecognitionAdapter(std::shared_ptr<SpeechEngine> engine);

    Recognition recognize(const int16_t* data, size_t samples, const std::string& language) const;
    Recognition recognize(const audio::Chunk& chunk, const std::string& language) const;

    void set_parallel_calls(size_t calls) const;

private:
    std::shared_ptr<SpeechEngine> engine_;
};

// Trim and drop non-speech markers such as "[BLANK_AUDIO]" or "(music)".
std::string clean_transcript(const std::string& raw);

}
