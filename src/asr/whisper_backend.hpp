#pragma once
#include <atomic>
#include <cstddef>
#include <string>
#include <vector>
#include "asr/speech_engine.hpp"

struct whisper_context;

namespace asr {

/**
 * @brief whisper.cpp speech engine
 *
 * The model context is loaded once and shared read-only; every transcribe()
 * call gets its own whisper_state, so concurrent calls are safe.
 */
class WhisperBackend : public SpeechEngine {
public:
    WhisperBackend() = default;
    ~WhisperBackend() override;

    WhisperBackend(const WhisperBackend&) = delete;
    WhisperBackend& operator=(const WhisperBackend&) = delete;

    // Bare names (base, small.en) are looked up under models/
    bool load_model(const std::string& model_name);
    bool loaded() const { return ctx_ != nullptr; }

    // Segment texts separated by newlines; throws EngineUnavailable on failure
    std::string transcribe(const int16_t* data, size_t samples, const std::string& language) override;

    void set_threads(int n);  // 0 = hardware threads split across parallel calls
    void set_parallel_calls(size_t calls) override;

private:
    whisper_context* ctx_ = nullptr;
    int n_threads_ = 0;
    std::atomic<size_t> parallel_calls_{1};
};

// "de-DE" -> "de"; whisper only knows primary language subtags
std::string whisper_language(const std::string& bcp47);

// Candidate files for a bare model name, in lookup order
std::vector<std::string> model_candidates(const std::string& model_name);

}
