#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace asr {

// Transient engine failure: unreachable, overloaded or failed mid-call.
class EngineUnavailable : public std::runtime_error {
public:
    explicit EngineUnavailable(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Opaque speech recognition capability
 *
 * Takes mono 16 kHz PCM16 and returns raw recognized text (possibly empty or
 * containing non-speech markers). Implementations throw EngineUnavailable on
 * transient failure and must be callable from several threads at once.
 */
class SpeechEngine {
public:
    virtual ~SpeechEngine() = default;
    virtual std::string transcribe(const int16_t* data, size_t samples, const std::string& language) = 0;

    // Number of transcribe() calls the caller is about to run side by side.
    // Engines with their own thread pools size them from this.
    virtual void set_parallel_calls(size_t /*calls*/) {}
};

}
