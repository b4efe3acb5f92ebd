#pragma once
#include <stdexcept>
#include <string>

namespace core {

// Outcome kinds that are reported as values, never thrown.
enum class ErrorKind {
    NoSpeechDetected,   ///< unit held no recognizable speech
    ServiceUnavailable, ///< engine unreachable or transient failure
    EmptyResult         ///< batch-level: no unit produced text
};

const char* to_string(ErrorKind kind);

// Invalid parameter combination, rejected before any processing starts.
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument(what) {}
};

}
