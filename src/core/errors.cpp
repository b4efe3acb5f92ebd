#include "core/errors.hpp"

namespace core {

const char* to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NoSpeechDetected:   return "no speech detected";
    case ErrorKind::ServiceUnavailable: return "recognition service unavailable";
    case ErrorKind::EmptyResult:        return "no speech found";
    }
    return "unknown error";
}

}
