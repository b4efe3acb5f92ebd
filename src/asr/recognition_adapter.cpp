#include "asr/recognition_adapter.hpp"
#include "core/logging.hpp"
#include <sstream>
#include <stdexcept>
#include <utility>

namespace asr {

namespace {
void trim(std::string& x) {
    size_t a = x.find_first_not_of(" \t\r\n");
    size_t b = x.find_last_not_of(" \t\r\n");
    if (a == std::string::npos) { x.clear(); return; }
    x = x.substr(a, b - a + 1);
}

bool is_marker(const std::string& s) {
    if (s.size() < 2) return false;
    return (s.front() == '[' && s.back() == ']') || (s.front() == '(' && s.back() == ')') ||
           (s.front() == '*' && s.back() == '*');
}
}

std::string clean_transcript(const std::string& raw) {
    // Engines return one line per decoded segment; markers occupy whole segments
    std::istringstream lines(raw);
    std::string line;
    std::string out;
    while (std::getline(lines, line)) {
        trim(line);
        if (line.empty() || is_marker(line)) continue;
        if (!out.empty()) out.push_back(' ');
        out += line;
    }
    return out;
}

RecognitionAdapter::RecognitionAdapter(std::shared_ptr<SpeechEngine> engine)
    : engine_(std::move(engine)) {
    if (!engine_) throw std::invalid_argument("RecognitionAdapter requires an engine");
}

Recognition RecognitionAdapter::recognize(const int16_t* data, size_t samples,
                                          const std::string& language) const {
    Recognition r;
    if (!data || samples == 0) {
        r.error = core::ErrorKind::NoSpeechDetected;
        return r;
    }
    try {
        r.text = clean_transcript(engine_->transcribe(data, samples, language));
    } catch (const std::runtime_error& e) {
        core::log_error(std::string("[asr] recognition failed: ") + e.what());
        r.error = core::ErrorKind::ServiceUnavailable;
        return r;
    }
    if (r.text.empty()) r.error = core::ErrorKind::NoSpeechDetected;
    return r;
}

Recognition RecognitionAdapter::recognize(const audio::Chunk& chunk, const std::string& language) const {
    Recognition r = recognize(chunk.samples.data(), chunk.samples.size(), language);
    if (r.error == core::ErrorKind::NoSpeechDetected) {
        core::log_debug("[asr] chunk " + std::to_string(chunk.index) + ": no speech");
    } else if (r.error == core::ErrorKind::ServiceUnavailable) {
        core::log_warn("[asr] chunk " + std::to_string(chunk.index) + " skipped: " +
                       core::to_string(*r.error));
    }
    return r;
}

void RecognitionAdapter::set_parallel_calls(size_t calls) const {
    engine_->set_parallel_calls(calls);
}

}
