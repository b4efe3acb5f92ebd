#include "core/config.hpp"
#include "core/errors.hpp"
#include <cstdlib>

namespace core {

namespace {
Config load_config() {
    Config cfg;
    if (const char* v = std::getenv("CHUNKSCRIBE_LANGUAGE")) cfg.language = v;
    if (const char* v = std::getenv("CHUNKSCRIBE_MODEL")) cfg.model = v;
    if (const char* v = std::getenv("CHUNKSCRIBE_DEBUG_DIR")) cfg.debug_chunk_dir = v;
    cfg.verbose = std::getenv("CHUNKSCRIBE_DEBUG") != nullptr;
    return cfg;
}
}

const Config& get_config() {
    static const Config cfg = load_config();
    return cfg;
}

void validate(const Config& config) {
    if (config.language.empty()) {
        throw ConfigurationError("language code must not be empty");
    }
    if (config.sample_rate <= 0) {
        throw ConfigurationError("sample rate must be positive");
    }
    if (config.silence.min_silence_ms <= 0 || config.silence.window_ms <= 0) {
        throw ConfigurationError("silence durations must be positive");
    }
    if (config.silence.keep_silence_ms < 0 || config.silence.min_segment_ms < 0 || config.pad_ms < 0) {
        throw ConfigurationError("padding durations must not be negative");
    }
    if (config.silence.headroom < 0.0 || config.silence.headroom >= 1.0) {
        throw ConfigurationError("normalization headroom must be in [0, 1)");
    }
    audio::validate(config.window);
    StreamParams stream = config.stream;
    stream.sample_rate = config.sample_rate;
    validate(stream);
}

Segmentation parse_segmentation(const std::string& name) {
    if (name == "silence") return Segmentation::Silence;
    if (name == "fixed" || name == "window") return Segmentation::FixedWindow;
    throw ConfigurationError("unknown segmentation mode: " + name);
}

}
