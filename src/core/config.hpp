#pragma once
#include <cstddef>
#include <string>
#include "audio/fixed_window_chunker.hpp"
#include "audio/silence_segmenter.hpp"
#include "core/stream_buffer.hpp"

namespace core {

enum class Segmentation { Silence, FixedWindow };

struct Config {
    std::string language = "de-DE";   // BCP-47 tag
    std::string model = "base";       // bare name or path to .bin/.gguf
    int sample_rate = 16000;

    Segmentation segmentation = Segmentation::Silence;
    audio::SilenceParams silence;
    audio::WindowParams window;
    StreamParams stream;

    size_t max_concurrency = 0;  // 0 = hardware threads
    int engine_threads = 0;      // 0 = auto
    int pad_ms = 100;            // silence added around each unit before recognition

    std::string debug_chunk_dir; // empty = no chunk dumps
    bool verbose = false;
};

// Defaults with CHUNKSCRIBE_* environment overrides applied once.
const Config& get_config();

// Throws ConfigurationError on the first invalid setting.
void validate(const Config& config);

Segmentation parse_segmentation(const std::string& name);

}
