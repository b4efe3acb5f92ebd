#include "audio/fixed_window_chunker.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <string>

namespace audio {

void validate(const WindowParams& params) {
    if (params.chunk_ms <= 0) {
        throw core::ConfigurationError("chunk duration must be positive, got " +
                                       std::to_string(params.chunk_ms) + " ms");
    }
    if (params.overlap_ms < 0) {
        throw core::ConfigurationError("overlap must not be negative, got " +
                                       std::to_string(params.overlap_ms) + " ms");
    }
    if (params.overlap_ms >= params.chunk_ms) {
        throw core::ConfigurationError("overlap (" + std::to_string(params.overlap_ms) +
                                       " ms) must be shorter than chunk duration (" +
                                       std::to_string(params.chunk_ms) + " ms)");
    }
}

std::vector<Chunk> chunk_fixed_windows(const Signal& signal, const WindowParams& params) {
    validate(params);
    std::vector<Chunk> chunks;
    if (signal.empty()) return chunks;

    const int sr = signal.sample_rate;
    const size_t window = std::max<size_t>(1, ms_to_samples(params.chunk_ms, sr));
    const size_t overlap = std::min(window - 1, ms_to_samples(params.overlap_ms, sr));
    const size_t step = window - overlap;

    for (size_t start = 0; start < signal.size(); start += step) {
        const size_t end = std::min(signal.size(), start + window);
        Chunk c;
        c.index = chunks.size();
        c.samples.assign(signal.samples.begin() + start, signal.samples.begin() + end);
        c.start_sample = start;
        c.overlap_start_offset = chunks.empty() ? 0 : overlap;
        c.sample_rate = sr;
        chunks.push_back(std::move(c));
        if (end == signal.size()) break;
    }

    core::log_debug("[chunk] " + std::to_string(chunks.size()) + " windows of " +
                    std::to_string(params.chunk_ms) + " ms, overlap " +
                    std::to_string(params.overlap_ms) + " ms");
    return chunks;
}

}
