#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace audio {

constexpr int kDefaultSampleRate = 16000;

// Mono 16-bit PCM at a fixed sample rate.
struct Signal {
    std::vector<int16_t> samples;
    int sample_rate = kDefaultSampleRate;

    size_t size() const { return samples.size(); }
    bool empty() const { return samples.empty(); }
    int64_t duration_ms() const {
        return sample_rate > 0 ? static_cast<int64_t>(samples.size()) * 1000 / sample_rate : 0;
    }
};

// Speech region cut out of a parent Signal by the silence segmenter.
struct Segment {
    std::vector<int16_t> samples;
    size_t start_sample = 0;    ///< offset in the parent signal
    int sample_rate = kDefaultSampleRate;

    size_t end_sample() const { return start_sample + samples.size(); }
    int64_t start_ms() const { return static_cast<int64_t>(start_sample) * 1000 / sample_rate; }
    int64_t end_ms() const { return static_cast<int64_t>(end_sample()) * 1000 / sample_rate; }
    int64_t duration_ms() const { return static_cast<int64_t>(samples.size()) * 1000 / sample_rate; }
};

// Unit of work handed to recognition.
struct Chunk {
    size_t index = 0;
    std::vector<int16_t> samples;
    size_t start_sample = 0;          ///< offset in the source signal or stream
    size_t overlap_start_offset = 0;  ///< leading samples shared with the previous chunk
    int sample_rate = kDefaultSampleRate;

    int64_t start_ms() const { return static_cast<int64_t>(start_sample) * 1000 / sample_rate; }
    int64_t duration_ms() const { return static_cast<int64_t>(samples.size()) * 1000 / sample_rate; }
};

inline size_t ms_to_samples(int64_t ms, int sample_rate) {
    if (ms <= 0 || sample_rate <= 0) return 0;
    return static_cast<size_t>(ms * sample_rate / 1000);
}

}
