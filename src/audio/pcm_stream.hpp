#pragma once
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace audio {

// Raw little-endian mono PCM16 source: stdin ("-") or a file/pipe.
// Stands in for a live transport that delivers decoded sample blocks.
class PcmStreamReader {
public:
    explicit PcmStreamReader(size_t block_samples = 2048) : block_samples_(block_samples) {}
    ~PcmStreamReader() { stop(); }

    PcmStreamReader(const PcmStreamReader&) = delete;
    PcmStreamReader& operator=(const PcmStreamReader&) = delete;

    bool start(const std::string& input);
    void stop();

    // Next block of up to block_samples samples; empty at end of stream.
    std::vector<int16_t> read_block();

    uint64_t samples_read() const { return samples_read_; }

private:
    FILE* in_ = nullptr;
    bool owns_input_ = false;
    size_t block_samples_;
    uint64_t samples_read_ = 0;
    std::vector<uint8_t> carry_;
};

}
