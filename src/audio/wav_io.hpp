#pragma once
#include <string>
#include <vector>
#include "audio/chunk_sink.hpp"
#include "audio/signal.hpp"

namespace audio {

// Read a WAV file as mono PCM16 (channels averaged) at its own sample rate.
// Returns true on success
bool read_wav(const std::string& path, Signal& out);

// Write mono PCM16 samples as a WAV file, creating parent directories.
bool write_wav(const std::string& path, const int16_t* data, size_t samples, int sample_rate);

/**
 * @brief Debug sink that dumps every chunk as <dir>/chunk_<index>.wav
 */
class WavChunkSink : public ChunkSink {
public:
    explicit WavChunkSink(std::string dir);

    void write(const Chunk& chunk) override;

    // Remove chunk_*.wav files left by earlier runs; returns how many were removed.
    size_t clear();

    const std::string& dir() const { return dir_; }
    std::string path_for(size_t index) const;

private:
    std::string dir_;
};

}
