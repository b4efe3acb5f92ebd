#pragma once
#include "audio/signal.hpp"

namespace audio {

// Optional side channel receiving every chunk before recognition.
// Batch workers call write() concurrently with distinct chunks.
class ChunkSink {
public:
    virtual ~ChunkSink() = default;
    virtual void write(const Chunk& chunk) = 0;
};

}
