#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "audio/signal.hpp"

namespace core {

struct StreamParams {
    int sample_rate = audio::kDefaultSampleRate;
    int min_process_ms = 5000;        ///< emit a chunk once this much audio is pending
    int context_retention_ms = 2500;  ///< tail kept as context for the next chunk
};

// Throws ConfigurationError for non-positive lengths or retention >= threshold.
void validate(const StreamParams& params);

/**
 * @brief Sliding accumulation buffer for one live stream.
 *
 * Collects sample blocks until min_process_ms of audio is pending, hands the
 * whole buffer out as a Chunk, then keeps only the trailing
 * context_retention_ms so the next chunk starts with acoustic context.
 * Also remembers the last emitted transcript to suppress back-to-back
 * duplicates.
 *
 * Not thread-safe: one producer per instance.
 */
class StreamBuffer {
public:
    enum class State {
        Accumulating,
        Ready  ///< only observable while a chunk is being handed out
    };

    explicit StreamBuffer(const StreamParams& params = {});

    /**
     * @brief Append a block of samples
     * @return the chunk to recognize once the threshold is reached
     */
    std::optional<audio::Chunk> add_samples(const int16_t* data, size_t count);
    std::optional<audio::Chunk> add_samples(const std::vector<int16_t>& block) {
        return add_samples(block.data(), block.size());
    }

    /**
     * @brief Duplicate gate for a freshly recognized text
     * @return true for non-empty text that differs from the last emitted one
     */
    bool should_emit(const std::string& text);

    size_t sample_count() const { return sample_count_; }
    const std::vector<int16_t>& pending() const { return pending_; }
    const std::string& last_emitted_text() const { return last_emitted_text_; }
    State state() const { return state_; }

    size_t min_samples_to_process() const { return min_samples_; }
    size_t context_retention_samples() const { return retention_samples_; }

    void reset();

private:
    audio::Chunk take_chunk();

    StreamParams params_;
    size_t min_samples_ = 0;
    size_t retention_samples_ = 0;

    std::vector<int16_t> pending_;
    size_t sample_count_ = 0;
    std::string last_emitted_text_;
    State state_ = State::Accumulating;

    size_t next_index_ = 0;
    size_t retained_ = 0;       ///< leading samples of pending_ carried from the last chunk
    uint64_t stream_pos_ = 0;   ///< absolute stream offset of pending_[0]
};

}
