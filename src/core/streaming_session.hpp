#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "asr/recognition_adapter.hpp"
#include "audio/chunk_sink.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"

namespace core {

/**
 * @brief One transcription outcome of a live stream
 */
struct StreamEvent {
    enum class Kind { Text, Error };

    Kind kind = Kind::Text;
    size_t chunk_index = 0;
    std::string text;               ///< set for Kind::Text
    std::optional<ErrorKind> error; ///< set for Kind::Error
};

/**
 * @brief Live transcription for a single connection.
 *
 * Audio Thread (caller):
 *   - add_samples() pushes the block onto a queue and returns immediately
 *
 * Accumulation Thread:
 *   - pops blocks in arrival order into a StreamBuffer
 *   - hands every emitted chunk to the recognition thread
 *
 * Recognition Thread:
 *   - recognizes one chunk at a time
 *   - runs the duplicate gate and raises events
 *
 * NoSpeechDetected and repeated text raise nothing; ServiceUnavailable raises
 * an Error event and the stream carries on. An exception thrown while a chunk
 * is handled (event callback, chunk sink, engine) is logged, skips that chunk
 * only, and is rethrown by finish(). Audio left below the processing
 * threshold when the stream ends is not transcribed.
 */
class StreamingSession {
public:
    using EventCallback = std::function<void(const StreamEvent&)>;

    struct Stats {
        size_t blocks_received = 0;
        size_t samples_received = 0;
        size_t chunks_emitted = 0;
        size_t chunks_recognized = 0;
        size_t text_events = 0;
        size_t error_events = 0;
        size_t duplicates_suppressed = 0;
        size_t internal_errors = 0;
        size_t peak_pending_chunks = 0;  ///< chunks waiting for recognition
    };

    // A warning is logged when more chunks than this wait for recognition
    static constexpr size_t kPendingChunksWarning = 4;

    StreamingSession(std::shared_ptr<const asr::RecognitionAdapter> adapter,
                     const Config& config,
                     EventCallback on_event);
    ~StreamingSession();

    StreamingSession(const StreamingSession&) = delete;
    StreamingSession& operator=(const StreamingSession&) = delete;

    void set_chunk_sink(std::shared_ptr<audio::ChunkSink> sink);

    /**
     * @brief Start the worker threads
     * @return false if the session was already started once
     */
    bool start();

    /**
     * @brief Queue a block of mono samples (never blocks)
     */
    void add_samples(const int16_t* samples, size_t sample_count);

    /**
     * @brief End of input: recognize every chunk already emitted, then stop.
     * Rethrows the first exception raised while handling a chunk.
     */
    void finish();

    /**
     * @brief Connection closed: discard buffered audio and pending chunks.
     * A recognition already running completes and its result is dropped.
     */
    void stop();

    bool is_running() const { return running_.load(); }

    Stats stats() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;

    std::atomic<bool> running_{false};
};

}
