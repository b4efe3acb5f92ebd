// StreamingSession - live transcription for one connection
//
// The transport thread only ever touches the AudioQueue. Buffer slicing and
// recognition run on separate threads so new audio keeps accumulating while a
// chunk is being recognized. Recognition is strictly sequential, which keeps
// the duplicate gate in StreamBuffer consistent with the latest result.

#include "core/streaming_session.hpp"
#include "audio/audio_queue.hpp"
#include "core/logging.hpp"
#include "core/stream_buffer.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

namespace core {

class StreamingSession::Impl {
public:
    Impl(std::shared_ptr<const asr::RecognitionAdapter> a, const Config& cfg, EventCallback cb)
        : adapter(std::move(a)), config(cfg), on_event(std::move(cb)), buffer(make_params(cfg)) {}

    static StreamParams make_params(const Config& cfg) {
        StreamParams p = cfg.stream;
        p.sample_rate = cfg.sample_rate;
        return p;
    }

    std::shared_ptr<const asr::RecognitionAdapter> adapter;
    Config config;
    EventCallback on_event;
    std::shared_ptr<audio::ChunkSink> sink;

    audio::AudioQueue audio_queue;
    std::thread accumulation_thread;
    std::thread recognition_thread;

    // StreamBuffer is single-owner; both threads go through buffer_mutex
    StreamBuffer buffer;
    std::mutex buffer_mutex;

    std::deque<audio::Chunk> ready_chunks;
    std::mutex chunks_mutex;
    std::condition_variable chunks_cv;
    bool accumulation_done = false;

    std::atomic<bool> cancelled{false};
    bool started = false;  // sessions are single-use

    // First exception thrown while handling a chunk; finish() rethrows it
    std::exception_ptr first_failure;
    std::mutex failure_mutex;

    mutable std::mutex stats_mutex;
    Stats stats;

    void accumulation_loop() {
        audio::AudioQueue::Block block;
        while (audio_queue.pop(block)) {
            if (cancelled.load()) break;
            std::optional<audio::Chunk> chunk;
            {
                std::lock_guard<std::mutex> lock(buffer_mutex);
                chunk = buffer.add_samples(block.samples);
            }
            if (!chunk) continue;
            const size_t chunk_index = chunk->index;
            size_t pending = 0;
            {
                std::lock_guard<std::mutex> lock(chunks_mutex);
                ready_chunks.push_back(std::move(*chunk));
                pending = ready_chunks.size();
                chunks_cv.notify_one();
            }
            {
                std::lock_guard<std::mutex> lock(stats_mutex);
                stats.chunks_emitted++;
                stats.peak_pending_chunks = std::max(stats.peak_pending_chunks, pending);
            }
            if (pending == kPendingChunksWarning + 1) {
                log_warn("[stream] recognition is falling behind: " + std::to_string(pending) +
                         " chunks pending at chunk " + std::to_string(chunk_index));
            }
        }
        std::lock_guard<std::mutex> lock(chunks_mutex);
        accumulation_done = true;
        chunks_cv.notify_all();
    }

    void recognition_loop() {
        while (true) {
            audio::Chunk chunk;
            {
                std::unique_lock<std::mutex> lock(chunks_mutex);
                chunks_cv.wait(lock, [this] {
                    return !ready_chunks.empty() || accumulation_done || cancelled.load();
                });
                if (cancelled.load() || ready_chunks.empty()) break;
                chunk = std::move(ready_chunks.front());
                ready_chunks.pop_front();
            }
            try {
                process_chunk(chunk);
            } catch (const std::exception& e) {
                record_failure(chunk.index, e.what());
            } catch (...) {
                record_failure(chunk.index, "unknown exception");
            }
        }
    }

    // Must be called from inside a catch block
    void record_failure(size_t chunk_index, const std::string& what) {
        log_error("[stream] chunk " + std::to_string(chunk_index) + " failed: " + what);
        {
            std::lock_guard<std::mutex> lock(stats_mutex);
            stats.internal_errors++;
        }
        std::lock_guard<std::mutex> lock(failure_mutex);
        if (!first_failure) first_failure = std::current_exception();
    }

    void process_chunk(const audio::Chunk& chunk) {
        if (sink) sink->write(chunk);
        asr::Recognition r = adapter->recognize(chunk, config.language);
        if (cancelled.load()) return;  // connection closed during the call

        {
            std::lock_guard<std::mutex> lock(stats_mutex);
            stats.chunks_recognized++;
        }

        StreamEvent ev;
        ev.chunk_index = chunk.index;
        if (r.error == ErrorKind::ServiceUnavailable) {
            ev.kind = StreamEvent::Kind::Error;
            ev.error = r.error;
            std::lock_guard<std::mutex> lock(stats_mutex);
            stats.error_events++;
        } else if (r.error == ErrorKind::NoSpeechDetected) {
            return;
        } else {
            bool emit = false;
            {
                std::lock_guard<std::mutex> lock(buffer_mutex);
                emit = buffer.should_emit(r.text);
            }
            if (!emit) {
                log_debug("[stream] chunk " + std::to_string(chunk.index) + ": duplicate text suppressed");
                std::lock_guard<std::mutex> lock(stats_mutex);
                stats.duplicates_suppressed++;
                return;
            }
            ev.kind = StreamEvent::Kind::Text;
            ev.text = std::move(r.text);
            std::lock_guard<std::mutex> lock(stats_mutex);
            stats.text_events++;
        }
        if (on_event) on_event(ev);
    }

    void join() {
        if (accumulation_thread.joinable()) accumulation_thread.join();
        if (recognition_thread.joinable()) recognition_thread.join();
    }
};

// =============================================================================
// Public API Implementation
// =============================================================================

StreamingSession::StreamingSession(std::shared_ptr<const asr::RecognitionAdapter> adapter,
                                   const Config& config,
                                   EventCallback on_event) {
    if (!adapter) throw std::invalid_argument("StreamingSession requires a recognition adapter");
    validate(config);
    impl_ = std::make_unique<Impl>(std::move(adapter), config, std::move(on_event));
}

StreamingSession::~StreamingSession() {
    stop();
}

void StreamingSession::set_chunk_sink(std::shared_ptr<audio::ChunkSink> sink) {
    impl_->sink = std::move(sink);
}

bool StreamingSession::start() {
    if (running_.load() || impl_->started) return false;
    impl_->started = true;
    running_.store(true);
    impl_->adapter->set_parallel_calls(1);

    impl_->accumulation_thread = std::thread([this]() { impl_->accumulation_loop(); });
    impl_->recognition_thread = std::thread([this]() { impl_->recognition_loop(); });

    log_debug("[stream] session started");
    return true;
}

void StreamingSession::add_samples(const int16_t* samples, size_t sample_count) {
    if (!running_.load() || !samples || sample_count == 0) return;

    audio::AudioQueue::Block block;
    block.samples.assign(samples, samples + sample_count);
    block.sample_rate = impl_->config.sample_rate;
    if (impl_->audio_queue.push(std::move(block))) {
        std::lock_guard<std::mutex> lock(impl_->stats_mutex);
        impl_->stats.blocks_received++;
        impl_->stats.samples_received += sample_count;
    }
}

void StreamingSession::finish() {
    if (!running_.exchange(false)) return;
    impl_->audio_queue.stop();
    impl_->join();

    {
        std::lock_guard<std::mutex> lock(impl_->buffer_mutex);
        if (impl_->buffer.sample_count() > 0) {
            log_debug("[stream] dropping " + std::to_string(impl_->buffer.sample_count()) +
                      " trailing samples below the processing threshold");
        }
    }

    std::exception_ptr failure;
    {
        std::lock_guard<std::mutex> lock(impl_->failure_mutex);
        failure = impl_->first_failure;
    }
    if (failure) std::rethrow_exception(failure);
}

void StreamingSession::stop() {
    if (!running_.exchange(false)) return;
    impl_->cancelled.store(true);
    impl_->audio_queue.stop_and_clear();
    {
        std::lock_guard<std::mutex> lock(impl_->chunks_mutex);
        impl_->ready_chunks.clear();
        impl_->chunks_cv.notify_all();
    }
    impl_->join();

    std::lock_guard<std::mutex> lock(impl_->buffer_mutex);
    impl_->buffer.reset();
    log_debug("[stream] session stopped, buffered audio discarded");
}

StreamingSession::Stats StreamingSession::stats() const {
    std::lock_guard<std::mutex> lock(impl_->stats_mutex);
    return impl_->stats;
}

}
