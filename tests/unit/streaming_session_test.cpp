#undef NDEBUG
#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "core/streaming_session.hpp"
#include "test_audio.hpp"

namespace {

struct EventLog {
    std::mutex mutex;
    std::vector<core::StreamEvent> events;

    void operator()(const core::StreamEvent& ev) {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(ev);
    }
    std::vector<core::StreamEvent> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return events;
    }
};

core::Config small_config() {
    core::Config cfg;
    cfg.stream.min_process_ms = 1000;       // 16000 samples
    cfg.stream.context_retention_ms = 500;  // 8000 samples
    return cfg;
}

class FailingSink : public audio::ChunkSink {
public:
    explicit FailingSink(size_t bad_index) : bad_index_(bad_index) {}
    void write(const audio::Chunk& chunk) override {
        if (chunk.index == bad_index_) throw std::logic_error("disk full");
    }

private:
    size_t bad_index_;
};

void feed(core::StreamingSession& session, size_t total, size_t block) {
    std::vector<int16_t> pcm;
    test::append_tone(pcm, static_cast<int>(total * 1000 / 16000), 5000);
    for (size_t pos = 0; pos < pcm.size(); pos += block) {
        size_t n = std::min(block, pcm.size() - pos);
        session.add_samples(pcm.data() + pos, n);
    }
}

}

int main() {
    // Repeated text is emitted once; changed text is emitted again
    {
        const char* replies[] = {"hallo", "hallo", "wie geht es", "[BLANK_AUDIO]", "wie geht es", "gut"};
        auto engine = std::make_shared<test::ScriptedEngine>([&replies](const int16_t*, size_t, size_t call) {
            return std::string(call < 6 ? replies[call] : "");
        });
        auto log = std::make_shared<EventLog>();
        core::StreamingSession session(std::make_shared<asr::RecognitionAdapter>(engine), small_config(),
                                       [log](const core::StreamEvent& ev) { (*log)(ev); });
        assert(session.start());
        assert(!session.start());

        // 16000 + 5 * 8000 samples: six chunks
        feed(session, 16000 + 5 * 8000, 2000);
        session.finish();

        assert(engine->calls() == 6);
        auto events = log->snapshot();
        assert(events.size() == 3);
        assert(events[0].kind == core::StreamEvent::Kind::Text && events[0].text == "hallo");
        assert(events[1].text == "wie geht es" && events[1].chunk_index == 2);
        assert(events[2].text == "gut" && events[2].chunk_index == 5);

        auto st = session.stats();
        assert(st.chunks_emitted == 6);
        assert(st.chunks_recognized == 6);
        assert(st.text_events == 3);
        assert(st.duplicates_suppressed == 2);
        assert(st.samples_received == 16000 + 5 * 8000);
        // Every chunk is the full threshold
        for (size_t n : engine->sizes()) assert(n == 16000);
    }

    // A failing recognition is reported and the stream keeps going
    {
        auto engine = std::make_shared<test::ScriptedEngine>([](const int16_t*, size_t, size_t call) -> std::string {
            if (call == 1) throw asr::EngineUnavailable("503");
            return "satz " + std::to_string(call);
        });
        auto log = std::make_shared<EventLog>();
        core::StreamingSession session(std::make_shared<asr::RecognitionAdapter>(engine), small_config(),
                                       [log](const core::StreamEvent& ev) { (*log)(ev); });
        session.start();
        feed(session, 16000 + 2 * 8000, 4000);
        session.finish();

        auto events = log->snapshot();
        assert(events.size() == 3);
        assert(events[0].kind == core::StreamEvent::Kind::Text && events[0].text == "satz 0");
        assert(events[1].kind == core::StreamEvent::Kind::Error);
        assert(events[1].error == core::ErrorKind::ServiceUnavailable);
        assert(events[1].chunk_index == 1);
        assert(events[2].kind == core::StreamEvent::Kind::Text && events[2].text == "satz 2");
    }

    // Audio below the threshold at end of stream is not transcribed
    {
        auto engine = std::make_shared<test::ScriptedEngine>([](const int16_t*, size_t, size_t) {
            return std::string("nie");
        });
        auto log = std::make_shared<EventLog>();
        core::StreamingSession session(std::make_shared<asr::RecognitionAdapter>(engine), small_config(),
                                       [log](const core::StreamEvent& ev) { (*log)(ev); });
        session.start();
        feed(session, 15000, 1000);
        session.finish();
        assert(engine->calls() == 0);
        assert(log->snapshot().empty());
    }

    // Recognition is sequential and stop() drops the in-flight result
    {
        std::mutex gate_mutex;
        std::condition_variable gate_cv;
        bool entered = false;
        bool release = false;
        std::atomic<int> concurrent{0};
        std::atomic<int> peak{0};

        auto engine = std::make_shared<test::ScriptedEngine>([&](const int16_t*, size_t, size_t) {
            int now = ++concurrent;
            if (now > peak.load()) peak.store(now);
            std::unique_lock<std::mutex> lock(gate_mutex);
            entered = true;
            gate_cv.notify_all();
            gate_cv.wait(lock, [&] { return release; });
            --concurrent;
            return std::string("zu spaet");
        });
        auto log = std::make_shared<EventLog>();
        core::StreamingSession session(std::make_shared<asr::RecognitionAdapter>(engine), small_config(),
                                       [log](const core::StreamEvent& ev) { (*log)(ev); });
        session.start();
        feed(session, 16000 + 4 * 8000, 2000);  // five chunks queue up

        {
            std::unique_lock<std::mutex> lock(gate_mutex);
            gate_cv.wait(lock, [&] { return entered; });
        }
        std::thread closer([&] { session.stop(); });
        // Let stop() mark the session cancelled before the call returns
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        {
            std::lock_guard<std::mutex> lock(gate_mutex);
            release = true;
        }
        gate_cv.notify_all();
        closer.join();

        assert(!session.is_running());
        assert(peak.load() == 1);
        assert(engine->calls() == 1);
        assert(log->snapshot().empty());
    }

    // A throwing event callback loses that event only; finish() reports it
    {
        auto engine = std::make_shared<test::ScriptedEngine>([](const int16_t*, size_t, size_t call) {
            return "satz " + std::to_string(call);
        });
        auto log = std::make_shared<EventLog>();
        core::StreamingSession session(std::make_shared<asr::RecognitionAdapter>(engine), small_config(),
                                       [log](const core::StreamEvent& ev) {
                                           if (ev.chunk_index == 0) throw std::runtime_error("invalid UTF-8");
                                           (*log)(ev);
                                       });
        session.start();
        feed(session, 16000 + 2 * 8000, 4000);

        bool rethrown = false;
        try {
            session.finish();
        } catch (const std::runtime_error& e) {
            rethrown = std::string(e.what()) == "invalid UTF-8";
        }
        assert(rethrown);
        assert(!session.is_running());
        assert(engine->calls() == 3);
        auto events = log->snapshot();
        assert(events.size() == 2);
        assert(events[0].text == "satz 1" && events[0].chunk_index == 1);
        assert(events[1].text == "satz 2" && events[1].chunk_index == 2);
        assert(session.stats().internal_errors == 1);
    }

    // A failing chunk sink skips that chunk and the stream carries on
    {
        auto engine = std::make_shared<test::ScriptedEngine>([](const int16_t*, size_t, size_t call) {
            return "satz " + std::to_string(call);
        });
        auto log = std::make_shared<EventLog>();
        core::StreamingSession session(std::make_shared<asr::RecognitionAdapter>(engine), small_config(),
                                       [log](const core::StreamEvent& ev) { (*log)(ev); });
        session.set_chunk_sink(std::make_shared<FailingSink>(1));
        session.start();
        feed(session, 16000 + 2 * 8000, 4000);

        bool rethrown = false;
        try {
            session.finish();
        } catch (const std::logic_error&) {
            rethrown = true;
        }
        assert(rethrown);
        assert(engine->calls() == 2);
        auto events = log->snapshot();
        assert(events.size() == 2);
        assert(events[0].chunk_index == 0 && events[1].chunk_index == 2);
        assert(session.stats().internal_errors == 1);
    }

    // Chunks waiting behind a slow recognition are tracked and all processed
    {
        std::mutex gate_mutex;
        std::condition_variable gate_cv;
        bool release = false;

        auto engine = std::make_shared<test::ScriptedEngine>([&](const int16_t*, size_t, size_t call) {
            if (call == 0) {
                std::unique_lock<std::mutex> lock(gate_mutex);
                gate_cv.wait(lock, [&] { return release; });
            }
            return "satz " + std::to_string(call);
        });
        auto log = std::make_shared<EventLog>();
        core::StreamingSession session(std::make_shared<asr::RecognitionAdapter>(engine), small_config(),
                                       [log](const core::StreamEvent& ev) { (*log)(ev); });
        session.start();
        assert(engine->parallel_calls() == 1);

        const size_t chunks = core::StreamingSession::kPendingChunksWarning + 3;
        feed(session, 16000 + (chunks - 1) * 8000, 2000);
        for (int i = 0; i < 500 && session.stats().chunks_emitted < chunks; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        assert(session.stats().chunks_emitted == chunks);
        // The first chunk may already be in recognition; the rest wait
        assert(session.stats().peak_pending_chunks >= chunks - 1);
        assert(session.stats().peak_pending_chunks > core::StreamingSession::kPendingChunksWarning);

        {
            std::lock_guard<std::mutex> lock(gate_mutex);
            release = true;
        }
        gate_cv.notify_all();
        session.finish();
        assert(engine->calls() == chunks);
        assert(log->snapshot().size() == chunks);
        assert(session.stats().internal_errors == 0);
    }

    // Samples are ignored before start and after stop
    {
        auto engine = std::make_shared<test::ScriptedEngine>([](const int16_t*, size_t, size_t) {
            return std::string("x");
        });
        core::StreamingSession session(std::make_shared<asr::RecognitionAdapter>(engine), small_config(), nullptr);
        feed(session, 32000, 4000);
        assert(session.stats().blocks_received == 0);
        session.start();
        session.stop();
        feed(session, 32000, 4000);
        assert(session.stats().blocks_received == 0);
        assert(!session.start());
    }
    return 0;
}
