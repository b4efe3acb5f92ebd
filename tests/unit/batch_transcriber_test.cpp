#undef NDEBUG
#include <cassert>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "core/batch_transcriber.hpp"
#include "core/errors.hpp"
#include "test_audio.hpp"

namespace {

// Records what a batch hands to the debug side channel
class RecordingSink : public audio::ChunkSink {
public:
    void write(const audio::Chunk& chunk) override {
        std::lock_guard<std::mutex> lock(mutex_);
        indices_.insert(chunk.index);
    }
    std::set<size_t> indices() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return indices_;
    }
private:
    mutable std::mutex mutex_;
    std::set<size_t> indices_;
};

audio::Signal three_phrases() {
    audio::Signal sig;
    test::append_tone(sig.samples, 2000, 8000, 16000, 300.0);
    test::append_silence(sig.samples, 2000);
    test::append_tone(sig.samples, 2000, 8000, 16000, 500.0);
    test::append_silence(sig.samples, 2000);
    test::append_tone(sig.samples, 2000, 8000, 16000, 700.0);
    return sig;
}

// Replies with the phrase number encoded in the pitch of the unit
std::string by_pitch(const int16_t* data, size_t n) {
    size_t crossings = 0;
    size_t voiced = 0;
    for (size_t i = 0; i < n; ++i) {
        if (data[i] != 0) ++voiced;
        if (i > 0 && (data[i - 1] < 0) != (data[i] < 0)) ++crossings;
    }
    if (voiced == 0) return "";
    const double hz = crossings / 2.0 / (static_cast<double>(voiced) / 16000.0);
    if (hz < 400) return "eins";
    if (hz < 600) return "zwei";
    return "drei";
}

}

int main() {
    // Silence mode: three units joined in temporal order
    {
        auto engine = std::make_shared<test::ScriptedEngine>([](const int16_t* d, size_t n, size_t) {
            return by_pitch(d, n);
        });
        auto adapter = std::make_shared<asr::RecognitionAdapter>(engine);
        core::Config cfg;
        cfg.max_concurrency = 3;
        core::BatchTranscriber batch(adapter, cfg);

        auto sink = std::make_shared<RecordingSink>();
        batch.set_chunk_sink(sink);

        auto result = batch.transcribe(three_phrases());
        assert(!result.error);
        assert(result.results.size() == 3);
        assert(result.text == "eins zwei drei");
        assert(sink->indices() == (std::set<size_t>{0, 1, 2}));
        for (const auto& lang : engine->languages()) assert(lang == "de-DE");
        // The engine is told how many recognitions share the CPU
        assert(engine->parallel_calls() == core::worker_count(3, 3));
    }

    // A single worker leaves the whole CPU to each recognition
    {
        auto engine = std::make_shared<test::ScriptedEngine>([](const int16_t* d, size_t n, size_t) {
            return by_pitch(d, n);
        });
        core::Config cfg;
        cfg.max_concurrency = 1;
        core::BatchTranscriber batch(std::make_shared<asr::RecognitionAdapter>(engine), cfg);
        assert(batch.transcribe(three_phrases()).text == "eins zwei drei");
        assert(engine->parallel_calls() == 1);
    }

    // Every unit padded with 100 ms of silence on both sides
    {
        auto engine = std::make_shared<test::ScriptedEngine>([](const int16_t*, size_t, size_t) {
            return std::string("x");
        });
        core::Config cfg;
        cfg.segmentation = core::Segmentation::FixedWindow;
        cfg.window = {2000, 500};
        core::BatchTranscriber batch(std::make_shared<asr::RecognitionAdapter>(engine), cfg);

        audio::Signal sig;
        test::append_tone(sig.samples, 3000, 4000);
        auto units = batch.plan(sig);
        assert(units.size() == 2);  // 0-2 s, 1.5-3 s

        auto result = batch.transcribe(sig);
        assert(result.text == "x x");
        auto sizes = engine->sizes();
        std::multiset<size_t> got(sizes.begin(), sizes.end());
        assert(got == (std::multiset<size_t>{units[0].samples.size() + 3200, units[1].samples.size() + 3200}));
    }

    // Every unit failing yields EmptyResult, not an exception
    {
        auto engine = std::make_shared<test::ScriptedEngine>([](const int16_t*, size_t, size_t) -> std::string {
            throw asr::EngineUnavailable("offline");
        });
        core::BatchTranscriber batch(std::make_shared<asr::RecognitionAdapter>(engine), core::Config{});
        auto result = batch.transcribe(three_phrases());
        assert(result.empty_result());
        assert(result.error == core::ErrorKind::EmptyResult);
        assert(result.text.empty());
        assert(result.results.size() == 3);
        assert(result.failed_count() == 3);
        for (const auto& r : result.results) assert(r.error == core::ErrorKind::ServiceUnavailable);
    }

    // One failing unit is skipped, the rest survive
    {
        auto engine = std::make_shared<test::ScriptedEngine>([](const int16_t* d, size_t n, size_t) {
            std::string word = by_pitch(d, n);
            if (word == "zwei") throw asr::EngineUnavailable("timeout");
            return word;
        });
        core::BatchTranscriber batch(std::make_shared<asr::RecognitionAdapter>(engine), core::Config{});
        auto result = batch.transcribe(three_phrases());
        assert(!result.error);
        assert(result.text == "eins drei");
        assert(result.failed_count() == 1);
    }

    // Silent input: nothing to dispatch, reported as no speech
    {
        auto engine = std::make_shared<test::ScriptedEngine>([](const int16_t*, size_t, size_t) {
            return std::string("never");
        });
        core::BatchTranscriber batch(std::make_shared<asr::RecognitionAdapter>(engine), core::Config{});
        audio::Signal sig;
        test::append_silence(sig.samples, 4000);
        auto result = batch.transcribe(sig);
        assert(result.empty_result());
        assert(engine->calls() == 0);
    }

    // Invalid configuration is rejected up front
    {
        core::Config cfg;
        cfg.window = {1000, 1000};
        bool rejected = false;
        try {
            core::BatchTranscriber batch(std::make_shared<asr::RecognitionAdapter>(
                std::make_shared<test::ScriptedEngine>([](const int16_t*, size_t, size_t) { return std::string(); })), cfg);
        } catch (const core::ConfigurationError&) {
            rejected = true;
        }
        assert(rejected);
    }

    assert(core::pad_with_silence({5, 6}, 2) == (std::vector<int16_t>{0, 0, 5, 6, 0, 0}));
    return 0;
}
