#undef NDEBUG
#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "core/chunk_dispatcher.hpp"

static std::vector<audio::Chunk> make_chunks(size_t n) {
    std::vector<audio::Chunk> chunks(n);
    for (size_t i = 0; i < n; ++i) {
        chunks[i].index = i;
        chunks[i].samples.assign(1600, static_cast<int16_t>(i));
    }
    return chunks;
}

static asr::Recognition text(const std::string& t) {
    asr::Recognition r;
    r.text = t;
    return r;
}

static asr::Recognition failure(core::ErrorKind kind) {
    asr::Recognition r;
    r.error = kind;
    return r;
}

int main() {
    // Chunk 2 finishes first and chunk 1 last; text still follows chunk order
    {
        auto chunks = make_chunks(3);
        const int delays_ms[] = {60, 150, 0};
        std::mutex mtx;
        std::vector<size_t> completion;
        auto results = core::dispatch(chunks, [&](const audio::Chunk& c) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delays_ms[c.index]));
            {
                std::lock_guard<std::mutex> lock(mtx);
                completion.push_back(c.index);
            }
            return text("part" + std::to_string(c.index));
        }, 3);
        assert(results.size() == 3);
        for (size_t i = 0; i < 3; ++i) assert(results[i].chunk_index == i);
        assert(core::join_results(results) == "part0 part1 part2");
        assert(completion.size() == 3);
    }

    // Failed units are kept in the results but left out of the text
    {
        auto chunks = make_chunks(4);
        auto results = core::dispatch(chunks, [](const audio::Chunk& c) {
            if (c.index == 1) return failure(core::ErrorKind::ServiceUnavailable);
            if (c.index == 2) return failure(core::ErrorKind::NoSpeechDetected);
            return text("t" + std::to_string(c.index));
        }, 2);
        assert(results.size() == 4);
        assert(results[1].error == core::ErrorKind::ServiceUnavailable);
        assert(results[1].text.empty());
        assert(results[2].error == core::ErrorKind::NoSpeechDetected);
        assert(!results[0].error && !results[3].error);
        assert(core::join_results(results) == "t0 t3");
    }

    // Never more than max_concurrency recognitions in flight
    {
        auto chunks = make_chunks(12);
        std::atomic<int> in_flight{0};
        std::atomic<int> peak{0};
        core::dispatch(chunks, [&](const audio::Chunk&) {
            int now = ++in_flight;
            int prev = peak.load();
            while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            --in_flight;
            return text("x");
        }, 2);
        assert(peak.load() >= 1 && peak.load() <= 2);
    }

    // Unexpected exceptions reach the caller after all workers joined
    {
        auto chunks = make_chunks(6);
        bool thrown = false;
        try {
            core::dispatch(chunks, [](const audio::Chunk& c) -> asr::Recognition {
                if (c.index == 3) throw std::logic_error("boom");
                return text("ok");
            }, 2);
        } catch (const std::logic_error& e) {
            thrown = std::string(e.what()) == "boom";
        }
        assert(thrown);
    }

    // Worker pool sizing
    {
        assert(core::worker_count(4, 0) == 0);
        assert(core::worker_count(8, 1) == 1);
        assert(core::worker_count(1, 100) == 1);
        const size_t hw = std::max(1u, std::thread::hardware_concurrency());
        assert(core::worker_count(0, 1000) == hw);
        assert(core::worker_count(1000, 1000) == hw);
    }

    // Engine threads are split between concurrent recognitions
    {
        assert(core::threads_per_call(1, 8) == 8);
        assert(core::threads_per_call(2, 8) == 4);
        assert(core::threads_per_call(3, 8) == 2);
        assert(core::threads_per_call(8, 8) == 1);
        assert(core::threads_per_call(16, 8) == 1);
        assert(core::threads_per_call(0, 8) == 8);
        assert(core::threads_per_call(4, 1) == 1);
    }

    assert(core::dispatch({}, [](const audio::Chunk&) { return text("x"); }, 4).empty());
    assert(core::join_results({}).empty());
    return 0;
}
