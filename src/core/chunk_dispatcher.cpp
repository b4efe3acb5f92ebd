#include "core/chunk_dispatcher.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>

namespace core {

size_t worker_count(size_t max_concurrency, size_t chunk_count) {
    if (chunk_count == 0) return 0;
    const size_t hw = std::max(1u, std::thread::hardware_concurrency());
    const size_t cap = (max_concurrency == 0) ? hw : std::min(max_concurrency, hw);
    return std::max<size_t>(1, std::min(cap, chunk_count));
}

size_t threads_per_call(size_t parallel_calls, size_t hw_threads) {
    return std::max<size_t>(1, hw_threads / std::max<size_t>(1, parallel_calls));
}

std::vector<TranscriptResult> dispatch(const std::vector<audio::Chunk>& chunks,
                                       const RecognizeFn& recognize,
                                       size_t max_concurrency) {
    std::vector<TranscriptResult> results(chunks.size());
    if (chunks.empty()) return results;

    std::atomic<size_t> next{0};
    std::atomic<bool> failed{false};
    std::exception_ptr first_error;
    std::mutex error_mutex;

    // Each worker writes only results[i] for the positions it claimed
    auto worker = [&]() {
        while (!failed.load()) {
            const size_t i = next.fetch_add(1);
            if (i >= chunks.size()) break;
            const audio::Chunk& chunk = chunks[i];
            TranscriptResult& out = results[i];
            out.chunk_index = chunk.index;
            try {
                asr::Recognition r = recognize(chunk);
                if (r.error) {
                    out.error = r.error;
                } else {
                    out.text = std::move(r.text);
                }
            } catch (...) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) first_error = std::current_exception();
                failed.store(true);
            }
        }
    };

    const size_t n_workers = worker_count(max_concurrency, chunks.size());
    log_debug("[dispatch] " + std::to_string(chunks.size()) + " chunks on " +
              std::to_string(n_workers) + " workers");

    std::vector<std::thread> workers;
    workers.reserve(n_workers);
    for (size_t w = 0; w < n_workers; ++w) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) {
        t.join();
    }
    if (first_error) std::rethrow_exception(first_error);

    std::sort(results.begin(), results.end(),
              [](const TranscriptResult& a, const TranscriptResult& b) { return a.chunk_index < b.chunk_index; });
    return results;
}

std::string join_results(const std::vector<TranscriptResult>& results) {
    std::string out;
    for (const auto& r : results) {
        if (r.error || r.text.empty()) continue;
        if (!out.empty()) out.push_back(' ');
        out += r.text;
    }
    return out;
}

}
