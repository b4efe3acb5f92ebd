#pragma once
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "asr/recognition_adapter.hpp"
#include "audio/signal.hpp"
#include "core/errors.hpp"

namespace core {

struct TranscriptResult {
    size_t chunk_index = 0;
    std::string text;              ///< empty when error is set
    std::optional<ErrorKind> error;
};

using RecognizeFn = std::function<asr::Recognition(const audio::Chunk&)>;

/**
 * @brief Recognize independent chunks concurrently.
 *
 * Runs at most min(max_concurrency, hardware threads, chunk count) workers
 * (max_concurrency == 0 means hardware threads). Unit failures are recorded
 * in the result and never stop the batch. An exception escaping recognize
 * is treated as an internal error: no new chunks are started, all workers
 * are joined and the first exception is rethrown.
 *
 * @return one result per chunk, ordered by chunk_index
 */
std::vector<TranscriptResult> dispatch(const std::vector<audio::Chunk>& chunks,
                                       const RecognizeFn& recognize,
                                       size_t max_concurrency = 0);

// Successful texts in index order, single-space separated.
std::string join_results(const std::vector<TranscriptResult>& results);

size_t worker_count(size_t max_concurrency, size_t chunk_count);

// Engine threads for each of `parallel_calls` concurrent recognitions so the
// total stays within `hw_threads` (never below one).
size_t threads_per_call(size_t parallel_calls, size_t hw_threads);

}
