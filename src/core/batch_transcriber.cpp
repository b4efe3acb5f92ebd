#include "core/batch_transcriber.hpp"
#include "audio/fixed_window_chunker.hpp"
#include "audio/silence_segmenter.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

namespace core {

size_t BatchTranscript::failed_count() const {
    size_t n = 0;
    for (const auto& r : results) {
        if (r.error == ErrorKind::ServiceUnavailable) ++n;
    }
    return n;
}

std::vector<int16_t> pad_with_silence(const std::vector<int16_t>& samples, size_t pad_samples) {
    std::vector<int16_t> out;
    out.reserve(samples.size() + 2 * pad_samples);
    out.insert(out.end(), pad_samples, 0);
    out.insert(out.end(), samples.begin(), samples.end());
    out.insert(out.end(), pad_samples, 0);
    return out;
}

BatchTranscriber::BatchTranscriber(std::shared_ptr<const asr::RecognitionAdapter> adapter, Config config)
    : adapter_(std::move(adapter)), config_(std::move(config)) {
    if (!adapter_) throw std::invalid_argument("BatchTranscriber requires a recognition adapter");
    validate(config_);
}

std::vector<audio::Chunk> BatchTranscriber::plan(const audio::Signal& signal) const {
    if (config_.segmentation == Segmentation::FixedWindow) {
        return audio::chunk_fixed_windows(signal, config_.window);
    }
    std::vector<audio::Chunk> chunks;
    for (auto& seg : audio::segment_on_silence(signal, config_.silence)) {
        audio::Chunk c;
        c.index = chunks.size();
        c.start_sample = seg.start_sample;
        c.sample_rate = seg.sample_rate;
        c.samples = std::move(seg.samples);
        chunks.push_back(std::move(c));
    }
    return chunks;
}

BatchTranscript BatchTranscriber::transcribe(const audio::Signal& signal) const {
    BatchTranscript out;
    const auto chunks = plan(signal);
    log_info("[batch] " + std::to_string(signal.duration_ms()) + " ms of audio split into " +
             std::to_string(chunks.size()) + " units");

    const size_t pad = audio::ms_to_samples(config_.pad_ms, signal.sample_rate);
    const std::string language = config_.language;
    auto recognize = [this, pad, &language](const audio::Chunk& chunk) {
        if (sink_) sink_->write(chunk);
        audio::Chunk padded = chunk;
        if (pad > 0) padded.samples = pad_with_silence(chunk.samples, pad);
        auto r = adapter_->recognize(padded, language);
        if (r.ok()) log_debug("[batch] unit " + std::to_string(chunk.index) + " transcribed");
        return r;
    };

    // Concurrent units share the CPU with the engine's own threads
    adapter_->set_parallel_calls(std::max<size_t>(1, worker_count(config_.max_concurrency, chunks.size())));

    auto t0 = std::chrono::steady_clock::now();
    out.results = dispatch(chunks, recognize, config_.max_concurrency);
    auto t1 = std::chrono::steady_clock::now();

    out.text = join_results(out.results);
    if (out.text.empty()) out.error = ErrorKind::EmptyResult;

    log_info("[batch] " + std::to_string(out.results.size()) + " units, " +
             std::to_string(out.failed_count()) + " failed, " +
             std::to_string(std::chrono::duration<double>(t1 - t0).count()) + " s");
    return out;
}

}
