#include "core/stream_buffer.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include <algorithm>

namespace core {

void validate(const StreamParams& params) {
    if (params.sample_rate <= 0) {
        throw ConfigurationError("stream sample rate must be positive");
    }
    if (params.min_process_ms <= 0 || params.context_retention_ms < 0) {
        throw ConfigurationError("stream thresholds must be positive");
    }
    if (params.context_retention_ms >= params.min_process_ms) {
        throw ConfigurationError("context retention (" + std::to_string(params.context_retention_ms) +
                                 " ms) must be shorter than the processing threshold (" +
                                 std::to_string(params.min_process_ms) + " ms)");
    }
}

StreamBuffer::StreamBuffer(const StreamParams& params) : params_(params) {
    validate(params_);
    min_samples_ = audio::ms_to_samples(params_.min_process_ms, params_.sample_rate);
    retention_samples_ = audio::ms_to_samples(params_.context_retention_ms, params_.sample_rate);
    pending_.reserve(min_samples_ * 2);
}

std::optional<audio::Chunk> StreamBuffer::add_samples(const int16_t* data, size_t count) {
    if (data && count > 0) {
        pending_.insert(pending_.end(), data, data + count);
        sample_count_ = pending_.size();
    }
    if (sample_count_ < min_samples_) return std::nullopt;

    state_ = State::Ready;
    audio::Chunk chunk = take_chunk();
    state_ = State::Accumulating;
    return chunk;
}

audio::Chunk StreamBuffer::take_chunk() {
    audio::Chunk chunk;
    chunk.index = next_index_++;
    chunk.samples = pending_;
    chunk.start_sample = static_cast<size_t>(stream_pos_);
    chunk.overlap_start_offset = retained_;
    chunk.sample_rate = params_.sample_rate;

    // Slide: keep only the trailing context for the next chunk
    const size_t keep = std::min(retention_samples_, pending_.size());
    const size_t discard = pending_.size() - keep;
    pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(discard));
    stream_pos_ += discard;
    retained_ = keep;
    sample_count_ = pending_.size();

    log_debug("[stream] chunk " + std::to_string(chunk.index) + ": " +
              std::to_string(chunk.samples.size()) + " samples, retained " + std::to_string(keep));
    return chunk;
}

bool StreamBuffer::should_emit(const std::string& text) {
    if (text.empty() || text == last_emitted_text_) return false;
    last_emitted_text_ = text;
    return true;
}

void StreamBuffer::reset() {
    pending_.clear();
    sample_count_ = 0;
    last_emitted_text_.clear();
    state_ = State::Accumulating;
    next_index_ = 0;
    retained_ = 0;
    stream_pos_ = 0;
}

}
