#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "asr/recognition_adapter.hpp"
#include "audio/chunk_sink.hpp"
#include "audio/signal.hpp"
#include "core/chunk_dispatcher.hpp"
#include "core/config.hpp"

namespace core {

struct BatchTranscript {
    std::string text;                      ///< joined transcript
    std::vector<TranscriptResult> results; ///< per unit, ordered by index
    std::optional<ErrorKind> error;        ///< EmptyResult when no unit produced text

    bool empty_result() const { return error == ErrorKind::EmptyResult; }
    size_t failed_count() const;
};

/**
 * @brief File-path transcription: split a whole signal into units, recognize
 * them concurrently and join the text in temporal order.
 */
class BatchTranscriber {
public:
    BatchTranscriber(std::shared_ptr<const asr::RecognitionAdapter> adapter, Config config);

    void set_chunk_sink(std::shared_ptr<audio::ChunkSink> sink) { sink_ = std::move(sink); }

    // Units that would be dispatched for this signal
    std::vector<audio::Chunk> plan(const audio::Signal& signal) const;

    BatchTranscript transcribe(const audio::Signal& signal) const;

private:
    std::shared_ptr<const asr::RecognitionAdapter> adapter_;
    Config config_;
    std::shared_ptr<audio::ChunkSink> sink_;
};

// Copy of samples with pad_samples of silence on both sides.
std::vector<int16_t> pad_with_silence(const std::vector<int16_t>& samples, size_t pad_samples);

}
