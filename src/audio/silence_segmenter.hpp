#pragma once
#include <vector>
#include "audio/signal.hpp"

namespace audio {

struct SilenceParams {
    int min_silence_ms = 1000;          ///< shortest gap that splits speech
    double silence_threshold_db = -40.0;///< dBFS below which a window is silent
    int keep_silence_ms = 500;          ///< padding kept on both sides of a segment
    int min_segment_ms = 500;           ///< shorter segments are dropped
    int window_ms = 10;                 ///< energy analysis window
    bool normalize = true;              ///< peak-normalize before measuring energy
    double headroom = 0.1;
};

/**
 * @brief Split a signal into speech segments separated by silence.
 *
 * Energy is measured on a peak-normalized copy; returned segments carry the
 * original (unnormalized) samples. Segments are ordered by start offset, never
 * overlap, and are at least min_segment_ms long.
 */
std::vector<Segment> segment_on_silence(const Signal& signal, const SilenceParams& params = {});

}
