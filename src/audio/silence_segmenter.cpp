#include "audio/silence_segmenter.hpp"
#include "audio/levels.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <utility>

namespace audio {

namespace {
// Half-open sample ranges [first, second)
using Range = std::pair<size_t, size_t>;

std::vector<Range> find_silent_ranges(const std::vector<int16_t>& pcm, int sample_rate,
                                      const SilenceParams& p) {
    std::vector<Range> silent;
    const size_t win = std::max<size_t>(1, ms_to_samples(p.window_ms, sample_rate));
    const size_t min_len = ms_to_samples(p.min_silence_ms, sample_rate);

    size_t run_start = 0;
    bool in_run = false;
    for (size_t pos = 0; pos < pcm.size(); pos += win) {
        size_t n = std::min(win, pcm.size() - pos);
        bool quiet = rms_dbfs(pcm.data() + pos, n) < p.silence_threshold_db;
        if (quiet && !in_run) {
            run_start = pos;
            in_run = true;
        } else if (!quiet && in_run) {
            if (pos - run_start >= min_len) silent.emplace_back(run_start, pos);
            in_run = false;
        }
    }
    if (in_run && pcm.size() - run_start >= min_len) silent.emplace_back(run_start, pcm.size());
    return silent;
}
}

std::vector<Segment> segment_on_silence(const Signal& signal, const SilenceParams& params) {
    std::vector<Segment> out;
    if (signal.empty() || signal.sample_rate <= 0) return out;

    const int sr = signal.sample_rate;
    const std::vector<int16_t> measured = params.normalize
        ? normalize_peak(signal.samples, params.headroom) : signal.samples;
    const auto silent = find_silent_ranges(measured, sr, params);

    // Complement of the silent ranges are the speech candidates
    std::vector<Range> speech;
    size_t cursor = 0;
    for (const auto& s : silent) {
        if (s.first > cursor) speech.emplace_back(cursor, s.first);
        cursor = s.second;
    }
    if (cursor < signal.size()) speech.emplace_back(cursor, signal.size());

    const size_t keep = ms_to_samples(params.keep_silence_ms, sr);
    std::vector<Range> padded;
    padded.reserve(speech.size());
    for (size_t i = 0; i < speech.size(); ++i) {
        size_t a = speech[i].first > keep ? speech[i].first - keep : 0;
        size_t b = std::min(signal.size(), speech[i].second + keep);
        // Neighbours whose padding would collide share the gap at its midpoint
        if (i > 0) {
            size_t gap_mid = speech[i - 1].second + (speech[i].first - speech[i - 1].second) / 2;
            a = std::max(a, gap_mid);
        }
        if (i + 1 < speech.size()) {
            size_t gap_mid = speech[i].second + (speech[i + 1].first - speech[i].second) / 2;
            b = std::min(b, gap_mid);
        }
        padded.emplace_back(a, b);
    }

    const size_t min_len = ms_to_samples(params.min_segment_ms, sr);
    for (const auto& r : padded) {
        if (r.second <= r.first || r.second - r.first < min_len) continue;
        Segment seg;
        seg.samples.assign(signal.samples.begin() + r.first, signal.samples.begin() + r.second);
        seg.start_sample = r.first;
        seg.sample_rate = sr;
        out.push_back(std::move(seg));
    }

    core::log_debug("[segment] " + std::to_string(silent.size()) + " silent runs, " +
                    std::to_string(out.size()) + " speech segments");
    return out;
}

}
