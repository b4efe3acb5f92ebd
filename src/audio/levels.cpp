#include "audio/levels.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace audio {

double rms_dbfs(const int16_t* data, size_t n) {
    if (!data || n == 0) return kSilenceFloorDb;
    double sum2 = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double v = data[i] / 32768.0;
        sum2 += v * v;
    }
    double rms = std::sqrt(sum2 / static_cast<double>(n));
    return (rms > 0) ? std::max(kSilenceFloorDb, 20.0 * std::log10(rms)) : kSilenceFloorDb;
}

int16_t peak_abs(const int16_t* data, size_t n) {
    int peak = 0;
    for (size_t i = 0; i < n; ++i) {
        peak = std::max(peak, std::abs(static_cast<int>(data[i])));
    }
    return static_cast<int16_t>(std::min(peak, 32767));
}

std::vector<int16_t> normalize_peak(const std::vector<int16_t>& in, double headroom) {
    const int16_t peak = peak_abs(in.data(), in.size());
    if (peak == 0) return in;
    const double target = (1.0 - std::clamp(headroom, 0.0, 1.0)) * 32767.0;
    const double gain = target / static_cast<double>(peak);
    std::vector<int16_t> out(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        long v = std::lrint(in[i] * gain);
        out[i] = static_cast<int16_t>(std::clamp<long>(v, -32768, 32767));
    }
    return out;
}

}
