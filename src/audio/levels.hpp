#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace audio {

constexpr double kSilenceFloorDb = -120.0;

// RMS level in dB relative to int16 full scale; kSilenceFloorDb for silence.
double rms_dbfs(const int16_t* data, size_t n);

int16_t peak_abs(const int16_t* data, size_t n);

// Scale so the absolute peak lands at (1 - headroom) of full scale.
// All-zero input is returned unchanged.
std::vector<int16_t> normalize_peak(const std::vector<int16_t>& in, double headroom = 0.1);

}
