#pragma once
#include <vector>
#include "audio/signal.hpp"

namespace audio {

struct WindowParams {
    int chunk_ms = 30000;
    int overlap_ms = 2000;  ///< must stay below chunk_ms
};

// Throws core::ConfigurationError for an invalid window/overlap pair.
void validate(const WindowParams& params);

/**
 * @brief Cut a signal into overlapping fixed-length windows.
 *
 * Windows advance by chunk_ms - overlap_ms. The last window is truncated at
 * the end of the signal, never padded. Text in the overlap region is not
 * de-duplicated downstream.
 */
std::vector<Chunk> chunk_fixed_windows(const Signal& signal, const WindowParams& params = {});

}
