#pragma once
#include <string>
#include "audio/signal.hpp"

namespace audio {

// Containers accepted for upload: .wav, .mp4, .mov, .avi (case-insensitive)
bool is_supported_media(const std::string& path);

// Run ffmpeg to produce a mono PCM16 WAV at sample_rate with the speech
// band-pass applied. Returns true on success
bool extract_audio(const std::string& input, const std::string& wav_out, int sample_rate);

/**
 * @brief Load any supported media file as a mono Signal at sample_rate.
 *
 * A WAV already at the target rate is read directly; anything else goes
 * through ffmpeg into a temporary file that is removed afterwards.
 */
bool load_media(const std::string& path, int sample_rate, Signal& out);

}
