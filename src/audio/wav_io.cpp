#include "audio/wav_io.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

#define DR_WAV_IMPLEMENTATION
#include "dr_wav.h"

namespace audio {

namespace fs = std::filesystem;

bool read_wav(const std::string& path, Signal& out) {
    drwav wav;
    if (!drwav_init_file(&wav, path.c_str(), nullptr)) {
        core::log_error("[wav] cannot open: " + path);
        return false;
    }

    const uint64_t n = wav.totalPCMFrameCount;
    const unsigned channels = wav.channels > 0 ? wav.channels : 1;
    std::vector<int16_t> pcm16(n * channels);
    const uint64_t got = drwav_read_pcm_frames_s16(&wav, n, pcm16.data());
    const int sample_rate = static_cast<int>(wav.sampleRate);
    drwav_uninit(&wav);

    out.sample_rate = sample_rate;
    out.samples.resize(got);
    if (channels == 1) {
        std::copy(pcm16.begin(), pcm16.begin() + static_cast<std::ptrdiff_t>(got), out.samples.begin());
    } else {
        for (uint64_t i = 0; i < got; i++) {
            int32_t sum = 0;
            for (unsigned c = 0; c < channels; ++c) {
                sum += pcm16[i * channels + c];
            }
            out.samples[i] = static_cast<int16_t>(sum / static_cast<int32_t>(channels));
        }
    }
    core::log_debug("[wav] " + path + ": " + std::to_string(got) + " frames, sr=" +
                    std::to_string(sample_rate) + ", ch=" + std::to_string(channels));
    return true;
}

bool write_wav(const std::string& path, const int16_t* data, size_t samples, int sample_rate) {
    std::error_code ec;
    fs::path fp = fs::u8path(path);
    if (fp.has_parent_path()) fs::create_directories(fp.parent_path(), ec);

    drwav_data_format format;
    format.container = drwav_container_riff;
    format.format = DR_WAVE_FORMAT_PCM;
    format.channels = 1;
    format.sampleRate = static_cast<drwav_uint32>(sample_rate);
    format.bitsPerSample = 16;

    drwav wav;
    if (!drwav_init_file_write(&wav, path.c_str(), &format, nullptr)) {
        core::log_error("[wav] cannot write: " + path);
        return false;
    }
    const drwav_uint64 written = drwav_write_pcm_frames(&wav, samples, data);
    drwav_uninit(&wav);
    return written == samples;
}

WavChunkSink::WavChunkSink(std::string dir) : dir_(std::move(dir)) {}

std::string WavChunkSink::path_for(size_t index) const {
    return (fs::u8path(dir_) / ("chunk_" + std::to_string(index) + ".wav")).string();
}

void WavChunkSink::write(const Chunk& chunk) {
    const std::string path = path_for(chunk.index);
    if (!write_wav(path, chunk.samples.data(), chunk.samples.size(), chunk.sample_rate)) {
        core::log_warn("[debug] chunk " + std::to_string(chunk.index) + " not saved");
        return;
    }
    core::log_debug("[debug] saved " + path);
}

size_t WavChunkSink::clear() {
    std::error_code ec;
    size_t removed = 0;
    if (!fs::is_directory(fs::u8path(dir_), ec)) return 0;
    for (const auto& entry : fs::directory_iterator(fs::u8path(dir_), ec)) {
        const std::string name = entry.path().filename().string();
        if (name.rfind("chunk_", 0) != 0 || entry.path().extension() != ".wav") continue;
        if (fs::remove(entry.path(), ec)) ++removed;
    }
    if (ec) core::log_warn("[debug] clearing " + dir_ + ": " + ec.message());
    return removed;
}

}
