#include "audio/media_extract.hpp"
#include "audio/wav_io.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <system_error>
#include <utility>

#include <unistd.h>

namespace audio {

namespace fs = std::filesystem;

namespace {
std::string lower_extension(const std::string& path) {
    std::string ext = fs::u8path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

// Single-quote for /bin/sh
std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

std::string temp_wav_path() {
    static std::atomic<unsigned> counter{0};
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec) dir = ".";
    return (dir / ("chunkscribe_" + std::to_string(::getpid()) + "_" +
                   std::to_string(counter.fetch_add(1)) + ".wav")).string();
}
}

bool is_supported_media(const std::string& path) {
    const std::string ext = lower_extension(path);
    return ext == ".wav" || ext == ".mp4" || ext == ".mov" || ext == ".avi";
}

bool extract_audio(const std::string& input, const std::string& wav_out, int sample_rate) {
    std::string cmd = "ffmpeg -i " + shell_quote(input) +
                      " -vn -ac 1 -ar " + std::to_string(sample_rate) +
                      " -af highpass=f=200,lowpass=f=3000 -c:a pcm_s16le " +
                      shell_quote(wav_out) + " -y -loglevel error";
    core::log_debug("[media] " + cmd);
    int ret = std::system(cmd.c_str());
    if (ret != 0) {
        core::log_error("[media] ffmpeg failed (" + std::to_string(ret) + ") for " + input +
                        "; make sure ffmpeg is installed and the file has an audio track");
        return false;
    }
    return true;
}

bool load_media(const std::string& path, int sample_rate, Signal& out) {
    if (lower_extension(path) == ".wav") {
        Signal wav;
        if (read_wav(path, wav) && wav.sample_rate == sample_rate) {
            out = std::move(wav);
            return true;
        }
    }

    const std::string tmp = temp_wav_path();
    bool ok = extract_audio(path, tmp, sample_rate) && read_wav(tmp, out);
    std::error_code ec;
    fs::remove(fs::u8path(tmp), ec);
    if (ok && out.sample_rate != sample_rate) {
        core::log_error("[media] expected " + std::to_string(sample_rate) + " Hz after conversion, got " +
                        std::to_string(out.sample_rate));
        ok = false;
    }
    if (ok) {
        core::log_info("[media] " + path + ": " + std::to_string(out.duration_ms() / 1000.0) + " s at " +
                       std::to_string(out.sample_rate) + " Hz");
    }
    return ok;
}

}
