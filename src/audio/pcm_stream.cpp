#include "audio/pcm_stream.hpp"
#include "core/logging.hpp"

namespace audio {

bool PcmStreamReader::start(const std::string& input) {
    stop();
    if (input.empty() || input == "-") {
        in_ = stdin;
        owns_input_ = false;
    } else {
        in_ = std::fopen(input.c_str(), "rb");
        owns_input_ = true;
    }
    if (!in_) {
        core::log_error("[input] failed to open PCM input: " + input);
        return false;
    }
    samples_read_ = 0;
    carry_.clear();
    return true;
}

void PcmStreamReader::stop() {
    if (owns_input_ && in_) std::fclose(in_);
    in_ = nullptr;
    owns_input_ = false;
}

std::vector<int16_t> PcmStreamReader::read_block() {
    std::vector<int16_t> out;
    if (!in_ || block_samples_ == 0) return out;

    std::vector<uint8_t> bytes(carry_);
    const size_t want = block_samples_ * 2;
    const size_t have = bytes.size();
    bytes.resize(want);
    size_t n = have + std::fread(bytes.data() + have, 1, want - have, in_);
    bytes.resize(n);
    carry_.clear();

    // An odd trailing byte waits for the next read
    if (n % 2 != 0) {
        carry_.push_back(bytes.back());
        bytes.pop_back();
    }
    out.resize(bytes.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = static_cast<int16_t>(static_cast<uint16_t>(bytes[2 * i]) |
                                      (static_cast<uint16_t>(bytes[2 * i + 1]) << 8));
    }
    samples_read_ += out.size();
    return out;
}

}
