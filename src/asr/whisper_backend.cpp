#include "asr/whisper_backend.hpp"
#include "core/chunk_dispatcher.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <thread>

#include <whisper.h>

namespace {
// Filter whisper/ggml logs: keep errors/warnings always; info/debug only if verbose
void log_cb(ggml_log_level level, const char* text, void*) {
    switch (level) {
    case GGML_LOG_LEVEL_ERROR:
    case GGML_LOG_LEVEL_WARN:
        std::fputs(text, stderr);
        break;
    case GGML_LOG_LEVEL_INFO:
    case GGML_LOG_LEVEL_DEBUG:
    default:
        if (core::is_verbose()) std::fputs(text, stderr);
        break;
    }
}
} // anonymous namespace

namespace asr {

std::string whisper_language(const std::string& bcp47) {
    std::string lang = bcp47.substr(0, bcp47.find_first_of("-_"));
    std::transform(lang.begin(), lang.end(), lang.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lang.empty() ? "auto" : lang;
}

std::vector<std::string> model_candidates(const std::string& model_name) {
    const bool has_ext = (model_name.find(".gguf") != std::string::npos) ||
                         (model_name.find(".bin") != std::string::npos);
    if (has_ext) return {model_name};
    return {
        "models/" + model_name + ".gguf",
        "models/ggml-" + model_name + "-q5_1.gguf",
        "models/ggml-" + model_name + ".gguf",
        "models/" + model_name + ".bin",
        "models/ggml-" + model_name + ".bin",
        "models/ggml-" + model_name + "-q5_1.bin",
    };
}

WhisperBackend::~WhisperBackend() {
    if (ctx_) whisper_free(ctx_);
}

bool WhisperBackend::load_model(const std::string& model_name) {
    if (ctx_) return true;

    auto candidates = model_candidates(model_name);
    std::string path = candidates.front();  // fallback, may fail
    for (const auto& c : candidates) {
        if (std::filesystem::exists(std::filesystem::u8path(c))) { path = c; break; }
    }

    // Set logging verbosity before creating context to suppress init spam when not verbose
    whisper_log_set(log_cb, nullptr);

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = false;
    core::log_info("[whisper] init from: " + path);
    ctx_ = whisper_init_from_file_with_params(path.c_str(), cparams);
    if (!ctx_) {
        core::log_error("[whisper] init FAILED for path: " + path);
        return false;
    }
    core::log_debug(std::string("[whisper] system: ") + whisper_print_system_info());
    return true;
}

void WhisperBackend::set_threads(int n) {
    n_threads_ = std::max(0, n);
}

void WhisperBackend::set_parallel_calls(size_t calls) {
    parallel_calls_.store(std::max<size_t>(1, calls));
}

std::string WhisperBackend::transcribe(const int16_t* data, size_t samples, const std::string& language) {
    if (!data || samples == 0) return {};
    if (!ctx_) throw EngineUnavailable("whisper model not loaded");

    const std::string lang = whisper_language(language);
    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.print_realtime   = false;
    wparams.print_progress   = false;
    wparams.print_timestamps = false;
    wparams.print_special    = false;
    wparams.translate        = false;
    wparams.language         = lang.c_str();
    wparams.detect_language  = false;
    wparams.n_threads        = (n_threads_ == 0)
        ? static_cast<int>(core::threads_per_call(parallel_calls_.load(),
                                                  std::max(1u, std::thread::hardware_concurrency())))
        : n_threads_;
    wparams.no_context       = true;
    wparams.suppress_blank   = true;
    wparams.no_speech_thold  = 0.6f;
    wparams.greedy.best_of   = 1;

    // Convert int16 PCM to float [-1,1]
    std::vector<float> pcm_f32;
    pcm_f32.reserve(samples);
    constexpr float scale = 1.0f / 32768.0f;
    for (size_t i = 0; i < samples; ++i) {
        pcm_f32.push_back(static_cast<float>(data[i]) * scale);
    }

    whisper_state* state = whisper_init_state(ctx_);
    if (!state) throw EngineUnavailable("whisper_init_state failed");

    const int ret = whisper_full_with_state(ctx_, state, wparams, pcm_f32.data(), static_cast<int>(pcm_f32.size()));
    if (ret != 0) {
        whisper_free_state(state);
        throw EngineUnavailable("whisper_full failed, ret=" + std::to_string(ret));
    }

    std::string out;
    const int n = whisper_full_n_segments_from_state(state);
    for (int i = 0; i < n; ++i) {
        const char* txt = whisper_full_get_segment_text_from_state(state, i);
        if (!txt) continue;
        if (!out.empty()) out.push_back('\n');
        out += txt;
    }
    whisper_free_state(state);

    core::log_debug("[whisper] " + std::to_string(samples) + " samples -> " + std::to_string(n) + " segments");
    return out;
}

}
