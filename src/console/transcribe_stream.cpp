// Live transcription of raw PCM16 mono 16 kHz read from stdin or a pipe.
// Prints one JSON object per event: {"text": ...} or {"error": ...}
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "asr/recognition_adapter.hpp"
#include "asr/whisper_backend.hpp"
#include "audio/pcm_stream.hpp"
#include "audio/wav_io.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "core/streaming_session.hpp"

using json = nlohmann::json;

namespace {
volatile std::sig_atomic_t g_interrupted = 0;

void handle_sigint(int) {
    g_interrupted = 1;
}

json to_json(const core::StreamEvent& ev) {
    json j;
    if (ev.kind == core::StreamEvent::Kind::Text) {
        j["text"] = ev.text;
    } else {
        j["error"] = ev.error ? core::to_string(*ev.error) : "recognition failed";
    }
    j["chunk"] = ev.chunk_index;
    return j;
}
} // namespace

static void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--input PATH|-] [options]\n"
              << "  --block-samples N    samples per transport block (default 2048)\n"
              << "  --language L         BCP-47 language tag (default de-DE)\n"
              << "  --model M            whisper model name or path\n"
              << "  --min-process-ms N   audio collected before each recognition\n"
              << "  --context-ms N       audio carried into the next chunk\n"
              << "  --threads N          whisper threads\n"
              << "  --debug-dir DIR      save every chunk as WAV under DIR\n"
              << "  -v, --verbose\n";
}

int main(int argc, char** argv) {
    std::signal(SIGINT, handle_sigint);

    core::Config config = core::get_config();
    std::string input = "-";
    size_t block_samples = 2048;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            auto next = [&]() -> std::string {
                if (i + 1 >= argc) throw core::ConfigurationError("missing value for " + a);
                return argv[++i];
            };
            if (a == "-h" || a == "--help") { print_usage(argv[0]); return 0; }
            if (a == "-v" || a == "--verbose") { config.verbose = true; continue; }
            if (a == "--input" || a == "-i") { input = next(); continue; }
            if (a == "--block-samples") { block_samples = static_cast<size_t>(std::atoi(next().c_str())); continue; }
            if (a == "--language") { config.language = next(); continue; }
            if (a == "--model") { config.model = next(); continue; }
            if (a == "--min-process-ms") { config.stream.min_process_ms = std::atoi(next().c_str()); continue; }
            if (a == "--context-ms") { config.stream.context_retention_ms = std::atoi(next().c_str()); continue; }
            if (a == "--threads") { config.engine_threads = std::atoi(next().c_str()); continue; }
            if (a == "--debug-dir") { config.debug_chunk_dir = next(); continue; }
            throw core::ConfigurationError("unknown argument: " + a);
        }
        if (block_samples == 0) throw core::ConfigurationError("--block-samples must be positive");
        core::set_verbose(config.verbose);
        core::validate(config);
    } catch (const core::ConfigurationError& e) {
        core::log_error(std::string("[config] ") + e.what());
        print_usage(argv[0]);
        return 1;
    }

    try {
        auto whisper = std::make_shared<asr::WhisperBackend>();
        whisper->set_threads(config.engine_threads);
        if (!whisper->load_model(config.model)) {
            core::log_error("[whisper] Model load failed. Ensure a valid .gguf or .bin exists and path is correct.");
            return 1;
        }
        auto adapter = std::make_shared<asr::RecognitionAdapter>(whisper);

        std::mutex print_mtx;
        core::StreamingSession session(adapter, config, [&](const core::StreamEvent& ev) {
            std::lock_guard<std::mutex> lock(print_mtx);
            std::cout << to_json(ev).dump(-1, ' ', false, json::error_handler_t::replace) << std::endl;
        });
        if (!config.debug_chunk_dir.empty()) {
            session.set_chunk_sink(std::make_shared<audio::WavChunkSink>(config.debug_chunk_dir));
        }

        audio::PcmStreamReader reader(block_samples);
        if (!reader.start(input)) return 1;

        session.start();
        core::log_info("[stream] listening on " + (input == "-" ? std::string("stdin") : input) +
                       ", language " + config.language);
        while (!g_interrupted) {
            auto block = reader.read_block();
            if (block.empty()) break;
            session.add_samples(block.data(), block.size());
        }

        // Ctrl+C behaves like a closed connection; end of input lets queued chunks finish
        if (g_interrupted) session.stop();
        else session.finish();
        reader.stop();

        auto st = session.stats();
        core::log_info("[stream] " + std::to_string(reader.samples_read()) + " samples, " +
                       std::to_string(st.chunks_emitted) + " chunks, " +
                       std::to_string(st.text_events) + " texts, " +
                       std::to_string(st.error_events) + " errors, " +
                       std::to_string(st.duplicates_suppressed) + " duplicates");
    } catch (const std::exception& e) {
        core::log_error(std::string("[fatal] ") + e.what());
        return 1;
    }
    return 0;
}
