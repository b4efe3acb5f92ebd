// Batch transcription of a video or audio file
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include "asr/recognition_adapter.hpp"
#include "asr/whisper_backend.hpp"
#include "audio/media_extract.hpp"
#include "audio/wav_io.hpp"
#include "console/file_args.hpp"
#include "core/batch_transcriber.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"

static void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <media.(wav|mp4|mov|avi)> [options]\n"
              << "  --language L         BCP-47 language tag (default de-DE)\n"
              << "  --model M            whisper model name or path\n"
              << "  --mode silence|fixed segmentation strategy (default silence)\n"
              << "  --chunk-ms N         fixed window length\n"
              << "  --overlap-ms N       fixed window overlap\n"
              << "  --min-silence-ms N   shortest silence that splits speech\n"
              << "  --silence-db D       silence threshold in dBFS\n"
              << "  --keep-silence-ms N  padding kept around each segment\n"
              << "  --max-concurrency N  parallel recognitions (0 = auto)\n"
              << "  --threads N          whisper threads per recognition\n"
              << "  --debug-dir DIR      save every chunk as WAV under DIR\n"
              << "  --clear-debug        remove saved chunks in DIR first\n"
              << "  -v, --verbose\n";
}

int main(int argc, char** argv) {
    core::Config config;
    std::string path;
    bool clear_debug = false;

    try {
        console::FileArgs args = console::parse_file_args(argc, argv, core::get_config());
        if (args.show_help) { print_usage(argv[0]); return 0; }
        config = args.config;
        path = args.path;
        clear_debug = args.clear_debug;
        core::set_verbose(config.verbose);
        core::validate(config);
    } catch (const core::ConfigurationError& e) {
        core::log_error(std::string("[config] ") + e.what());
        print_usage(argv[0]);
        return 1;
    }

    if (path.empty()) {
        print_usage(argv[0]);
        return 1;
    }
    if (!audio::is_supported_media(path)) {
        core::log_error("[input] unsupported file format: " + path + " (use WAV, MP4, MOV or AVI)");
        return 1;
    }

    try {
        core::log_info("[input] " + path + ", language " + config.language);
        audio::Signal signal;
        if (!audio::load_media(path, config.sample_rate, signal)) {
            core::log_error("[input] no usable audio track in " + path);
            return 1;
        }

        auto whisper = std::make_shared<asr::WhisperBackend>();
        whisper->set_threads(config.engine_threads);
        if (!whisper->load_model(config.model)) {
            core::log_error("[whisper] Model load failed. Ensure a valid .gguf or .bin exists and path is correct.");
            return 1;
        }
        auto adapter = std::make_shared<asr::RecognitionAdapter>(whisper);

        core::BatchTranscriber transcriber(adapter, config);
        if (!config.debug_chunk_dir.empty()) {
            auto sink = std::make_shared<audio::WavChunkSink>(config.debug_chunk_dir);
            if (clear_debug) {
                core::log_info("[debug] removed " + std::to_string(sink->clear()) + " old chunk files");
            }
            transcriber.set_chunk_sink(sink);
        }

        core::BatchTranscript result = transcriber.transcribe(signal);
        if (result.empty_result()) {
            std::cout << "No speech found. Please ensure the audio is clear and contains speech." << std::endl;
            return 2;
        }
        std::cout << result.text << std::endl;
    } catch (const std::exception& e) {
        core::log_error(std::string("[fatal] ") + e.what());
        return 1;
    }
    return 0;
}
