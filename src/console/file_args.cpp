#include "console/file_args.hpp"
#include "core/errors.hpp"
#include <cstdlib>

namespace console {

FileArgs parse_file_args(int argc, const char* const* argv, const core::Config& base) {
    FileArgs out;
    out.config = base;
    core::Config& config = out.config;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) throw core::ConfigurationError("missing value for " + a);
            return argv[++i];
        };
        if (a == "-h" || a == "--help") { out.show_help = true; continue; }
        if (a == "-v" || a == "--verbose") { config.verbose = true; continue; }
        if (a == "--language") { config.language = next(); continue; }
        if (a == "--model") { config.model = next(); continue; }
        if (a == "--mode") { config.segmentation = core::parse_segmentation(next()); continue; }
        if (a == "--chunk-ms") { config.window.chunk_ms = std::atoi(next().c_str()); continue; }
        if (a == "--overlap-ms") { config.window.overlap_ms = std::atoi(next().c_str()); continue; }
        if (a == "--min-silence-ms") { config.silence.min_silence_ms = std::atoi(next().c_str()); continue; }
        if (a == "--silence-db") { config.silence.silence_threshold_db = std::atof(next().c_str()); continue; }
        if (a == "--keep-silence-ms") { config.silence.keep_silence_ms = std::atoi(next().c_str()); continue; }
        if (a == "--max-concurrency") { config.max_concurrency = static_cast<size_t>(std::atoi(next().c_str())); continue; }
        if (a == "--threads") { config.engine_threads = std::atoi(next().c_str()); continue; }
        if (a == "--debug-dir") { config.debug_chunk_dir = next(); continue; }
        if (a == "--clear-debug") { out.clear_debug = true; continue; }
        // "-" alone is not a flag, everything else starting with '-' is
        if (a.size() > 1 && a[0] == '-') throw core::ConfigurationError("unknown argument: " + a);
        if (!out.path.empty()) throw core::ConfigurationError("unexpected extra argument: " + a);
        out.path = a;
    }
    return out;
}

}
