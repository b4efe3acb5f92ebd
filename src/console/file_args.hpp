#pragma once
#include <string>
#include "core/config.hpp"

namespace console {

struct FileArgs {
    core::Config config;
    std::string path;
    bool clear_debug = false;
    bool show_help = false;
};

// Parses chunkscribe_file's command line on top of `base`. Throws
// core::ConfigurationError for unknown flags, a missing value or a second
// input path. Does not validate the resulting config.
FileArgs parse_file_args(int argc, const char* const* argv, const core::Config& base);

}
