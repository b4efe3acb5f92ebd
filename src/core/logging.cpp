#include "core/logging.hpp"
#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace core {

namespace {
std::atomic<bool> g_verbose{std::getenv("CHUNKSCRIBE_DEBUG") != nullptr};
std::mutex g_log_mutex;

// Transcript text owns stdout; every diagnostic goes to stderr.
void write_line(const char* tag, const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << tag << ' ' << msg << std::endl;
}
}

void set_verbose(bool on) { g_verbose.store(on); }
bool is_verbose() { return g_verbose.load(); }

void log_debug(const std::string& msg) {
    if (is_verbose()) write_line("[DEBUG]", msg);
}
void log_info(const std::string& msg) { write_line("[INFO]", msg); }
void log_warn(const std::string& msg) { write_line("[WARN]", msg); }
void log_error(const std::string& msg) { write_line("[ERROR]", msg); }

}
