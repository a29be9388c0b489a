#include "slotguard/log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace slotguard {
namespace log {

static std::atomic<LogLevel> g_level{LogLevel::Info};
static std::mutex g_output_mutex;

void set_level(LogLevel level) {
    g_level.store(level);
}

LogLevel level() {
    return g_level.load();
}

bool enabled(LogLevel level) {
    return level != LogLevel::Off && level >= g_level.load();
}

void write(LogLevel level, const std::string& tag, const std::string& message) {
    if (!enabled(level)) return;

    std::lock_guard<std::mutex> lock(g_output_mutex);
    if (level >= LogLevel::Warn) {
        std::cerr << "[" << tag << "] " << message << std::endl;
    } else {
        std::cout << "[" << tag << "] " << message << std::endl;
    }
}

} // namespace log
} // namespace slotguard
