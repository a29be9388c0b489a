#pragma once

#include <string>

namespace slotguard {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Off
};

namespace log {

// Process-wide threshold; lines below it are dropped
void set_level(LogLevel level);
LogLevel level();
bool enabled(LogLevel level);

// Writes "[TAG] message". Warn and Error go to stderr.
void write(LogLevel level, const std::string& tag, const std::string& message);

inline void debug(const std::string& tag, const std::string& message) { write(LogLevel::Debug, tag, message); }
inline void info(const std::string& tag, const std::string& message) { write(LogLevel::Info, tag, message); }
inline void warn(const std::string& tag, const std::string& message) { write(LogLevel::Warn, tag, message); }
inline void error(const std::string& tag, const std::string& message) { write(LogLevel::Error, tag, message); }

} // namespace log
} // namespace slotguard
