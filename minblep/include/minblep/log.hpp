#pragma once

#include <string_view>

namespace minblep {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

// Receives every library log message. The library itself never prints.
using LogHandler = void (*)(LogLevel level, std::string_view message);

/// Install a process-wide handler; nullptr discards messages (the default).
/// Not synchronized with concurrent logging, install it before building tables.
void set_log_handler(LogHandler handler);

[[nodiscard]] LogHandler log_handler();

[[nodiscard]] std::string_view level_name(LogLevel level);

void log(LogLevel level, std::string_view message);

inline void log_debug(std::string_view message) { log(LogLevel::Debug, message); }
inline void log_info(std::string_view message) { log(LogLevel::Info, message); }
inline void log_warning(std::string_view message) { log(LogLevel::Warning, message); }
inline void log_error(std::string_view message) { log(LogLevel::Error, message); }

}  // namespace minblep
