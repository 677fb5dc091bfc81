#include "minblep/log.hpp"

namespace minblep {

namespace {
    LogHandler g_handler = nullptr;
}

void set_log_handler(LogHandler handler) {
    g_handler = handler;
}

LogHandler log_handler() {
    return g_handler;
}

std::string_view level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "debug";
        case LogLevel::Info:    return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error:   return "error";
    }
    return "unknown";
}

void log(LogLevel level, std::string_view message) {
    if (g_handler) {
        g_handler(level, message);
    }
}

}  // namespace minblep
