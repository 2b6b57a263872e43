#include "logging.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <strings.h>

namespace {
std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_log_mutex;

void vlog(LogLevel level, const char* fmt, va_list args) {
    if (level < g_level.load()) {
        return;
    }
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::printf("[%s] ", log_level_name(level));
    std::vprintf(fmt, args);
    std::printf("\n");
    std::fflush(stdout);
}
} // namespace

void init_logging(LogLevel level) {
    g_level.store(level);
}

void set_log_level(LogLevel level) {
    g_level.store(level);
}

LogLevel log_level() {
    return g_level.load();
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off: return "OFF";
    }
    return "?";
}

bool parse_log_level(const char* text, LogLevel& out) {
    if (text == nullptr) return false;
    static const LogLevel kLevels[] = {
        LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error, LogLevel::Off,
    };
    for (LogLevel level : kLevels) {
        const char* name = log_level_name(level);
        if (strcasecmp(text, name) == 0) {
            out = level;
            return true;
        }
    }
    return false;
}

void log_debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Debug, fmt, args);
    va_end(args);
}

void log_info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Info, fmt, args);
    va_end(args);
}

void log_warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Warn, fmt, args);
    va_end(args);
}

void log_error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Error, fmt, args);
    va_end(args);
}
