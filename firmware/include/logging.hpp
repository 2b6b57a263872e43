#pragma once

#include <cstdint>

enum class LogLevel : uint8_t {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4,
};

// Tagged printf-style logging to stdout. Callers put their component tag in
// the format string, e.g. log_info("[ORCH] connected to %s", name).
void init_logging(LogLevel level = LogLevel::Info);
void set_log_level(LogLevel level);
LogLevel log_level();
const char* log_level_name(LogLevel level);
bool parse_log_level(const char* text, LogLevel& out);

void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
