#pragma once
// Log: timestamped, component-tagged lines on stderr
//
//   [12:00:01.250][collector] stream store unavailable: connect() failed
//
// One process-wide threshold. Lines are formatted printf-style and
// written whole, so concurrent threads never interleave mid-line.

#include <optional>
#include <string>

namespace sakshi {

enum class LogLevel {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3
};

void set_log_level(LogLevel level);
LogLevel log_level();
bool log_enabled(LogLevel level);

const char* log_level_name(LogLevel level);
std::optional<LogLevel> parse_log_level(const std::string& name);

void log_error(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_warn(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_info(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_debug(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

} // namespace sakshi
