#include <sakshi/log.hpp>
#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace sakshi {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_write_mutex;

void vlog(LogLevel level, const char* component, const char* fmt, va_list args) {
    if (!log_enabled(level)) return;

    // Get timestamp with milliseconds
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&now_time_t, &local);
    char time_buf[16];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &local);

    char message[2048];
    std::vsnprintf(message, sizeof(message), fmt, args);

    const char* marker = "";
    if (level == LogLevel::Error) marker = "ERROR: ";
    else if (level == LogLevel::Warn) marker = "WARNING: ";

    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::fprintf(stderr, "[%s.%03d][%s] %s%s\n", time_buf,
                 static_cast<int>(now_ms.count()), component, marker, message);
}

}  // anonymous namespace

void set_log_level(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_level.load());
}

bool log_enabled(LogLevel level) {
    return static_cast<int>(level) <= g_level.load();
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "error";
        case LogLevel::Warn: return "warn";
        case LogLevel::Info: return "info";
        case LogLevel::Debug: return "debug";
    }
    return "info";
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    if (name == "error") return LogLevel::Error;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "info") return LogLevel::Info;
    if (name == "debug" || name == "trace") return LogLevel::Debug;
    return std::nullopt;
}

void log_error(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Error, component, fmt, args);
    va_end(args);
}

void log_warn(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Warn, component, fmt, args);
    va_end(args);
}

void log_info(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Info, component, fmt, args);
    va_end(args);
}

void log_debug(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Debug, component, fmt, args);
    va_end(args);
}

} // namespace sakshi
