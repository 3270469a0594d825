#pragma once
// Core types: time, points, and parse outcomes shared by every layer
//
// Time is Unix millis. Coordinates are floats. Parsers never throw;
// they report Complete, Incomplete or Malformed.

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <optional>
#include <string>

namespace sakshi {

// Embedding dimension (all-MiniLM-L6-v2 compatible)
constexpr size_t EMBED_DIM = 384;

// Timestamp as Unix millis
using Timestamp = int64_t;

// Current time as Timestamp
inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// Injectable wall clock (tests drive time by hand)
using Clock = std::function<Timestamp()>;

// Outcome of incremental wire parsing (RESP, HTTP, WebSocket)
enum class ParseStatus {
    Complete,
    Incomplete,
    Malformed
};

// A point in projected 3-D space
struct Point3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
};

inline float clamp_unit(float v) { return std::clamp(v, 0.0f, 1.0f); }
inline float clamp_signed(float v) { return std::clamp(v, -1.0f, 1.0f); }

// RFC 3339 UTC with milliseconds: 2026-10-19T12:00:00.123Z
inline std::string format_rfc3339(Timestamp ms) {
    int64_t secs = ms / 1000;
    int64_t millis = ms % 1000;
    if (millis < 0) {
        millis += 1000;
        secs -= 1;
    }
    std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[40];
    size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    std::snprintf(buf + n, sizeof(buf) - n, ".%03dZ", static_cast<int>(millis));
    return buf;
}

// Accepts 2026-10-19T12:00:00Z, fractional seconds of any precision,
// and numeric offsets (+02:00 / -0530). Returns Unix millis.
inline std::optional<Timestamp> parse_rfc3339(const std::string& s) {
    int year, month, day, hour, minute, second;
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2d%*1[Tt ]%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    size_t pos = static_cast<size_t>(consumed);
    int64_t millis = 0;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
            if (digits < 3) millis = millis * 10 + (s[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (; digits < 3; ++digits) millis *= 10;
    }

    int64_t offset_minutes = 0;
    if (pos >= s.size()) return std::nullopt;
    if (s[pos] == 'Z' || s[pos] == 'z') {
        ++pos;
    } else if (s[pos] == '+' || s[pos] == '-') {
        int sign = s[pos] == '-' ? -1 : 1;
        int oh = 0, om = 0;
        if (std::sscanf(s.c_str() + pos + 1, "%2d:%2d", &oh, &om) == 2) {
            pos += 6;
        } else if (std::sscanf(s.c_str() + pos + 1, "%2d%2d", &oh, &om) == 2) {
            pos += 5;
        } else {
            return std::nullopt;
        }
        offset_minutes = sign * (oh * 60 + om);
    } else {
        return std::nullopt;
    }
    if (pos != s.size()) return std::nullopt;

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    int64_t secs = static_cast<int64_t>(timegm(&tm)) - offset_minutes * 60;
    return secs * 1000 + millis;
}

} // namespace sakshi
