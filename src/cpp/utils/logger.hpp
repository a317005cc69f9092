#pragma once
// Leveled printf-style logging to stderr (stdout is reserved for sample rows)
#include <cstdio>
#include <cstdarg>
#include <chrono>
#include <ctime>
#include <string>

namespace nodestat {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

inline LogLevel g_log_level = LogLevel::INFO;

inline const char* log_level_str(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warn";
        case LogLevel::ERROR: return "error";
    }
    return "??";
}

// "debug" | "info" | "warn" | "error"; false leaves out untouched
inline bool parse_log_level(const std::string& s, LogLevel& out) {
    if (s == "debug")      out = LogLevel::DEBUG;
    else if (s == "info")  out = LogLevel::INFO;
    else if (s == "warn")  out = LogLevel::WARN;
    else if (s == "error") out = LogLevel::ERROR;
    else return false;
    return true;
}

inline void log(LogLevel level, const char* fmt, ...) {
    if (level < g_log_level) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    struct tm tm_buf{};
    localtime_r(&t, &tm_buf);

    const char* prefix = "???";
    switch (level) {
        case LogLevel::DEBUG: prefix = "DBG"; break;
        case LogLevel::INFO:  prefix = "INF"; break;
        case LogLevel::WARN:  prefix = "WRN"; break;
        case LogLevel::ERROR: prefix = "ERR"; break;
    }

    std::fprintf(stderr, "[%04d-%02d-%02d %02d:%02d:%02d.%03d] [%s] ",
        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms),
        prefix);

    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
    std::fputc('\n', stderr);
}

#define LOG_DBG(...) ::nodestat::log(::nodestat::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INF(...) ::nodestat::log(::nodestat::LogLevel::INFO,  __VA_ARGS__)
#define LOG_WRN(...) ::nodestat::log(::nodestat::LogLevel::WARN,  __VA_ARGS__)
#define LOG_ERR(...) ::nodestat::log(::nodestat::LogLevel::ERROR, __VA_ARGS__)

} // namespace nodestat
