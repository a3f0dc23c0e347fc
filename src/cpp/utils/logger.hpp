#pragma once
#include <cstdio>
#include <cstdarg>
#include <chrono>
#include <ctime>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace docbench {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

inline LogLevel g_log_level = LogLevel::INFO;

// Serializes whole lines; benchmark workers log concurrently
inline std::mutex g_log_mutex;

inline void set_log_level(LogLevel level) { g_log_level = level; }

inline LogLevel parse_log_level(const std::string& s) {
    if (s == "debug") return LogLevel::DEBUG;
    if (s == "warn")  return LogLevel::WARN;
    if (s == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

inline void log(LogLevel level, const char* fmt, ...) {
    if (level < g_log_level) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    struct tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    const char* prefix = "???";
    switch (level) {
        case LogLevel::DEBUG: prefix = "DBG"; break;
        case LogLevel::INFO:  prefix = "INF"; break;
        case LogLevel::WARN:  prefix = "WRN"; break;
        case LogLevel::ERROR: prefix = "ERR"; break;
    }

    // Short thread tag so interleaved worker output can be told apart
    unsigned tid = static_cast<unsigned>(
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 10000);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::fprintf(stderr, "[%04d-%02d-%02d %02d:%02d:%02d.%03d] [%s] [t%04u] ",
        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms),
        prefix, tid);

    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
    std::fputc('\n', stderr);
}

#define LOG_DBG(...) ::docbench::log(::docbench::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INF(...) ::docbench::log(::docbench::LogLevel::INFO,  __VA_ARGS__)
#define LOG_WRN(...) ::docbench::log(::docbench::LogLevel::WARN,  __VA_ARGS__)
#define LOG_ERR(...) ::docbench::log(::docbench::LogLevel::ERROR, __VA_ARGS__)

} // namespace docbench
