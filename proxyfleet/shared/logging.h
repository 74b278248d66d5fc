#pragma once
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <chrono>
#include <mutex>
#include <string_view>

enum log_level : uint8_t
{
    log_debug = 0,
    log_info  = 1,
    log_warn  = 2,
    log_error = 3
};

bool parse_log_level(std::string_view str, log_level& level);

struct logger
{
    static inline log_level g_level = log_info;

    // Optional append-mode sink; stderr is always written.
    static bool open_file(const char* path);
    static void close_file();

    static void log(log_level level, const char* msg)
    {
        if (level < g_level)
            return;

        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        std::tm tm{};
        localtime_r(&t, &tm);

        const char* tag;
        switch (level)
        {
            case log_debug: tag = "DEBUG"; break;
            case log_info:  tag = "INFO";  break;
            case log_warn:  tag = "WARN";  break;
            case log_error: tag = "ERROR"; break;
            default:        tag = "?";     break;
        }

        std::lock_guard<std::mutex> lock(s_mutex);
        std::fprintf(stderr, "[%02d:%02d:%02d] [%s] %s\n",
            tm.tm_hour, tm.tm_min, tm.tm_sec, tag, msg);
        if (s_file)
        {
            std::fprintf(s_file, "%04d-%02d-%02d %02d:%02d:%02d [%s] %s\n",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                tm.tm_hour, tm.tm_min, tm.tm_sec, tag, msg);
            std::fflush(s_file);
        }
    }

    [[gnu::format(printf, 2, 3)]]
    static void logf(log_level level, const char* fmt, ...)
    {
        if (level < g_level)
            return;

        char buf[1024];
        va_list ap;
        va_start(ap, fmt);
        std::vsnprintf(buf, sizeof(buf), fmt, ap);
        va_end(ap);
        log(level, buf);
    }

private:
    static inline std::mutex s_mutex;
    static inline std::FILE* s_file = nullptr;
};

#define LOG_DEBUG(msg) do { if (logger::g_level <= log_debug) logger::log(log_debug, msg); } while(0)
#define LOG_INFO(msg)  do { if (logger::g_level <= log_info)  logger::log(log_info,  msg); } while(0)
#define LOG_WARN(msg)  do { if (logger::g_level <= log_warn)  logger::log(log_warn,  msg); } while(0)
#define LOG_ERROR(msg) do { if (logger::g_level <= log_error) logger::log(log_error, msg); } while(0)

#define LOG_DEBUGF(...) do { if (logger::g_level <= log_debug) logger::logf(log_debug, __VA_ARGS__); } while(0)
#define LOG_INFOF(...)  do { if (logger::g_level <= log_info)  logger::logf(log_info,  __VA_ARGS__); } while(0)
#define LOG_WARNF(...)  do { if (logger::g_level <= log_warn)  logger::logf(log_warn,  __VA_ARGS__); } while(0)
#define LOG_ERRORF(...) do { if (logger::g_level <= log_error) logger::logf(log_error, __VA_ARGS__); } while(0)
