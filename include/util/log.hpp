#pragma once
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <optional>
#include <string>

namespace framecast
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3,
    System  = 4  // startup banners and shutdown notices, always shown
};

inline Level &global_level()
{
    static Level lv = Level::Info;
    return lv;
}

inline void set_log_level(Level lv)
{
    global_level() = lv;
}

inline std::optional<Level> level_from_name(const char *name)
{
    if (!name)
        return std::nullopt;
    std::string level(name);
    for (auto &c : level)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (level == "debug")
        return Level::Debug;
    if (level == "info")
        return Level::Info;
    if (level == "warn" || level == "warning")
        return Level::Warning;
    if (level == "error" || level == "err")
        return Level::Error;
    return std::nullopt;
}

// Unknown names fall back to Info.
inline void set_log_level_by_name(const char *name)
{
    set_log_level(level_from_name(name).value_or(Level::Info));
}

// FRAMECAST_LOG_LEVEL, if present
inline void init_log_level_from_env()
{
    if (const char *e = std::getenv("FRAMECAST_LOG_LEVEL"); e && *e)
        set_log_level_by_name(e);
}

inline const char *level_name(Level lv)
{
    switch (lv)
    {
        case Level::Debug:
            return "[DEBUG]";
        case Level::Info:
            return "[INFO]";
        case Level::Warning:
            return "[WARN]";
        case Level::Error:
            return "[ERROR]";
        case Level::System:
            return "[SYSTEM]";
    }
    return "?";
}

inline void timestamp(char *buf, size_t n)
{
    using namespace std::chrono;
    const auto  now = system_clock::now();
    const auto  ms  = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t tt  = system_clock::to_time_t(now);
    std::tm     tm{};
    localtime_r(&tt, &tm);
    std::snprintf(buf, n, "%02d:%02d:%02d.%03d", tm.tm_hour, tm.tm_min, tm.tm_sec,
                  (int)ms.count());
}

inline void logf(Level lv, const char *func, const char *fmt, ...)
{
    if ((int)lv < (int)global_level())
        return;

    char ts[16];
    timestamp(ts, sizeof(ts));

    std::fprintf(stderr, "%s %s %s: ", ts, level_name(lv), func ? func : "?");

    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);

    size_t m = std::strlen(fmt);
    if (m == 0 || fmt[m - 1] != '\n')
        std::fputc('\n', stderr);
}

#define LOG_DEBUG(...) ::framecast::logf(::framecast::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::framecast::logf(::framecast::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::framecast::logf(::framecast::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::framecast::logf(::framecast::Level::Error, __func__, __VA_ARGS__)
#define LOG_SYSTEM(...) ::framecast::logf(::framecast::Level::System, __func__, __VA_ARGS__)

}  // namespace framecast
