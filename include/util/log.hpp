#pragma once
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cctype>
#include <cstring>
#include <ctime>
#include <mutex>
#include <string>

namespace phonelink
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3,
    System  = 4  // always shown, used for status reports and lifecycle milestones
};

inline Level &global_level()
{
    static Level lv = Level::Debug;
    return lv;
}

inline void set_log_level(Level lv)
{
    global_level() = lv;
}

// Accepts upper or lower case names; anything unknown falls back to Info.
inline void set_log_level_by_name(const char *name)
{
    std::string level = name ? std::string(name) : std::string();
    for (auto &c : level)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (level == "debug")
        set_log_level(Level::Debug);
    else if (level == "info")
        set_log_level(Level::Info);
    else if (level == "warn" || level == "warning")
        set_log_level(Level::Warning);
    else if (level == "error" || level == "err")
        set_log_level(Level::Error);
    else
        set_log_level(Level::Info);
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

// bus thread, scheduler thread and ipc thread all log; keep lines whole
inline std::mutex &log_mutex()
{
    static std::mutex mu;
    return mu;
}

inline void logf(Level lv, const char *func, const char *fmt, ...)
{
    if ((int)lv < (int)global_level())
        return;

    char ts[16];
    timestamp(ts, sizeof(ts));

    char    msg[1024];
    va_list ap;
    va_start(ap, fmt);
    std::vsnprintf(msg, sizeof(msg), fmt, ap);
    va_end(ap);

    size_t m = std::strlen(msg);
    bool   nl = (m != 0 && msg[m - 1] == '\n');

    std::lock_guard<std::mutex> lk(log_mutex());
    std::fprintf(stderr, "%s %s %s: %s%s", ts, level_name(lv), func ? func : "?", msg,
                 nl ? "" : "\n");
}

#define LOG_DEBUG(...) ::phonelink::logf(::phonelink::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::phonelink::logf(::phonelink::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::phonelink::logf(::phonelink::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::phonelink::logf(::phonelink::Level::Error, __func__, __VA_ARGS__)
#define LOG_SYSTEM(...) ::phonelink::logf(::phonelink::Level::System, __func__, __VA_ARGS__)

}  // namespace phonelink
