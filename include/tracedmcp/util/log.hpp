#pragma once
/// @file log.hpp
/// @brief Thread-safe, level-filtered stderr logging

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>
#include <string>

namespace tracedmcp::util::log
{

enum class Level
{
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

inline Level level_from_string(const std::string& s)
{
    if (s == "DEBUG" || s == "TRACE")
        return Level::Debug;
    if (s == "WARN" || s == "WARNING")
        return Level::Warn;
    if (s == "ERROR")
        return Level::Error;
    return Level::Info;
}

namespace detail
{

inline std::mutex& log_mutex()
{
    static std::mutex m;
    return m;
}

inline std::atomic<int>& threshold()
{
    static std::atomic<int> t{static_cast<int>(Level::Info)};
    return t;
}

inline void write(Level level, const std::string& msg)
{
    if (static_cast<int>(level) < threshold().load(std::memory_order_relaxed))
        return;

    const char* tag = "";
    switch (level)
    {
    case Level::Debug:
        tag = "DEBUG";
        break;
    case Level::Info:
        tag = "INFO ";
        break;
    case Level::Warn:
        tag = "WARN ";
        break;
    case Level::Error:
        tag = "ERROR";
        break;
    }

    const auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    ::localtime_r(&time, &tm_buf);
#endif
    char time_buf[16];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);
    char prefix[32];
    std::snprintf(prefix, sizeof(prefix), "%s.%03d [%s] ", time_buf,
                  static_cast<int>(ms.count()), tag);

    std::lock_guard<std::mutex> lock(log_mutex());
    std::cerr << prefix << msg << '\n';
}

} // namespace detail

inline void set_level(Level level)
{
    detail::threshold().store(static_cast<int>(level), std::memory_order_relaxed);
}

inline bool enabled(Level level)
{
    return static_cast<int>(level) >= detail::threshold().load(std::memory_order_relaxed);
}

inline void debug(const std::string& msg)
{
    detail::write(Level::Debug, msg);
}

inline void info(const std::string& msg)
{
    detail::write(Level::Info, msg);
}

inline void warn(const std::string& msg)
{
    detail::write(Level::Warn, msg);
}

inline void error(const std::string& msg)
{
    detail::write(Level::Error, msg);
}

} // namespace tracedmcp::util::log
