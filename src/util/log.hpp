#pragma once

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <optional>
#include <string_view>

namespace util {

enum class LogLevel { Trace, Debug, Info, Warn, Error, Fatal };

inline const char* level_name(LogLevel lvl) noexcept {
    switch (lvl) {
    case LogLevel::Trace: return "TRACE";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Fatal: return "FATAL";
    }
    return "UNKNOWN";
}

// Accepts the lower-case names used in the config file ("debug", "warn", ...).
inline std::optional<LogLevel> level_from_string(std::string_view s) noexcept {
    if (s == "trace") return LogLevel::Trace;
    if (s == "debug") return LogLevel::Debug;
    if (s == "info") return LogLevel::Info;
    if (s == "warn") return LogLevel::Warn;
    if (s == "error") return LogLevel::Error;
    if (s == "fatal") return LogLevel::Fatal;
    return std::nullopt;
}

namespace detail {
inline std::mutex& slow_log_mutex() {
    static std::mutex mtx;
    return mtx;
}

inline std::atomic<int>& min_level_storage() {
    static std::atomic<int> lvl{static_cast<int>(LogLevel::Info)};
    return lvl;
}

inline void slow_log_impl(LogLevel lvl, const char* fmt, va_list args) {
    std::lock_guard<std::mutex> lock(slow_log_mutex());
    std::fprintf(stderr, "%s: ", level_name(lvl));
    std::vfprintf(stderr, fmt, args);
    std::fprintf(stderr, "\n");
}
} // namespace detail

inline void set_min_log_level(LogLevel lvl) noexcept {
    detail::min_level_storage().store(static_cast<int>(lvl), std::memory_order_relaxed);
}

inline LogLevel min_log_level() noexcept {
    return static_cast<LogLevel>(detail::min_level_storage().load(std::memory_order_relaxed));
}

inline bool log_enabled(LogLevel lvl) noexcept {
    return static_cast<int>(lvl) >= detail::min_level_storage().load(std::memory_order_relaxed);
}

class SyncLogger {
public:
    static void log(LogLevel lvl, const char* fmt, ...) {
        if (!log_enabled(lvl)) {
            return;
        }
        va_list args;
        va_start(args, fmt);
        detail::slow_log_impl(lvl, fmt, args);
        va_end(args);
    }
};

} // namespace util

#define LOG_SLOW_TRACE(FMT, ...) ::util::SyncLogger::log(::util::LogLevel::Trace, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_DEBUG(FMT, ...) ::util::SyncLogger::log(::util::LogLevel::Debug, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_INFO(FMT, ...)  ::util::SyncLogger::log(::util::LogLevel::Info,  (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_WARN(FMT, ...)  ::util::SyncLogger::log(::util::LogLevel::Warn,  (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_ERROR(FMT, ...) ::util::SyncLogger::log(::util::LogLevel::Error, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_FATAL(FMT, ...) ::util::SyncLogger::log(::util::LogLevel::Fatal, (FMT) __VA_OPT__(, __VA_ARGS__))
