#pragma once

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <ctime>
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

inline std::optional<LogLevel> level_from_string(std::string_view s) noexcept {
    if (s == "TRACE" || s == "trace") return LogLevel::Trace;
    if (s == "DEBUG" || s == "debug") return LogLevel::Debug;
    if (s == "INFO" || s == "info") return LogLevel::Info;
    if (s == "WARN" || s == "warn") return LogLevel::Warn;
    if (s == "ERROR" || s == "error") return LogLevel::Error;
    if (s == "FATAL" || s == "fatal") return LogLevel::Fatal;
    return std::nullopt;
}

namespace detail {
inline std::mutex& log_mutex() {
    static std::mutex mtx;
    return mtx;
}

inline std::atomic<LogLevel>& min_level() {
    static std::atomic<LogLevel> lvl{LogLevel::Info};
    return lvl;
}

inline void log_impl(LogLevel lvl, const char* category, const char* fmt, va_list args) {
    const std::time_t t = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%SZ", &tm);

    std::lock_guard<std::mutex> lock(log_mutex());
    std::fprintf(stderr, "%s %s [%s] ", stamp, level_name(lvl), category ? category : "-");
    std::vfprintf(stderr, fmt, args);
    std::fprintf(stderr, "\n");
}
} // namespace detail

inline void set_log_level(LogLevel lvl) noexcept {
    detail::min_level().store(lvl, std::memory_order_relaxed);
}

inline LogLevel log_level() noexcept {
    return detail::min_level().load(std::memory_order_relaxed);
}

inline bool log_enabled(LogLevel lvl) noexcept {
    return static_cast<int>(lvl) >= static_cast<int>(log_level());
}

// Formatting happens under a process-wide mutex; keep these off tight loops.
inline void log(LogLevel lvl, const char* category, const char* fmt, ...) {
    if (!log_enabled(lvl)) {
        return;
    }
    va_list args;
    va_start(args, fmt);
    detail::log_impl(lvl, category, fmt, args);
    va_end(args);
}

} // namespace util

#define QL_LOG_TRACE(CAT, FMT, ...) ::util::log(::util::LogLevel::Trace, (CAT), (FMT) __VA_OPT__(, __VA_ARGS__))
#define QL_LOG_DEBUG(CAT, FMT, ...) ::util::log(::util::LogLevel::Debug, (CAT), (FMT) __VA_OPT__(, __VA_ARGS__))
#define QL_LOG_INFO(CAT, FMT, ...)  ::util::log(::util::LogLevel::Info,  (CAT), (FMT) __VA_OPT__(, __VA_ARGS__))
#define QL_LOG_WARN(CAT, FMT, ...)  ::util::log(::util::LogLevel::Warn,  (CAT), (FMT) __VA_OPT__(, __VA_ARGS__))
#define QL_LOG_ERROR(CAT, FMT, ...) ::util::log(::util::LogLevel::Error, (CAT), (FMT) __VA_OPT__(, __VA_ARGS__))
#define QL_LOG_FATAL(CAT, FMT, ...) ::util::log(::util::LogLevel::Fatal, (CAT), (FMT) __VA_OPT__(, __VA_ARGS__))
