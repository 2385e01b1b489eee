#pragma once

/// @file cache_logger.hpp
/// @brief CacheLogger wrapping kcenon logger_system for structured logging.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "rcache/foundation/cache_result.hpp"

namespace rcache::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories for structured filtering, one per subsystem.
enum class LogCategory : uint8_t {
    Core      = 0, ///< Scheduler, clock, lifecycle
    Cache     = 1, ///< Entry store and resource caches
    Registry  = 2, ///< Cache / breaker / limiter registries
    Retry     = 3, ///< Retry executor
    Circuit   = 4, ///< Circuit breaker transitions
    RateLimit = 5, ///< Token bucket and concurrency limiting
    Handler   = 6, ///< Composite protected handler
    Config    = 7  ///< Configuration loading
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 8;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Cache", "Registry", "Retry", "Circuit", "RateLimit", "Handler", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

/// Return the string name for a log level.
constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context data attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.resource = "pets";
///   ctx.key = "pet:42";
///   ctx.extra["attempt"] = "2";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Retry,
///                         "retrying upstream call", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> resource;
    std::optional<std::string> key;
    std::optional<std::string> breaker;
    std::optional<std::string> traceId;
    std::unordered_map<std::string, std::string> extra;
};

/// Logger wrapping kcenon's logging system.
///
/// Uses PIMPL to hide kcenon implementation details from the public API.
///
/// Default log levels per category:
/// | Category  | Default Level |
/// |-----------|---------------|
/// | Core      | Info          |
/// | Cache     | Info          |
/// | Registry  | Info          |
/// | Retry     | Info          |
/// | Circuit   | Info          |
/// | RateLimit | Warning       |
/// | Handler   | Info          |
/// | Config    | Info          |
class CacheLogger {
public:
    CacheLogger();
    ~CacheLogger();

    // Non-copyable, movable.
    CacheLogger(const CacheLogger&) = delete;
    CacheLogger& operator=(const CacheLogger&) = delete;
    CacheLogger(CacheLogger&&) noexcept;
    CacheLogger& operator=(CacheLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context data.
    /// Context fields are appended as key-value pairs to the log message.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    /// Set the minimum log level for a category at runtime.
    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Get the current minimum log level for a category.
    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    /// Check if logging is enabled for the given level and category.
    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    CacheResult<void> flush();

    /// Get the global CacheLogger instance.
    static CacheLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rcache::foundation

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------

/// @name RCACHE_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// RCACHE_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef RCACHE_MIN_LOG_LEVEL
    #define RCACHE_MIN_LOG_LEVEL 0
#endif

#define RCACHE_LOG(level, cat, msg)                                                  \
    do {                                                                             \
        _Pragma("GCC diagnostic push")                                               \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                          \
        if (static_cast<int>(level) >= RCACHE_MIN_LOG_LEVEL &&                       \
            ::rcache::foundation::CacheLogger::instance().isEnabled((level), (cat)))  \
        {                                                                            \
            ::rcache::foundation::CacheLogger::instance().log((level), (cat), (msg)); \
        }                                                                            \
        _Pragma("GCC diagnostic pop")                                                \
    } while (0)

#define RCACHE_LOG_DEBUG(cat, msg) \
    RCACHE_LOG(::rcache::foundation::LogLevel::Debug, (cat), (msg))

#define RCACHE_LOG_INFO(cat, msg) \
    RCACHE_LOG(::rcache::foundation::LogLevel::Info, (cat), (msg))

#define RCACHE_LOG_WARN(cat, msg) \
    RCACHE_LOG(::rcache::foundation::LogLevel::Warning, (cat), (msg))

#define RCACHE_LOG_ERROR(cat, msg) \
    RCACHE_LOG(::rcache::foundation::LogLevel::Error, (cat), (msg))

/// @}
