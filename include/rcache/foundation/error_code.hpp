#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the resilient resource cache.

#include <cstdint>
#include <string_view>

namespace rcache::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    NotImplemented = 0x0005,

    // Cache (0x0100 - 0x01FF)
    CacheNotFound = 0x0100,
    CacheAlreadyRegistered = 0x0101,
    CacheTypeMismatch = 0x0102,
    CacheDisabled = 0x0103,
    InvalidTtl = 0x0104,

    // Upstream (0x0200 - 0x02FF)
    UpstreamFailed = 0x0200,
    UpstreamTimeout = 0x0201,
    UpstreamUnavailable = 0x0202,
    UpstreamRejected = 0x0203,

    // Reliability (0x0300 - 0x03FF)
    CircuitOpen = 0x0300,
    RateLimited = 0x0301,
    ConcurrencyLimited = 0x0302,
    RetryExhausted = 0x0303,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigInvalidValue = 0x0603,

    // Thread (0x0700 - 0x07FF)
    ThreadError = 0x0700,
    TaskScheduleFailed = 0x0701,
    TimerNotFound = 0x0702,
    SchedulerStopped = 0x0703,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerNotInitialized = 0x0801,
    LoggerFlushFailed = 0x0802,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Cache";
        case 0x0200: return "Upstream";
        case 0x0300: return "Reliability";
        case 0x0600: return "Config";
        case 0x0700: return "Thread";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace rcache::foundation
