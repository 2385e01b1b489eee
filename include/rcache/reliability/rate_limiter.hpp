#pragma once

/// @file rate_limiter.hpp
/// @brief Token bucket rate limiter for a named resource.
///
/// Controls sustained throughput towards a resource with a configurable
/// burst capacity. Optionally keeps an independent bucket per client key.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "rcache/foundation/clock.hpp"
#include "rcache/foundation/metrics_sink.hpp"

namespace rcache::reliability {

/// Configuration for a RateLimiter instance.
struct RateLimiterConfig {
    /// Maximum burst, in cost units.
    double capacity = 100.0;

    /// Tokens added per second.
    double refillRate = 100.0 / 60.0;

    /// Human-readable name for logging and metrics.
    std::string name = "default";
};

/// Token bucket limiter.
///
/// Every acquisition first refills the bucket with
/// tokens = min(capacity, tokens + elapsed_seconds * refillRate) and then
/// grants the request if tokens >= cost. The bucket starts full, so the
/// total cost granted over any window of length t never exceeds
/// capacity + refillRate * t. Rejections never queue.
///
/// Thread-safe: refill and subtraction happen under one mutex.
///
/// Example:
/// @code
///   RateLimiter limiter({.capacity = 10, .refillRate = 5, .name = "pets"}, clock);
///   if (!limiter.tryAcquire()) {
///       // reject with RateLimited
///   }
///   if (!limiter.tryAcquireFor("client-7", 2.0)) { ... }
/// @endcode
class RateLimiter {
public:
    RateLimiter(RateLimiterConfig config, foundation::Clock& clock,
                foundation::MetricsSink& metrics = foundation::NullMetricsSink::instance());

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /// Try to take @p cost tokens from the shared bucket.
    /// Returns true if allowed, false if the rate limit is exceeded or
    /// @p cost is negative or NaN.
    [[nodiscard]] bool tryAcquire(double cost = 1.0);

    /// Try to take @p cost tokens from @p clientKey's own bucket. Each
    /// client starts with a full bucket of the same capacity and rate.
    [[nodiscard]] bool tryAcquireFor(const std::string& clientKey, double cost = 1.0);

    /// Tokens currently available in the shared bucket (after refill).
    [[nodiscard]] double available() const;

    /// Tokens currently available for @p clientKey.
    [[nodiscard]] double availableFor(const std::string& clientKey) const;

    /// Refill the shared bucket to capacity.
    void reset();

    /// Stop tracking @p clientKey (e.g. when the client goes away).
    void removeClient(const std::string& clientKey);

    [[nodiscard]] std::size_t clientCount() const;

    /// Total rejected acquisitions.
    [[nodiscard]] uint64_t rejectedCount() const;

    [[nodiscard]] std::string_view name() const;

    [[nodiscard]] const RateLimiterConfig& config() const noexcept { return config_; }

private:
    struct Bucket {
        double tokens;
        foundation::Clock::time_point lastRefill;
    };

    // Caller holds mutex_.
    void refill(Bucket& bucket) const;
    bool take(Bucket& bucket, double cost);

    void reportRejected(std::string_view clientKey);

    RateLimiterConfig config_;
    foundation::Clock& clock_;
    foundation::MetricsSink& metrics_;

    mutable std::mutex mutex_;
    mutable Bucket shared_;
    mutable std::unordered_map<std::string, Bucket> clients_;
    uint64_t rejected_{0};
};

}  // namespace rcache::reliability
