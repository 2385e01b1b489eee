#pragma once

/// @file resilience_config.hpp
/// @brief Plain configuration structs for caches and protection layers,
///        and their loader from ConfigManager.
///
/// Expected YAML layout (every key optional):
/// @code
///   cache:
///     enabled: true
///     default_ttl_ms: 300000
///     max_capacity: 10000
///     coalesce_fetches: false
///     sweep_interval_ms: 60000
///   retry:
///     enabled: true
///     max_attempts: 3
///     initial_backoff_ms: 100
///     backoff_multiplier: 2.0
///     max_backoff_ms: 1000
///     jitter: true
///   circuit_breaker:
///     failure_threshold: 5
///     reset_timeout_ms: 30000
///     success_threshold: 2
///     mode: consecutive          # or rolling_window
///     window_ms: 60000
///     failure_rate_percent: 50
///     minimum_requests: 10
///   rate_limit:
///     capacity: 100
///     refill_per_second: 1.67
///   concurrency:
///     enabled: false
///     max_concurrent: 100
///   resources:
///     pets:                      # same sections, overriding the above
///       cache:
///         default_ttl_ms: 5000
/// @endcode

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

#include "rcache/cache/cache_policy.hpp"
#include "rcache/foundation/cache_result.hpp"
#include "rcache/foundation/config_manager.hpp"
#include "rcache/reliability/circuit_breaker.hpp"
#include "rcache/reliability/rate_limiter.hpp"
#include "rcache/reliability/retry_policy.hpp"

namespace rcache::config {

/// Cache settings; a CachePolicy plus the sweeper interval.
struct CacheSettings {
    bool enabled = true;
    std::chrono::milliseconds defaultTtl{300000};
    std::size_t maxCapacity = 10000;
    bool coalesceFetches = false;

    /// Period of the optional expiry sweeper, 0 to disable it.
    std::chrono::milliseconds sweepInterval{60000};

    [[nodiscard]] cache::CachePolicy toPolicy() const {
        return cache::CachePolicy{
            .enabled = enabled,
            .defaultTtl = defaultTtl,
            .maxCapacity = maxCapacity,
            .coalesceFetches = coalesceFetches,
        };
    }
};

/// Optional concurrency layer.
struct ConcurrencyConfig {
    bool enabled = false;
    uint32_t maxConcurrent = 100;
};

/// Every setting that applies to one resource.
struct ResourceSettings {
    CacheSettings cache;
    reliability::RetryConfig retry;
    reliability::CircuitBreakerConfig circuitBreaker;
    reliability::RateLimiterConfig rateLimiter;
    ConcurrencyConfig concurrency;
};

/// Global defaults plus per-resource overrides.
struct ResilienceConfig {
    ResourceSettings defaults;
    std::map<std::string, ResourceSettings> resources;

    /// Settings for @p resource: its override block if present, otherwise
    /// the defaults. Breaker and limiter names are set to @p resource.
    [[nodiscard]] ResourceSettings settingsFor(std::string_view resource) const;
};

/// Build and validate a ResilienceConfig from loaded configuration.
///
/// Absent keys keep their defaults. Returns ConfigTypeMismatch for values
/// of the wrong type and ConfigInvalidValue for out-of-range values (zero
/// thresholds or attempts, multiplier below 1, non-positive TTL or refill
/// rate, capacity <= 0, unknown breaker mode).
[[nodiscard]] foundation::CacheResult<ResilienceConfig> loadResilienceConfig(
    const foundation::ConfigManager& config);

/// Validate one resource's settings. @p scope prefixes error messages.
[[nodiscard]] foundation::CacheResult<void> validate(const ResourceSettings& settings,
                                                     std::string_view scope);

}  // namespace rcache::config
