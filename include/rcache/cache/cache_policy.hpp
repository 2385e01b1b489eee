#pragma once

/// @file cache_policy.hpp
/// @brief Per-cache TTL, capacity and fetch behaviour.

#include <chrono>
#include <cstddef>

#include "rcache/foundation/clock.hpp"

namespace rcache::cache {

/// Configuration fixed at registration time.
struct CachePolicy {
    /// When false the cache stores nothing and every lookup goes upstream.
    bool enabled = true;

    /// TTL applied when a call supplies no override.
    foundation::Clock::duration defaultTtl = std::chrono::minutes(5);

    /// Upper bound on entries (LRU eviction), 0 for unbounded.
    std::size_t maxCapacity = 0;

    /// Share one upstream fetch between concurrent misses on the same key.
    bool coalesceFetches = false;
};

}  // namespace rcache::cache
