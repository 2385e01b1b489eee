#pragma once

/// @file cache_stats.hpp
/// @brief Point-in-time cache counters.

#include <cstddef>
#include <cstdint>

namespace rcache::cache {

/// Snapshot of a cache's counters, taken under the store lock.
struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;       ///< Lazy expiries, sweeps and LRU evictions.
    uint64_t entriesCreated = 0;  ///< Successful inserts, overwrites included.
    std::size_t size = 0;

    /// Fraction of lookups that were hits (0.0 when there were none).
    [[nodiscard]] double hitRatio() const noexcept {
        auto total = hits + misses;
        return total == 0 ? 0.0
                          : static_cast<double>(hits) / static_cast<double>(total);
    }

    CacheStats& operator+=(const CacheStats& other) noexcept {
        hits += other.hits;
        misses += other.misses;
        evictions += other.evictions;
        entriesCreated += other.entriesCreated;
        size += other.size;
        return *this;
    }
};

}  // namespace rcache::cache
