#pragma once

/// @file entry_store.hpp
/// @brief Thread-safe key -> entry map with lazy TTL expiry and LRU bound.
///
/// Backing store of every ResourceCache. Lookups check the entry's expiry
/// against the injected clock under the store lock, so a get() never returns
/// a value whose deadline has passed at the time of the check. Expired
/// entries that are never read again can be reclaimed with sweepExpired().

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

#include "rcache/cache/cache_stats.hpp"
#include "rcache/foundation/cache_result.hpp"
#include "rcache/foundation/clock.hpp"
#include "rcache/foundation/metrics_sink.hpp"

namespace rcache::cache {

/// Stored value plus its lifetime bookkeeping.
///
/// Invariant: expiresAt > insertedAt.
template <typename V>
struct CacheEntry {
    V value;
    foundation::Clock::time_point insertedAt;
    foundation::Clock::time_point expiresAt;
    uint64_t accessCount = 0;
};

/// Read-only view of an entry's bookkeeping, without the value.
struct EntryMetadata {
    foundation::Clock::time_point insertedAt;
    foundation::Clock::time_point expiresAt;
    uint64_t accessCount = 0;
};

/// Concurrent LRU map with per-entry TTL.
///
/// Every get() counts exactly one hit or one miss; every entry removed
/// because it expired (on read or by sweep) or because the capacity bound
/// pushed it out counts exactly one eviction. Counters live under the same
/// mutex as the map, so stats() is consistent with every get()/insert()
/// that completed before it. Metric updates are emitted after the lock is
/// released.
///
/// Usage:
/// @code
///   EntryStore<std::string, Pet> store("pets", 1000, clock, metrics);
///   store.insert("pet:42", pet, std::chrono::seconds(5));
///   if (auto cached = store.get("pet:42")) { use(*cached); }
/// @endcode
template <typename K, typename V, typename Hash = std::hash<K>>
class EntryStore {
public:
    /// @param maxCapacity Maximum number of entries, 0 for unbounded.
    EntryStore(std::string name, std::size_t maxCapacity,
               foundation::Clock& clock, foundation::MetricsSink& metrics)
        : name_(std::move(name)),
          maxCapacity_(maxCapacity),
          clock_(clock),
          metrics_(metrics),
          labels_{{"cache", name_}} {}

    EntryStore(const EntryStore&) = delete;
    EntryStore& operator=(const EntryStore&) = delete;

    /// Look up a live entry.
    ///
    /// An entry with now >= expiresAt is removed and reported as a miss.
    [[nodiscard]] std::optional<V> get(const K& key) {
        std::optional<V> found;
        bool expired = false;
        {
            std::lock_guard lock(mutex_);
            auto it = index_.find(key);
            if (it == index_.end()) {
                ++stats_.misses;
            } else if (clock_.now() >= it->second->entry.expiresAt) {
                lru_.erase(it->second);
                index_.erase(it);
                ++stats_.evictions;
                ++stats_.misses;
                expired = true;
            } else {
                auto listIt = it->second;
                lru_.splice(lru_.begin(), lru_, listIt);
                ++listIt->entry.accessCount;
                ++stats_.hits;
                found = listIt->entry.value;
            }
        }

        if (found) {
            emit("rcache_cache_hits_total", 1);
        } else {
            if (expired) {
                emit("rcache_cache_evictions_total", 1);
            }
            emit("rcache_cache_misses_total", 1);
        }
        return found;
    }

    /// Insert or overwrite an entry, resetting its timestamps.
    ///
    /// @return InvalidTtl if @p ttl is not positive.
    foundation::CacheResult<void> insert(const K& key, V value,
                                         foundation::Clock::duration ttl) {
        if (ttl <= foundation::Clock::duration::zero()) {
            return foundation::CacheResult<void>::err(foundation::CacheError(
                foundation::ErrorCode::InvalidTtl,
                "ttl must be positive for cache '" + name_ + "'"));
        }

        bool evicted = false;
        {
            std::lock_guard lock(mutex_);
            auto now = clock_.now();
            auto it = index_.find(key);
            if (it != index_.end()) {
                auto listIt = it->second;
                listIt->entry.value = std::move(value);
                listIt->entry.insertedAt = now;
                listIt->entry.expiresAt = now + ttl;
                listIt->entry.accessCount = 0;
                lru_.splice(lru_.begin(), lru_, listIt);
            } else {
                if (maxCapacity_ > 0 && lru_.size() >= maxCapacity_) {
                    index_.erase(lru_.back().key);
                    lru_.pop_back();
                    ++stats_.evictions;
                    evicted = true;
                }
                lru_.push_front(Node{key, CacheEntry<V>{std::move(value), now, now + ttl, 0}});
                index_.emplace(key, lru_.begin());
            }
            ++stats_.entriesCreated;
        }

        if (evicted) {
            emit("rcache_cache_evictions_total", 1);
        }
        emit("rcache_cache_entries_created_total", 1);
        return foundation::CacheResult<void>::ok();
    }

    /// Remove an entry regardless of TTL. Idempotent.
    ///
    /// @return true if an entry was present.
    bool remove(const K& key) {
        std::lock_guard lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            return false;
        }
        lru_.erase(it->second);
        index_.erase(it);
        return true;
    }

    /// Drop every entry. Not counted as evictions.
    void clear() {
        std::lock_guard lock(mutex_);
        lru_.clear();
        index_.clear();
    }

    /// Remove every expired entry.
    ///
    /// @return Number of entries removed.
    std::size_t sweepExpired() {
        std::size_t removed = 0;
        {
            std::lock_guard lock(mutex_);
            auto now = clock_.now();
            for (auto it = lru_.begin(); it != lru_.end();) {
                if (now >= it->entry.expiresAt) {
                    index_.erase(it->key);
                    it = lru_.erase(it);
                    ++removed;
                } else {
                    ++it;
                }
            }
            stats_.evictions += removed;
        }
        if (removed > 0) {
            emit("rcache_cache_evictions_total", static_cast<double>(removed));
        }
        return removed;
    }

    /// Entry bookkeeping without touching counters or recency.
    [[nodiscard]] std::optional<EntryMetadata> metadata(const K& key) const {
        std::lock_guard lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            return std::nullopt;
        }
        const auto& entry = it->second->entry;
        return EntryMetadata{entry.insertedAt, entry.expiresAt, entry.accessCount};
    }

    /// Number of stored entries, expired-but-unread ones included.
    [[nodiscard]] std::size_t size() const {
        std::lock_guard lock(mutex_);
        return lru_.size();
    }

    [[nodiscard]] CacheStats stats() const {
        std::lock_guard lock(mutex_);
        auto snapshot = stats_;
        snapshot.size = lru_.size();
        return snapshot;
    }

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    [[nodiscard]] std::size_t maxCapacity() const noexcept { return maxCapacity_; }

private:
    struct Node {
        K key;
        CacheEntry<V> entry;
    };

    using LruList = std::list<Node>;

    void emit(const char* metric, double value) {
        metrics_.record(metric, value, labels_);
    }

    std::string name_;
    std::size_t maxCapacity_;
    foundation::Clock& clock_;
    foundation::MetricsSink& metrics_;
    const foundation::MetricLabels labels_;

    mutable std::mutex mutex_;
    // Front = most recently used.
    LruList lru_;
    std::unordered_map<K, typename LruList::iterator, Hash> index_;
    CacheStats stats_;
};

}  // namespace rcache::cache
