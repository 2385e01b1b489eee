#pragma once

/// @file cache_registry.hpp
/// @brief Named collection of heterogeneous ResourceCaches.

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

#include "rcache/cache/cache_handle.hpp"
#include "rcache/cache/cache_policy.hpp"
#include "rcache/cache/cache_stats.hpp"
#include "rcache/cache/resource_cache.hpp"
#include "rcache/foundation/cache_result.hpp"
#include "rcache/foundation/clock.hpp"
#include "rcache/foundation/metrics_sink.hpp"

namespace rcache::cache {

/// Thread-safe name -> cache registry.
///
/// Each cache is stored behind its CacheHandle together with the type tag
/// of the concrete ResourceCache<K, V> it was registered as. Typed access
/// compares the requested tag against the recorded one before recovering
/// the concrete cache, so asking for the wrong K/V fails with
/// CacheTypeMismatch instead of misbehaving.
///
/// Constructed explicitly and passed by reference; tests build their own.
///
/// Usage:
/// @code
///   CacheRegistry registry(SteadyClock::instance(), metrics);
///   registry.registerCache<std::string, Pet>("pets",
///       {.defaultTtl = std::chrono::seconds(5)});
///
///   auto count = registry.withCache<std::string, Pet>("pets",
///       [](ResourceCache<std::string, Pet>& cache) { return cache.size(); });
/// @endcode
class CacheRegistry {
public:
    CacheRegistry(foundation::Clock& clock, foundation::MetricsSink& metrics);
    ~CacheRegistry();

    CacheRegistry(const CacheRegistry&) = delete;
    CacheRegistry& operator=(const CacheRegistry&) = delete;

    /// Create and register a ResourceCache<K, V> under @p name.
    ///
    /// @return CacheAlreadyRegistered if the name is taken.
    template <typename K, typename V, typename Hash = std::hash<K>>
    foundation::CacheResult<void> registerCache(std::string name,
                                                CachePolicy policy = {}) {
        auto cache = std::make_shared<ResourceCache<K, V, Hash>>(
            name, policy, clock_, metrics_);
        return insert(std::move(name), std::move(cache),
                      std::type_index(typeid(ResourceCache<K, V, Hash>)));
    }

    /// Typed handle to the cache registered under @p name.
    ///
    /// @return CacheNotFound or CacheTypeMismatch.
    template <typename K, typename V, typename Hash = std::hash<K>>
    [[nodiscard]] foundation::CacheResult<std::shared_ptr<ResourceCache<K, V, Hash>>>
    find(std::string_view name) const {
        using Typed = ResourceCache<K, V, Hash>;
        auto entry = lookup(name, std::type_index(typeid(Typed)));
        if (entry.hasError()) {
            return foundation::CacheResult<std::shared_ptr<Typed>>::err(
                std::move(entry).error());
        }
        // The type tag matched, so the handle is a Typed.
        return foundation::CacheResult<std::shared_ptr<Typed>>::ok(
            std::static_pointer_cast<Typed>(std::move(entry).value()));
    }

    /// Run @p fn against the typed cache and return its result.
    ///
    /// @return CacheNotFound or CacheTypeMismatch without calling @p fn.
    template <typename K, typename V, typename Hash = std::hash<K>, typename Fn>
    auto withCache(std::string_view name, Fn&& fn) const
        -> foundation::CacheResult<std::invoke_result_t<Fn, ResourceCache<K, V, Hash>&>> {
        using R = std::invoke_result_t<Fn, ResourceCache<K, V, Hash>&>;
        auto cache = find<K, V, Hash>(name);
        if (cache.hasError()) {
            return foundation::CacheResult<R>::err(cache.error());
        }
        if constexpr (std::is_void_v<R>) {
            std::forward<Fn>(fn)(*cache.value());
            return foundation::CacheResult<void>::ok();
        } else {
            return foundation::CacheResult<R>::ok(std::forward<Fn>(fn)(*cache.value()));
        }
    }

    /// Type-erased handle, for callers that only need the CacheHandle
    /// capability.
    [[nodiscard]] foundation::CacheResult<std::shared_ptr<CacheHandle>> handle(
        std::string_view name) const;

    /// Remove a cache from the registry. Outstanding handles stay valid.
    foundation::CacheResult<void> unregisterCache(std::string_view name);

    [[nodiscard]] bool contains(std::string_view name) const;

    /// Registered names in sorted order.
    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] std::size_t cacheCount() const;

    /// Stats snapshot of every cache, keyed by name.
    [[nodiscard]] std::map<std::string, CacheStats> aggregateStats() const;

    /// Sum of all caches' counters.
    [[nodiscard]] CacheStats totalStats() const;

    /// Drop every entry of every cache.
    void invalidateAll();

    /// Sweep expired entries from every cache. @return Number removed.
    std::size_t sweepExpired();

    /// Publish rcache_cache_entries and rcache_cache_hit_ratio gauges for
    /// every cache.
    void publishMetrics();

private:
    struct Registered {
        std::shared_ptr<CacheHandle> handle;
        std::type_index type;
    };

    foundation::CacheResult<void> insert(std::string name,
                                         std::shared_ptr<CacheHandle> handle,
                                         std::type_index type);

    foundation::CacheResult<std::shared_ptr<CacheHandle>> lookup(
        std::string_view name, std::type_index type) const;

    // Snapshot of handles so per-cache work runs without the registry lock.
    std::vector<std::shared_ptr<CacheHandle>> snapshot() const;

    foundation::Clock& clock_;
    foundation::MetricsSink& metrics_;

    mutable std::mutex mutex_;
    std::map<std::string, Registered, std::less<>> caches_;
};

}  // namespace rcache::cache
