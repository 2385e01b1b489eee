/// @file cache_registry.cpp
/// @brief CacheRegistry implementation.

#include "rcache/cache/cache_registry.hpp"

#include "rcache/foundation/cache_logger.hpp"

namespace rcache::cache {

using foundation::CacheError;
using foundation::CacheResult;
using foundation::ErrorCode;
using foundation::LogCategory;

CacheRegistry::CacheRegistry(foundation::Clock& clock,
                             foundation::MetricsSink& metrics)
    : clock_(clock), metrics_(metrics) {}

CacheRegistry::~CacheRegistry() = default;

CacheResult<void> CacheRegistry::insert(std::string name,
                                        std::shared_ptr<CacheHandle> handle,
                                        std::type_index type) {
    {
        std::lock_guard lock(mutex_);
        if (caches_.find(name) != caches_.end()) {
            RCACHE_LOG_ERROR(LogCategory::Registry,
                             "cache already registered: " + name);
            return CacheResult<void>::err(CacheError(
                ErrorCode::CacheAlreadyRegistered,
                "cache already registered: " + name));
        }
        caches_.emplace(name, Registered{std::move(handle), type});
    }
    RCACHE_LOG_INFO(LogCategory::Registry, "registered cache: " + name);
    return CacheResult<void>::ok();
}

CacheResult<std::shared_ptr<CacheHandle>> CacheRegistry::lookup(
    std::string_view name, std::type_index type) const {
    std::lock_guard lock(mutex_);
    auto it = caches_.find(name);
    if (it == caches_.end()) {
        return CacheResult<std::shared_ptr<CacheHandle>>::err(CacheError(
            ErrorCode::CacheNotFound,
            "cache not found: " + std::string(name)));
    }
    if (it->second.type != type) {
        return CacheResult<std::shared_ptr<CacheHandle>>::err(CacheError(
            ErrorCode::CacheTypeMismatch,
            "cache '" + std::string(name) + "' was registered with different types"));
    }
    return CacheResult<std::shared_ptr<CacheHandle>>::ok(it->second.handle);
}

CacheResult<std::shared_ptr<CacheHandle>> CacheRegistry::handle(
    std::string_view name) const {
    std::lock_guard lock(mutex_);
    auto it = caches_.find(name);
    if (it == caches_.end()) {
        return CacheResult<std::shared_ptr<CacheHandle>>::err(CacheError(
            ErrorCode::CacheNotFound,
            "cache not found: " + std::string(name)));
    }
    return CacheResult<std::shared_ptr<CacheHandle>>::ok(it->second.handle);
}

CacheResult<void> CacheRegistry::unregisterCache(std::string_view name) {
    std::lock_guard lock(mutex_);
    auto it = caches_.find(name);
    if (it == caches_.end()) {
        return CacheResult<void>::err(CacheError(
            ErrorCode::CacheNotFound,
            "cache not found: " + std::string(name)));
    }
    caches_.erase(it);
    return CacheResult<void>::ok();
}

bool CacheRegistry::contains(std::string_view name) const {
    std::lock_guard lock(mutex_);
    return caches_.find(name) != caches_.end();
}

std::vector<std::string> CacheRegistry::names() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> result;
    result.reserve(caches_.size());
    for (const auto& [name, entry] : caches_) {
        result.push_back(name);
    }
    return result;
}

std::size_t CacheRegistry::cacheCount() const {
    std::lock_guard lock(mutex_);
    return caches_.size();
}

std::vector<std::shared_ptr<CacheHandle>> CacheRegistry::snapshot() const {
    std::lock_guard lock(mutex_);
    std::vector<std::shared_ptr<CacheHandle>> handles;
    handles.reserve(caches_.size());
    for (const auto& [name, entry] : caches_) {
        handles.push_back(entry.handle);
    }
    return handles;
}

std::map<std::string, CacheStats> CacheRegistry::aggregateStats() const {
    std::map<std::string, CacheStats> result;
    for (const auto& cache : snapshot()) {
        result.emplace(cache->name(), cache->stats());
    }
    return result;
}

CacheStats CacheRegistry::totalStats() const {
    CacheStats total;
    for (const auto& cache : snapshot()) {
        total += cache->stats();
    }
    return total;
}

void CacheRegistry::invalidateAll() {
    for (const auto& cache : snapshot()) {
        cache->invalidateAll();
    }
    RCACHE_LOG_INFO(LogCategory::Registry, "invalidated all caches");
}

std::size_t CacheRegistry::sweepExpired() {
    std::size_t removed = 0;
    for (const auto& cache : snapshot()) {
        removed += cache->sweepExpired();
    }
    if (removed > 0) {
        RCACHE_LOG_DEBUG(LogCategory::Registry,
                         "swept " + std::to_string(removed) + " expired entries");
    }
    return removed;
}

void CacheRegistry::publishMetrics() {
    for (const auto& cache : snapshot()) {
        auto stats = cache->stats();
        foundation::MetricLabels labels{{"cache", cache->name()}};
        metrics_.record("rcache_cache_entries", static_cast<double>(stats.size), labels);
        metrics_.record("rcache_cache_hit_ratio", stats.hitRatio(), labels);
    }
}

}  // namespace rcache::cache
