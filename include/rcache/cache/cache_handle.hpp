#pragma once

/// @file cache_handle.hpp
/// @brief Type-erased capability interface over a ResourceCache.

#include <cstddef>
#include <string>

#include "rcache/cache/cache_stats.hpp"

namespace rcache::cache {

/// Operations the registry can perform without knowing K and V.
class CacheHandle {
public:
    virtual ~CacheHandle() = default;

    [[nodiscard]] virtual const std::string& name() const noexcept = 0;

    [[nodiscard]] virtual CacheStats stats() const = 0;

    [[nodiscard]] virtual std::size_t size() const = 0;

    /// Drop every entry.
    virtual void invalidateAll() = 0;

    /// Remove expired entries. @return Number removed.
    virtual std::size_t sweepExpired() = 0;
};

}  // namespace rcache::cache
