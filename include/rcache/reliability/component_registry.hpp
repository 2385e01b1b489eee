#pragma once

/// @file component_registry.hpp
/// @brief Named registries of circuit breakers and rate limiters.

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "rcache/foundation/cache_result.hpp"
#include "rcache/foundation/clock.hpp"
#include "rcache/foundation/metrics_sink.hpp"
#include "rcache/reliability/circuit_breaker.hpp"
#include "rcache/reliability/rate_limiter.hpp"

namespace rcache::reliability {

/// Thread-safe name -> component map, one shared instance per dependency.
///
/// @tparam T      Component constructible as T(Config, Clock&, MetricsSink&).
/// @tparam Config Configuration type carrying a `name` member.
///
/// Constructed explicitly and passed by reference, like CacheRegistry.
template <typename T, typename Config>
class ComponentRegistry {
public:
    ComponentRegistry(foundation::Clock& clock, foundation::MetricsSink& metrics)
        : clock_(clock), metrics_(metrics) {}

    ComponentRegistry(const ComponentRegistry&) = delete;
    ComponentRegistry& operator=(const ComponentRegistry&) = delete;

    /// Create a component named config.name.
    ///
    /// @return AlreadyExists if the name is taken.
    foundation::CacheResult<std::shared_ptr<T>> registerComponent(Config config) {
        std::lock_guard lock(mutex_);
        if (items_.find(config.name) != items_.end()) {
            return foundation::CacheResult<std::shared_ptr<T>>::err(foundation::CacheError(
                foundation::ErrorCode::AlreadyExists,
                "already registered: " + config.name));
        }
        auto name = config.name;
        auto item = std::make_shared<T>(std::move(config), clock_, metrics_);
        items_.emplace(std::move(name), item);
        return foundation::CacheResult<std::shared_ptr<T>>::ok(std::move(item));
    }

    /// Existing component named config.name, or a new one built from
    /// @p config. An existing component keeps its original configuration.
    std::shared_ptr<T> getOrCreate(Config config) {
        std::lock_guard lock(mutex_);
        auto it = items_.find(config.name);
        if (it != items_.end()) {
            return it->second;
        }
        auto name = config.name;
        auto item = std::make_shared<T>(std::move(config), clock_, metrics_);
        items_.emplace(std::move(name), item);
        return item;
    }

    /// @return NotFound if no component has this name.
    [[nodiscard]] foundation::CacheResult<std::shared_ptr<T>> find(std::string_view name) const {
        std::lock_guard lock(mutex_);
        auto it = items_.find(name);
        if (it == items_.end()) {
            return foundation::CacheResult<std::shared_ptr<T>>::err(foundation::CacheError(
                foundation::ErrorCode::NotFound, "not registered: " + std::string(name)));
        }
        return foundation::CacheResult<std::shared_ptr<T>>::ok(it->second);
    }

    [[nodiscard]] bool contains(std::string_view name) const {
        std::lock_guard lock(mutex_);
        return items_.find(name) != items_.end();
    }

    [[nodiscard]] std::vector<std::string> names() const {
        std::lock_guard lock(mutex_);
        std::vector<std::string> result;
        result.reserve(items_.size());
        for (const auto& [name, item] : items_) {
            result.push_back(name);
        }
        return result;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    /// Visit every component outside the registry lock.
    void forEach(const std::function<void(const std::string&, T&)>& fn) const {
        std::vector<std::pair<std::string, std::shared_ptr<T>>> snapshot;
        {
            std::lock_guard lock(mutex_);
            snapshot.assign(items_.begin(), items_.end());
        }
        for (auto& [name, item] : snapshot) {
            fn(name, *item);
        }
    }

private:
    foundation::Clock& clock_;
    foundation::MetricsSink& metrics_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<T>, std::less<>> items_;
};

/// Circuit breakers keyed by dependency name.
class CircuitBreakerRegistry
    : public ComponentRegistry<CircuitBreaker, CircuitBreakerConfig> {
public:
    using ComponentRegistry::ComponentRegistry;

    /// Current state of every breaker, keyed by name.
    [[nodiscard]] std::map<std::string, CircuitBreaker::State> states() const {
        std::map<std::string, CircuitBreaker::State> result;
        forEach([&result](const std::string& name, CircuitBreaker& breaker) {
            result.emplace(name, breaker.state());
        });
        return result;
    }

    /// Return every breaker to Closed.
    void resetAll() {
        forEach([](const std::string&, CircuitBreaker& breaker) { breaker.reset(); });
    }
};

/// Rate limiters keyed by resource name.
using RateLimiterRegistry = ComponentRegistry<RateLimiter, RateLimiterConfig>;

}  // namespace rcache::reliability
