#pragma once

/// @file resource_cache.hpp
/// @brief Typed get-or-fetch cache over an EntryStore.

#include <any>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

#include "rcache/cache/cache_handle.hpp"
#include "rcache/cache/cache_policy.hpp"
#include "rcache/cache/entry_store.hpp"
#include "rcache/foundation/async.hpp"
#include "rcache/foundation/cache_error.hpp"
#include "rcache/foundation/cache_logger.hpp"
#include "rcache/foundation/cache_result.hpp"

namespace rcache::cache {

/// Per-resource cache implementing the get-or-fetch pattern.
///
/// On a hit the cached value is delivered without calling the fetch. On a
/// miss the fetch runs; a success is stored with the call's TTL override
/// (or the policy default) and returned, a failure is returned and never
/// cached.
///
/// Concurrent misses on one key each call their own fetch unless the
/// policy sets coalesceFetches, in which case later callers attach to the
/// fetch already in flight and receive its outcome. Coalescing only joins
/// callers using the same error type.
///
/// The store is shared with pending completions, so a fetch that finishes
/// after its caller gave up still populates the cache.
///
/// Usage:
/// @code
///   auto pets = registry.find<std::string, Pet>("pets").value();
///   pets->getOrFetch<FetchError>(
///       "pet:42", std::nullopt,
///       [&api](auto done) { api.getPet(42, std::move(done)); },
///       [](Result<Pet, FetchError> r) { ... });
/// @endcode
template <typename K, typename V, typename Hash = std::hash<K>>
class ResourceCache final : public CacheHandle {
public:
    using key_type = K;
    using mapped_type = V;

    ResourceCache(std::string name, CachePolicy policy,
                  foundation::Clock& clock, foundation::MetricsSink& metrics)
        : state_(std::make_shared<State>(std::move(name), policy, clock, metrics)) {}

    ResourceCache(const ResourceCache&) = delete;
    ResourceCache& operator=(const ResourceCache&) = delete;

    /// Deliver the cached value for @p key or fetch it upstream.
    ///
    /// @p done runs exactly once: synchronously on a hit, otherwise on the
    /// thread that completes @p fetch.
    template <typename E = foundation::FetchError>
    void getOrFetch(const K& key,
                    std::optional<foundation::Clock::duration> ttlOverride,
                    foundation::AsyncOperation<V, E> fetch,
                    foundation::Completion<V, E> done) {
        if (!state_->policy.enabled) {
            fetch(std::move(done));
            return;
        }

        if (auto cached = state_->store.get(key)) {
            done(Result<V, E>::ok(std::move(*cached)));
            return;
        }

        auto ttl = ttlOverride.value_or(state_->policy.defaultTtl);

        uint64_t flight = 0;  // non-zero while leading a flight
        if (state_->policy.coalesceFetches) {
            auto role = enterFlight<E>(key, ttl, fetch, done, flight);
            if (role == FlightRole::Joined) {
                return;
            }
        }

        auto complete = [state = state_, key, ttl, flight, done = std::move(done)](
                            Result<V, E> result) mutable {
            if (result.hasValue()) {
                storeFetched(*state, key, result.value(), ttl);
            }
            if (flight != 0) {
                completeFlight(*state, key, flight, result);
            }
            done(std::move(result));
        };
        if (flight == 0) {
            fetch(std::move(complete));
            return;
        }
        try {
            fetch(std::move(complete));
        } catch (...) {
            // Waiters fall back to their own fetch; the exception is the
            // caller's.
            abandonFlight(*state_, key, flight);
            throw;
        }
    }

    /// getOrFetch() with the policy's default TTL.
    template <typename E = foundation::FetchError>
    void getOrFetch(const K& key, foundation::AsyncOperation<V, E> fetch,
                    foundation::Completion<V, E> done) {
        getOrFetch<E>(key, std::nullopt, std::move(fetch), std::move(done));
    }

    /// Plain lookup. Counts a hit or miss; nullopt when disabled.
    [[nodiscard]] std::optional<V> get(const K& key) {
        if (!state_->policy.enabled) {
            return std::nullopt;
        }
        return state_->store.get(key);
    }

    /// Store a value directly, e.g. after a write-through.
    ///
    /// @return CacheDisabled when the policy disables caching, InvalidTtl
    ///         for a non-positive TTL.
    foundation::CacheResult<void> put(
        const K& key, V value,
        std::optional<foundation::Clock::duration> ttl = std::nullopt) {
        if (!state_->policy.enabled) {
            return foundation::CacheResult<void>::err(foundation::CacheError(
                foundation::ErrorCode::CacheDisabled,
                "cache '" + name() + "' is disabled"));
        }
        return state_->store.insert(key, std::move(value),
                                    ttl.value_or(state_->policy.defaultTtl));
    }

    /// Remove @p key regardless of TTL. Succeeds whether or not it existed.
    foundation::CacheResult<void> invalidate(const K& key) {
        state_->store.remove(key);
        return foundation::CacheResult<void>::ok();
    }

    [[nodiscard]] std::optional<EntryMetadata> metadata(const K& key) const {
        return state_->store.metadata(key);
    }

    /// Number of keys with a coalesced fetch outstanding.
    [[nodiscard]] std::size_t inFlightCount() const {
        std::lock_guard lock(state_->flightMutex);
        return state_->inFlight.size();
    }

    [[nodiscard]] const CachePolicy& policy() const noexcept { return state_->policy; }

    // CacheHandle
    [[nodiscard]] const std::string& name() const noexcept override {
        return state_->store.name();
    }

    [[nodiscard]] CacheStats stats() const override { return state_->store.stats(); }

    [[nodiscard]] std::size_t size() const override { return state_->store.size(); }

    void invalidateAll() override { state_->store.clear(); }

    std::size_t sweepExpired() override { return state_->store.sweepExpired(); }

private:
    using Waiter = std::function<void(const std::any&)>;

    // An empty std::any tells a waiter the leader gave up.
    struct Flight {
        std::type_index errorType;
        uint64_t token;
        std::vector<Waiter> waiters;
    };

    struct State {
        State(std::string name, CachePolicy p, foundation::Clock& clock,
              foundation::MetricsSink& metrics)
            : store(std::move(name), p.maxCapacity, clock, metrics), policy(p) {}

        EntryStore<K, V, Hash> store;
        const CachePolicy policy;

        mutable std::mutex flightMutex;
        std::unordered_map<K, Flight, Hash> inFlight;
        uint64_t nextFlightToken = 1;
    };

    enum class FlightRole { Leader, Joined, Independent };

    // Attach @p done to the flight for @p key, or open one and set
    // @p token. A flight opened with a different error type cannot be
    // joined; the caller then fetches on its own.
    template <typename E>
    FlightRole enterFlight(const K& key, foundation::Clock::duration ttl,
                           const foundation::AsyncOperation<V, E>& fetch,
                           foundation::Completion<V, E>& done, uint64_t& token) {
        std::lock_guard lock(state_->flightMutex);
        auto [it, inserted] = state_->inFlight.try_emplace(
            key, Flight{std::type_index(typeid(E)), state_->nextFlightToken, {}});
        if (inserted) {
            token = state_->nextFlightToken++;
            return FlightRole::Leader;
        }
        if (it->second.errorType != std::type_index(typeid(E))) {
            return FlightRole::Independent;
        }
        it->second.waiters.push_back(
            [state = state_, key, ttl, fetch, cb = std::move(done)](
                const std::any& outcome) mutable {
                if (!outcome.has_value()) {
                    fetchDirect<E>(state, key, ttl, fetch, std::move(cb));
                    return;
                }
                cb(*std::any_cast<Result<V, E>>(&outcome));
            });
        return FlightRole::Joined;
    }

    template <typename E>
    static void fetchDirect(const std::shared_ptr<State>& state, const K& key,
                            foundation::Clock::duration ttl,
                            const foundation::AsyncOperation<V, E>& fetch,
                            foundation::Completion<V, E> done) {
        fetch([state, key, ttl, done = std::move(done)](Result<V, E> result) {
            if (result.hasValue()) {
                storeFetched(*state, key, result.value(), ttl);
            }
            done(std::move(result));
        });
    }

    // Close flight @p token without an outcome and hand its waiters back
    // to their own fetches.
    static void abandonFlight(State& state, const K& key, uint64_t token) {
        std::vector<Waiter> waiters;
        {
            std::lock_guard lock(state.flightMutex);
            auto it = state.inFlight.find(key);
            if (it != state.inFlight.end() && it->second.token == token) {
                waiters = std::move(it->second.waiters);
                state.inFlight.erase(it);
            }
        }
        if (!waiters.empty()) {
            RCACHE_LOG_WARN(foundation::LogCategory::Cache,
                            "coalesced fetch threw; " + std::to_string(waiters.size()) +
                                " waiters fetch on their own");
        }
        const std::any abandoned;
        for (auto& waiter : waiters) {
            waiter(abandoned);
        }
    }

    template <typename E>
    static void completeFlight(State& state, const K& key, uint64_t token,
                               const Result<V, E>& result) {
        std::vector<Waiter> waiters;
        {
            std::lock_guard lock(state.flightMutex);
            auto it = state.inFlight.find(key);
            if (it != state.inFlight.end() && it->second.token == token) {
                waiters = std::move(it->second.waiters);
                state.inFlight.erase(it);
            }
        }
        if (waiters.empty()) {
            return;
        }
        std::any outcome(result);
        for (auto& waiter : waiters) {
            waiter(outcome);
        }
    }

    static void storeFetched(State& state, const K& key, const V& value,
                             foundation::Clock::duration ttl) {
        auto inserted = state.store.insert(key, value, ttl);
        if (inserted.hasError()) {
            RCACHE_LOG_WARN(foundation::LogCategory::Cache,
                            "not caching fetched value: " +
                                std::string(inserted.error().message()));
        }
    }

    std::shared_ptr<State> state_;
};

}  // namespace rcache::cache
