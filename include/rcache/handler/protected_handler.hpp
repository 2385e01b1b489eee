#pragma once

/// @file protected_handler.hpp
/// @brief Composite get-or-fetch entry point with rate limiting, circuit
///        breaking, caching and retries.

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "rcache/cache/resource_cache.hpp"
#include "rcache/foundation/async.hpp"
#include "rcache/foundation/cache_error.hpp"
#include "rcache/foundation/cache_logger.hpp"
#include "rcache/foundation/clock.hpp"
#include "rcache/handler/handler_error.hpp"
#include "rcache/reliability/circuit_breaker.hpp"
#include "rcache/reliability/concurrency_limiter.hpp"
#include "rcache/reliability/rate_limiter.hpp"
#include "rcache/reliability/retry_executor.hpp"
#include "rcache/reliability/retry_policy.hpp"

namespace rcache::handler {

/// Per-handler request settings.
struct HandlerOptions {
    /// Tokens taken from the rate limiter per request.
    double requestCost = 1.0;

    /// TTL for values stored by this handler; the cache default when unset.
    std::optional<foundation::Clock::duration> ttlOverride;

    /// Label for retry metrics and logs.
    std::string operationName = "fetch";
};

/// Single callable that fetches resources through every protection layer.
///
/// Layers, outermost first:
///   1. RateLimiter         rejects with RateLimited before anything else runs
///   2. ConcurrencyLimiter  optional; rejects with Overloaded
///   3. ResourceCache       a hit is returned even while the circuit is open
///   4. CircuitBreaker      gates the upstream only; CircuitOpen when rejected
///   5. RetryExecutor       retries the upstream call per the RetryPolicy
///   6. upstream fetch(key)
///
/// The breaker sees one outcome per handled miss, after retries. Every
/// referenced component must outlive the handler and any call still in
/// flight.
///
/// Usage:
/// @code
///   ProtectedHandler<std::string, Pet> pets(limiter, breaker, *cache, retry,
///                                           RetryPolicy<FetchError>(retryConfig));
///   pets.handle("pet:42",
///       [&api](const std::string& key, Completion<Pet, FetchError> done) {
///           api.getPet(key, std::move(done));
///       },
///       [](Result<Pet, HandlerError<FetchError>> r) { ... });
/// @endcode
template <typename K, typename V, typename E = foundation::FetchError,
          typename Hash = std::hash<K>>
class ProtectedHandler {
public:
    using Error = HandlerError<E>;
    using Outcome = Result<V, Error>;
    using Fetch = std::function<void(const K&, foundation::Completion<V, E>)>;

    ProtectedHandler(reliability::RateLimiter& rateLimiter,
                     reliability::CircuitBreaker& breaker,
                     cache::ResourceCache<K, V, Hash>& cache,
                     reliability::RetryExecutor& retry,
                     reliability::RetryPolicy<E> policy,
                     HandlerOptions options = {})
        : rateLimiter_(rateLimiter),
          breaker_(breaker),
          cache_(cache),
          retry_(retry),
          policy_(std::move(policy)),
          options_(std::move(options)) {}

    ProtectedHandler(const ProtectedHandler&) = delete;
    ProtectedHandler& operator=(const ProtectedHandler&) = delete;

    /// Enable the concurrency layer. Pass nullptr to disable it again.
    void setConcurrencyLimiter(reliability::ConcurrencyLimiter* limiter) noexcept {
        concurrency_ = limiter;
    }

    /// Resolve @p key, calling @p fetch only on a cache miss.
    void handle(const K& key, Fetch fetch, foundation::Completion<V, Error> done) {
        if (!rateLimiter_.tryAcquire(options_.requestCost)) {
            done(Outcome::err(Error::rateLimited()));
            return;
        }

        std::shared_ptr<reliability::ConcurrencyLimiter::Permit> permit;
        if (concurrency_ != nullptr) {
            auto acquired = concurrency_->tryAcquire();
            if (!acquired) {
                done(Outcome::err(Error::overloaded()));
                return;
            }
            permit = std::make_shared<reliability::ConcurrencyLimiter::Permit>(
                std::move(*acquired));
        }

        cache_.template getOrFetch<Error>(
            key, options_.ttlOverride,
            [this, key, fetch = std::move(fetch)](foundation::Completion<V, Error> cacheDone) {
                fetchProtected(key, fetch, std::move(cacheDone));
            },
            [permit, done = std::move(done)](Outcome outcome) {
                if (permit) {
                    permit->release();
                }
                done(std::move(outcome));
            });
    }

    /// handle() bridged to a future, for callers that block.
    [[nodiscard]] std::future<Outcome> handleFuture(const K& key, Fetch fetch) {
        auto promise = std::make_shared<std::promise<Outcome>>();
        auto future = promise->get_future();
        handle(key, std::move(fetch), [promise](Outcome outcome) {
            promise->set_value(std::move(outcome));
        });
        return future;
    }

    [[nodiscard]] const HandlerOptions& options() const noexcept { return options_; }

private:
    // Cache miss path: breaker, then retries around the upstream call.
    void fetchProtected(const K& key, const Fetch& fetch,
                        foundation::Completion<V, Error> cacheDone) {
        auto admission = breaker_.tryAcquire();
        if (!admission.allowed()) {
            RCACHE_LOG_DEBUG(foundation::LogCategory::Handler,
                             std::string(breaker_.name()) + ": circuit open, upstream skipped");
            cacheDone(Outcome::err(Error::circuitOpen()));
            return;
        }

        retry_.template execute<V, E>(
            policy_,
            [key, fetch](foundation::Completion<V, E> attemptDone) {
                fetch(key, std::move(attemptDone));
            },
            [this, admission, cacheDone = std::move(cacheDone)](Result<V, E> result) {
                if (result.hasValue()) {
                    breaker_.onSuccess(admission);
                    cacheDone(Outcome::ok(std::move(result).value()));
                } else {
                    breaker_.onFailure(admission);
                    cacheDone(Outcome::err(Error::upstream(std::move(result).error())));
                }
            },
            options_.operationName);
    }

    reliability::RateLimiter& rateLimiter_;
    reliability::CircuitBreaker& breaker_;
    cache::ResourceCache<K, V, Hash>& cache_;
    reliability::RetryExecutor& retry_;
    const reliability::RetryPolicy<E> policy_;
    const HandlerOptions options_;
    reliability::ConcurrencyLimiter* concurrency_ = nullptr;
};

}  // namespace rcache::handler
