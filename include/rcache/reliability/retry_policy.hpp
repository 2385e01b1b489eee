#pragma once

/// @file retry_policy.hpp
/// @brief Retry configuration, backoff schedule and retryable predicates.

#include <chrono>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <utility>
#include <vector>

#include "rcache/foundation/cache_error.hpp"
#include "rcache/foundation/clock.hpp"

namespace rcache::reliability {

/// Numeric retry parameters.
struct RetryConfig {
    /// Total tries, the first one included.
    uint32_t maxAttempts = 3;

    /// Delay before the second attempt.
    std::chrono::milliseconds initialBackoff{100};

    /// Growth factor applied per attempt (>= 1.0).
    double backoffMultiplier = 2.0;

    /// Ceiling for any single delay, jitter included.
    std::chrono::milliseconds maxBackoff{1000};

    /// Perturb each delay by a uniform factor in [0.5, 1.5].
    bool jitterEnabled = true;
};

/// Delay between attempt @p attempt and attempt + 1 (attempt is 1-based):
/// min(initialBackoff * backoffMultiplier^(attempt - 1), maxBackoff).
[[nodiscard]] foundation::Clock::duration computeBackoff(const RetryConfig& config,
                                                         uint32_t attempt);

/// Scale @p base by @p factor and cap the result at @p maxBackoff.
[[nodiscard]] foundation::Clock::duration applyJitter(foundation::Clock::duration base,
                                                      double factor,
                                                      foundation::Clock::duration maxBackoff);

/// Uniform random factor in [0.5, 1.5].
[[nodiscard]] double randomJitterFactor();

/// Backoff for @p attempt with jitter applied when the config enables it.
[[nodiscard]] foundation::Clock::duration nextDelay(const RetryConfig& config,
                                                    uint32_t attempt);

/// Immutable retry policy: configuration plus a predicate choosing which
/// errors are worth another attempt.
///
/// Usage:
/// @code
///   auto policy = RetryPolicy<FetchError>(config, retryableCodes({
///       ErrorCode::UpstreamTimeout, ErrorCode::UpstreamUnavailable}));
/// @endcode
template <typename E>
class RetryPolicy {
public:
    using Predicate = std::function<bool(const E&)>;

    /// Policy that retries every error.
    explicit RetryPolicy(RetryConfig config = {})
        : config_(config), retryable_([](const E&) { return true; }) {}

    RetryPolicy(RetryConfig config, Predicate retryable)
        : config_(config), retryable_(std::move(retryable)) {}

    [[nodiscard]] const RetryConfig& config() const noexcept { return config_; }

    [[nodiscard]] bool isRetryable(const E& error) const { return retryable_(error); }

private:
    RetryConfig config_;
    Predicate retryable_;
};

/// Predicate retrying CacheErrors whose code is one of @p codes.
[[nodiscard]] std::function<bool(const foundation::CacheError&)> retryableCodes(
    std::vector<foundation::ErrorCode> codes);

/// Transient upstream failures: UpstreamFailed, UpstreamTimeout and
/// UpstreamUnavailable. UpstreamRejected is never retried.
[[nodiscard]] std::function<bool(const foundation::CacheError&)> transientUpstreamErrors();

}  // namespace rcache::reliability
