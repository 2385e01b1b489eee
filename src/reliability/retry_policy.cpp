/// @file retry_policy.cpp
/// @brief Backoff computation and stock retry predicates.

#include "rcache/reliability/retry_policy.hpp"

#include <algorithm>
#include <cmath>
#include <random>

namespace rcache::reliability {

using foundation::Clock;

Clock::duration computeBackoff(const RetryConfig& config, uint32_t attempt) {
    auto cap = std::chrono::duration_cast<Clock::duration>(config.maxBackoff);
    auto initial = std::chrono::duration_cast<Clock::duration>(config.initialBackoff);
    if (attempt <= 1) {
        return std::min(initial, cap);
    }

    // Computed in floating point so large exponents saturate at the cap
    // instead of overflowing the tick count.
    double scaled = static_cast<double>(initial.count()) *
                    std::pow(config.backoffMultiplier, static_cast<double>(attempt - 1));
    if (!std::isfinite(scaled) || scaled >= static_cast<double>(cap.count())) {
        return cap;
    }
    return Clock::duration(static_cast<Clock::duration::rep>(scaled));
}

Clock::duration applyJitter(Clock::duration base, double factor,
                            Clock::duration maxBackoff) {
    auto jittered = Clock::duration(static_cast<Clock::duration::rep>(
        static_cast<double>(base.count()) * factor));
    return std::clamp(jittered, Clock::duration::zero(), maxBackoff);
}

double randomJitterFactor() {
    thread_local std::mt19937 engine{std::random_device{}()};
    std::uniform_real_distribution<double> dist(0.5, 1.5);
    return dist(engine);
}

Clock::duration nextDelay(const RetryConfig& config, uint32_t attempt) {
    auto base = computeBackoff(config, attempt);
    if (!config.jitterEnabled) {
        return base;
    }
    return applyJitter(base, randomJitterFactor(),
                       std::chrono::duration_cast<Clock::duration>(config.maxBackoff));
}

std::function<bool(const foundation::CacheError&)> retryableCodes(
    std::vector<foundation::ErrorCode> codes) {
    return [codes = std::move(codes)](const foundation::CacheError& error) {
        return std::find(codes.begin(), codes.end(), error.code()) != codes.end();
    };
}

std::function<bool(const foundation::CacheError&)> transientUpstreamErrors() {
    return retryableCodes({foundation::ErrorCode::UpstreamFailed,
                           foundation::ErrorCode::UpstreamTimeout,
                           foundation::ErrorCode::UpstreamUnavailable});
}

}  // namespace rcache::reliability
