/// @file rate_limiter.cpp
/// @brief RateLimiter implementation.

#include "rcache/reliability/rate_limiter.hpp"

#include <algorithm>

#include "rcache/foundation/cache_logger.hpp"

namespace rcache::reliability {

using foundation::LogCategory;

RateLimiter::RateLimiter(RateLimiterConfig config, foundation::Clock& clock,
                         foundation::MetricsSink& metrics)
    : config_(std::move(config)),
      clock_(clock),
      metrics_(metrics),
      shared_{config_.capacity, clock.now()} {}

bool RateLimiter::tryAcquire(double cost) {
    bool granted = false;
    {
        std::lock_guard lock(mutex_);
        granted = take(shared_, cost);
    }
    if (!granted) {
        reportRejected({});
    }
    return granted;
}

bool RateLimiter::tryAcquireFor(const std::string& clientKey, double cost) {
    bool granted = false;
    {
        std::lock_guard lock(mutex_);
        auto it = clients_.find(clientKey);
        if (it == clients_.end()) {
            it = clients_.emplace(clientKey, Bucket{config_.capacity, clock_.now()}).first;
        }
        granted = take(it->second, cost);
    }
    if (!granted) {
        reportRejected(clientKey);
    }
    return granted;
}

double RateLimiter::available() const {
    std::lock_guard lock(mutex_);
    refill(shared_);
    return shared_.tokens;
}

double RateLimiter::availableFor(const std::string& clientKey) const {
    std::lock_guard lock(mutex_);
    auto it = clients_.find(clientKey);
    if (it == clients_.end()) {
        return config_.capacity;
    }
    refill(it->second);
    return it->second.tokens;
}

void RateLimiter::reset() {
    std::lock_guard lock(mutex_);
    shared_ = Bucket{config_.capacity, clock_.now()};
}

void RateLimiter::removeClient(const std::string& clientKey) {
    std::lock_guard lock(mutex_);
    clients_.erase(clientKey);
}

std::size_t RateLimiter::clientCount() const {
    std::lock_guard lock(mutex_);
    return clients_.size();
}

uint64_t RateLimiter::rejectedCount() const {
    std::lock_guard lock(mutex_);
    return rejected_;
}

std::string_view RateLimiter::name() const {
    return config_.name;
}

void RateLimiter::refill(Bucket& bucket) const {
    auto now = clock_.now();
    if (now <= bucket.lastRefill) {
        return;
    }
    auto elapsed = std::chrono::duration<double>(now - bucket.lastRefill).count();
    bucket.tokens = std::min(bucket.tokens + elapsed * config_.refillRate,
                             config_.capacity);
    bucket.lastRefill = now;
}

bool RateLimiter::take(Bucket& bucket, double cost) {
    // Negative and NaN costs would add tokens or poison the bucket.
    if (!(cost >= 0.0)) {
        ++rejected_;
        return false;
    }
    refill(bucket);
    if (bucket.tokens < cost) {
        ++rejected_;
        return false;
    }
    bucket.tokens = std::max(bucket.tokens - cost, 0.0);
    return true;
}

void RateLimiter::reportRejected(std::string_view clientKey) {
    metrics_.record("rcache_rate_limited_total", 1, {{"limiter", config_.name}});
    if (foundation::CacheLogger::instance().isEnabled(foundation::LogLevel::Debug,
                                                      LogCategory::RateLimit)) {
        foundation::LogContext ctx;
        ctx.resource = config_.name;
        if (!clientKey.empty()) {
            ctx.extra["client"] = std::string(clientKey);
        }
        foundation::CacheLogger::instance().logWithContext(
            foundation::LogLevel::Debug, LogCategory::RateLimit, "request rate limited", ctx);
    }
}

}  // namespace rcache::reliability
