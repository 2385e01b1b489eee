/// @file concurrency_limiter.cpp
/// @brief ConcurrencyLimiter implementation.

#include "rcache/reliability/concurrency_limiter.hpp"

#include <utility>

#include "rcache/foundation/cache_logger.hpp"

namespace rcache::reliability {

ConcurrencyLimiter::Permit::Permit(std::shared_ptr<Shared> shared) noexcept
    : shared_(std::move(shared)) {}

ConcurrencyLimiter::Permit::Permit(Permit&& other) noexcept
    : shared_(std::move(other.shared_)) {}

ConcurrencyLimiter::Permit& ConcurrencyLimiter::Permit::operator=(Permit&& other) noexcept {
    if (this != &other) {
        release();
        shared_ = std::move(other.shared_);
    }
    return *this;
}

ConcurrencyLimiter::Permit::~Permit() {
    release();
}

void ConcurrencyLimiter::Permit::release() noexcept {
    if (shared_) {
        shared_->inFlight.fetch_sub(1, std::memory_order_acq_rel);
        shared_.reset();
    }
}

ConcurrencyLimiter::ConcurrencyLimiter(uint32_t maxConcurrent, std::string name,
                                       foundation::MetricsSink& metrics)
    : maxConcurrent_(maxConcurrent),
      name_(std::move(name)),
      metrics_(metrics),
      shared_(std::make_shared<Shared>()) {}

std::optional<ConcurrencyLimiter::Permit> ConcurrencyLimiter::tryAcquire() {
    auto current = shared_->inFlight.load(std::memory_order_acquire);
    while (current < maxConcurrent_) {
        if (shared_->inFlight.compare_exchange_weak(current, current + 1,
                                                    std::memory_order_acq_rel)) {
            return Permit(shared_);
        }
    }

    rejected_.fetch_add(1, std::memory_order_relaxed);
    metrics_.record("rcache_concurrency_rejected_total", 1, {{"limiter", name_}});
    RCACHE_LOG_DEBUG(foundation::LogCategory::RateLimit,
                     "concurrency limit reached for " + name_);
    return std::nullopt;
}

uint32_t ConcurrencyLimiter::inFlight() const noexcept {
    return shared_->inFlight.load(std::memory_order_acquire);
}

uint64_t ConcurrencyLimiter::rejectedCount() const noexcept {
    return rejected_.load(std::memory_order_relaxed);
}

}  // namespace rcache::reliability
