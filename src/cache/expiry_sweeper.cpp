/// @file expiry_sweeper.cpp
/// @brief ExpirySweeper implementation.

#include "rcache/cache/expiry_sweeper.hpp"

#include <atomic>
#include <mutex>
#include <optional>

#include "rcache/foundation/cache_logger.hpp"

namespace rcache::cache {

using foundation::CacheError;
using foundation::CacheResult;
using foundation::ErrorCode;
using foundation::LogCategory;

struct ExpirySweeper::Impl {
    Impl(CacheRegistry& r, foundation::Scheduler& s, foundation::Clock::duration i)
        : registry(r), scheduler(s), interval(i) {}

    CacheRegistry& registry;
    foundation::Scheduler& scheduler;
    foundation::Clock::duration interval;

    mutable std::mutex mutex;
    bool running = false;
    // Bumped by start() and stop(); a tick from an older run is ignored.
    uint64_t generation = 0;
    std::optional<foundation::Scheduler::TimerId> timer;
    std::atomic<uint64_t> ticks{0};

    std::size_t sweep() {
        auto removed = registry.sweepExpired();
        registry.publishMetrics();
        return removed;
    }

    // Caller holds mutex.
    void scheduleNext(const std::weak_ptr<Impl>& self) {
        auto posted = scheduler.postAfter(
            interval, [self, gen = generation] { tick(self, gen); });
        if (posted.hasError()) {
            RCACHE_LOG_ERROR(LogCategory::Cache,
                             "expiry sweeper stopped: " +
                                 std::string(posted.error().message()));
            running = false;
            timer.reset();
            return;
        }
        timer = posted.value();
    }

    static void tick(const std::weak_ptr<Impl>& weak, uint64_t gen) {
        auto impl = weak.lock();
        if (!impl) {
            return;  // sweeper destroyed
        }
        {
            std::lock_guard lock(impl->mutex);
            if (!impl->running || impl->generation != gen) {
                return;
            }
            impl->timer.reset();
        }

        impl->sweep();
        impl->ticks.fetch_add(1, std::memory_order_relaxed);

        std::lock_guard lock(impl->mutex);
        if (impl->running && impl->generation == gen && !impl->timer) {
            impl->scheduleNext(weak);
        }
    }
};

ExpirySweeper::ExpirySweeper(CacheRegistry& registry,
                             foundation::Scheduler& scheduler,
                             foundation::Clock::duration interval)
    : impl_(std::make_shared<Impl>(registry, scheduler, interval)) {}

ExpirySweeper::~ExpirySweeper() {
    stop();
}

CacheResult<void> ExpirySweeper::start() {
    if (impl_->interval <= foundation::Clock::duration::zero()) {
        return CacheResult<void>::err(CacheError(
            ErrorCode::InvalidArgument, "sweep interval must be positive"));
    }

    std::lock_guard lock(impl_->mutex);
    if (impl_->running) {
        return CacheResult<void>::err(CacheError(
            ErrorCode::AlreadyExists, "expiry sweeper already running"));
    }
    impl_->running = true;
    ++impl_->generation;
    impl_->scheduleNext(impl_);
    if (!impl_->running) {
        return CacheResult<void>::err(CacheError(
            ErrorCode::TaskScheduleFailed, "failed to schedule expiry sweep"));
    }
    RCACHE_LOG_INFO(LogCategory::Cache, "expiry sweeper started");
    return CacheResult<void>::ok();
}

void ExpirySweeper::stop() {
    std::lock_guard lock(impl_->mutex);
    if (!impl_->running) {
        return;
    }
    impl_->running = false;
    ++impl_->generation;
    if (impl_->timer) {
        auto cancelled = impl_->scheduler.cancel(*impl_->timer);
        if (cancelled.hasError()) {
            // The tick already fired; its generation is now stale.
            RCACHE_LOG_DEBUG(LogCategory::Cache,
                             "expiry sweep timer already dispatched");
        }
        impl_->timer.reset();
    }
    RCACHE_LOG_INFO(LogCategory::Cache, "expiry sweeper stopped");
}

bool ExpirySweeper::isRunning() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->running;
}

std::size_t ExpirySweeper::runOnce() {
    return impl_->sweep();
}

uint64_t ExpirySweeper::tickCount() const {
    return impl_->ticks.load(std::memory_order_relaxed);
}

}  // namespace rcache::cache
