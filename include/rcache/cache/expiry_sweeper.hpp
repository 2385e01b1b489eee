#pragma once

/// @file expiry_sweeper.hpp
/// @brief Optional periodic sweep of expired entries across a registry.

#include <cstddef>
#include <cstdint>
#include <memory>

#include "rcache/cache/cache_registry.hpp"
#include "rcache/foundation/clock.hpp"
#include "rcache/foundation/scheduler.hpp"

namespace rcache::cache {

/// Periodically removes expired entries that nobody reads any more and
/// republishes the registry's cache gauges.
///
/// Lazy expiry on read already guarantees correctness; the sweeper only
/// bounds memory. Each tick reschedules itself through the Scheduler, so no
/// thread is dedicated to it. stop() cancels the pending tick and may be
/// called at any time, including from the destructor.
///
/// Usage:
/// @code
///   ExpirySweeper sweeper(registry, scheduler, std::chrono::seconds(30));
///   sweeper.start();
///   ...
///   sweeper.stop();
/// @endcode
class ExpirySweeper {
public:
    ExpirySweeper(CacheRegistry& registry, foundation::Scheduler& scheduler,
                  foundation::Clock::duration interval);
    ~ExpirySweeper();

    ExpirySweeper(const ExpirySweeper&) = delete;
    ExpirySweeper& operator=(const ExpirySweeper&) = delete;

    /// Schedule the first tick. InvalidArgument for a non-positive interval,
    /// AlreadyExists when already running.
    foundation::CacheResult<void> start();

    /// Cancel the pending tick. Idempotent.
    void stop();

    [[nodiscard]] bool isRunning() const;

    /// Sweep and publish immediately. @return Number of entries removed.
    std::size_t runOnce();

    /// Completed scheduled ticks.
    [[nodiscard]] uint64_t tickCount() const;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

}  // namespace rcache::cache
