#pragma once

/// @file scheduler.hpp
/// @brief Task scheduling interface used for non-blocking delays.
///
/// The retry executor waits between attempts and the expiry sweeper ticks
/// periodically; both do so by handing a continuation to a Scheduler rather
/// than sleeping on a worker thread.

#include <cstdint>
#include <functional>

#include "rcache/foundation/cache_result.hpp"
#include "rcache/foundation/clock.hpp"

namespace rcache::foundation {

/// Executes tasks now or after a delay.
///
/// Implementations:
///   - ThreadPoolScheduler: kcenon thread_pool workers plus a timer thread.
///   - ManualScheduler: deterministic, driven by a ManualClock in tests.
class Scheduler {
public:
    using Task = std::function<void()>;
    using TimerId = uint64_t;

    virtual ~Scheduler() = default;

    /// Run @p task as soon as a worker is available.
    virtual CacheResult<void> post(Task task) = 0;

    /// Run @p task once @p delay has elapsed. No thread is blocked while
    /// the delay is pending.
    /// @return An id usable with cancel().
    virtual CacheResult<TimerId> postAfter(Clock::duration delay, Task task) = 0;

    /// Cancel a pending delayed task.
    /// @return TimerNotFound if the task already ran or was never scheduled.
    virtual CacheResult<void> cancel(TimerId id) = 0;
};

}  // namespace rcache::foundation
