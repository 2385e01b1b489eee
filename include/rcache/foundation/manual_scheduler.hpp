#pragma once

/// @file manual_scheduler.hpp
/// @brief Deterministic Scheduler driven by a ManualClock.

#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <unordered_map>

#include "rcache/foundation/clock.hpp"
#include "rcache/foundation/scheduler.hpp"

namespace rcache::foundation {

/// Scheduler that runs nothing until told to.
///
/// post() queues a task; postAfter() files it under clock.now() + delay.
/// drain() runs every ready task (including tasks queued by tasks) and
/// advance() walks the clock forward timer by timer, so a continuation
/// scheduled from inside a timer sees the clock at that timer's deadline.
/// Tasks always run on the calling thread with no lock held.
///
/// Example:
/// @code
///   ManualClock clock;
///   ManualScheduler scheduler(clock);
///   executor.execute(policy, op, onDone);
///   scheduler.advance(std::chrono::milliseconds(100));  // next attempt fires
/// @endcode
class ManualScheduler final : public Scheduler {
public:
    explicit ManualScheduler(ManualClock& clock);

    CacheResult<void> post(Task task) override;

    CacheResult<TimerId> postAfter(Clock::duration delay, Task task) override;

    CacheResult<void> cancel(TimerId id) override;

    /// Run ready tasks and due timers until none remain.
    /// @return Number of tasks executed.
    std::size_t drain();

    /// Move the clock forward by @p delta, firing timers in deadline order.
    /// @return Number of tasks executed.
    std::size_t advance(Clock::duration delta);

    /// Tasks queued via post() and not yet run.
    [[nodiscard]] std::size_t readyCount() const;

    /// Delayed tasks not yet fired.
    [[nodiscard]] std::size_t pendingTimers() const;

private:
    bool runOne();

    ManualClock& clock_;
    mutable std::mutex mutex_;
    TimerId nextId_{1};
    std::deque<Task> ready_;
    std::multimap<Clock::time_point, TimerId> deadlines_;
    std::unordered_map<TimerId, Task> timers_;
};

}  // namespace rcache::foundation
