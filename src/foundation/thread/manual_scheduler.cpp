/// @file manual_scheduler.cpp
/// @brief ManualScheduler implementation.

#include "rcache/foundation/manual_scheduler.hpp"

#include <utility>

namespace rcache::foundation {

ManualScheduler::ManualScheduler(ManualClock& clock) : clock_(clock) {}

CacheResult<void> ManualScheduler::post(Task task) {
    std::lock_guard lock(mutex_);
    ready_.push_back(std::move(task));
    return CacheResult<void>::ok();
}

CacheResult<Scheduler::TimerId> ManualScheduler::postAfter(
    Clock::duration delay, Task task)
{
    std::lock_guard lock(mutex_);
    auto id = nextId_++;
    timers_.emplace(id, std::move(task));
    deadlines_.emplace(clock_.now() + delay, id);
    return CacheResult<TimerId>::ok(id);
}

CacheResult<void> ManualScheduler::cancel(TimerId id) {
    std::lock_guard lock(mutex_);
    if (timers_.erase(id) == 0) {
        return CacheResult<void>::err(
            CacheError(ErrorCode::TimerNotFound, "timer not pending"));
    }
    return CacheResult<void>::ok();
}

// Run a single ready task, or the earliest due timer. Returns false when
// nothing is runnable at the current clock time.
bool ManualScheduler::runOne() {
    Task task;
    {
        std::lock_guard lock(mutex_);
        if (!ready_.empty()) {
            task = std::move(ready_.front());
            ready_.pop_front();
        } else {
            auto now = clock_.now();
            while (!deadlines_.empty() && deadlines_.begin()->first <= now) {
                auto id = deadlines_.begin()->second;
                deadlines_.erase(deadlines_.begin());
                auto it = timers_.find(id);
                if (it == timers_.end()) {
                    continue;  // cancelled
                }
                task = std::move(it->second);
                timers_.erase(it);
                break;
            }
            if (!task) {
                return false;
            }
        }
    }
    task();
    return true;
}

std::size_t ManualScheduler::drain() {
    std::size_t executed = 0;
    while (runOne()) {
        ++executed;
    }
    return executed;
}

std::size_t ManualScheduler::advance(Clock::duration delta) {
    auto target = clock_.now() + delta;
    std::size_t executed = drain();

    for (;;) {
        Clock::time_point next;
        {
            std::lock_guard lock(mutex_);
            // Skip cancelled entries so they do not pin the clock.
            while (!deadlines_.empty() &&
                   timers_.find(deadlines_.begin()->second) == timers_.end()) {
                deadlines_.erase(deadlines_.begin());
            }
            if (deadlines_.empty() || deadlines_.begin()->first > target) {
                break;
            }
            next = deadlines_.begin()->first;
        }
        if (next > clock_.now()) {
            clock_.set(next);
        }
        executed += drain();
    }

    if (target > clock_.now()) {
        clock_.set(target);
    }
    executed += drain();
    return executed;
}

std::size_t ManualScheduler::readyCount() const {
    std::lock_guard lock(mutex_);
    return ready_.size();
}

std::size_t ManualScheduler::pendingTimers() const {
    std::lock_guard lock(mutex_);
    return timers_.size();
}

}  // namespace rcache::foundation
