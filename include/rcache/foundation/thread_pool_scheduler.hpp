#pragma once

/// @file thread_pool_scheduler.hpp
/// @brief Scheduler backed by kcenon thread_system with a dedicated timer thread.

#include <cstddef>
#include <memory>
#include <string>
#include <thread>

#include "rcache/foundation/scheduler.hpp"

namespace rcache::foundation {

/// Scheduler wrapping kcenon's thread_pool.
///
/// Immediate tasks are enqueued into the pool. Delayed tasks wait in a
/// deadline-ordered timer queue owned by a single timer thread, which
/// dispatches them into the pool when due, so a pending delay never
/// occupies a worker. Uses PIMPL to keep thread_system headers out of the
/// public API.
///
/// Example:
/// @code
///   ThreadPoolScheduler scheduler(4);
///   scheduler.post([] { warmCaches(); });
///   auto timer = scheduler.postAfter(std::chrono::milliseconds(200),
///                                    [] { retryUpstream(); });
/// @endcode
class ThreadPoolScheduler final : public Scheduler {
public:
    /// Construct a scheduler backed by @p numThreads pool workers.
    explicit ThreadPoolScheduler(
        std::size_t numThreads = std::thread::hardware_concurrency(),
        std::string name = "rcache");

    ~ThreadPoolScheduler() override;

    ThreadPoolScheduler(const ThreadPoolScheduler&) = delete;
    ThreadPoolScheduler& operator=(const ThreadPoolScheduler&) = delete;

    CacheResult<void> post(Task task) override;

    CacheResult<TimerId> postAfter(Clock::duration delay, Task task) override;

    CacheResult<void> cancel(TimerId id) override;

    /// Stop the timer thread (dropping pending timers) and the pool,
    /// waiting for running tasks. Idempotent.
    void shutdown();

    /// Number of delayed tasks not yet dispatched.
    [[nodiscard]] std::size_t pendingTimers() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace rcache::foundation
