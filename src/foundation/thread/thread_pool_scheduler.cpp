/// @file thread_pool_scheduler.cpp
/// @brief ThreadPoolScheduler implementation wrapping kcenon thread_system.

#include "rcache/foundation/thread_pool_scheduler.hpp"

// kcenon thread_system headers (hidden behind PIMPL)
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>
#include <kcenon/thread/core/job_builder.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "rcache/foundation/cache_logger.hpp"

namespace rcache::foundation {

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct ThreadPoolScheduler::Impl {
    using TimePoint = std::chrono::steady_clock::time_point;

    std::string name;
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::atomic<uint64_t> nextId{1};
    std::atomic<bool> stopped{false};

    // Timer queue: deadline-ordered ids, tasks looked up by id so cancel()
    // only needs to erase from the map.
    mutable std::mutex timerMutex;
    std::condition_variable timerCv;
    std::multimap<TimePoint, TimerId> deadlines;
    std::unordered_map<TimerId, Task> timers;
    bool timerStop{false};
    std::thread timerThread;

    CacheResult<void> enqueue(Task task) {
        if (stopped.load(std::memory_order_acquire)) {
            return CacheResult<void>::err(
                CacheError(ErrorCode::SchedulerStopped, "scheduler is shut down"));
        }

        auto id = nextId.fetch_add(1, std::memory_order_relaxed);
        auto threadJob = kcenon::thread::job_builder()
            .name(name + "_task_" + std::to_string(id))
            .work([fn = std::move(task)]() -> kcenon::common::VoidResult {
                try {
                    fn();
                } catch (const std::exception& e) {
                    CacheLogger::instance().log(
                        LogLevel::Error, LogCategory::Core,
                        std::string("scheduled task threw: ") + e.what());
                } catch (...) {
                    CacheLogger::instance().log(
                        LogLevel::Error, LogCategory::Core,
                        "scheduled task threw a non-standard exception");
                }
                return kcenon::common::VoidResult::ok(std::monostate{});
            })
            .build();

        auto enqResult = pool->enqueue(std::move(threadJob));
        if (enqResult.is_err()) {
            return CacheResult<void>::err(
                CacheError(ErrorCode::TaskScheduleFailed, "failed to enqueue task"));
        }
        return CacheResult<void>::ok();
    }

    void timerLoop() {
        std::unique_lock lock(timerMutex);
        while (!timerStop) {
            if (deadlines.empty()) {
                timerCv.wait(lock, [this] { return timerStop || !deadlines.empty(); });
                continue;
            }

            auto next = deadlines.begin();
            if (next->first > std::chrono::steady_clock::now()) {
                // Woken early by a new (possibly earlier) deadline or stop.
                timerCv.wait_until(lock, next->first);
                continue;
            }

            auto id = next->second;
            deadlines.erase(next);
            auto it = timers.find(id);
            if (it == timers.end()) {
                continue;  // cancelled
            }
            auto task = std::move(it->second);
            timers.erase(it);

            lock.unlock();
            auto result = enqueue(std::move(task));
            if (result.hasError()) {
                CacheLogger::instance().log(
                    LogLevel::Error, LogCategory::Core,
                    "dropping due timer task: " + std::string(result.error().message()));
            }
            lock.lock();
        }
    }
};

// ---------------------------------------------------------------------------
// Construction / Destruction
// ---------------------------------------------------------------------------
ThreadPoolScheduler::ThreadPoolScheduler(std::size_t numThreads, std::string name)
    : impl_(std::make_unique<Impl>())
{
    impl_->name = std::move(name);
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>(impl_->name);

    if (numThreads == 0) {
        numThreads = 1;
    }
    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(numThreads);
    for (std::size_t i = 0; i < numThreads; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(workers));
    impl_->pool->start();

    impl_->timerThread = std::thread([impl = impl_.get()] { impl->timerLoop(); });
}

ThreadPoolScheduler::~ThreadPoolScheduler() {
    shutdown();
}

// ---------------------------------------------------------------------------
// post() / postAfter() / cancel()
// ---------------------------------------------------------------------------
CacheResult<void> ThreadPoolScheduler::post(Task task) {
    return impl_->enqueue(std::move(task));
}

CacheResult<Scheduler::TimerId> ThreadPoolScheduler::postAfter(
    Clock::duration delay, Task task)
{
    if (impl_->stopped.load(std::memory_order_acquire)) {
        return CacheResult<TimerId>::err(
            CacheError(ErrorCode::SchedulerStopped, "scheduler is shut down"));
    }

    auto id = impl_->nextId.fetch_add(1, std::memory_order_relaxed);
    auto deadline = std::chrono::steady_clock::now() + delay;
    {
        std::lock_guard lock(impl_->timerMutex);
        impl_->timers.emplace(id, std::move(task));
        impl_->deadlines.emplace(deadline, id);
    }
    impl_->timerCv.notify_one();
    return CacheResult<TimerId>::ok(id);
}

CacheResult<void> ThreadPoolScheduler::cancel(TimerId id) {
    std::lock_guard lock(impl_->timerMutex);
    // The deadline entry stays behind; timerLoop skips ids without a task.
    if (impl_->timers.erase(id) == 0) {
        return CacheResult<void>::err(
            CacheError(ErrorCode::TimerNotFound, "timer not pending"));
    }
    return CacheResult<void>::ok();
}

// ---------------------------------------------------------------------------
// shutdown()
// ---------------------------------------------------------------------------
void ThreadPoolScheduler::shutdown() {
    if (!impl_ || impl_->stopped.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    {
        std::lock_guard lock(impl_->timerMutex);
        impl_->timerStop = true;
        impl_->timers.clear();
        impl_->deadlines.clear();
    }
    impl_->timerCv.notify_all();
    if (impl_->timerThread.joinable()) {
        impl_->timerThread.join();
    }

    if (impl_->pool) {
        impl_->pool->stop(false); // graceful: wait for running jobs
    }
}

std::size_t ThreadPoolScheduler::pendingTimers() const {
    std::lock_guard lock(impl_->timerMutex);
    return impl_->timers.size();
}

} // namespace rcache::foundation
