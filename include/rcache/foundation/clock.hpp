#pragma once

/// @file clock.hpp
/// @brief Injectable monotonic time source for TTL and backoff computation.

#include <atomic>
#include <chrono>

namespace rcache::foundation {

/// Monotonic time source.
///
/// Every component that reasons about TTLs, circuit timeouts or token
/// refill takes a Clock& so tests can substitute a ManualClock.
class Clock {
public:
    using duration = std::chrono::steady_clock::duration;
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    /// Current monotonic time.
    [[nodiscard]] virtual time_point now() const = 0;
};

/// Clock backed by std::chrono::steady_clock.
class SteadyClock final : public Clock {
public:
    [[nodiscard]] time_point now() const override {
        return std::chrono::steady_clock::now();
    }

    /// Shared process-wide instance.
    static SteadyClock& instance() {
        static SteadyClock inst;
        return inst;
    }
};

/// Manually driven clock for deterministic tests.
///
/// Starts at the epoch of steady_clock's time_point plus one second (so
/// that a default-constructed time_point is always in the past) and only
/// moves when advance() or set() is called. Thread-safe.
class ManualClock final : public Clock {
public:
    ManualClock() = default;

    [[nodiscard]] time_point now() const override {
        return time_point(duration(ticks_.load(std::memory_order_acquire)));
    }

    /// Move the clock forward by @p delta.
    void advance(duration delta) {
        ticks_.fetch_add(delta.count(), std::memory_order_acq_rel);
    }

    /// Jump to an absolute time point.
    void set(time_point tp) {
        ticks_.store(tp.time_since_epoch().count(), std::memory_order_release);
    }

private:
    std::atomic<duration::rep> ticks_{
        std::chrono::duration_cast<duration>(std::chrono::seconds(1)).count()};
};

} // namespace rcache::foundation
