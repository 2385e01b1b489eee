#pragma once

/// @file concurrency_limiter.hpp
/// @brief Bounds the number of calls in flight at once.

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "rcache/foundation/metrics_sink.hpp"

namespace rcache::reliability {

/// Non-queuing limit on concurrent calls.
///
/// tryAcquire() hands out an RAII Permit while fewer than maxConcurrent are
/// outstanding and nullopt otherwise. A Permit releases its slot when
/// destroyed, so it can ride along inside an asynchronous continuation.
///
/// Example:
/// @code
///   ConcurrencyLimiter limiter(32, "pets");
///   auto permit = limiter.tryAcquire();
///   if (!permit) {
///       // reject with Overloaded
///   }
/// @endcode
class ConcurrencyLimiter {
    struct Shared;

public:
    /// Slot held for the lifetime of one call.
    class Permit {
    public:
        Permit(Permit&& other) noexcept;
        Permit& operator=(Permit&& other) noexcept;
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
        ~Permit();

        /// Give the slot back early. Idempotent.
        void release() noexcept;

    private:
        friend class ConcurrencyLimiter;
        explicit Permit(std::shared_ptr<Shared> shared) noexcept;

        std::shared_ptr<Shared> shared_;
    };

    explicit ConcurrencyLimiter(
        uint32_t maxConcurrent, std::string name = "default",
        foundation::MetricsSink& metrics = foundation::NullMetricsSink::instance());

    ConcurrencyLimiter(const ConcurrencyLimiter&) = delete;
    ConcurrencyLimiter& operator=(const ConcurrencyLimiter&) = delete;

    [[nodiscard]] std::optional<Permit> tryAcquire();

    [[nodiscard]] uint32_t inFlight() const noexcept;

    [[nodiscard]] uint32_t maxConcurrent() const noexcept { return maxConcurrent_; }

    [[nodiscard]] uint64_t rejectedCount() const noexcept;

    [[nodiscard]] std::string_view name() const noexcept { return name_; }

private:
    // Outlives the limiter while permits are outstanding.
    struct Shared {
        std::atomic<uint32_t> inFlight{0};
    };

    uint32_t maxConcurrent_;
    std::string name_;
    foundation::MetricsSink& metrics_;
    std::shared_ptr<Shared> shared_;
    std::atomic<uint64_t> rejected_{0};
};

}  // namespace rcache::reliability
