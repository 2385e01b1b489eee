#pragma once

/// @file circuit_breaker.hpp
/// @brief Per-dependency circuit breaker (Closed -> Open -> HalfOpen).
///
/// Stops calling an unhealthy upstream for a cooldown period, then lets a
/// single probe through to test recovery.

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "rcache/foundation/async.hpp"
#include "rcache/foundation/clock.hpp"
#include "rcache/foundation/metrics_sink.hpp"

namespace rcache::reliability {

/// How failures are counted while Closed.
enum class FailureMode : uint8_t {
    ConsecutiveFailures,  ///< Open after failureThreshold failures in a row.
    RollingWindow         ///< Open when the failure rate within window is too high.
};

/// Configuration for a CircuitBreaker instance.
struct CircuitBreakerConfig {
    /// Consecutive failures before the circuit opens.
    uint32_t failureThreshold = 5;

    /// Time the circuit stays open before the next call may probe.
    std::chrono::milliseconds resetTimeout{30000};

    /// Consecutive probe successes in half-open to close the circuit.
    uint32_t successThreshold = 2;

    /// Human-readable name for logging and metrics.
    std::string name = "default";

    FailureMode failureMode = FailureMode::ConsecutiveFailures;

    /// RollingWindow only: span of outcomes considered.
    std::chrono::milliseconds window{60000};

    /// RollingWindow only: failure percentage (1-100) that opens the circuit.
    uint32_t failureRatePercent = 50;

    /// RollingWindow only: outcomes required in the window before the rate
    /// is evaluated.
    uint32_t minimumRequests = 10;
};

/// Error returned by CircuitBreaker::call().
template <typename E>
class CircuitError {
public:
    struct Open {};

    static CircuitError open() { return CircuitError(Open{}); }
    static CircuitError upstream(E error) { return CircuitError(std::move(error)); }

    /// The call was rejected without reaching the operation.
    [[nodiscard]] bool isOpen() const noexcept { return std::holds_alternative<Open>(data_); }

    [[nodiscard]] bool isUpstream() const noexcept { return std::holds_alternative<E>(data_); }

    /// The operation's own error (undefined behavior if isOpen()).
    [[nodiscard]] const E& upstreamError() const& { return std::get<E>(data_); }
    [[nodiscard]] E&& upstreamError() && { return std::get<E>(std::move(data_)); }

private:
    explicit CircuitError(Open o) : data_(o) {}
    explicit CircuitError(E e) : data_(std::in_place_type<E>, std::move(e)) {}

    std::variant<Open, E> data_;
};

/// Circuit breaker state machine guarding one upstream dependency.
///
/// Callers either use call(), or drive the machine by hand: tryAcquire()
/// before the upstream call, then onSuccess()/onFailure() with the returned
/// Admission. Each Admission carries the generation it was issued under;
/// outcomes reported for an older generation (a call admitted before the
/// circuit last changed state) are ignored so they cannot corrupt the
/// current streaks.
///
/// While HalfOpen exactly one probe is in flight; every other caller is
/// rejected until it resolves.
///
/// Thread-safe: all state transitions happen under one mutex. Metrics and
/// logs for a transition are emitted after it is released.
///
/// Usage:
/// @code
///   CircuitBreaker cb(CircuitBreakerConfig{.name = "pets-api"}, clock, metrics);
///   cb.call<Pet, FetchError>(
///       [&api](auto done) { api.getPet(42, std::move(done)); },
///       [](Result<Pet, CircuitError<FetchError>> r) {
///           if (r.hasError() && r.error().isOpen()) { /* fail fast */ }
///       });
/// @endcode
class CircuitBreaker {
public:
    /// Circuit breaker states.
    enum class State : uint8_t {
        Closed,   ///< Normal operation; calls pass through.
        Open,     ///< Failure threshold reached; calls are rejected.
        HalfOpen  ///< Recovery probe; one call allowed.
    };

    /// Ticket returned by tryAcquire().
    struct Admission {
        enum class Kind : uint8_t { Rejected, Admitted, Probe };

        Kind kind = Kind::Rejected;
        uint64_t generation = 0;

        [[nodiscard]] bool allowed() const noexcept { return kind != Kind::Rejected; }
    };

    CircuitBreaker(CircuitBreakerConfig config, foundation::Clock& clock,
                   foundation::MetricsSink& metrics);

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /// Ask to make an upstream call.
    ///
    /// While Open, the first call after resetTimeout has elapsed moves the
    /// circuit to HalfOpen and becomes the probe.
    [[nodiscard]] Admission tryAcquire();

    /// Report a successful call admitted by @p admission.
    void onSuccess(const Admission& admission);

    /// Report a failed call admitted by @p admission.
    void onFailure(const Admission& admission);

    /// Release a probe slot without counting an outcome, e.g. when the call
    /// was abandoned before it started.
    void onCancelled(const Admission& admission);

    /// Run @p op through the breaker.
    ///
    /// Rejected calls complete with CircuitError::open() without invoking
    /// @p op; failures are wrapped as CircuitError::upstream().
    template <typename T, typename E>
    void call(foundation::AsyncOperation<T, E> op,
              foundation::Completion<T, CircuitError<E>> done) {
        auto admission = tryAcquire();
        if (!admission.allowed()) {
            done(Result<T, CircuitError<E>>::err(CircuitError<E>::open()));
            return;
        }
        op([this, admission, done = std::move(done)](Result<T, E> result) {
            if (result.hasValue()) {
                onSuccess(admission);
                done(Result<T, CircuitError<E>>::ok(std::move(result).value()));
            } else {
                onFailure(admission);
                done(Result<T, CircuitError<E>>::err(
                    CircuitError<E>::upstream(std::move(result).error())));
            }
        });
    }

    /// Force the circuit into a specific state (for testing or manual override).
    void forceState(State newState);

    /// Reset all counters and return to Closed state.
    void reset();

    // ── Queries ──────────────────────────────────────────────────────────

    /// Current circuit state. Does not trigger the Open -> HalfOpen move.
    [[nodiscard]] State state() const;

    /// Number of consecutive failures while Closed.
    [[nodiscard]] uint32_t failureCount() const;

    /// Number of consecutive successes in HalfOpen state.
    [[nodiscard]] uint32_t halfOpenSuccessCount() const;

    /// Total number of requests rejected.
    [[nodiscard]] uint64_t rejectedCount() const;

    /// Whether a half-open probe is outstanding.
    [[nodiscard]] bool probeInFlight() const;

    /// Bumped on every state change.
    [[nodiscard]] uint64_t generation() const;

    /// Configuration name.
    [[nodiscard]] std::string_view name() const;

    [[nodiscard]] const CircuitBreakerConfig& config() const noexcept { return config_; }

private:
    struct Transition {
        State from;
        State to;
    };

    // Caller holds mutex_.
    Transition transitionTo(State newState);
    bool windowTripped(foundation::Clock::time_point now);
    void pruneWindow(foundation::Clock::time_point now);

    // Caller must not hold mutex_.
    void publish(const Transition& t);

    CircuitBreakerConfig config_;
    foundation::Clock& clock_;
    foundation::MetricsSink& metrics_;

    mutable std::mutex mutex_;
    State state_{State::Closed};
    uint64_t generation_{0};
    uint32_t consecutiveFailures_{0};
    uint32_t halfOpenSuccesses_{0};
    uint64_t totalRejected_{0};
    bool probeInFlight_{false};
    foundation::Clock::time_point openedAt_{};

    // RollingWindow outcomes, oldest first: (time, failed).
    std::deque<std::pair<foundation::Clock::time_point, bool>> outcomes_;
};

/// Convert circuit breaker state to string.
[[nodiscard]] constexpr std::string_view toString(CircuitBreaker::State s) {
    switch (s) {
        case CircuitBreaker::State::Closed:
            return "closed";
        case CircuitBreaker::State::Open:
            return "open";
        case CircuitBreaker::State::HalfOpen:
            return "half_open";
    }
    return "unknown";
}

/// Numeric value published in the rcache_circuit_state gauge.
[[nodiscard]] constexpr double stateGaugeValue(CircuitBreaker::State s) {
    switch (s) {
        case CircuitBreaker::State::Closed:
            return 0.0;
        case CircuitBreaker::State::Open:
            return 1.0;
        case CircuitBreaker::State::HalfOpen:
            return 2.0;
    }
    return -1.0;
}

}  // namespace rcache::reliability
