/// @file circuit_breaker.cpp
/// @brief CircuitBreaker state machine implementation.

#include "rcache/reliability/circuit_breaker.hpp"

#include <optional>

#include "rcache/foundation/cache_logger.hpp"

namespace rcache::reliability {

using foundation::LogCategory;
using foundation::LogLevel;

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config,
                               foundation::Clock& clock,
                               foundation::MetricsSink& metrics)
    : config_(std::move(config)), clock_(clock), metrics_(metrics) {}

CircuitBreaker::Admission CircuitBreaker::tryAcquire() {
    std::optional<Transition> moved;
    Admission admission;
    {
        std::lock_guard lock(mutex_);

        switch (state_) {
            case State::Closed:
                admission = {Admission::Kind::Admitted, generation_};
                break;

            case State::Open: {
                auto elapsed = clock_.now() - openedAt_;
                if (elapsed >= config_.resetTimeout) {
                    moved = transitionTo(State::HalfOpen);
                    probeInFlight_ = true;
                    admission = {Admission::Kind::Probe, generation_};
                } else {
                    ++totalRejected_;
                }
                break;
            }

            case State::HalfOpen:
                if (probeInFlight_) {
                    ++totalRejected_;
                } else {
                    probeInFlight_ = true;
                    admission = {Admission::Kind::Probe, generation_};
                }
                break;
        }
    }

    if (moved) {
        publish(*moved);
    }
    if (!admission.allowed()) {
        metrics_.record("rcache_circuit_rejected_total", 1, {{"breaker", config_.name}});
    }
    return admission;
}

void CircuitBreaker::onSuccess(const Admission& admission) {
    std::optional<Transition> moved;
    {
        std::lock_guard lock(mutex_);
        if (!admission.allowed() || admission.generation != generation_) {
            return;
        }

        switch (state_) {
            case State::Closed:
                consecutiveFailures_ = 0;
                if (config_.failureMode == FailureMode::RollingWindow) {
                    outcomes_.emplace_back(clock_.now(), false);
                    pruneWindow(clock_.now());
                }
                break;

            case State::HalfOpen:
                if (admission.kind != Admission::Kind::Probe) {
                    break;
                }
                probeInFlight_ = false;
                ++halfOpenSuccesses_;
                if (halfOpenSuccesses_ >= config_.successThreshold) {
                    moved = transitionTo(State::Closed);
                }
                break;

            case State::Open:
                break;
        }
    }

    if (moved) {
        publish(*moved);
    }
}

void CircuitBreaker::onFailure(const Admission& admission) {
    std::optional<Transition> moved;
    {
        std::lock_guard lock(mutex_);
        if (!admission.allowed() || admission.generation != generation_) {
            return;
        }

        switch (state_) {
            case State::Closed: {
                ++consecutiveFailures_;
                bool trip = false;
                if (config_.failureMode == FailureMode::RollingWindow) {
                    auto now = clock_.now();
                    outcomes_.emplace_back(now, true);
                    trip = windowTripped(now);
                } else {
                    trip = consecutiveFailures_ >= config_.failureThreshold;
                }
                if (trip) {
                    moved = transitionTo(State::Open);
                }
                break;
            }

            case State::HalfOpen:
                // Any probe failure immediately re-opens.
                if (admission.kind == Admission::Kind::Probe) {
                    moved = transitionTo(State::Open);
                }
                break;

            case State::Open:
                break;
        }
    }

    if (moved) {
        publish(*moved);
    }
}

void CircuitBreaker::onCancelled(const Admission& admission) {
    std::lock_guard lock(mutex_);
    if (admission.kind == Admission::Kind::Probe &&
        admission.generation == generation_ && state_ == State::HalfOpen) {
        probeInFlight_ = false;
    }
}

void CircuitBreaker::forceState(State newState) {
    Transition moved;
    {
        std::lock_guard lock(mutex_);
        moved = transitionTo(newState);
    }
    if (moved.from != moved.to) {
        publish(moved);
    }
}

void CircuitBreaker::reset() {
    Transition moved;
    {
        std::lock_guard lock(mutex_);
        moved = transitionTo(State::Closed);
        totalRejected_ = 0;
        openedAt_ = {};
    }
    if (moved.from != moved.to) {
        publish(moved);
    }
}

CircuitBreaker::State CircuitBreaker::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

uint32_t CircuitBreaker::failureCount() const {
    std::lock_guard lock(mutex_);
    return consecutiveFailures_;
}

uint32_t CircuitBreaker::halfOpenSuccessCount() const {
    std::lock_guard lock(mutex_);
    return halfOpenSuccesses_;
}

uint64_t CircuitBreaker::rejectedCount() const {
    std::lock_guard lock(mutex_);
    return totalRejected_;
}

bool CircuitBreaker::probeInFlight() const {
    std::lock_guard lock(mutex_);
    return probeInFlight_;
}

uint64_t CircuitBreaker::generation() const {
    std::lock_guard lock(mutex_);
    return generation_;
}

std::string_view CircuitBreaker::name() const {
    return config_.name;
}

CircuitBreaker::Transition CircuitBreaker::transitionTo(State newState) {
    Transition t{state_, newState};
    state_ = newState;
    ++generation_;
    probeInFlight_ = false;
    halfOpenSuccesses_ = 0;
    if (newState == State::Closed) {
        consecutiveFailures_ = 0;
        outcomes_.clear();
    } else if (newState == State::Open) {
        // Reset timeout runs from the moment the circuit (re)opens.
        openedAt_ = clock_.now();
    }
    return t;
}

void CircuitBreaker::pruneWindow(foundation::Clock::time_point now) {
    while (!outcomes_.empty() && now - outcomes_.front().first > config_.window) {
        outcomes_.pop_front();
    }
}

bool CircuitBreaker::windowTripped(foundation::Clock::time_point now) {
    pruneWindow(now);
    uint64_t total = outcomes_.size();
    if (total == 0 || total < config_.minimumRequests) {
        return false;
    }
    uint64_t failures = 0;
    for (const auto& [at, failed] : outcomes_) {
        if (failed) {
            ++failures;
        }
    }
    return failures * 100 >= static_cast<uint64_t>(config_.failureRatePercent) * total;
}

void CircuitBreaker::publish(const Transition& t) {
    metrics_.record("rcache_circuit_transitions_total", 1,
                    {{"breaker", config_.name},
                     {"from", std::string(toString(t.from))},
                     {"to", std::string(toString(t.to))}});
    metrics_.record("rcache_circuit_state", stateGaugeValue(t.to),
                    {{"breaker", config_.name}});

    auto level = t.to == State::Open ? LogLevel::Warning : LogLevel::Info;
    foundation::LogContext ctx;
    ctx.breaker = config_.name;
    ctx.extra["from"] = std::string(toString(t.from));
    ctx.extra["to"] = std::string(toString(t.to));
    foundation::CacheLogger::instance().logWithContext(
        level, LogCategory::Circuit, "circuit state changed", ctx);
}

}  // namespace rcache::reliability
