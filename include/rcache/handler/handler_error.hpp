#pragma once

/// @file handler_error.hpp
/// @brief Error returned by ProtectedHandler.

#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

namespace rcache::handler {

/// Which layer stopped the request.
///
/// RateLimited, CircuitOpen and Overloaded mean the upstream was never
/// attempted; Upstream means it was attempted (possibly several times) and
/// failed.
template <typename E>
class HandlerError {
public:
    enum class Kind : uint8_t {
        RateLimited,
        CircuitOpen,
        Overloaded,
        Upstream
    };

    static HandlerError rateLimited() { return HandlerError(Kind::RateLimited); }
    static HandlerError circuitOpen() { return HandlerError(Kind::CircuitOpen); }
    static HandlerError overloaded() { return HandlerError(Kind::Overloaded); }
    static HandlerError upstream(E error) { return HandlerError(std::move(error)); }

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

    [[nodiscard]] bool isRateLimited() const noexcept { return kind_ == Kind::RateLimited; }
    [[nodiscard]] bool isCircuitOpen() const noexcept { return kind_ == Kind::CircuitOpen; }
    [[nodiscard]] bool isOverloaded() const noexcept { return kind_ == Kind::Overloaded; }
    [[nodiscard]] bool isUpstream() const noexcept { return kind_ == Kind::Upstream; }

    /// True when the request was turned away before reaching the upstream.
    [[nodiscard]] bool isRejection() const noexcept { return kind_ != Kind::Upstream; }

    /// Stable name of the kind, for logs and metric labels.
    [[nodiscard]] std::string_view kindName() const noexcept {
        switch (kind_) {
            case Kind::RateLimited:
                return "rate_limited";
            case Kind::CircuitOpen:
                return "circuit_open";
            case Kind::Overloaded:
                return "overloaded";
            case Kind::Upstream:
                return "upstream";
        }
        return "unknown";
    }

    /// The upstream's error (undefined behavior unless isUpstream()).
    [[nodiscard]] const E& upstreamError() const& { return *upstream_; }
    [[nodiscard]] E&& upstreamError() && { return std::move(*upstream_); }

private:
    explicit HandlerError(Kind kind) : kind_(kind) {}
    explicit HandlerError(E error) : kind_(Kind::Upstream), upstream_(std::move(error)) {}

    Kind kind_;
    std::optional<E> upstream_;
};

}  // namespace rcache::handler
