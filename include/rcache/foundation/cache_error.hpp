#pragma once

/// @file cache_error.hpp
/// @brief Error type used with Result<T, CacheError> across the library.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "rcache/foundation/error_code.hpp"

namespace rcache::foundation {

/// Rich error type carrying an error code, human-readable message,
/// and optional type-erased context data for debugging.
///
/// Also serves as the default upstream error type (see FetchError):
/// upstream adapters report failures with the Upstream* codes.
class CacheError {
public:
    CacheError() = default;

    explicit CacheError(ErrorCode code)
        : code_(code) {}

    CacheError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    CacheError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    /// The categorized error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// Human-readable error description.
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Access typed context data (returns nullptr if type mismatch or empty).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    /// Check whether this error carries context data.
    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    /// Check if this represents a success (no error).
    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

/// Default error type produced by upstream fetch operations.
using FetchError = CacheError;

} // namespace rcache::foundation
