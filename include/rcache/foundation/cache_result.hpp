#pragma once

/// @file cache_result.hpp
/// @brief CacheResult<T> type alias for library error handling.

#include "rcache/core/result.hpp"
#include "rcache/foundation/cache_error.hpp"

namespace rcache::foundation {

/// Result type specialized with CacheError for library operations.
///
/// Example:
/// @code
///   CacheResult<void> registerPets(CacheRegistry& registry) {
///       if (registry.contains("pets")) {
///           return CacheResult<void>::err(
///               CacheError(ErrorCode::CacheAlreadyRegistered, "pets"));
///       }
///       return CacheResult<void>::ok();
///   }
/// @endcode
template <typename T>
using CacheResult = rcache::Result<T, CacheError>;

}  // namespace rcache::foundation
