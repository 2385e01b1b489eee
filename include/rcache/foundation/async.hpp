#pragma once

/// @file async.hpp
/// @brief Continuation types shared by the cache and reliability layers.
///
/// An asynchronous operation is a callable that is handed a completion and
/// invokes it exactly once, on whatever thread finishes the work. Nothing
/// in the library blocks while an operation is outstanding.

#include <functional>

#include "rcache/core/result.hpp"

namespace rcache::foundation {

/// Receives the outcome of an asynchronous operation.
template <typename T, typename E>
using Completion = std::function<void(rcache::Result<T, E>)>;

/// Starts work and eventually calls the completion exactly once.
///
/// Example:
/// @code
///   AsyncOperation<Pet, FetchError> op = [&client, id](auto done) {
///       client.getPet(id, [done](Response r) { done(toResult(r)); });
///   };
/// @endcode
template <typename T, typename E>
using AsyncOperation = std::function<void(Completion<T, E>)>;

}  // namespace rcache::foundation
