#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration management with typed access and watch support.

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "rcache/foundation/cache_result.hpp"

namespace rcache::foundation {

/// Callback invoked when a watched configuration key changes.
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// YAML-based configuration manager providing typed access to config values.
///
/// Supports loading from a file or an in-memory document, dotted-key access
/// (e.g., "cache.default_ttl_ms"), setting values at runtime, and
/// registering callbacks for change notification.
///
/// Internally flattens the YAML tree into a key-value map to avoid
/// yaml-cpp reference-semantic pitfalls.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    /// @return Success or ConfigLoadFailed error.
    CacheResult<void> load(const std::filesystem::path& path);

    /// Load configuration from YAML text, replacing current entries.
    /// @return Success or ConfigLoadFailed error.
    CacheResult<void> loadFromString(std::string_view yaml);

    /// Retrieve a typed value by dotted key (e.g., "retry.max_attempts").
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    CacheResult<T> get(std::string_view key) const;

    /// Typed value, or @p fallback when the key is absent.
    /// A present value of the wrong type is still an error.
    template <typename T>
    CacheResult<T> getOr(std::string_view key, T fallback) const;

    /// Set a value by dotted key.
    /// Notifies any registered watchers for this key.
    template <typename T>
    void set(std::string_view key, const T& value);

    /// Register a callback that fires when the given key changes via set().
    void watch(std::string_view key, ConfigWatchCallback callback);

    /// Check if a key exists in the current configuration.
    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// All leaf keys starting with "<prefix>.", sorted.
    [[nodiscard]] std::vector<std::string> keysWithPrefix(std::string_view prefix) const;

    /// Distinct first path segments below @p prefix, sorted.
    /// For keys "resources.pets.ttl_ms" and "resources.owners.ttl_ms",
    /// childNames("resources") returns {"owners", "pets"}.
    [[nodiscard]] std::vector<std::string> childNames(std::string_view prefix) const;

private:
    /// Flatten a YAML node recursively into the entries_ map.
    void flatten(const std::string& prefix, const YAML::Node& node);

    /// Notify watchers registered for the given key.
    void notifyWatchers(std::string_view key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

// --- Template implementations ---

template <typename T>
CacheResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return CacheResult<T>::err(
            CacheError(ErrorCode::ConfigKeyNotFound,
                       std::string("config key not found: ") + std::string(key)));
    }
    try {
        return CacheResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return CacheResult<T>::err(
            CacheError(ErrorCode::ConfigTypeMismatch,
                       std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
CacheResult<T> ConfigManager::getOr(std::string_view key, T fallback) const {
    auto result = get<T>(key);
    if (result.hasError() && result.error().code() == ErrorCode::ConfigKeyNotFound) {
        return CacheResult<T>::ok(std::move(fallback));
    }
    return result;
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    {
        std::lock_guard lock(mutex_);
        entries_[std::string(key)] = YAML::Node(value);
    }
    notifyWatchers(key);
}

} // namespace rcache::foundation
