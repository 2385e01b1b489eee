#include "rcache/foundation/config_manager.hpp"

#include <algorithm>
#include <set>

namespace rcache::foundation {

CacheResult<void> ConfigManager::load(const std::filesystem::path& path) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::LoadFile(path.string());
        entries_.clear();
        flatten("", root);
        return CacheResult<void>::ok();
    } catch (const YAML::BadFile&) {
        return CacheResult<void>::err(
            CacheError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return CacheResult<void>::err(
            CacheError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

CacheResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::Load(std::string(yaml));
        entries_.clear();
        flatten("", root);
        return CacheResult<void>::ok();
    } catch (const YAML::ParserException& e) {
        return CacheResult<void>::err(
            CacheError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

void ConfigManager::watch(std::string_view key, ConfigWatchCallback callback) {
    std::lock_guard lock(mutex_);
    watchers_[std::string(key)].push_back(std::move(callback));
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

std::vector<std::string> ConfigManager::keysWithPrefix(std::string_view prefix) const {
    auto dotted = std::string(prefix) + ".";
    std::vector<std::string> keys;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [key, node] : entries_) {
            if (key.compare(0, dotted.size(), dotted) == 0) {
                keys.push_back(key);
            }
        }
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

std::vector<std::string> ConfigManager::childNames(std::string_view prefix) const {
    auto offset = prefix.size() + 1;
    std::set<std::string> names;
    for (const auto& key : keysWithPrefix(prefix)) {
        auto end = key.find('.', offset);
        names.insert(key.substr(offset, end == std::string::npos ? std::string::npos
                                                                 : end - offset));
    }
    return {names.begin(), names.end()};
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else if (!prefix.empty()) {
        // Leaf node (scalar, sequence, null): store with its dotted key.
        entries_[prefix] = YAML::Clone(node);
    }
}

void ConfigManager::notifyWatchers(std::string_view key) {
    std::vector<ConfigWatchCallback> callbacks;
    {
        std::lock_guard lock(mutex_);
        auto it = watchers_.find(std::string(key));
        if (it != watchers_.end()) {
            callbacks = it->second;
        }
    }
    // Outside the lock so callbacks may read the new value.
    for (auto& cb : callbacks) {
        cb(key);
    }
}

}  // namespace rcache::foundation
