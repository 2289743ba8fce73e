#pragma once

/// @file config_manager.hpp
/// @brief YAML-backed engine configuration with dotted-key typed access.

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "cre/foundation/combat_result.hpp"

namespace cre::foundation {

/// Callback invoked when a watched key changes through set().
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// Flat key-value view over a YAML document.
///
/// Nested maps are flattened into dotted keys ("combat.physics_tick_rate").
/// Sequences and scalars are stored as leaves.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    /// @return ConfigLoadFailed when the file is missing or malformed.
    CombatResult<void> load(const std::filesystem::path& path);

    /// Load configuration from in-memory YAML text.
    CombatResult<void> loadFromString(std::string_view yaml);

    /// @return The value or ConfigKeyNotFound / ConfigTypeMismatch.
    template <typename T>
    CombatResult<T> get(std::string_view key) const;

    /// Like get(), but substitutes @p fallback when the key is absent.
    /// A present value of the wrong type is still an error.
    template <typename T>
    CombatResult<T> getOr(std::string_view key, const T& fallback) const;

    template <typename T>
    void set(std::string_view key, const T& value);

    void watch(std::string_view key, ConfigWatchCallback callback);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    [[nodiscard]] std::size_t size() const;

private:
    CombatResult<void> loadNode(const YAML::Node& root);
    void flatten(const std::string& prefix, const YAML::Node& node);
    void notifyWatchers(std::string_view key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

// --- Template implementations ---

template <typename T>
CombatResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return CombatResult<T>::err(
            CombatError(ErrorCode::ConfigKeyNotFound,
                        std::string("config key not found: ") + std::string(key)));
    }
    try {
        return CombatResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return CombatResult<T>::err(
            CombatError(ErrorCode::ConfigTypeMismatch,
                        std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
CombatResult<T> ConfigManager::getOr(std::string_view key, const T& fallback) const {
    if (!hasKey(key)) {
        return CombatResult<T>::ok(fallback);
    }
    return get<T>(key);
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    {
        std::lock_guard lock(mutex_);
        entries_[std::string(key)] = YAML::Node(value);
    }
    notifyWatchers(key);
}

} // namespace cre::foundation
