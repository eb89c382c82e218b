#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with typed, dotted-key access.

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>

#include <yaml-cpp/yaml.h>

#include "arena/foundation/game_result.hpp"

namespace arena::foundation {

/// YAML configuration store.
///
/// The document is flattened into a key-value map on load: maps become
/// dotted prefixes ("match.frag_limit") and every other node (scalar,
/// sequence, null) is a leaf.  Sequences stay whole, so a spawn point list
/// is read with `get<std::vector<std::vector<float>>>("map.spawn_points")`
/// and a list of maps with `node("map.items")`.
///
/// Not synchronized: the simulation reads configuration on one thread
/// before the first tick.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    GameResult<void> load(const std::filesystem::path& path);

    /// Load configuration from YAML text, replacing current entries.
    GameResult<void> loadString(std::string_view yaml);

    /// Typed value by dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch.
    template <typename T>
    GameResult<T> get(std::string_view key) const;

    /// Typed value by dotted key, or @p fallback when the key is absent.
    /// A present key of the wrong type still yields ConfigTypeMismatch.
    template <typename T>
    GameResult<T> getOr(std::string_view key, T fallback) const;

    /// Raw node for structured leaves (sequences of maps).
    GameResult<YAML::Node> node(std::string_view key) const;

    /// Set a leaf value by dotted key.
    template <typename T>
    void set(std::string_view key, const T& value);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

private:
    void flatten(const std::string& prefix, const YAML::Node& node);

    std::unordered_map<std::string, YAML::Node> entries_;
};

// --- Template implementations ---

template <typename T>
GameResult<T> ConfigManager::get(std::string_view key) const {
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return GameResult<T>::err(
            GameError(ErrorCode::ConfigKeyNotFound,
                      std::string("config key not found: ") + std::string(key)));
    }
    try {
        return GameResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return GameResult<T>::err(
            GameError(ErrorCode::ConfigTypeMismatch,
                      std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
GameResult<T> ConfigManager::getOr(std::string_view key, T fallback) const {
    if (!hasKey(key)) {
        return GameResult<T>::ok(std::move(fallback));
    }
    return get<T>(key);
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    entries_[std::string(key)] = YAML::Node(value);
}

} // namespace arena::foundation
