/// @file map_geometry.cpp
/// @brief MapGeometry loading and validation.

#include "arena/game/map_geometry.hpp"

#include <string>
#include <vector>

namespace arena::game {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

GameError geometryError(const std::string& what) {
    return GameError(ErrorCode::InvalidGeometry, what);
}

GameResult<Vector3> toVector(const std::vector<float>& xyz, const std::string& key) {
    if (xyz.size() != 3) {
        return GameResult<Vector3>::err(
            GameError(ErrorCode::ConfigInvalidValue, key + " must have 3 components"));
    }
    return GameResult<Vector3>::ok(Vector3{xyz[0], xyz[1], xyz[2]});
}

GameResult<Vector3> readVector(const ConfigManager& config, const std::string& key) {
    auto xyz = config.get<std::vector<float>>(key);
    if (!xyz) {
        return GameResult<Vector3>::err(xyz.error());
    }
    return toVector(xyz.value(), key);
}

} // namespace

GameResult<void> MapGeometry::Validate() const {
    if (!bounds.IsValid()) {
        return GameResult<void>::err(geometryError("map bounds are empty or inverted"));
    }
    if (spawnPoints.empty()) {
        return GameResult<void>::err(geometryError("map has no spawn points"));
    }
    for (std::size_t i = 0; i < spawnPoints.size(); ++i) {
        if (!spawnPoints[i].IsFinite() || !bounds.Contains(spawnPoints[i])) {
            return GameResult<void>::err(
                geometryError("spawn point " + std::to_string(i) + " is outside the bounds"));
        }
    }
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (!items[i].position.IsFinite() || !bounds.Contains(items[i].position)) {
            return GameResult<void>::err(
                geometryError("item " + std::to_string(i) + " is outside the bounds"));
        }
    }
    return GameResult<void>::ok();
}

GameResult<MapGeometry> MapGeometry::FromConfig(const ConfigManager& config) {
    MapGeometry map;

    auto min = readVector(config, "map.bounds.min");
    if (!min) {
        return GameResult<MapGeometry>::err(min.error());
    }
    auto max = readVector(config, "map.bounds.max");
    if (!max) {
        return GameResult<MapGeometry>::err(max.error());
    }
    map.bounds = Bounds{min.value(), max.value()};

    auto spawns = config.get<std::vector<std::vector<float>>>("map.spawn_points");
    if (!spawns) {
        return GameResult<MapGeometry>::err(spawns.error());
    }
    for (const auto& xyz : spawns.value()) {
        auto point = toVector(xyz, "map.spawn_points");
        if (!point) {
            return GameResult<MapGeometry>::err(point.error());
        }
        map.spawnPoints.push_back(point.value());
    }

    if (config.hasKey("map.items")) {
        auto node = config.node("map.items");
        if (!node) {
            return GameResult<MapGeometry>::err(node.error());
        }
        if (!node.value().IsSequence()) {
            return GameResult<MapGeometry>::err(
                GameError(ErrorCode::ConfigTypeMismatch, "map.items must be a list"));
        }
        try {
            for (const auto& entry : node.value()) {
                auto name = entry["kind"].as<std::string>();
                auto kind = parseItemKind(name);
                if (!kind) {
                    return GameResult<MapGeometry>::err(
                        GameError(ErrorCode::ConfigInvalidValue, "unknown item kind: " + name));
                }
                auto position = toVector(entry["position"].as<std::vector<float>>(),
                                         "map.items.position");
                if (!position) {
                    return GameResult<MapGeometry>::err(position.error());
                }
                map.items.push_back(ItemPlacement{*kind, position.value()});
            }
        } catch (const YAML::Exception& e) {
            return GameResult<MapGeometry>::err(GameError(
                ErrorCode::ConfigTypeMismatch, std::string("malformed map.items entry: ") + e.what()));
        }
    }

    auto valid = map.Validate();
    if (!valid) {
        return GameResult<MapGeometry>::err(valid.error());
    }
    return GameResult<MapGeometry>::ok(std::move(map));
}

} // namespace arena::game
