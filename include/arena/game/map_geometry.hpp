#pragma once

/// @file map_geometry.hpp
/// @brief Static arena geometry: bounding box, spawn points, item placements.

#include <vector>

#include "arena/foundation/config_manager.hpp"
#include "arena/foundation/game_result.hpp"
#include "arena/game/item_types.hpp"
#include "arena/game/math_types.hpp"

namespace arena::game {

/// Axis-aligned box enclosing the playable space.  The floor is min.y.
struct Bounds {
    Vector3 min;
    Vector3 max;

    [[nodiscard]] constexpr bool Contains(const Vector3& p) const noexcept {
        return p.x >= min.x && p.x <= max.x &&
               p.y >= min.y && p.y <= max.y &&
               p.z >= min.z && p.z <= max.z;
    }

    /// Box shrunk by @p margin on every side (clamped to a point).
    [[nodiscard]] constexpr Bounds Shrunk(float margin) const noexcept {
        Bounds b{min + Vector3{margin, margin, margin}, max - Vector3{margin, margin, margin}};
        if (b.min.x > b.max.x) { b.min.x = b.max.x = (min.x + max.x) * 0.5f; }
        if (b.min.y > b.max.y) { b.min.y = b.max.y = (min.y + max.y) * 0.5f; }
        if (b.min.z > b.max.z) { b.min.z = b.max.z = (min.z + max.z) * 0.5f; }
        return b;
    }

    [[nodiscard]] constexpr bool IsValid() const noexcept {
        return min.x < max.x && min.y < max.y && min.z < max.z;
    }
};

struct ItemPlacement {
    ItemKind kind = ItemKind::Health25;
    Vector3 position;
};

/// Read-only map data shared by collision and respawn logic.
struct MapGeometry {
    Bounds bounds;
    std::vector<Vector3> spawnPoints;
    std::vector<ItemPlacement> items;

    /// InvalidGeometry for inverted bounds, no spawn points, or a spawn
    /// point/item outside the bounds.
    [[nodiscard]] foundation::GameResult<void> Validate() const;

    /// Read @c map.bounds.min / @c map.bounds.max ([x, y, z]),
    /// @c map.spawn_points (list of [x, y, z]) and optional @c map.items
    /// (list of {kind, position}).
    [[nodiscard]] static foundation::GameResult<MapGeometry> FromConfig(
        const foundation::ConfigManager& config);
};

}  // namespace arena::game
