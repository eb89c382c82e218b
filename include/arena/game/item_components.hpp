#pragma once

/// @file item_components.hpp
/// @brief Map item state.

#include "arena/foundation/types.hpp"
#include "arena/game/item_types.hpp"
#include "arena/game/math_types.hpp"

namespace arena::game {

/// A pickup placed from map data.
///
/// Items are never destroyed: a picked item turns inactive and comes back
/// with its original kind once @c respawnAt passes.
struct Item {
    foundation::ItemId id;
    ItemKind kind = ItemKind::Health25;
    Vector3 position;
    bool active = true;
    float respawnAt = 0.0f;

    [[nodiscard]] ItemCategory Category() const noexcept { return itemCategory(kind); }
};

}  // namespace arena::game
