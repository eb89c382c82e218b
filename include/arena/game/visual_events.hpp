#pragma once

/// @file visual_events.hpp
/// @brief Transient effects for the renderer (beams, impacts, explosions).

#include <cstdint>
#include <optional>

#include "arena/foundation/types.hpp"
#include "arena/game/item_types.hpp"
#include "arena/game/math_types.hpp"

namespace arena::game {

enum class VisualEventKind : uint8_t {
    RailTrail,
    LightningBeam,
    BulletImpact,
    Explosion,
    RocketSmoke,
    Gib,
    Spawn,
    ItemRespawn
};

/// One effect.  Beams use start/end; point effects use start only.
struct VisualEvent {
    VisualEventKind kind = VisualEventKind::BulletImpact;
    Vector3 start;
    Vector3 end;
    float radius = 0.0f;    ///< Explosion radius.
    float lifetime = 0.0f;  ///< How long the renderer keeps it.
    std::optional<foundation::PlayerId> player;
    std::optional<ItemKind> item;
};

}  // namespace arena::game
