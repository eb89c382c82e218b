#pragma once

/// @file projectile_components.hpp
/// @brief In-flight projectile state.

#include <cstdint>

#include "arena/foundation/types.hpp"
#include "arena/game/math_types.hpp"
#include "arena/game/weapon_types.hpp"

namespace arena::game {

/// A travelling weapon body.
///
/// @c owner is a weak reference: the owning player may have left the
/// match, in which case the explosion still happens but credits nobody.
struct Projectile {
    foundation::ProjectileId id;
    ProjectileKind kind = ProjectileKind::Rocket;
    WeaponKind weapon = WeaponKind::RocketLauncher;
    foundation::PlayerId owner;

    Vector3 position;
    Vector3 velocity;

    float spawnTime = 0.0f;
    float lifetime = 0.0f;  ///< Grenades: fuse; others: hard expiry.

    int32_t damage = 0;
    float splashRadius = 0.0f;

    uint32_t bounces = 0;          ///< Grenade only.
    bool resting = false;          ///< Grenade lying on the floor.
    float trailAccumulator = 0.0f; ///< Rocket only, seconds since last smoke puff.

    [[nodiscard]] float Age(float now) const noexcept { return now - spawnTime; }
    [[nodiscard]] bool IsExpired(float now) const noexcept { return Age(now) >= lifetime; }
};

}  // namespace arena::game
