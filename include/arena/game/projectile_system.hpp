#pragma once

/// @file projectile_system.hpp
/// @brief Per-tick projectile integration, collision and lifetime.

#include <optional>
#include <string_view>
#include <vector>

#include "arena/ecs/entity_table.hpp"
#include "arena/foundation/types.hpp"
#include "arena/game/collision_engine.hpp"
#include "arena/game/map_geometry.hpp"
#include "arena/game/player_components.hpp"
#include "arena/game/projectile_components.hpp"
#include "arena/game/weapon_catalog.hpp"

namespace arena::game {

/// Fixed per-kind behaviour.
struct ProjectileTraits {
    float radius = 0.0f;
    float lifetime = 0.0f;
    float gravity = 0.0f;
    bool bounces = false;      ///< Reflect off bounds instead of exploding.
    bool smokeTrail = false;
};

/// A projectile that exploded this tick.
struct Detonation {
    foundation::ProjectileId projectile;
    ProjectileKind kind = ProjectileKind::Rocket;
    WeaponKind weapon = WeaponKind::RocketLauncher;
    foundation::PlayerId owner;
    Vector3 position;
    int32_t damage = 0;
    float splashRadius = 0.0f;
    std::optional<foundation::PlayerId> directVictim;
};

/// Side effects of one simulation step.
struct ProjectileStepResult {
    std::vector<Detonation> detonations;
    std::vector<Vector3> bounces;      ///< Grenade bounce positions.
    std::vector<Vector3> smokePuffs;   ///< Rocket trail puffs.
    std::size_t expired = 0;           ///< Removed at max lifetime without exploding.
    std::size_t degenerate = 0;        ///< Removed for NaN/overflow.
};

/// System that advances every projectile by one fixed step.
///
/// Per projectile, in order:
///   1. Lifetime: grenades explode at the fuse, other kinds vanish.
///   2. Gravity (grenades), then integration over the swept segment.
///   3. Degenerate state check (non-finite, speed ceiling).
///   4. Nearest direct player hit vs. bounds exit along the segment;
///      players first if closer.  The owner is never hit directly.
///   5. Grenades reflect off bounds with damping; others detonate.
class ProjectileSystem final {
public:
    ProjectileSystem(ecs::EntityTable<foundation::ProjectileId, Projectile>& projectiles,
                     const ecs::EntityTable<foundation::PlayerId, Player>& players,
                     const Bounds& bounds);

    /// Advance @p deltaTime seconds ending at world time @p now.
    ProjectileStepResult Execute(float deltaTime, float now);

    [[nodiscard]] std::string_view GetName() const { return "ProjectileSystem"; }

    [[nodiscard]] static const ProjectileTraits& TraitsFor(ProjectileKind kind);

    /// Build a projectile from a fire outcome.
    [[nodiscard]] static Projectile Spawn(foundation::ProjectileId id,
                                          foundation::PlayerId owner, WeaponKind weapon,
                                          const ProjectileFire& fire, float now);

private:
    /// @return true if the projectile must be removed.
    bool step(foundation::ProjectileId id, Projectile& projectile, float deltaTime,
              float now, ProjectileStepResult& out);

    void bounce(Projectile& projectile, const BoundsHit& hit,
                ProjectileStepResult& out);

    ecs::EntityTable<foundation::ProjectileId, Projectile>& projectiles_;
    const ecs::EntityTable<foundation::PlayerId, Player>& players_;
    const Bounds& bounds_;
};

}  // namespace arena::game
