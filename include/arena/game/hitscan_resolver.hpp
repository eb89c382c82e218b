#pragma once

/// @file hitscan_resolver.hpp
/// @brief Instant ray resolution against players and arena bounds.

#include <span>
#include <vector>

#include "arena/foundation/types.hpp"
#include "arena/game/combat_types.hpp"
#include "arena/game/map_geometry.hpp"
#include "arena/game/math_types.hpp"
#include "arena/game/weapon_catalog.hpp"

namespace arena::game {

/// Snapshot of a player a ray can hit.
struct HitscanTarget {
    foundation::PlayerId id;
    Vector3 position;
    bool airborne = false;
};

/// Where a single ray went.
struct RayTrace {
    std::vector<CombatEvent> hits;  ///< Near to far.
    Vector3 endPoint;               ///< Last hit (non-penetrating) or geometry/range end.
    bool hitGeometry = false;       ///< Stopped by the bounds rather than range or a player.
};

/// Full resolution of one hitscan shot.
struct HitscanResult {
    std::vector<CombatEvent> events;  ///< All pellets, sorted near to far.
    std::vector<RayTrace> traces;     ///< One per pellet, in ray order.
};

/// Ray-sphere resolution of hitscan weapons.
///
/// Players are spheres of kPlayerRadius.  A ray stops at the first player
/// it enters unless penetrating (railgun), in which case every player
/// along the ray up to the bounds or max range is hit.
class HitscanResolver {
public:
    HitscanResolver() = delete;

    /// Trace one ray.
    [[nodiscard]] static RayTrace Trace(const Ray& ray, foundation::PlayerId shooter,
                                        WeaponKind weapon, int32_t damage, bool penetrating,
                                        std::span<const HitscanTarget> targets,
                                        const Bounds& bounds);

    /// Trace every pellet of @p shot; pellets are independent rays.
    [[nodiscard]] static HitscanResult Resolve(const HitscanFire& shot,
                                               foundation::PlayerId shooter, WeaponKind weapon,
                                               std::span<const HitscanTarget> targets,
                                               const Bounds& bounds);
};

}  // namespace arena::game
