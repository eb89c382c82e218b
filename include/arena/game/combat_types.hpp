#pragma once

/// @file combat_types.hpp
/// @brief Transient combat records produced and consumed within a tick.

#include <cstdint>
#include <optional>

#include "arena/foundation/types.hpp"
#include "arena/game/math_types.hpp"
#include "arena/game/weapon_types.hpp"

namespace arena::game {

/// Qualifiers attached to a hit.
struct CombatFlags {
    bool midAir = false;    ///< Victim was airborne when hit.
    bool splash = false;    ///< Explosion damage.
    bool telefrag = false;  ///< Spawn/teleport overlap; lethal regardless of state.
};

/// A raw hit waiting to be resolved.
///
/// Produced by the hitscan resolver, projectile detonations and telefrag
/// checks; consumed in the same tick by CombatResolver and AwardTracker.
struct CombatEvent {
    std::optional<foundation::PlayerId> attacker;  ///< None for environment damage.
    foundation::PlayerId victim;
    int32_t rawDamage = 0;
    Vector3 hitPosition;
    std::optional<WeaponKind> weapon;  ///< None for telefrag and environment.
    CombatFlags flags;
    float distance = 0.0f;  ///< Hitscan: along the ray; splash: from the blast.
};

/// Outcome of resolving one CombatEvent against the current victim state.
struct DamageResult {
    foundation::PlayerId victim;
    std::optional<foundation::PlayerId> attacker;

    int32_t applied = 0;        ///< Damage after multipliers, before the armor split.
    int32_t healthDamage = 0;
    int32_t armorAbsorbed = 0;
    int32_t healthAfter = 0;    ///< Before the death clamp; may be negative.
    int32_t armorAfter = 0;

    Vector3 knockback;          ///< Velocity impulse.

    bool selfDamage = false;
    bool killed = false;
    bool gibbed = false;
    bool telefrag = false;
};

/// Kill-feed entry.
struct KillRecord {
    std::optional<foundation::PlayerId> killer;  ///< None for environment deaths.
    foundation::PlayerId victim;
    std::optional<WeaponKind> weapon;
    float time = 0.0f;
    bool gibbed = false;
    bool telefrag = false;
    bool midAir = false;
    bool splash = false;

    /// Killer credited with a frag.
    [[nodiscard]] bool IsFrag() const noexcept {
        return killer.has_value() && *killer != victim;
    }
};

}  // namespace arena::game
