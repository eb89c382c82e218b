#pragma once

/// @file combat_resolver.hpp
/// @brief Damage pipeline: multipliers, armor, knockback, death.

#include <cstdint>

#include "arena/game/combat_types.hpp"
#include "arena/game/player_components.hpp"

namespace arena::game {

/// Converts raw hits into applied damage.
///
/// Resolve() is pure so the pipeline can be tested without a World.
/// Stages, in this fixed order (integer damage depends on it):
///   1. raw damage
///   2. attacker Quad: x3
///   3. self damage: /2 (integer)
///   4. victim Battle Suit: /2, armor is skipped
///   5. minimum 1 for any positive raw hit
///   6. armor saves floor(damage / 2), capped at current armor
///   7. knockback from the applied damage
///   8. death when health <= 0, gib when applied > kGibThreshold
/// Telefrag events bypass every stage and are always lethal.
class CombatResolver {
public:
    CombatResolver() = delete;

    /// @param attacker  Current attacker state, or nullptr when the attacker
    ///                  is gone or the damage is environmental.
    [[nodiscard]] static DamageResult Resolve(const CombatEvent& event,
                                              const Player* attacker,
                                              const Player& victim);

    /// Write health, armor and the knockback impulse into @p victim.
    /// Lethal results clamp health to 0; the life cycle change is left to
    /// the caller (PlayerSystem::Kill).
    static void Apply(const DamageResult& result, Player& victim);

    /// Knockback speed for @p damage.
    [[nodiscard]] static float KnockbackMagnitude(int32_t damage, bool selfDamage) noexcept;
};

}  // namespace arena::game
