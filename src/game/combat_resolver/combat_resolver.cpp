/// @file combat_resolver.cpp
/// @brief CombatResolver damage pipeline.

#include "arena/game/combat_resolver.hpp"

#include <algorithm>

#include "arena/game/game_constants.hpp"

namespace arena::game {

float CombatResolver::KnockbackMagnitude(int32_t damage, bool selfDamage) noexcept {
    const auto dmg = static_cast<float>(std::max(damage, 0));
    if (selfDamage) {
        return std::min(dmg * kSelfKnockbackScale, kSelfKnockbackMax);
    }
    return std::min(dmg * kKnockbackScale, kKnockbackMax);
}

DamageResult CombatResolver::Resolve(const CombatEvent& event, const Player* attacker,
                                     const Player& victim) {
    DamageResult result;
    result.victim = event.victim;
    result.attacker = event.attacker;
    result.selfDamage = event.attacker.has_value() && *event.attacker == event.victim;

    if (event.flags.telefrag) {
        // Ignores armor, quad and battle suit.
        result.telefrag = true;
        result.applied = kTelefragDamage;
        result.healthDamage = kTelefragDamage;
        result.healthAfter = victim.health - kTelefragDamage;
        result.armorAfter = victim.armor;
        result.killed = true;
        result.gibbed = true;
        return result;
    }

    int32_t damage = std::max(event.rawDamage, 0);

    if (attacker != nullptr && attacker->HasPowerup(PowerupKind::Quad)) {
        damage *= kQuadDamageFactor;
    }

    if (result.selfDamage) {
        damage /= 2;
    }

    const bool battleSuit = victim.HasPowerup(PowerupKind::BattleSuit);
    if (battleSuit) {
        damage /= 2;
    }

    if (event.rawDamage > 0) {
        damage = std::max(damage, 1);
    }

    int32_t save = 0;
    if (!battleSuit && victim.armor > 0) {
        save = std::min(damage / 2, victim.armor);
    }

    result.applied = damage;
    result.armorAbsorbed = save;
    result.healthDamage = damage - save;
    result.armorAfter = victim.armor - save;
    result.healthAfter = victim.health - result.healthDamage;

    // Push away from the impact; straight up when it landed on the origin.
    Vector3 direction = (victim.position - event.hitPosition).Normalized();
    if (direction.LengthSquared() == 0.0f) {
        direction = Vector3::Up();
    }
    result.knockback = direction * KnockbackMagnitude(damage, result.selfDamage);

    result.killed = result.healthAfter <= 0;
    result.gibbed = result.killed && damage > kGibThreshold;
    return result;
}

void CombatResolver::Apply(const DamageResult& result, Player& victim) {
    victim.armor = std::max(result.armorAfter, 0);
    victim.health = result.killed ? 0 : result.healthAfter;
    if (!result.killed) {
        victim.velocity += result.knockback;
    }
}

} // namespace arena::game
