#include <gtest/gtest.h>

#include "arena/game/combat_resolver.hpp"

using namespace arena::game;
using arena::foundation::PlayerId;

namespace {

Player makePlayer(uint32_t id, const Vector3& pos = {}) {
    Player p;
    p.id = PlayerId(id);
    p.position = pos;
    return p;
}

CombatEvent hit(uint32_t attacker, uint32_t victim, int32_t damage,
                const Vector3& at = {0, 0, -10}) {
    CombatEvent e;
    e.attacker = PlayerId(attacker);
    e.victim = PlayerId(victim);
    e.rawDamage = damage;
    e.hitPosition = at;
    e.weapon = WeaponKind::RocketLauncher;
    return e;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Multipliers
// ═══════════════════════════════════════════════════════════════════════════

TEST(CombatResolverTest, PlainHitNoArmor) {
    auto attacker = makePlayer(1);
    auto victim = makePlayer(2);

    auto r = CombatResolver::Resolve(hit(1, 2, 40), &attacker, victim);

    EXPECT_EQ(r.applied, 40);
    EXPECT_EQ(r.healthDamage, 40);
    EXPECT_EQ(r.armorAbsorbed, 0);
    EXPECT_EQ(r.healthAfter, 60);
    EXPECT_FALSE(r.killed);
    EXPECT_FALSE(r.selfDamage);
}

TEST(CombatResolverTest, QuadTriplesDamage) {
    auto attacker = makePlayer(1);
    attacker.powerups.Grant(PowerupKind::Quad, 30.0f);
    auto victim = makePlayer(2);

    auto r = CombatResolver::Resolve(hit(1, 2, 10), &attacker, victim);
    EXPECT_EQ(r.applied, 30);
}

TEST(CombatResolverTest, BattleSuitHalvesAndSkipsArmor) {
    auto attacker = makePlayer(1);
    auto victim = makePlayer(2);
    victim.armor = 100;
    victim.powerups.Grant(PowerupKind::BattleSuit, 30.0f);

    auto r = CombatResolver::Resolve(hit(1, 2, 40), &attacker, victim);

    EXPECT_EQ(r.applied, 20);
    EXPECT_EQ(r.armorAbsorbed, 0);
    EXPECT_EQ(r.armorAfter, 100);
    EXPECT_EQ(r.healthAfter, 80);
}

TEST(CombatResolverTest, SelfDamageHalved) {
    auto self = makePlayer(1);
    auto r = CombatResolver::Resolve(hit(1, 1, 100), &self, self);
    EXPECT_TRUE(r.selfDamage);
    EXPECT_EQ(r.applied, 50);
}

TEST(CombatResolverTest, QuadAppliesBeforeSelfHalving) {
    auto self = makePlayer(1);
    self.powerups.Grant(PowerupKind::Quad, 30.0f);
    auto r = CombatResolver::Resolve(hit(1, 1, 33), &self, self);
    // 33 * 3 = 99, / 2 = 49.
    EXPECT_EQ(r.applied, 49);
}

TEST(CombatResolverTest, MinimumOneForPositiveHit) {
    auto self = makePlayer(1);
    self.powerups.Grant(PowerupKind::BattleSuit, 30.0f);
    auto r = CombatResolver::Resolve(hit(1, 1, 1), &self, self);
    EXPECT_EQ(r.applied, 1);
}

TEST(CombatResolverTest, ZeroDamageStaysZero) {
    auto attacker = makePlayer(1);
    auto victim = makePlayer(2);
    auto r = CombatResolver::Resolve(hit(1, 2, 0), &attacker, victim);
    EXPECT_EQ(r.applied, 0);
    EXPECT_EQ(r.healthAfter, 100);
}

TEST(CombatResolverTest, MissingAttackerGetsNoQuad) {
    auto victim = makePlayer(2);
    auto r = CombatResolver::Resolve(hit(9, 2, 10), nullptr, victim);
    EXPECT_EQ(r.applied, 10);
    ASSERT_TRUE(r.attacker.has_value());
    EXPECT_EQ(*r.attacker, PlayerId(9));
}

// ═══════════════════════════════════════════════════════════════════════════
// Armor
// ═══════════════════════════════════════════════════════════════════════════

TEST(CombatResolverTest, ArmorSavesHalf) {
    auto attacker = makePlayer(1);
    auto victim = makePlayer(2);
    victim.armor = 50;

    auto r = CombatResolver::Resolve(hit(1, 2, 40), &attacker, victim);

    EXPECT_EQ(r.armorAbsorbed, 20);
    EXPECT_EQ(r.healthDamage, 20);
    EXPECT_EQ(r.armorAfter, 30);
    EXPECT_EQ(r.healthAfter, 80);
}

TEST(CombatResolverTest, ArmorSaveCappedByRemainingArmor) {
    auto attacker = makePlayer(1);
    auto victim = makePlayer(2);
    victim.armor = 5;

    auto r = CombatResolver::Resolve(hit(1, 2, 100), &attacker, victim);

    EXPECT_EQ(r.armorAbsorbed, 5);
    EXPECT_EQ(r.armorAfter, 0);
    EXPECT_EQ(r.healthDamage, 95);
}

TEST(CombatResolverTest, ArmorNeverNegative) {
    auto attacker = makePlayer(1);
    attacker.powerups.Grant(PowerupKind::Quad, 30.0f);
    for (int32_t armor = 0; armor <= 200; armor += 7) {
        for (int32_t raw = 0; raw <= 300; raw += 13) {
            auto victim = makePlayer(2);
            victim.armor = armor;
            auto r = CombatResolver::Resolve(hit(1, 2, raw), &attacker, victim);
            EXPECT_GE(r.armorAfter, 0);
            EXPECT_EQ(r.armorAbsorbed + r.healthDamage, r.applied);
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Death, gibs, telefrag
// ═══════════════════════════════════════════════════════════════════════════

TEST(CombatResolverTest, DirectRocketKillsAndGibs) {
    auto attacker = makePlayer(1);
    auto victim = makePlayer(2);

    auto r = CombatResolver::Resolve(hit(1, 2, 120), &attacker, victim);

    EXPECT_EQ(r.healthAfter, -20);
    EXPECT_TRUE(r.killed);
    EXPECT_TRUE(r.gibbed);
}

TEST(CombatResolverTest, ExactLethalIsNotGib) {
    auto attacker = makePlayer(1);
    auto victim = makePlayer(2);
    auto r = CombatResolver::Resolve(hit(1, 2, 100), &attacker, victim);
    EXPECT_TRUE(r.killed);
    EXPECT_FALSE(r.gibbed);
}

TEST(CombatResolverTest, TelefragIgnoresProtection) {
    auto victim = makePlayer(2);
    victim.armor = 200;
    victim.health = 200;
    victim.powerups.Grant(PowerupKind::BattleSuit, 30.0f);

    CombatEvent e;
    e.attacker = PlayerId(1);
    e.victim = PlayerId(2);
    e.flags.telefrag = true;

    auto r = CombatResolver::Resolve(e, nullptr, victim);
    EXPECT_TRUE(r.telefrag);
    EXPECT_TRUE(r.killed);
    EXPECT_TRUE(r.gibbed);
    EXPECT_EQ(r.armorAfter, 200);
}

// ═══════════════════════════════════════════════════════════════════════════
// Knockback / Apply
// ═══════════════════════════════════════════════════════════════════════════

TEST(CombatResolverTest, KnockbackPushesAwayAndCaps) {
    EXPECT_FLOAT_EQ(CombatResolver::KnockbackMagnitude(50, false), 300.0f);
    EXPECT_FLOAT_EQ(CombatResolver::KnockbackMagnitude(500, false), 1000.0f);
    EXPECT_FLOAT_EQ(CombatResolver::KnockbackMagnitude(50, true), 200.0f);
    EXPECT_FLOAT_EQ(CombatResolver::KnockbackMagnitude(500, true), 800.0f);

    auto attacker = makePlayer(1);
    auto victim = makePlayer(2, {0, 0, 0});
    auto r = CombatResolver::Resolve(hit(1, 2, 20, {0, 0, -50}), &attacker, victim);
    EXPECT_NEAR(r.knockback.z, 120.0f, 1e-3f);
}

TEST(CombatResolverTest, KnockbackAtOriginGoesUp) {
    auto attacker = makePlayer(1);
    auto victim = makePlayer(2, {5, 5, 5});
    auto r = CombatResolver::Resolve(hit(1, 2, 10, {5, 5, 5}), &attacker, victim);
    EXPECT_NEAR(r.knockback.y, 60.0f, 1e-3f);
}

TEST(CombatResolverTest, ApplyWritesStateAndClampsDeath) {
    auto attacker = makePlayer(1);
    auto victim = makePlayer(2);
    victim.armor = 10;

    auto survive = CombatResolver::Resolve(hit(1, 2, 20), &attacker, victim);
    CombatResolver::Apply(survive, victim);
    EXPECT_EQ(victim.health, 90);
    EXPECT_EQ(victim.armor, 0);
    EXPECT_GT(victim.velocity.z, 0.0f);

    auto lethal = CombatResolver::Resolve(hit(1, 2, 500), &attacker, victim);
    CombatResolver::Apply(lethal, victim);
    EXPECT_EQ(victim.health, 0);
}
