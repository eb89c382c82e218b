#include <gtest/gtest.h>

#include "arena/game/player_system.hpp"

using namespace arena::game;
using arena::foundation::PlayerId;

class PlayerSystemTest : public ::testing::Test {
protected:
    static constexpr float kDt = 1.0f / 60.0f;

    Player& addPlayer(uint32_t id, const Vector3& pos) {
        auto& p = players_.Emplace(PlayerId(id));
        p.id = PlayerId(id);
        PlayerSystem::Spawn(p, pos, 100);
        return p;
    }

    std::size_t countEvents(const PlayerStepResult& r, PlayerMotionKind kind) const {
        std::size_t n = 0;
        for (const auto& e : r.events) {
            n += e.kind == kind ? 1 : 0;
        }
        return n;
    }

    arena::ecs::EntityTable<PlayerId, Player> players_;
    Bounds bounds_{{-1000, 0, -1000}, {1000, 600, 1000}};
    PlayerSystem system_{players_, bounds_};
    // Standing height: floor + radius.
    float floorY_ = bounds_.min.y + kPlayerRadius;
};

// ═══════════════════════════════════════════════════════════════════════════
// Ground movement
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(PlayerSystemTest, RunsTowardMoveIntentWithoutExceedingMaxSpeed) {
    auto& p = addPlayer(1, {0, floorY_, 0});
    p.intent.move = {0, 0, 1};

    for (int i = 0; i < 120; ++i) {
        (void)system_.Execute(kDt, static_cast<float>(i) * kDt);
    }

    const auto* moved = players_.Find(PlayerId(1));
    EXPECT_GT(moved->position.z, 100.0f);
    EXPECT_LE(moved->velocity.z, kMaxSpeed + 0.01f);
    EXPECT_GT(moved->velocity.z, kMaxSpeed * 0.9f);
    EXPECT_EQ(moved->legs, LegsState::Ground);
    EXPECT_FLOAT_EQ(moved->position.y, floorY_);
}

TEST_F(PlayerSystemTest, FrictionStopsIdlePlayer) {
    auto& p = addPlayer(1, {0, floorY_, 0});
    p.velocity = {200, 0, 0};

    for (int i = 0; i < 60; ++i) {
        (void)system_.Execute(kDt, 0.0f);
    }
    EXPECT_NEAR(players_.Find(PlayerId(1))->velocity.x, 0.0f, 1e-3f);
}

TEST_F(PlayerSystemTest, CrouchLimitsSpeed) {
    auto& p = addPlayer(1, {0, floorY_, 0});
    p.intent.move = {1, 0, 0};
    p.intent.crouch = true;

    for (int i = 0; i < 120; ++i) {
        (void)system_.Execute(kDt, 0.0f);
    }
    const auto* crouched = players_.Find(PlayerId(1));
    EXPECT_EQ(crouched->legs, LegsState::Crouching);
    EXPECT_LE(crouched->velocity.x, kMaxSpeed * kCrouchSpeedScale + 0.01f);
}

TEST_F(PlayerSystemTest, WallsClampPositionAndVelocity) {
    auto& p = addPlayer(1, {960, floorY_, 0});
    p.velocity = {5000, 0, 0};

    (void)system_.Execute(kDt, 0.0f);

    const auto* clipped = players_.Find(PlayerId(1));
    EXPECT_FLOAT_EQ(clipped->position.x, bounds_.max.x - kPlayerRadius);
    EXPECT_FLOAT_EQ(clipped->velocity.x, 0.0f);
}

// ═══════════════════════════════════════════════════════════════════════════
// Legs state machine
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(PlayerSystemTest, JumpLeavesGround) {
    auto& p = addPlayer(1, {0, floorY_, 0});
    p.intent.jump = true;

    auto result = system_.Execute(kDt, 0.0f);

    EXPECT_EQ(countEvents(result, PlayerMotionKind::Jump), 1u);
    const auto* jumper = players_.Find(PlayerId(1));
    EXPECT_EQ(jumper->legs, LegsState::Air);
    EXPECT_GT(jumper->position.y, floorY_);
    EXPECT_NEAR(jumper->velocity.y, kJumpVelocity - kGravity * kDt, 1e-3f);
}

TEST_F(PlayerSystemTest, HardLandingEmitsLandEvent) {
    auto& p = addPlayer(1, {0, floorY_ + 8.0f, 0});
    p.legs = LegsState::Air;
    p.velocity = {0, -300, 0};

    auto result = system_.Execute(0.1f, 0.0f);

    EXPECT_EQ(countEvents(result, PlayerMotionKind::Land), 1u);
    const auto* landed = players_.Find(PlayerId(1));
    EXPECT_EQ(landed->legs, LegsState::Ground);
    EXPECT_FLOAT_EQ(landed->position.y, floorY_);
    EXPECT_FLOAT_EQ(landed->velocity.y, 0.0f);
    EXPECT_GT(landed->animation.landingTimer, 0.0f);
}

TEST_F(PlayerSystemTest, SoftLandingIsSilent) {
    auto& p = addPlayer(1, {0, floorY_ + 0.5f, 0});
    p.legs = LegsState::Air;
    p.velocity = {0, -20, 0};

    auto result = system_.Execute(kDt * 4.0f, 0.0f);

    EXPECT_EQ(countEvents(result, PlayerMotionKind::Land), 0u);
    EXPECT_EQ(players_.Find(PlayerId(1))->legs, LegsState::Ground);
}

TEST_F(PlayerSystemTest, SpawnAboveFloorFalls) {
    addPlayer(1, {0, floorY_ + 100.0f, 0});

    (void)system_.Execute(kDt, 0.0f);
    EXPECT_EQ(players_.Find(PlayerId(1))->legs, LegsState::Air);

    for (int i = 0; i < 120; ++i) {
        (void)system_.Execute(kDt, 0.0f);
    }
    EXPECT_EQ(players_.Find(PlayerId(1))->legs, LegsState::Ground);
}

TEST_F(PlayerSystemTest, FlightCancelsGravity) {
    auto& p = addPlayer(1, {0, floorY_ + 100.0f, 0});
    p.legs = LegsState::Air;
    p.powerups.Grant(PowerupKind::Flight, 30.0f);
    p.intent.jump = true;

    for (int i = 0; i < 30; ++i) {
        (void)system_.Execute(kDt, 0.0f);
    }
    EXPECT_GT(players_.Find(PlayerId(1))->velocity.y, 0.0f);
    EXPECT_GT(players_.Find(PlayerId(1))->position.y, floorY_ + 100.0f);
}

TEST_F(PlayerSystemTest, DeadPlayersDoNotMove) {
    auto& p = addPlayer(1, {0, floorY_, 0});
    PlayerSystem::Kill(p, 0.0f, 1.7f);
    p.velocity = {100, 0, 0};

    (void)system_.Execute(kDt, 0.0f);
    EXPECT_FLOAT_EQ(players_.Find(PlayerId(1))->position.x, 0.0f);
}

// ═══════════════════════════════════════════════════════════════════════════
// Weapon switching
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(PlayerSystemTest, SwitchRequestIsConsumed) {
    auto& p = addPlayer(1, {0, floorY_, 0});
    p.weapons.Give(WeaponKind::Railgun, 10);
    p.intent.switchTo = WeaponKind::Railgun;

    auto result = system_.Execute(kDt, 3.0f);

    EXPECT_EQ(countEvents(result, PlayerMotionKind::WeaponSwitch), 1u);
    const auto* switched = players_.Find(PlayerId(1));
    EXPECT_EQ(switched->heldWeapon, WeaponKind::Railgun);
    EXPECT_FLOAT_EQ(switched->switchReadyAt, 3.0f + kWeaponSwitchTime);
    EXPECT_FALSE(switched->intent.switchTo.has_value());
}

TEST_F(PlayerSystemTest, SwitchToUnownedWeaponIgnored) {
    auto& p = addPlayer(1, {0, floorY_, 0});
    EXPECT_FALSE(PlayerSystem::BeginSwitch(p, WeaponKind::BFG, 0.0f));
    EXPECT_FALSE(PlayerSystem::BeginSwitch(p, WeaponKind::MachineGun, 0.0f));
    EXPECT_EQ(p.heldWeapon, WeaponKind::MachineGun);
}

// ═══════════════════════════════════════════════════════════════════════════
// Life cycle
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(PlayerSystemTest, SpawnGivesStartingLoadout) {
    Player p;
    p.health = -40;
    p.armor = 75;
    p.weapons.Give(WeaponKind::Railgun, 10);
    p.powerups.Grant(PowerupKind::Quad, 10.0f);
    p.life = LifeState::Respawning;

    PlayerSystem::Spawn(p, {1, 2, 3}, 100);

    EXPECT_TRUE(p.IsAlive());
    EXPECT_EQ(p.health, kSpawnHealth);
    EXPECT_EQ(p.armor, kSpawnArmor);
    EXPECT_TRUE(p.weapons.Owns(WeaponKind::Gauntlet));
    EXPECT_EQ(p.weapons.Ammo(WeaponKind::MachineGun), 100);
    EXPECT_FALSE(p.weapons.Owns(WeaponKind::Railgun));
    EXPECT_FALSE(p.HasPowerup(PowerupKind::Quad));
    EXPECT_EQ(p.position, Vector3(1, 2, 3));
}

TEST_F(PlayerSystemTest, KillStartsRespawnTimer) {
    Player p;
    p.powerups.Grant(PowerupKind::Haste, 10.0f);

    PlayerSystem::Kill(p, 12.0f, 1.7f);

    EXPECT_FALSE(p.IsAlive());
    EXPECT_EQ(p.health, 0);
    EXPECT_EQ(p.deaths, 1);
    EXPECT_FLOAT_EQ(p.respawnAt, 13.7f);
    EXPECT_FALSE(p.HasPowerup(PowerupKind::Haste));
}
