#pragma once

/// @file game_constants.hpp
/// @brief Fixed tuning values of the arena ruleset.
///
/// Per-match tunables (tick rate, limits, respawn delay, award windows)
/// live in SimulationConfig; everything here is part of the ruleset and
/// changes only with a deliberate rules revision.

#include <cstdint>

namespace arena::game {

// ── Player ──────────────────────────────────────────────────────────────

/// Collision sphere radius of a player.
constexpr float kPlayerRadius = 32.0f;

/// Eye offset above the player origin; weapons fire from here.
constexpr float kPlayerEyeHeight = 26.0f;

constexpr int32_t kMaxHealth = 100;
constexpr int32_t kMegaHealthCap = 200;
constexpr int32_t kMaxArmor = 200;
constexpr int32_t kSpawnHealth = 100;
constexpr int32_t kSpawnArmor = 0;
constexpr int32_t kMaxAmmo = 200;

// ── Movement ────────────────────────────────────────────────────────────

constexpr float kGravity = 800.0f;
constexpr float kJumpVelocity = 270.0f;
constexpr float kMaxSpeed = 320.0f;
constexpr float kGroundAccelerate = 10.0f;
constexpr float kAirAccelerate = 1.0f;
constexpr float kFriction = 6.0f;
constexpr float kStopSpeed = 100.0f;
constexpr float kCrouchSpeedScale = 0.25f;
constexpr float kHasteScale = 1.3f;
constexpr float kFlightAccelerate = 8.0f;

/// Fall speed that produces a landing sound/animation.
constexpr float kLandingSpeed = 200.0f;

// ── Animation timers (seconds) ──────────────────────────────────────────

constexpr float kLandingTime = 0.2f;
constexpr float kBarrelSpinTime = 0.5f;
constexpr float kWeaponSwitchTime = 0.45f;

// ── Combat ──────────────────────────────────────────────────────────────

constexpr int32_t kQuadDamageFactor = 3;
constexpr int32_t kGibThreshold = 100;
constexpr int32_t kTelefragDamage = 100000;

constexpr float kKnockbackScale = 6.0f;
constexpr float kKnockbackMax = 1000.0f;
constexpr float kSelfKnockbackScale = 4.0f;
constexpr float kSelfKnockbackMax = 800.0f;

// ── Projectiles ─────────────────────────────────────────────────────────

constexpr float kGrenadeFuse = 2.5f;
constexpr float kGrenadeBounceDamping = 0.65f;
constexpr float kGrenadeSurfaceFriction = 0.9f;

/// Normal speed below which a grenade stops bouncing and rests.
constexpr float kGrenadeRestSpeed = 40.0f;

constexpr float kRocketTrailInterval = 0.05f;

/// Speeds above this are treated as corrupted state.
constexpr float kProjectileSpeedCeiling = 100000.0f;

// ── Items ───────────────────────────────────────────────────────────────

constexpr float kPickupRadius = 64.0f;

constexpr float kRespawnHealthItem = 35.0f;
constexpr float kRespawnArmorItem = 25.0f;
constexpr float kRespawnWeaponItem = 5.0f;
constexpr float kRespawnPowerupItem = 120.0f;

constexpr float kPowerupDuration = 30.0f;

constexpr int32_t kRegenHealthStep = 15;
constexpr int32_t kRegenOverchargeStep = 5;

// ── Visual effects ──────────────────────────────────────────────────────

constexpr float kRailTrailLifetime = 0.5f;
constexpr float kLightningBeamLifetime = 0.15f;
constexpr float kSmokePuffLifetime = 1.0f;
constexpr float kImpactLifetime = 0.3f;

}  // namespace arena::game
