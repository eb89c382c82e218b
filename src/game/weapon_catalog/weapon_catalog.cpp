/// @file weapon_catalog.cpp
/// @brief WeaponCatalog stat table and firing.

#include "arena/game/weapon_catalog.hpp"

#include <array>
#include <cassert>

#include "arena/foundation/game_logger.hpp"
#include "arena/game/game_constants.hpp"

namespace arena::game {

using foundation::LogCategory;

namespace {

WeaponStats hitscan(int32_t damage, float refire, int32_t cost, float range,
                    int32_t pickupAmmo, uint32_t pellets = 1, float spread = 0.0f,
                    bool penetrating = false) {
    WeaponStats s;
    s.damage = damage;
    s.pellets = pellets;
    s.refireInterval = refire;
    s.ammoCost = cost;
    s.mode = FireMode::Hitscan;
    s.range = range;
    s.spread = spread;
    s.penetrating = penetrating;
    s.pickupAmmo = pickupAmmo;
    return s;
}

WeaponStats projectile(ProjectileKind kind, int32_t damage, float refire, float splashRadius,
                       float speed, int32_t pickupAmmo) {
    WeaponStats s;
    s.damage = damage;
    s.refireInterval = refire;
    s.ammoCost = 1;
    s.mode = FireMode::Projectile;
    s.splashRadius = splashRadius;
    s.projectileSpeed = speed;
    s.pickupAmmo = pickupAmmo;
    s.projectile = kind;
    return s;
}

/// Indexed by WeaponKind.
const std::array<WeaponStats, kWeaponKindCount>& statTable() {
    static const std::array<WeaponStats, kWeaponKindCount> table = {
        hitscan(50, 0.4f, 0, 48.0f, 0),                               // Gauntlet
        hitscan(7, 0.1f, 1, 8192.0f, 50, 1, 0.025f),                  // MachineGun
        hitscan(10, 1.0f, 1, 4000.0f, 10, 11, 0.1f),                  // Shotgun
        projectile(ProjectileKind::Grenade, 100, 0.8f, 150.0f, 700.0f, 10),
        projectile(ProjectileKind::Rocket, 120, 0.8f, 120.0f, 900.0f, 10),
        hitscan(8, 0.05f, 1, 768.0f, 100),                            // Lightning
        hitscan(100, 1.5f, 1, 8192.0f, 10, 1, 0.0f, true),            // Railgun
        projectile(ProjectileKind::Plasma, 20, 0.1f, 20.0f, 2000.0f, 50),
        projectile(ProjectileKind::BFG, 100, 0.2f, 120.0f, 2000.0f, 20),
    };
    return table;
}

} // namespace

const WeaponStats& WeaponCatalog::StatsFor(WeaponKind kind) {
    auto idx = static_cast<std::size_t>(kind);
    assert(idx < kWeaponKindCount && "WeaponKind out of range");
    return statTable()[idx];
}

float WeaponCatalog::RefireInterval(const Player& player, WeaponKind kind) {
    const float base = StatsFor(kind).refireInterval;
    return player.HasPowerup(PowerupKind::Haste) ? base / kHasteScale : base;
}

std::optional<FireRejection> WeaponCatalog::CheckFire(const Player& player, WeaponKind kind,
                                                      float now) {
    if (!player.IsAlive()) {
        return FireRejection::Dead;
    }
    if (!player.weapons.Owns(kind)) {
        return FireRejection::NotOwned;
    }
    if (now < player.switchReadyAt) {
        return FireRejection::Switching;
    }
    if (now < player.weapons.ReadyAt(kind)) {
        return FireRejection::Cooldown;
    }
    const auto& stats = StatsFor(kind);
    if (stats.ammoCost > 0 && player.weapons.Ammo(kind) < stats.ammoCost) {
        return FireRejection::NoAmmo;
    }
    return std::nullopt;
}

bool WeaponCatalog::CanFire(const Player& player, WeaponKind kind, float now) {
    return !CheckFire(player, kind, now).has_value();
}

FireOutcome WeaponCatalog::Fire(Player& player, WeaponKind kind, const Ray& aim, float now,
                                std::mt19937& rng) {
    if (auto rejection = CheckFire(player, kind, now)) {
        return NotFired{*rejection};
    }

    const auto& stats = StatsFor(kind);
    const auto idx = static_cast<std::size_t>(kind);
    player.weapons.ammo[idx] -= stats.ammoCost;
    player.weapons.readyAt[idx] = now + RefireInterval(player, kind);
    ++player.shotsFired;

    if (kind == WeaponKind::MachineGun) {
        player.animation.barrelSpin = kBarrelSpinTime;
    }

    const Vector3 forward = aim.direction.Normalized();

    switch (stats.mode) {
        case FireMode::Hitscan: {
            HitscanFire shot;
            shot.damage = stats.damage;
            shot.penetrating = stats.penetrating;
            shot.rays.reserve(stats.pellets);
            for (uint32_t i = 0; i < stats.pellets; ++i) {
                auto dir = stats.spread > 0.0f ? ApplySpread(forward, stats.spread, rng) : forward;
                shot.rays.push_back(Ray::Make(aim.origin, dir, stats.range));
            }
            return shot;
        }
        case FireMode::Projectile: {
            assert(stats.projectile.has_value());
            ProjectileFire shot;
            shot.kind = *stats.projectile;
            shot.origin = aim.origin;
            shot.velocity = forward * stats.projectileSpeed;
            shot.damage = stats.damage;
            shot.splashRadius = stats.splashRadius;
            return shot;
        }
    }

    ARENA_LOG_ERROR(LogCategory::Weapon, "unreachable fire mode");
    return NotFired{FireRejection::NotOwned};
}

Vector3 WeaponCatalog::ApplySpread(const Vector3& direction, float spread, std::mt19937& rng) {
    // Build a basis around the aim; fall back to X when aiming straight up/down.
    Vector3 right = direction.Cross(Vector3::Up());
    if (right.LengthSquared() < 1e-6f) {
        right = Vector3{1.0f, 0.0f, 0.0f};
    }
    right = right.Normalized();
    const Vector3 up = right.Cross(direction).Normalized();

    std::uniform_real_distribution<float> deviation(-spread, spread);
    const float r = deviation(rng);
    const float u = deviation(rng);
    return (direction + right * r + up * u).Normalized();
}

} // namespace arena::game
