#pragma once

/// @file weapon_types.hpp
/// @brief Weapon and projectile enumerations plus the immutable stat block.

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace arena::game {

/// Every weapon in the ruleset.  The set is closed: adding a kind is a
/// schema change touching the catalog, items and projectile code.
enum class WeaponKind : uint8_t {
    Gauntlet,
    MachineGun,
    Shotgun,
    GrenadeLauncher,
    RocketLauncher,
    Lightning,
    Railgun,
    Plasmagun,
    BFG
};

/// Number of weapon kinds (for array sizing).
constexpr std::size_t kWeaponKindCount = 9;

/// Simulated projectile bodies.
enum class ProjectileKind : uint8_t {
    Rocket,
    Grenade,
    Plasma,
    BFG
};

constexpr std::size_t kProjectileKindCount = 4;

/// How a shot is resolved.
enum class FireMode : uint8_t {
    Hitscan,    ///< Instant ray trace.
    Projectile  ///< Spawns a travelling body.
};

/// Fixed per-weapon numbers.  Looked up from WeaponCatalog, never owned
/// per player.
struct WeaponStats {
    int32_t damage = 0;          ///< Per pellet / per projectile.
    uint32_t pellets = 1;        ///< Rays per shot (hitscan only).
    float refireInterval = 0.0f; ///< Seconds between shots.
    int32_t ammoCost = 0;        ///< 0 = infinite ammo (melee).
    FireMode mode = FireMode::Hitscan;
    float splashRadius = 0.0f;   ///< 0 = no splash.
    float range = 0.0f;          ///< Hitscan max range.
    float projectileSpeed = 0.0f;
    float spread = 0.0f;         ///< Max angular deviation in radians.
    bool penetrating = false;    ///< Ray continues through players.
    int32_t pickupAmmo = 0;      ///< Ammo granted by the weapon item.
    std::optional<ProjectileKind> projectile;
};

constexpr std::string_view weaponKindName(WeaponKind kind) {
    constexpr std::array<std::string_view, kWeaponKindCount> names = {
        "Gauntlet", "MachineGun", "Shotgun", "GrenadeLauncher", "RocketLauncher",
        "Lightning", "Railgun", "Plasmagun", "BFG"
    };
    auto idx = static_cast<std::size_t>(kind);
    return idx < kWeaponKindCount ? names[idx] : "Unknown";
}

constexpr std::string_view projectileKindName(ProjectileKind kind) {
    switch (kind) {
        case ProjectileKind::Rocket:  return "Rocket";
        case ProjectileKind::Grenade: return "Grenade";
        case ProjectileKind::Plasma:  return "Plasma";
        case ProjectileKind::BFG:     return "BFG";
    }
    return "Unknown";
}

}  // namespace arena::game
