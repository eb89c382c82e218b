#pragma once

/// @file weapon_catalog.hpp
/// @brief Weapon stat lookup and firing.

#include <cstdint>
#include <optional>
#include <random>
#include <variant>
#include <vector>

#include "arena/game/math_types.hpp"
#include "arena/game/player_components.hpp"
#include "arena/game/weapon_types.hpp"

namespace arena::game {

/// Why a fire request did nothing.
enum class FireRejection : uint8_t {
    Dead,
    NotOwned,
    Switching,  ///< Weapon switch still in progress.
    Cooldown,   ///< Refire interval not elapsed.
    NoAmmo
};

struct NotFired {
    FireRejection reason = FireRejection::Cooldown;
};

/// Instant shot: one ray per pellet, each already spread.
struct HitscanFire {
    std::vector<Ray> rays;
    int32_t damage = 0;  ///< Per ray.
    bool penetrating = false;
};

/// Shot that spawns a travelling body.
struct ProjectileFire {
    ProjectileKind kind = ProjectileKind::Rocket;
    Vector3 origin;
    Vector3 velocity;
    int32_t damage = 0;
    float splashRadius = 0.0f;
};

using FireOutcome = std::variant<NotFired, HitscanFire, ProjectileFire>;

/// Immutable weapon catalog.
///
/// Stats are a total function over the closed WeaponKind enumeration; an
/// out-of-range kind is a programming error.
///
/// Usage:
/// @code
///   auto outcome = WeaponCatalog::Fire(player, player.heldWeapon, aim, now, rng);
///   if (auto* shot = std::get_if<HitscanFire>(&outcome)) {
///       // trace shot->rays
///   }
/// @endcode
class WeaponCatalog {
public:
    WeaponCatalog() = delete;

    [[nodiscard]] static const WeaponStats& StatsFor(WeaponKind kind);

    /// Refire interval for @p player, shortened by Haste.
    [[nodiscard]] static float RefireInterval(const Player& player, WeaponKind kind);

    /// Why @p player cannot fire @p kind at @p now, or nullopt if it can.
    [[nodiscard]] static std::optional<FireRejection> CheckFire(const Player& player,
                                                                WeaponKind kind, float now);

    /// Alive, owned, not switching, refire elapsed, enough ammo.
    [[nodiscard]] static bool CanFire(const Player& player, WeaponKind kind, float now);

    /// Fire @p kind along @p aim.
    ///
    /// On success deducts ammo, restarts the weapon's refire timer, counts
    /// the shot for accuracy and, for the machinegun, restarts the barrel
    /// spin.  A rejected shot leaves @p player untouched.
    ///
    /// @param aim  Origin and direction; maxRange is replaced by the weapon's.
    /// @param rng  Spread source (shotgun, machinegun).
    static FireOutcome Fire(Player& player, WeaponKind kind, const Ray& aim, float now,
                            std::mt19937& rng);

    /// Deviate @p direction by up to @p spread radians on two axes.
    [[nodiscard]] static Vector3 ApplySpread(const Vector3& direction, float spread,
                                             std::mt19937& rng);
};

}  // namespace arena::game
