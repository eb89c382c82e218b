#pragma once

/// @file player_components.hpp
/// @brief Player state and per-tick intent.
///
/// Players are stored by value in the World's EntityTable<PlayerId, Player>.
/// The struct is plain data with a few small transition helpers; movement
/// and state-machine logic lives in PlayerSystem.

#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include "arena/foundation/types.hpp"
#include "arena/game/game_constants.hpp"
#include "arena/game/item_types.hpp"
#include "arena/game/math_types.hpp"
#include "arena/game/weapon_types.hpp"

namespace arena::game {

/// Leg/movement state machine.
enum class LegsState : uint8_t {
    Ground,    ///< Standing or running on the floor.
    Air,       ///< Jumping, falling or knocked into the air.
    Crouching  ///< On the floor, crouch held.
};

/// Alive/dead life cycle.
enum class LifeState : uint8_t {
    Alive,
    Respawning  ///< Dead, waiting for respawnAt.
};

/// Input for one player, supplied by the input collaborator.
///
/// Intent persists between ticks until replaced; @c switchTo is a
/// one-shot request consumed by the tick that handles it.
struct PlayerIntent {
    Vector3 move;                   ///< Desired horizontal direction, |move| <= 1.
    Vector3 aim{0.0f, 0.0f, 1.0f};  ///< View direction.
    bool fire = false;
    bool jump = false;
    bool crouch = false;
    std::optional<WeaponKind> switchTo;
};

/// Remaining seconds per powerup (0 = inactive).
struct PowerupTimers {
    std::array<float, kPowerupKindCount> remaining{};

    [[nodiscard]] bool Has(PowerupKind kind) const noexcept {
        return remaining[static_cast<std::size_t>(kind)] > 0.0f;
    }

    [[nodiscard]] float Remaining(PowerupKind kind) const noexcept {
        return remaining[static_cast<std::size_t>(kind)];
    }

    /// Start or refresh a powerup to @p duration seconds.
    void Grant(PowerupKind kind, float duration) noexcept {
        remaining[static_cast<std::size_t>(kind)] = duration;
    }

    void Clear() noexcept { remaining.fill(0.0f); }
};

/// Owned weapons, ammo and per-weapon refire deadlines.
struct WeaponInventory {
    std::array<bool, kWeaponKindCount> owned{};
    std::array<int32_t, kWeaponKindCount> ammo{};
    std::array<float, kWeaponKindCount> readyAt{};

    [[nodiscard]] bool Owns(WeaponKind kind) const noexcept {
        return owned[static_cast<std::size_t>(kind)];
    }

    [[nodiscard]] int32_t Ammo(WeaponKind kind) const noexcept {
        return ammo[static_cast<std::size_t>(kind)];
    }

    [[nodiscard]] float ReadyAt(WeaponKind kind) const noexcept {
        return readyAt[static_cast<std::size_t>(kind)];
    }

    void Give(WeaponKind kind, int32_t rounds) noexcept {
        auto idx = static_cast<std::size_t>(kind);
        owned[idx] = true;
        ammo[idx] = std::min(ammo[idx] + rounds, kMaxAmmo);
    }

    void Clear() noexcept {
        owned.fill(false);
        ammo.fill(0);
        readyAt.fill(0.0f);
    }
};

/// Cosmetic animation timers read by the renderer.
struct AnimationState {
    float legsTimer = 0.0f;     ///< Time in the current legs state/moving combination.
    float landingTimer = 0.0f;  ///< Counts down after touching the floor.
    float barrelSpin = 0.0f;    ///< Machinegun barrel spin, counts down.
    bool moving = false;
};

/// A player in the arena.
struct Player {
    foundation::PlayerId id;
    std::string name;

    Vector3 position;
    Vector3 velocity;

    /// Can go negative while a lethal hit is resolved; clamped to 0 on death.
    int32_t health = kSpawnHealth;
    int32_t armor = kSpawnArmor;

    WeaponInventory weapons;
    WeaponKind heldWeapon = WeaponKind::MachineGun;
    float switchReadyAt = 0.0f;

    LegsState legs = LegsState::Ground;
    AnimationState animation;
    PowerupTimers powerups;
    float regenAccumulator = 0.0f;

    PlayerIntent intent;
    bool firePressedLastTick = false;

    LifeState life = LifeState::Alive;
    float respawnAt = 0.0f;

    int32_t frags = 0;
    int32_t deaths = 0;
    uint32_t shotsFired = 0;
    uint32_t shotsHit = 0;

    [[nodiscard]] bool IsAlive() const noexcept { return life == LifeState::Alive; }
    [[nodiscard]] bool IsAirborne() const noexcept { return legs == LegsState::Air; }

    [[nodiscard]] bool HasPowerup(PowerupKind kind) const noexcept {
        return powerups.Has(kind);
    }

    /// Point that weapons fire from.
    [[nodiscard]] Vector3 EyePosition() const noexcept {
        return position + Vector3{0.0f, kPlayerEyeHeight, 0.0f};
    }

    /// Accuracy ratio, 0 when nothing has been fired.
    [[nodiscard]] float Accuracy() const noexcept {
        return shotsFired > 0 ? static_cast<float>(shotsHit) / static_cast<float>(shotsFired)
                              : 0.0f;
    }
};

}  // namespace arena::game
