#pragma once

/// @file player_system.hpp
/// @brief Intent application, movement and the legs state machine.

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "arena/ecs/entity_table.hpp"
#include "arena/foundation/types.hpp"
#include "arena/game/map_geometry.hpp"
#include "arena/game/player_components.hpp"

namespace arena::game {

enum class PlayerMotionKind : uint8_t {
    Jump,
    Land,
    WeaponSwitch
};

struct PlayerMotionEvent {
    PlayerMotionKind kind = PlayerMotionKind::Jump;
    foundation::PlayerId player;
    Vector3 position;
    std::optional<WeaponKind> weapon;  ///< WeaponSwitch only.
};

struct PlayerStepResult {
    std::vector<PlayerMotionEvent> events;
};

/// System that applies each living player's intent.
///
/// Execution order per player (ascending id):
///   1. Consume a pending weapon switch request
///   2. Friction, acceleration, jump, gravity/flight
///   3. Integrate and clip against the bounds (floor, walls, ceiling)
///   4. Legs state transition (Ground/Air/Crouching) and animation timers
class PlayerSystem final {
public:
    PlayerSystem(ecs::EntityTable<foundation::PlayerId, Player>& players, const Bounds& bounds);

    PlayerStepResult Execute(float deltaTime, float now);

    [[nodiscard]] std::string_view GetName() const { return "PlayerSystem"; }

    /// Reset @p player to a fresh life at @p position with the spawn
    /// loadout (gauntlet, machinegun holding @p machineGunAmmo rounds).
    static void Spawn(Player& player, const Vector3& position, int32_t machineGunAmmo);

    /// Enter the respawning state.  Health is clamped to 0, powerups are
    /// lost, deaths increments.
    static void Kill(Player& player, float now, float respawnDelay);

    /// Move @p player to @p destination keeping nothing of its momentum.
    static void Teleport(Player& player, const Vector3& destination);

    /// Request a switch to @p weapon; ignored if unowned or already held.
    /// @return true if the switch started.
    static bool BeginSwitch(Player& player, WeaponKind weapon, float now);

private:
    void move(Player& player, float deltaTime, PlayerStepResult& out);
    void clipToBounds(Player& player, bool wasAirborne, PlayerStepResult& out);
    static void updateAnimation(Player& player, LegsState previousLegs, float deltaTime);

    ecs::EntityTable<foundation::PlayerId, Player>& players_;
    Bounds moveBounds_;  ///< Bounds shrunk by the player radius.
};

}  // namespace arena::game
