#pragma once

/// @file item_system.hpp
/// @brief Pickups, item respawn scheduling and powerup timers.

#include <cstdint>
#include <string_view>
#include <vector>

#include "arena/ecs/entity_table.hpp"
#include "arena/foundation/types.hpp"
#include "arena/game/item_components.hpp"
#include "arena/game/player_components.hpp"

namespace arena::game {

enum class PickupOutcome : uint8_t {
    PickedUp,
    Inactive,    ///< Item depleted, waiting to respawn.
    OutOfRange,
    Refused,     ///< Player already full (health, armor, ammo).
    PlayerDead
};

struct PickupResult {
    PickupOutcome outcome = PickupOutcome::Inactive;
    ItemKind kind = ItemKind::Health25;

    [[nodiscard]] bool Succeeded() const noexcept { return outcome == PickupOutcome::PickedUp; }
};

struct PickupRecord {
    foundation::PlayerId player;
    foundation::ItemId item;
    ItemKind kind = ItemKind::Health25;
    Vector3 position;
};

struct PowerupExpiry {
    foundation::PlayerId player;
    PowerupKind powerup = PowerupKind::Quad;
};

struct ItemStepResult {
    std::vector<PickupRecord> pickups;
    std::vector<foundation::ItemId> respawned;
    std::vector<PowerupExpiry> expired;
};

/// System that runs the item stage of a tick.
///
/// Execution order within a single tick:
///   1. Count down powerups (and apply Regeneration); report expiries
///   2. Reactivate items whose respawn deadline has passed
///   3. Resolve pickups, players in ascending id, items in ascending id,
///      so a contested item goes to the lowest id
class ItemSystem final {
public:
    ItemSystem(ecs::EntityTable<foundation::ItemId, Item>& items,
               ecs::EntityTable<foundation::PlayerId, Player>& players);

    ItemStepResult Execute(float deltaTime, float now);

    [[nodiscard]] std::string_view GetName() const { return "ItemSystem"; }

    /// Attempt to pick up @p item.  On success applies the item to
    /// @p player, deactivates it and schedules its respawn.
    static PickupResult TryPickup(Player& player, Item& item, float now);

    /// Whether @p player would gain anything from @p kind.
    [[nodiscard]] static bool WouldAccept(const Player& player, ItemKind kind);

    /// Respawn delay by item family.
    [[nodiscard]] static float RespawnTime(ItemKind kind);

private:
    void updatePowerups(float deltaTime, ItemStepResult& out);
    void updateRespawns(float now, ItemStepResult& out);
    void resolvePickups(float now, ItemStepResult& out);

    static void applyItem(Player& player, ItemKind kind);

    ecs::EntityTable<foundation::ItemId, Item>& items_;
    ecs::EntityTable<foundation::PlayerId, Player>& players_;
};

}  // namespace arena::game
