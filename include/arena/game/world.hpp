#pragma once

/// @file world.hpp
/// @brief World: owns every entity and runs the fixed-order tick.

#include <cstdint>
#include <deque>
#include <random>
#include <string>
#include <vector>

#include "arena/ecs/entity_table.hpp"
#include "arena/foundation/game_result.hpp"
#include "arena/foundation/types.hpp"
#include "arena/game/audio_events.hpp"
#include "arena/game/award_tracker.hpp"
#include "arena/game/combat_types.hpp"
#include "arena/game/hitscan_resolver.hpp"
#include "arena/game/item_components.hpp"
#include "arena/game/map_geometry.hpp"
#include "arena/game/match_state.hpp"
#include "arena/game/player_components.hpp"
#include "arena/game/projectile_components.hpp"
#include "arena/game/simulation_config.hpp"
#include "arena/game/visual_events.hpp"
#include "arena/game/weapon_catalog.hpp"

namespace arena::game {

/// Immutable output of one tick, handed to audio/render consumers.
struct TickEvents {
    uint64_t tick = 0;
    float time = 0.0f;
    std::vector<AudioEvent> audio;
    std::vector<VisualEvent> visual;
    std::vector<CombatEvent> combat;   ///< Every hit resolved this tick, in order.
    std::vector<KillRecord> kills;
    std::vector<AwardRecord> awards;
    bool matchEnded = false;
    MatchEndReason endReason = MatchEndReason::None;
};

/// Authoritative simulation state and tick orchestrator.
///
/// Owns players, projectiles and items by value in id-keyed tables;
/// cross references are ids resolved on every use.  Single-threaded: all
/// mutation happens inside Tick() and the API calls below, never
/// concurrently.
///
/// Tick order:
///   1. Respawn players whose timer has run out
///   2. Apply intents (PlayerSystem)
///   3. Fire weapons; hitscan shots resolve now, projectiles are queued
///   4. Advance existing projectiles, then insert the queued ones
///   5. Resolve combat: pending telefrags first, then hits in order
///   6. Items: powerup timers, respawns, pickups
///   7. Awards
///   8. Match end check at the tick boundary
///
/// Usage:
/// @code
///   World world(config, map);
///   auto id = world.AddPlayer("sarge").value();
///   world.SetIntent(id, intent);
///   while (true) {
///       auto events = world.Tick();
///       if (!events || events.value().matchEnded) break;
///   }
/// @endcode
class World {
public:
    using PlayerTable = ecs::EntityTable<foundation::PlayerId, Player>;
    using ProjectileTable = ecs::EntityTable<foundation::ProjectileId, Projectile>;
    using ItemTable = ecs::EntityTable<foundation::ItemId, Item>;

    /// Items listed in @p map are spawned immediately.
    World(SimulationConfig config, MapGeometry map);

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    // ── Population ──────────────────────────────────────────────────────

    /// Add a player at a spawn point.  Overlapping players are telefragged
    /// in the next tick.
    /// @return PlayerLimitReached, NoSpawnPoints or the new id.
    foundation::GameResult<foundation::PlayerId> AddPlayer(std::string name);

    /// Remove a player.  Its projectiles keep flying without an owner.
    foundation::GameResult<void> RemovePlayer(foundation::PlayerId id);

    foundation::GameResult<foundation::ItemId> SpawnItem(ItemKind kind, const Vector3& position);

    // ── Control ─────────────────────────────────────────────────────────

    /// Replace a player's intent.  The intent persists until replaced.
    foundation::GameResult<void> SetIntent(foundation::PlayerId id, const PlayerIntent& intent);

    /// Move a living player; anyone at the destination is telefragged in
    /// the next tick.
    foundation::GameResult<void> TeleportPlayer(foundation::PlayerId id,
                                                const Vector3& destination);

    /// Advance one fixed step.
    /// @return MatchOver once the match has ended.
    foundation::GameResult<TickEvents> Tick();

    // ── Read access ─────────────────────────────────────────────────────

    [[nodiscard]] const Player* FindPlayer(foundation::PlayerId id) const {
        return players_.Find(id);
    }
    [[nodiscard]] const PlayerTable& Players() const noexcept { return players_; }
    [[nodiscard]] const ProjectileTable& Projectiles() const noexcept { return projectiles_; }
    [[nodiscard]] const ItemTable& Items() const noexcept { return items_; }
    [[nodiscard]] const MatchState& Match() const noexcept { return match_; }
    [[nodiscard]] const MapGeometry& Map() const noexcept { return map_; }
    [[nodiscard]] const SimulationConfig& Config() const noexcept { return config_; }
    [[nodiscard]] const std::deque<AwardRecord>& AwardHistory() const noexcept {
        return awards_.History();
    }
    [[nodiscard]] uint32_t Seed() const noexcept { return config_.rngSeed; }
    [[nodiscard]] float Time() const noexcept { return match_.elapsed; }

private:
    /// Per-tick scratch state.
    struct TickContext {
        float now = 0.0f;
        float dt = 0.0f;
        AudioEventQueue audio;
        TickEvents events;
        std::vector<CombatEvent> pendingHits;
        std::vector<Projectile> newProjectiles;
    };

    [[nodiscard]] Vector3 selectSpawnPoint(foundation::PlayerId spawning) const;

    void respawnPlayers(TickContext& ctx);
    void applyIntents(TickContext& ctx);
    void fireWeapons(TickContext& ctx);
    void fireWeapon(Player& player, TickContext& ctx);
    void simulateProjectiles(TickContext& ctx);
    void resolveCombat(TickContext& ctx);
    void applyHit(const CombatEvent& event, TickContext& ctx);
    void updateItems(TickContext& ctx);
    void updateAwards(TickContext& ctx);
    void checkMatchEnd(TickContext& ctx);

    void queueTelefragCheck(foundation::PlayerId id, const Vector3& position);
    [[nodiscard]] foundation::ProjectileId allocateProjectileId();
    [[nodiscard]] std::vector<HitscanTarget> hitscanTargets(foundation::PlayerId shooter) const;

    SimulationConfig config_;
    MapGeometry map_;
    MatchState match_;

    PlayerTable players_;
    ProjectileTable projectiles_;
    ItemTable items_;

    AwardTracker awards_;
    std::mt19937 rng_;

    uint32_t nextPlayerId_ = 1;
    uint32_t nextProjectileId_ = 1;
    /// Ids of removed projectiles, reused so the projectile table's sparse
    /// index stays as large as the peak live count rather than every shot
    /// ever fired.
    std::vector<foundation::ProjectileId> freeProjectileIds_;
    uint32_t nextItemId_ = 1;

    /// Arrival spot of a player that spawned or teleported since the last
    /// combat stage.
    struct PendingTelefrag {
        foundation::PlayerId player;
        Vector3 position;
    };
    std::vector<PendingTelefrag> pendingTelefrags_;
};

}  // namespace arena::game
