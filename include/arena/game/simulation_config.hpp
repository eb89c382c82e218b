#pragma once

/// @file simulation_config.hpp
/// @brief Per-match tunables read from configuration.

#include <cstdint>

#include "arena/foundation/config_manager.hpp"
#include "arena/foundation/game_result.hpp"

namespace arena::game {

/// Match and simulation settings.
///
/// Defaults describe a standard free-for-all.  Keys:
/// | Key                            | Field                |
/// |--------------------------------|----------------------|
/// | simulation.tick_rate           | tickRate             |
/// | simulation.max_players         | maxPlayers           |
/// | simulation.seed                | rngSeed              |
/// | match.frag_limit               | fragLimit            |
/// | match.time_limit               | timeLimit            |
/// | match.respawn_delay            | respawnDelay         |
/// | match.spawn_machinegun_ammo    | spawnMachineGunAmmo  |
/// | awards.excellent_window        | excellentWindow      |
/// | awards.accuracy_threshold      | accuracyThreshold    |
/// | awards.accuracy_min_shots      | accuracyMinShots     |
/// | awards.history_window          | awardHistoryWindow   |
struct SimulationConfig {
    uint32_t tickRate = 60;
    uint32_t maxPlayers = 16;
    uint32_t rngSeed = 0x5EED;

    int32_t fragLimit = 20;     ///< 0 disables.
    float timeLimit = 600.0f;   ///< Seconds, 0 disables.
    float respawnDelay = 1.7f;
    int32_t spawnMachineGunAmmo = 100;

    float excellentWindow = 2.0f;
    float accuracyThreshold = 0.8f;
    uint32_t accuracyMinShots = 10;
    float awardHistoryWindow = 30.0f;

    /// Fixed step in seconds.
    [[nodiscard]] float TickInterval() const noexcept {
        return 1.0f / static_cast<float>(tickRate);
    }

    /// Check value ranges.
    /// @return ConfigInvalidValue naming the first offending field.
    [[nodiscard]] foundation::GameResult<void> Validate() const;

    /// Read every key present in @p config over the defaults, then validate.
    [[nodiscard]] static foundation::GameResult<SimulationConfig> FromConfig(
        const foundation::ConfigManager& config);
};

}  // namespace arena::game
