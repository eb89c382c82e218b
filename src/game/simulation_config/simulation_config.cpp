/// @file simulation_config.cpp
/// @brief SimulationConfig loading and validation.

#include "arena/game/simulation_config.hpp"

#include <string>

namespace arena::game {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

GameResult<void> invalid(const std::string& what) {
    return GameResult<void>::err(GameError(ErrorCode::ConfigInvalidValue, what));
}

/// Overwrite @p field when @p key is present; propagate type errors.
template <typename T>
GameResult<void> readInto(const ConfigManager& config, std::string_view key, T& field) {
    auto value = config.getOr<T>(key, field);
    if (!value) {
        return GameResult<void>::err(value.error());
    }
    field = value.value();
    return GameResult<void>::ok();
}

} // namespace

GameResult<void> SimulationConfig::Validate() const {
    if (tickRate == 0) {
        return invalid("simulation.tick_rate must be positive");
    }
    if (maxPlayers == 0) {
        return invalid("simulation.max_players must be positive");
    }
    if (fragLimit < 0) {
        return invalid("match.frag_limit must not be negative");
    }
    if (timeLimit < 0.0f) {
        return invalid("match.time_limit must not be negative");
    }
    if (respawnDelay < 0.0f) {
        return invalid("match.respawn_delay must not be negative");
    }
    if (spawnMachineGunAmmo < 0) {
        return invalid("match.spawn_machinegun_ammo must not be negative");
    }
    if (excellentWindow <= 0.0f) {
        return invalid("awards.excellent_window must be positive");
    }
    if (accuracyThreshold < 0.0f || accuracyThreshold > 1.0f) {
        return invalid("awards.accuracy_threshold must be within [0, 1]");
    }
    if (awardHistoryWindow < excellentWindow) {
        return invalid("awards.history_window must cover the excellent window");
    }
    return GameResult<void>::ok();
}

GameResult<SimulationConfig> SimulationConfig::FromConfig(const ConfigManager& config) {
    SimulationConfig cfg;

    for (auto result : {
             readInto(config, "simulation.tick_rate", cfg.tickRate),
             readInto(config, "simulation.max_players", cfg.maxPlayers),
             readInto(config, "simulation.seed", cfg.rngSeed),
             readInto(config, "match.frag_limit", cfg.fragLimit),
             readInto(config, "match.time_limit", cfg.timeLimit),
             readInto(config, "match.respawn_delay", cfg.respawnDelay),
             readInto(config, "match.spawn_machinegun_ammo", cfg.spawnMachineGunAmmo),
             readInto(config, "awards.excellent_window", cfg.excellentWindow),
             readInto(config, "awards.accuracy_threshold", cfg.accuracyThreshold),
             readInto(config, "awards.accuracy_min_shots", cfg.accuracyMinShots),
             readInto(config, "awards.history_window", cfg.awardHistoryWindow),
         }) {
        if (!result) {
            return GameResult<SimulationConfig>::err(result.error());
        }
    }

    auto valid = cfg.Validate();
    if (!valid) {
        return GameResult<SimulationConfig>::err(valid.error());
    }
    return GameResult<SimulationConfig>::ok(cfg);
}

} // namespace arena::game
