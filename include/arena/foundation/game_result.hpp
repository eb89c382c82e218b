#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> alias binding Result to GameError.

#include "arena/core/result.hpp"
#include "arena/foundation/game_error.hpp"

namespace arena::foundation {

/// Result type specialized with GameError.
///
/// Example:
/// @code
///   GameResult<int> readTickRate(const ConfigManager& cfg) {
///       auto rate = cfg.get<int>("simulation.tick_rate");
///       if (!rate) {
///           return GameResult<int>::err(rate.error());
///       }
///       return GameResult<int>::ok(rate.value());
///   }
/// @endcode
template <typename T>
using GameResult = arena::Result<T, GameError>;

}  // namespace arena::foundation
