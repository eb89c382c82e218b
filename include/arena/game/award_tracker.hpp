#pragma once

/// @file award_tracker.hpp
/// @brief Medal detection over a rolling window of kills.

#include <cstdint>
#include <deque>
#include <optional>
#include <span>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "arena/foundation/types.hpp"
#include "arena/game/award_types.hpp"
#include "arena/game/combat_types.hpp"

namespace arena::game {

struct AwardSettings {
    float excellentWindow = 2.0f;   ///< Frags must be strictly closer than this.
    float accuracyThreshold = 0.8f;
    uint32_t accuracyMinShots = 10;
    float historyWindow = 30.0f;
};

/// Tracks per-player kill timestamps and hands out awards.
///
/// Kill history per player is a deque pruned by timestamp, so it never
/// holds more than the frags of one excellent window.
class AwardTracker {
public:
    explicit AwardTracker(AwardSettings settings = {});

    /// Consume one tick's kill feed.  Self, environment and unattributed
    /// kills award nothing.
    std::vector<AwardRecord> ProcessKills(std::span<const KillRecord> kills);

    /// Accuracy medal, granted at most once per player per match.
    std::optional<AwardRecord> CheckAccuracy(foundation::PlayerId player, uint32_t shotsFired,
                                             uint32_t shotsHit, float now);

    /// Perfect for every listed player with zero deaths.
    std::vector<AwardRecord> EvaluateMatchEnd(
        std::span<const std::pair<foundation::PlayerId, int32_t>> deathsByPlayer, float now);

    /// Drop award records older than the history window.
    void Prune(float now);

    /// Remove a player that left the match.
    void Forget(foundation::PlayerId player);

    [[nodiscard]] const std::deque<AwardRecord>& History() const noexcept { return history_; }

    /// Number of recorded kill timestamps for @p player (within the window).
    [[nodiscard]] std::size_t RecentKillCount(foundation::PlayerId player) const;

    [[nodiscard]] const AwardSettings& Settings() const noexcept { return settings_; }

private:
    AwardRecord record(AwardKind kind, foundation::PlayerId player, float time);

    AwardSettings settings_;
    std::unordered_map<foundation::PlayerId, std::deque<float>> recentKills_;
    std::unordered_set<foundation::PlayerId> accuracyGranted_;
    std::deque<AwardRecord> history_;
};

}  // namespace arena::game
