/// @file award_tracker.cpp
/// @brief AwardTracker implementation.

#include "arena/game/award_tracker.hpp"

#include <iterator>
#include <string>

#include "arena/foundation/game_logger.hpp"

namespace arena::game {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::PlayerId;

AwardTracker::AwardTracker(AwardSettings settings) : settings_(settings) {}

AwardRecord AwardTracker::record(AwardKind kind, PlayerId player, float time) {
    AwardRecord award{kind, player, time};
    history_.push_back(award);

    LogContext ctx;
    ctx.playerId = player;
    ctx.extra["award"] = std::string(awardKindName(kind));
    ARENA_LOG_CTX(LogLevel::Info, LogCategory::Awards, "award granted", ctx);
    return award;
}

std::vector<AwardRecord> AwardTracker::ProcessKills(std::span<const KillRecord> kills) {
    std::vector<AwardRecord> granted;

    for (const auto& kill : kills) {
        if (!kill.IsFrag()) {
            continue;
        }
        const PlayerId killer = *kill.killer;

        auto& recent = recentKills_[killer];
        while (!recent.empty() && kill.time - recent.front() >= settings_.excellentWindow) {
            recent.pop_front();
        }
        if (!recent.empty()) {
            granted.push_back(record(AwardKind::Excellent, killer, kill.time));
        }
        recent.push_back(kill.time);

        if (kill.weapon == WeaponKind::Railgun && kill.midAir) {
            granted.push_back(record(AwardKind::Impressive, killer, kill.time));
        }
        if (kill.weapon == WeaponKind::Gauntlet) {
            granted.push_back(record(AwardKind::Humiliation, killer, kill.time));
        }
    }
    return granted;
}

std::optional<AwardRecord> AwardTracker::CheckAccuracy(PlayerId player, uint32_t shotsFired,
                                                       uint32_t shotsHit, float now) {
    if (shotsFired < settings_.accuracyMinShots || shotsFired == 0) {
        return std::nullopt;
    }
    if (accuracyGranted_.contains(player)) {
        return std::nullopt;
    }
    const float ratio = static_cast<float>(shotsHit) / static_cast<float>(shotsFired);
    if (ratio < settings_.accuracyThreshold) {
        return std::nullopt;
    }
    accuracyGranted_.insert(player);
    return record(AwardKind::Accuracy, player, now);
}

std::vector<AwardRecord> AwardTracker::EvaluateMatchEnd(
    std::span<const std::pair<PlayerId, int32_t>> deathsByPlayer, float now) {
    std::vector<AwardRecord> granted;
    for (const auto& [player, deaths] : deathsByPlayer) {
        if (deaths == 0) {
            granted.push_back(record(AwardKind::Perfect, player, now));
        }
    }
    return granted;
}

void AwardTracker::Prune(float now) {
    while (!history_.empty() && now - history_.front().time > settings_.historyWindow) {
        history_.pop_front();
    }
    for (auto it = recentKills_.begin(); it != recentKills_.end();) {
        auto& times = it->second;
        while (!times.empty() && now - times.front() >= settings_.excellentWindow) {
            times.pop_front();
        }
        it = times.empty() ? recentKills_.erase(it) : std::next(it);
    }
}

void AwardTracker::Forget(PlayerId player) {
    recentKills_.erase(player);
    accuracyGranted_.erase(player);
}

std::size_t AwardTracker::RecentKillCount(PlayerId player) const {
    auto it = recentKills_.find(player);
    return it == recentKills_.end() ? 0 : it->second.size();
}

} // namespace arena::game
