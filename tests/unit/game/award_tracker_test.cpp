#include <gtest/gtest.h>

#include <utility>
#include <vector>

#include "arena/game/award_tracker.hpp"

using namespace arena::game;
using arena::foundation::PlayerId;

namespace {

KillRecord frag(uint32_t killer, uint32_t victim, float time,
                WeaponKind weapon = WeaponKind::RocketLauncher, bool midAir = false) {
    KillRecord k;
    k.killer = PlayerId(killer);
    k.victim = PlayerId(victim);
    k.weapon = weapon;
    k.time = time;
    k.midAir = midAir;
    return k;
}

std::size_t countKind(const std::vector<AwardRecord>& awards, AwardKind kind) {
    std::size_t n = 0;
    for (const auto& a : awards) {
        n += a.kind == kind ? 1 : 0;
    }
    return n;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Excellent
// ═══════════════════════════════════════════════════════════════════════════

TEST(AwardTrackerTest, ExcellentWithinWindow) {
    AwardTracker tracker;
    std::vector<KillRecord> first = {frag(1, 2, 10.0f)};
    EXPECT_TRUE(tracker.ProcessKills(first).empty());

    std::vector<KillRecord> second = {frag(1, 3, 11.5f)};
    auto awards = tracker.ProcessKills(second);
    ASSERT_EQ(awards.size(), 1u);
    EXPECT_EQ(awards[0].kind, AwardKind::Excellent);
    EXPECT_EQ(awards[0].player, PlayerId(1));
    EXPECT_FLOAT_EQ(awards[0].time, 11.5f);
}

TEST(AwardTrackerTest, NoExcellentOutsideWindow) {
    AwardTracker tracker;
    std::vector<KillRecord> kills = {frag(1, 2, 10.0f), frag(1, 3, 13.0f)};
    EXPECT_EQ(countKind(tracker.ProcessKills(kills), AwardKind::Excellent), 0u);
}

TEST(AwardTrackerTest, WindowEndIsExclusive) {
    AwardTracker tracker;
    std::vector<KillRecord> kills = {frag(1, 2, 10.0f), frag(1, 3, 12.0f)};
    EXPECT_EQ(countKind(tracker.ProcessKills(kills), AwardKind::Excellent), 0u);

    // One tick short of the window still counts.
    std::vector<KillRecord> next = {frag(1, 4, 12.0f + 2.0f - 1.0f / 60.0f)};
    EXPECT_EQ(countKind(tracker.ProcessKills(next), AwardKind::Excellent), 1u);
}

TEST(AwardTrackerTest, PruneAtWindowEndDropsKillTime) {
    AwardTracker tracker;
    std::vector<KillRecord> kills = {frag(1, 2, 1.0f)};
    (void)tracker.ProcessKills(kills);

    tracker.Prune(2.5f);
    EXPECT_EQ(tracker.RecentKillCount(PlayerId(1)), 1u);
    tracker.Prune(3.0f);
    EXPECT_EQ(tracker.RecentKillCount(PlayerId(1)), 0u);
}

TEST(AwardTrackerTest, DoubleKillInOneTickIsExcellent) {
    AwardTracker tracker;
    std::vector<KillRecord> kills = {frag(1, 2, 5.0f), frag(1, 3, 5.0f)};
    EXPECT_EQ(countKind(tracker.ProcessKills(kills), AwardKind::Excellent), 1u);
}

TEST(AwardTrackerTest, SelfAndEnvironmentKillsAwardNothing) {
    AwardTracker tracker;
    KillRecord suicide = frag(1, 1, 1.0f);
    KillRecord world;
    world.victim = PlayerId(2);
    world.time = 1.2f;
    std::vector<KillRecord> kills = {suicide, world, frag(1, 3, 1.5f, WeaponKind::Gauntlet)};

    auto awards = tracker.ProcessKills(kills);
    EXPECT_EQ(countKind(awards, AwardKind::Excellent), 0u);
    EXPECT_EQ(countKind(awards, AwardKind::Humiliation), 1u);
    EXPECT_EQ(tracker.RecentKillCount(PlayerId(1)), 1u);
}

// ═══════════════════════════════════════════════════════════════════════════
// Impressive / Humiliation
// ═══════════════════════════════════════════════════════════════════════════

TEST(AwardTrackerTest, ImpressiveNeedsMidAirRail) {
    AwardTracker tracker;
    std::vector<KillRecord> grounded = {frag(1, 2, 1.0f, WeaponKind::Railgun, false)};
    EXPECT_EQ(countKind(tracker.ProcessKills(grounded), AwardKind::Impressive), 0u);

    std::vector<KillRecord> airborne = {frag(1, 2, 10.0f, WeaponKind::Railgun, true)};
    EXPECT_EQ(countKind(tracker.ProcessKills(airborne), AwardKind::Impressive), 1u);

    std::vector<KillRecord> rocket = {frag(1, 2, 20.0f, WeaponKind::RocketLauncher, true)};
    EXPECT_EQ(countKind(tracker.ProcessKills(rocket), AwardKind::Impressive), 0u);
}

TEST(AwardTrackerTest, GauntletFragHumiliates) {
    AwardTracker tracker;
    std::vector<KillRecord> kills = {frag(4, 2, 3.0f, WeaponKind::Gauntlet)};
    auto awards = tracker.ProcessKills(kills);
    ASSERT_EQ(awards.size(), 1u);
    EXPECT_EQ(awards[0].kind, AwardKind::Humiliation);
    EXPECT_EQ(awards[0].player, PlayerId(4));
}

// ═══════════════════════════════════════════════════════════════════════════
// Accuracy / Perfect
// ═══════════════════════════════════════════════════════════════════════════

TEST(AwardTrackerTest, AccuracyRequiresShotsAndRatio) {
    AwardTracker tracker;
    EXPECT_FALSE(tracker.CheckAccuracy(PlayerId(1), 5, 5, 1.0f).has_value());
    EXPECT_FALSE(tracker.CheckAccuracy(PlayerId(1), 10, 7, 1.0f).has_value());

    auto award = tracker.CheckAccuracy(PlayerId(1), 10, 8, 2.0f);
    ASSERT_TRUE(award.has_value());
    EXPECT_EQ(award->kind, AwardKind::Accuracy);

    // Latched for the rest of the match.
    EXPECT_FALSE(tracker.CheckAccuracy(PlayerId(1), 20, 20, 3.0f).has_value());
}

TEST(AwardTrackerTest, PerfectForDeathlessPlayers) {
    AwardTracker tracker;
    std::vector<std::pair<PlayerId, int32_t>> deaths = {
        {PlayerId(1), 0}, {PlayerId(2), 3}, {PlayerId(3), 0}};

    auto awards = tracker.EvaluateMatchEnd(deaths, 600.0f);

    ASSERT_EQ(awards.size(), 2u);
    EXPECT_EQ(awards[0].player, PlayerId(1));
    EXPECT_EQ(awards[1].player, PlayerId(3));
    EXPECT_EQ(awards[0].kind, AwardKind::Perfect);
}

// ═══════════════════════════════════════════════════════════════════════════
// History
// ═══════════════════════════════════════════════════════════════════════════

TEST(AwardTrackerTest, PruneDropsOldRecordsAndKillTimes) {
    AwardSettings settings;
    settings.historyWindow = 10.0f;
    AwardTracker tracker(settings);

    std::vector<KillRecord> kills = {frag(1, 2, 1.0f, WeaponKind::Gauntlet)};
    (void)tracker.ProcessKills(kills);
    ASSERT_EQ(tracker.History().size(), 1u);

    tracker.Prune(5.0f);
    EXPECT_EQ(tracker.History().size(), 1u);
    EXPECT_EQ(tracker.RecentKillCount(PlayerId(1)), 0u);

    tracker.Prune(12.0f);
    EXPECT_TRUE(tracker.History().empty());
}

TEST(AwardTrackerTest, ForgetResetsAccuracyLatch) {
    AwardTracker tracker;
    ASSERT_TRUE(tracker.CheckAccuracy(PlayerId(1), 10, 10, 1.0f).has_value());
    tracker.Forget(PlayerId(1));
    EXPECT_TRUE(tracker.CheckAccuracy(PlayerId(1), 10, 10, 2.0f).has_value());
}
