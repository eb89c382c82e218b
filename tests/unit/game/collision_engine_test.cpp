#include <gtest/gtest.h>

#include "arena/game/collision_engine.hpp"

using namespace arena::game;
using arena::foundation::PlayerId;

namespace {

Player& addPlayer(arena::ecs::EntityTable<PlayerId, Player>& players, uint32_t id,
                  const Vector3& pos) {
    auto& p = players.Emplace(PlayerId(id));
    p.id = PlayerId(id);
    p.position = pos;
    return p;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Sphere primitives
// ═══════════════════════════════════════════════════════════════════════════

TEST(CollisionEngineTest, SpheresOverlapIncludesTouching) {
    EXPECT_TRUE(CollisionEngine::SpheresOverlap({0, 0, 0}, 32.0f, {64, 0, 0}, 32.0f));
    EXPECT_FALSE(CollisionEngine::SpheresOverlap({0, 0, 0}, 32.0f, {64.5f, 0, 0}, 32.0f));
}

TEST(CollisionEngineTest, PointInSphere) {
    EXPECT_TRUE(CollisionEngine::PointInSphere({10, 0, 0}, {0, 0, 0}, 10.0f));
    EXPECT_FALSE(CollisionEngine::PointInSphere({10, 1, 0}, {0, 0, 0}, 10.0f));
}

TEST(CollisionEngineTest, SegmentHitsSphereAtFrontFace) {
    auto t = CollisionEngine::SegmentSphereIntersection({0, 0, 0}, {200, 0, 0},
                                                        {100, 0, 0}, 20.0f);
    ASSERT_TRUE(t.has_value());
    EXPECT_NEAR(*t, 0.4f, 1e-4f);
}

TEST(CollisionEngineTest, SegmentStartingInsideReportsZero) {
    auto t = CollisionEngine::SegmentSphereIntersection({100, 0, 0}, {300, 0, 0},
                                                        {100, 0, 0}, 20.0f);
    ASSERT_TRUE(t.has_value());
    EXPECT_FLOAT_EQ(*t, 0.0f);
}

TEST(CollisionEngineTest, SegmentStoppingShortMisses) {
    EXPECT_FALSE(CollisionEngine::SegmentSphereIntersection({0, 0, 0}, {50, 0, 0},
                                                            {100, 0, 0}, 20.0f));
    EXPECT_FALSE(CollisionEngine::SegmentSphereIntersection({0, 0, 0}, {200, 0, 0},
                                                            {100, 50, 0}, 20.0f));
}

TEST(CollisionEngineTest, RayRespectsMaxRange) {
    auto ray = Ray::Make({0, 0, 0}, {1, 0, 0}, 500.0f);
    auto hit = CollisionEngine::RaySphereIntersection(ray, {300, 0, 0}, 32.0f);
    ASSERT_TRUE(hit.has_value());
    EXPECT_NEAR(*hit, 268.0f, 1e-3f);

    auto shortRay = Ray::Make({0, 0, 0}, {1, 0, 0}, 100.0f);
    EXPECT_FALSE(CollisionEngine::RaySphereIntersection(shortRay, {300, 0, 0}, 32.0f));
}

TEST(CollisionEngineTest, RayFromInsideHitsAtZero) {
    auto ray = Ray::Make({0, 0, 0}, {1, 0, 0}, 500.0f);
    auto hit = CollisionEngine::RaySphereIntersection(ray, {10, -20, 0}, 32.0f);
    ASSERT_TRUE(hit.has_value());
    EXPECT_FLOAT_EQ(*hit, 0.0f);
}

TEST(CollisionEngineTest, RayBehindOriginMisses) {
    auto ray = Ray::Make({0, 0, 0}, {1, 0, 0}, 500.0f);
    EXPECT_FALSE(CollisionEngine::RaySphereIntersection(ray, {-100, 0, 0}, 32.0f));
}

// ═══════════════════════════════════════════════════════════════════════════
// Explosion falloff
// ═══════════════════════════════════════════════════════════════════════════

TEST(CollisionEngineTest, FalloffEndpoints) {
    EXPECT_FLOAT_EQ(CollisionEngine::ExplosionFalloff(120.0f, 0.0f, 120.0f), 120.0f);
    EXPECT_FLOAT_EQ(CollisionEngine::ExplosionFalloff(120.0f, 120.0f, 120.0f), 0.0f);
    EXPECT_FLOAT_EQ(CollisionEngine::ExplosionFalloff(120.0f, 500.0f, 120.0f), 0.0f);
    EXPECT_FLOAT_EQ(CollisionEngine::ExplosionFalloff(120.0f, 60.0f, 120.0f), 60.0f);
}

TEST(CollisionEngineTest, FalloffIsMonotonic) {
    float previous = CollisionEngine::ExplosionFalloff(100.0f, 0.0f, 150.0f);
    for (float d = 5.0f; d <= 160.0f; d += 5.0f) {
        float current = CollisionEngine::ExplosionFalloff(100.0f, d, 150.0f);
        EXPECT_LE(current, previous) << "distance " << d;
        previous = current;
    }
}

TEST(CollisionEngineTest, ZeroRadiusHasNoSplash) {
    EXPECT_FLOAT_EQ(CollisionEngine::ExplosionFalloff(100.0f, 0.0f, 0.0f), 0.0f);
}

// ═══════════════════════════════════════════════════════════════════════════
// Splash targets
// ═══════════════════════════════════════════════════════════════════════════

TEST(CollisionEngineTest, SplashMeasuresToBodySurface) {
    arena::ecs::EntityTable<PlayerId, Player> players;
    addPlayer(players, 1, {92, 0, 0});  // surface 60 away

    auto targets = CollisionEngine::SplashTargets(players, {0, 0, 0}, 120.0f, 120);
    ASSERT_EQ(targets.size(), 1u);
    EXPECT_NEAR(targets[0].distance, 60.0f, 1e-3f);
    EXPECT_EQ(targets[0].damage, 60);
}

TEST(CollisionEngineTest, SplashSkipsDeadAndOutOfRangeInIdOrder) {
    arena::ecs::EntityTable<PlayerId, Player> players;
    addPlayer(players, 5, {10, 0, 0});
    addPlayer(players, 2, {0, 0, 20});
    addPlayer(players, 3, {1000, 0, 0});
    addPlayer(players, 4, {0, 0, -10}).life = LifeState::Respawning;

    auto targets = CollisionEngine::SplashTargets(players, {0, 0, 0}, 120.0f, 100);
    ASSERT_EQ(targets.size(), 2u);
    EXPECT_EQ(targets[0].player, PlayerId(2));
    EXPECT_EQ(targets[1].player, PlayerId(5));
    EXPECT_EQ(targets[0].damage, 100);
}

TEST(CollisionEngineTest, SplashDropsSubUnitDamage) {
    arena::ecs::EntityTable<PlayerId, Player> players;
    // Surface at 119.5 of 120: 20 * (0.5/120) < 1.
    addPlayer(players, 1, {151.5f, 0, 0});
    EXPECT_TRUE(CollisionEngine::SplashTargets(players, {0, 0, 0}, 120.0f, 20).empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// Bounds
// ═══════════════════════════════════════════════════════════════════════════

TEST(CollisionEngineTest, SegmentInsideBoundsHasNoHit) {
    Bounds box{{-100, 0, -100}, {100, 200, 100}};
    EXPECT_FALSE(CollisionEngine::SegmentBoundsHit({0, 50, 0}, {50, 50, 0}, box));
}

TEST(CollisionEngineTest, SegmentThroughFloorReportsUpNormal) {
    Bounds box{{-100, 0, -100}, {100, 200, 100}};
    auto hit = CollisionEngine::SegmentBoundsHit({0, 50, 0}, {0, -50, 0}, box);
    ASSERT_TRUE(hit.has_value());
    EXPECT_NEAR(hit->fraction, 0.5f, 1e-5f);
    EXPECT_EQ(hit->normal, Vector3(0, 1, 0));
    EXPECT_NEAR(hit->point.y, 0.0f, 1e-5f);
}

TEST(CollisionEngineTest, EarliestFaceWins) {
    Bounds box{{-100, 0, -100}, {100, 200, 100}};
    // Crosses +X at t=0.5 and the ceiling at t=0.75.
    auto hit = CollisionEngine::SegmentBoundsHit({0, 100, 0}, {200, 233.33f, 0}, box);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->normal, Vector3(-1, 0, 0));
    EXPECT_NEAR(hit->point.x, 100.0f, 1e-3f);
}
