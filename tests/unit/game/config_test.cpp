#include <gtest/gtest.h>

#include "arena/foundation/config_manager.hpp"
#include "arena/game/map_geometry.hpp"
#include "arena/game/simulation_config.hpp"

using namespace arena::game;
using arena::foundation::ConfigManager;
using arena::foundation::ErrorCode;

namespace {

constexpr const char* kMapYaml = R"(
map:
  bounds:
    min: [-500, 0, -500]
    max: [500, 400, 500]
  spawn_points:
    - [0, 32, 0]
    - [300, 32, 300]
  items:
    - { kind: rocket_launcher, position: [100, 32, 0] }
    - { kind: mega_health, position: [-100, 32, 0] }
)";

ConfigManager load(const std::string& yaml) {
    ConfigManager config;
    EXPECT_TRUE(config.loadString(yaml).hasValue());
    return config;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// SimulationConfig
// ═══════════════════════════════════════════════════════════════════════════

TEST(SimulationConfigTest, DefaultsAreValid) {
    SimulationConfig cfg;
    EXPECT_TRUE(cfg.Validate().hasValue());
    EXPECT_FLOAT_EQ(cfg.TickInterval(), 1.0f / 60.0f);
}

TEST(SimulationConfigTest, EmptyConfigKeepsDefaults) {
    ConfigManager config;
    auto cfg = SimulationConfig::FromConfig(config);
    ASSERT_TRUE(cfg.hasValue());
    EXPECT_EQ(cfg.value().fragLimit, 20);
    EXPECT_EQ(cfg.value().tickRate, 60u);
}

TEST(SimulationConfigTest, ReadsOverrides) {
    auto config = load(R"(
simulation:
  tick_rate: 125
  seed: 42
match:
  frag_limit: 5
  time_limit: 120
awards:
  excellent_window: 3.0
)");

    auto cfg = SimulationConfig::FromConfig(config);
    ASSERT_TRUE(cfg.hasValue());
    EXPECT_EQ(cfg.value().tickRate, 125u);
    EXPECT_EQ(cfg.value().rngSeed, 42u);
    EXPECT_EQ(cfg.value().fragLimit, 5);
    EXPECT_FLOAT_EQ(cfg.value().timeLimit, 120.0f);
    EXPECT_FLOAT_EQ(cfg.value().excellentWindow, 3.0f);
}

TEST(SimulationConfigTest, RejectsZeroTickRate) {
    auto config = load("simulation:\n  tick_rate: 0\n");
    auto cfg = SimulationConfig::FromConfig(config);
    ASSERT_TRUE(cfg.hasError());
    EXPECT_EQ(cfg.error().code(), ErrorCode::ConfigInvalidValue);
}

TEST(SimulationConfigTest, RejectsWrongType) {
    auto config = load("match:\n  respawn_delay: soon\n");
    auto cfg = SimulationConfig::FromConfig(config);
    ASSERT_TRUE(cfg.hasError());
    EXPECT_EQ(cfg.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(SimulationConfigTest, RejectsAccuracyAboveOne) {
    SimulationConfig cfg;
    cfg.accuracyThreshold = 1.5f;
    EXPECT_TRUE(cfg.Validate().hasError());
}

// ═══════════════════════════════════════════════════════════════════════════
// MapGeometry
// ═══════════════════════════════════════════════════════════════════════════

TEST(MapGeometryTest, LoadsBoundsSpawnsAndItems) {
    auto config = load(kMapYaml);
    auto map = MapGeometry::FromConfig(config);
    ASSERT_TRUE(map.hasValue()) << map.error().message();

    EXPECT_EQ(map.value().bounds.max, Vector3(500, 400, 500));
    ASSERT_EQ(map.value().spawnPoints.size(), 2u);
    EXPECT_EQ(map.value().spawnPoints[1], Vector3(300, 32, 300));
    ASSERT_EQ(map.value().items.size(), 2u);
    EXPECT_EQ(map.value().items[0].kind, ItemKind::RocketLauncher);
    EXPECT_EQ(map.value().items[1].kind, ItemKind::HealthMega);
}

TEST(MapGeometryTest, MissingSpawnPointsFails) {
    auto config = load(R"(
map:
  bounds:
    min: [-500, 0, -500]
    max: [500, 400, 500]
  spawn_points: []
)");
    auto map = MapGeometry::FromConfig(config);
    ASSERT_TRUE(map.hasError());
    EXPECT_EQ(map.error().code(), ErrorCode::InvalidGeometry);
}

TEST(MapGeometryTest, SpawnOutsideBoundsFails) {
    auto config = load(R"(
map:
  bounds:
    min: [-500, 0, -500]
    max: [500, 400, 500]
  spawn_points:
    - [900, 32, 0]
)");
    auto map = MapGeometry::FromConfig(config);
    ASSERT_TRUE(map.hasError());
    EXPECT_EQ(map.error().code(), ErrorCode::InvalidGeometry);
}

TEST(MapGeometryTest, InvertedBoundsFail) {
    MapGeometry map;
    map.bounds = Bounds{{10, 10, 10}, {0, 0, 0}};
    map.spawnPoints.push_back({5, 5, 5});
    EXPECT_TRUE(map.Validate().hasError());
}

TEST(MapGeometryTest, UnknownItemKindFails) {
    auto config = load(R"(
map:
  bounds:
    min: [-500, 0, -500]
    max: [500, 400, 500]
  spawn_points:
    - [0, 32, 0]
  items:
    - { kind: chainsaw, position: [0, 32, 0] }
)");
    auto map = MapGeometry::FromConfig(config);
    ASSERT_TRUE(map.hasError());
    EXPECT_EQ(map.error().code(), ErrorCode::ConfigInvalidValue);
}

TEST(MapGeometryTest, ShortVectorFails) {
    auto config = load(R"(
map:
  bounds:
    min: [-500, 0]
    max: [500, 400, 500]
  spawn_points:
    - [0, 32, 0]
)");
    auto map = MapGeometry::FromConfig(config);
    ASSERT_TRUE(map.hasError());
    EXPECT_EQ(map.error().code(), ErrorCode::ConfigInvalidValue);
}
