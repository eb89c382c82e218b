/// @file main.cpp
/// @brief Headless arena server entry point.
///
/// Loads configuration and map, fills the arena with scripted bots and
/// runs the match to completion on a fixed-step loop, then prints the
/// scoreboard.
///
/// Usage: arena_server [--config <path>] [--realtime]

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include "arena/foundation/config_manager.hpp"
#include "arena/foundation/game_logger.hpp"
#include "arena/game/simulation_config.hpp"
#include "arena/game/map_geometry.hpp"
#include "arena/game/weapon_catalog.hpp"
#include "arena/game/world.hpp"
#include "arena/service/game_loop.hpp"
#include "arena/version.hpp"

namespace {

namespace kci = kcenon::common::interfaces;

using arena::foundation::ConfigManager;
using arena::foundation::GameLogger;
using arena::foundation::LogCategory;
using arena::foundation::PlayerId;
using arena::game::Player;
using arena::game::PlayerIntent;
using arena::game::Vector3;
using arena::game::WeaponKind;
using arena::game::World;

constexpr std::string_view kDefaultConfigPath = "config/arena.yaml";

/// Writes log lines to stderr.
class ConsoleLogger : public kci::ILogger {
public:
    kcenon::common::VoidResult log(kci::log_level level, const std::string& message) override {
        if (is_enabled(level)) {
            std::lock_guard lock(mutex_);
            std::clog << message << '\n';
        }
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(kci::log_level level, std::string_view message,
                                   const kci::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(const kci::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(kci::log_level level) const override { return level >= level_; }

    kcenon::common::VoidResult set_level(kci::log_level level) override {
        level_ = level;
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kci::log_level get_level() const override { return level_; }

    kcenon::common::VoidResult flush() override {
        std::clog.flush();
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

private:
    std::mutex mutex_;
    kci::log_level level_ = kci::log_level::trace;
};

struct Options {
    std::string configPath{kDefaultConfigPath};
    bool realTime = false;
};

Options parseArgs(int argc, char* argv[]) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);
        if (arg == "--config" && i + 1 < argc) {
            options.configPath = argv[++i];
        } else if (arg == "--realtime") {
            options.realTime = true;
        }
    }
    return options;
}

/// Apply `logging.<category>: <level>` overrides.
void applyLogLevels(const ConfigManager& config) {
    for (std::size_t i = 0; i < arena::foundation::kLogCategoryCount; ++i) {
        auto category = static_cast<LogCategory>(i);
        std::string key = "logging.";
        for (char c : arena::foundation::logCategoryName(category)) {
            key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        auto name = config.get<std::string>(key);
        if (!name) {
            continue;
        }
        if (auto level = arena::foundation::parseLogLevel(name.value())) {
            GameLogger::instance().setCategoryLevel(category, *level);
        } else {
            ARENA_LOG_WARN(LogCategory::Config, "unknown log level for " + key + ": " + name.value());
        }
    }
}

/// Scripted opponent: chase the nearest enemy, strafe when close, fire
/// the best weapon for the distance.
class Bot {
public:
    Bot(PlayerId id, uint32_t seed) : id_(id), rng_(seed) {}

    [[nodiscard]] PlayerId id() const { return id_; }

    PlayerIntent think(const World& world) {
        PlayerIntent intent;
        const Player* self = world.FindPlayer(id_);
        if (self == nullptr || !self->IsAlive()) {
            return intent;
        }

        const Player* target = nullptr;
        float best = std::numeric_limits<float>::max();
        for (const auto& other : world.Players()) {
            if (other.id == id_ || !other.IsAlive()) {
                continue;
            }
            float d = other.position.DistanceTo(self->position);
            if (d < best) {
                best = d;
                target = &other;
            }
        }
        if (target == nullptr) {
            return intent;
        }

        const Vector3 toTarget = target->position - self->position;
        intent.aim = (target->position - self->EyePosition()).Normalized();

        if (best > 400.0f) {
            intent.move = Vector3{toTarget.x, 0.0f, toTarget.z}.Normalized();
        } else {
            Vector3 strafe = Vector3{toTarget.x, 0.0f, toTarget.z}.Cross(Vector3::Up()).Normalized();
            if (std::uniform_int_distribution<int>(0, 60)(rng_) == 0) {
                strafeSign_ = -strafeSign_;
            }
            intent.move = strafe * strafeSign_;
        }
        intent.jump = std::uniform_int_distribution<int>(0, 90)(rng_) == 0;

        const WeaponKind weapon = pickWeapon(*self, best);
        if (weapon != self->heldWeapon) {
            intent.switchTo = weapon;
        }
        intent.fire = best <= arena::game::WeaponCatalog::StatsFor(weapon).range ||
                      arena::game::WeaponCatalog::StatsFor(weapon).mode ==
                          arena::game::FireMode::Projectile;
        return intent;
    }

private:
    static WeaponKind pickWeapon(const Player& self, float distance) {
        static constexpr std::array kPreference = {
            WeaponKind::Railgun, WeaponKind::RocketLauncher, WeaponKind::Lightning,
            WeaponKind::Plasmagun, WeaponKind::Shotgun, WeaponKind::GrenadeLauncher,
            WeaponKind::BFG, WeaponKind::MachineGun,
        };
        for (auto kind : kPreference) {
            const auto& stats = arena::game::WeaponCatalog::StatsFor(kind);
            const bool inRange = stats.mode == arena::game::FireMode::Projectile ||
                                 distance <= stats.range;
            if (self.weapons.Owns(kind) && self.weapons.Ammo(kind) >= stats.ammoCost && inRange) {
                return kind;
            }
        }
        return WeaponKind::Gauntlet;
    }

    PlayerId id_;
    std::mt19937 rng_;
    float strafeSign_ = 1.0f;
};

void printScoreboard(const World& world) {
    std::vector<const Player*> ranking;
    for (const auto& player : world.Players()) {
        ranking.push_back(&player);
    }
    std::sort(ranking.begin(), ranking.end(), [](const Player* a, const Player* b) {
        return a->frags != b->frags ? a->frags > b->frags : a->id < b->id;
    });

    std::cout << "Match over ("
              << arena::game::matchEndReasonName(world.Match().endReason) << ") after "
              << world.Match().elapsed << "s\n";
    for (const auto* player : ranking) {
        std::cout << "  " << player->name << ": " << player->frags << " frags, "
                  << player->deaths << " deaths, accuracy "
                  << static_cast<int>(player->Accuracy() * 100.0f) << "%\n";
    }
    for (const auto& award : world.AwardHistory()) {
        const auto* player = world.FindPlayer(award.player);
        std::cout << "  award " << arena::game::awardKindName(award.kind) << " -> "
                  << (player != nullptr ? player->name : std::string("?")) << " at "
                  << award.time << "s\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    kci::GlobalLoggerRegistry::instance().set_default_logger(std::make_shared<ConsoleLogger>());

    auto options = parseArgs(argc, argv);

    ConfigManager config;
    auto loadResult = config.load(options.configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }
    applyLogLevels(config);

    auto simConfig = arena::game::SimulationConfig::FromConfig(config);
    if (!simConfig) {
        std::cerr << "Invalid simulation config: " << simConfig.error().message() << "\n";
        return EXIT_FAILURE;
    }
    auto map = arena::game::MapGeometry::FromConfig(config);
    if (!map) {
        std::cerr << "Invalid map: " << map.error().message() << "\n";
        return EXIT_FAILURE;
    }

    World world(simConfig.value(), std::move(map).value());

    auto botNames = config.getOr<std::vector<std::string>>(
        "bots.names", {"Sarge", "Visor", "Doom", "Hunter"});
    if (!botNames) {
        std::cerr << "Invalid bots.names: " << botNames.error().message() << "\n";
        return EXIT_FAILURE;
    }

    std::vector<Bot> bots;
    for (const auto& name : botNames.value()) {
        auto id = world.AddPlayer(name);
        if (!id) {
            std::cerr << "Cannot add bot " << name << ": " << id.error().message() << "\n";
            return EXIT_FAILURE;
        }
        bots.emplace_back(id.value(), world.Seed() + id.value().value());
    }

    std::cout << "arena_server " << ARENA_VERSION_STRING << " (tick_rate: "
              << world.Config().tickRate << " Hz, bots: " << bots.size() << ")\n";

    arena::service::GameLoop loop(world.Config().tickRate);
    bool failed = false;
    loop.setTickCallback([&](float /*dt*/) {
        for (auto& bot : bots) {
            auto intent = bot.think(world);
            if (auto set = world.SetIntent(bot.id(), intent); !set) {
                ARENA_LOG_ERROR(LogCategory::Core, std::string(set.error().message()));
            }
        }
        auto events = world.Tick();
        if (!events) {
            ARENA_LOG_ERROR(LogCategory::Core, std::string(events.error().message()));
            failed = true;
            loop.stop();
        }
    });
    loop.setMetricsCallback([](const arena::service::TickMetrics& metrics) {
        if (metrics.overrun) {
            ARENA_LOG_WARN(LogCategory::Core,
                           "tick " + std::to_string(metrics.tickNumber) + " overran its budget");
        }
    });

    loop.runUntil([&] { return world.Match().IsOver(); }, options.realTime);

    printScoreboard(world);
    (void)GameLogger::instance().flush();
    return failed ? EXIT_FAILURE : EXIT_SUCCESS;
}
