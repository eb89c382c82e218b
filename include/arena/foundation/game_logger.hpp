#pragma once

/// @file game_logger.hpp
/// @brief GameLogger wrapping the kcenon logger interfaces with
///        simulation-specific categories.
///
/// Category-based filtering, structured context and per-category runtime
/// levels.  The kcenon registry decides where lines end up; without a
/// registered logger every call is a cheap no-op.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "arena/foundation/game_result.hpp"
#include "arena/foundation/types.hpp"

namespace arena::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Simulation subsystems used to filter log output.
enum class LogCategory : uint8_t {
    Core       = 0, ///< Process lifecycle, loop timing
    Config     = 1, ///< Configuration and map loading
    World      = 2, ///< Orchestrator, spawns, match state
    Weapon     = 3, ///< Firing and weapon switching
    Projectile = 4, ///< Projectile integration and detonation
    Combat     = 5, ///< Damage resolution, deaths
    Items      = 6, ///< Pickups, respawns, powerups
    Awards     = 7  ///< Award detection
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Config", "World", "Weapon", "Projectile", "Combat", "Items", "Awards"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a lower- or upper-case level name ("debug", "WARNING", ...).
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Structured context appended to a log line.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.playerId = victim;
///   ctx.attackerId = attacker;
///   ctx.extra["damage"] = "120";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Combat,
///                         "player fragged", ctx);
/// @endcode
struct LogContext {
    std::optional<PlayerId> playerId;
    std::optional<PlayerId> attackerId;
    std::optional<ProjectileId> projectileId;
    std::optional<uint64_t> tick;
    std::unordered_map<std::string, std::string> extra;
};

/// Simulation logger wrapping kcenon's logging registry.
///
/// Default levels:
/// | Category   | Default Level |
/// |------------|---------------|
/// | Core       | Info          |
/// | Config     | Info          |
/// | World      | Info          |
/// | Weapon     | Debug         |
/// | Projectile | Debug         |
/// | Combat     | Debug         |
/// | Items      | Info          |
/// | Awards     | Info          |
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as `{k=v, ...}`.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default logger.
    GameResult<void> flush();

    /// Process-wide instance used by the ARENA_LOG macros.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace arena::foundation

/// @name ARENA_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// Define ARENA_MIN_LOG_LEVEL before including this header to strip calls
/// below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef ARENA_MIN_LOG_LEVEL
    #define ARENA_MIN_LOG_LEVEL 0
#endif

#define ARENA_LOG(level, cat, msg)                                                 \
    do {                                                                           \
        _Pragma("GCC diagnostic push")                                             \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                        \
        if (static_cast<int>(level) >= ARENA_MIN_LOG_LEVEL &&                      \
            ::arena::foundation::GameLogger::instance().isEnabled((level), (cat))) \
        {                                                                          \
            ::arena::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                          \
        _Pragma("GCC diagnostic pop")                                              \
    } while (0)

#define ARENA_LOG_CTX(level, cat, msg, ctx)                                        \
    do {                                                                           \
        if (static_cast<int>(level) >= ARENA_MIN_LOG_LEVEL &&                      \
            ::arena::foundation::GameLogger::instance().isEnabled((level), (cat))) \
        {                                                                          \
            ::arena::foundation::GameLogger::instance().logWithContext(            \
                (level), (cat), (msg), (ctx));                                     \
        }                                                                          \
    } while (0)

#define ARENA_LOG_DEBUG(cat, msg) \
    ARENA_LOG(::arena::foundation::LogLevel::Debug, (cat), (msg))

#define ARENA_LOG_INFO(cat, msg) \
    ARENA_LOG(::arena::foundation::LogLevel::Info, (cat), (msg))

#define ARENA_LOG_WARN(cat, msg) \
    ARENA_LOG(::arena::foundation::LogLevel::Warning, (cat), (msg))

#define ARENA_LOG_ERROR(cat, msg) \
    ARENA_LOG(::arena::foundation::LogLevel::Error, (cat), (msg))

/// @}
