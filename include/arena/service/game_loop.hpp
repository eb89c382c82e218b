#pragma once

/// @file game_loop.hpp
/// @brief Fixed-step game loop with frame timing and metrics.
///
/// GameLoop converts wall-clock time into whole fixed ticks.  It never
/// runs a partial step: leftover time stays in an accumulator until it
/// adds up to another tick.  Each tick measures its update time, reports
/// budget utilization and flags overruns (ticks that took longer than
/// the step they simulate).
///
/// Everything runs on the calling thread; the simulation is single-writer.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>

namespace arena::service {

/// Per-tick performance metrics.
struct TickMetrics {
    /// Actual time spent in the tick callback.
    std::chrono::microseconds updateTime{0};

    /// Ratio of updateTime to target frame time (1.0 = full budget).
    float budgetUtilization = 0.0f;

    /// Monotonically increasing tick counter (starts at 0).
    uint64_t tickNumber = 0;

    /// True when updateTime exceeded the target frame time.
    bool overrun = false;
};

/// Fixed-step loop.
///
/// Usage:
/// @code
///   GameLoop loop(60);
///   loop.setTickCallback([&](float dt) { world.Tick(); });
///   loop.runUntil([&] { return world.Match().IsOver(); });
/// @endcode
class GameLoop {
public:
    using TickCallback = std::function<void(float deltaTime)>;
    using MetricsCallback = std::function<void(const TickMetrics&)>;
    using StopPredicate = std::function<bool()>;

    /// @param tickRate        Ticks per second (0 falls back to 60).
    /// @param maxCatchUpTicks Most ticks a single advance() may run; time
    ///                        beyond that is dropped to avoid a spiral of
    ///                        ever longer frames.
    explicit GameLoop(uint32_t tickRate = 60, uint32_t maxCatchUpTicks = 5);

    GameLoop(const GameLoop&) = delete;
    GameLoop& operator=(const GameLoop&) = delete;

    /// Set the callback invoked each tick with the fixed step in seconds.
    void setTickCallback(TickCallback callback);

    /// Set an optional callback invoked after each tick with metrics.
    void setMetricsCallback(MetricsCallback callback);

    /// Feed @p elapsed wall time and run every whole tick it covers.
    /// @return Number of ticks executed.
    uint32_t advance(std::chrono::microseconds elapsed);

    /// Execute a single tick immediately, ignoring the accumulator.
    /// @return The metrics for the executed tick.
    TickMetrics tick();

    /// Run ticks paced to real time on the calling thread until
    /// @p done returns true (checked after every tick) or stop() is called.
    /// @param realTime When false, ticks run back to back.
    /// @return Number of ticks executed.
    uint64_t runUntil(const StopPredicate& done, bool realTime = true);

    /// Ask runUntil() to return after the current tick.  Safe to call from
    /// the tick callback or another thread.
    void stop() noexcept;

    [[nodiscard]] bool isRunning() const noexcept;

    [[nodiscard]] uint32_t tickRate() const noexcept;

    [[nodiscard]] std::chrono::microseconds targetFrameTime() const noexcept;

    /// Fixed step in seconds.
    [[nodiscard]] float deltaTime() const noexcept;

    [[nodiscard]] uint64_t tickCount() const noexcept;

    /// Wall time carried over to the next advance().
    [[nodiscard]] std::chrono::microseconds accumulated() const noexcept;

    /// Metrics from the last completed tick.
    [[nodiscard]] TickMetrics lastMetrics() const;

private:
    TickMetrics executeTick();

    uint32_t tickRate_;
    uint32_t maxCatchUpTicks_;
    std::chrono::microseconds targetFrameTime_;
    std::chrono::microseconds accumulator_{0};

    TickCallback tickCallback_;
    MetricsCallback metricsCallback_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopRequested_{false};
    uint64_t tickCount_ = 0;
    TickMetrics lastMetrics_;
};

}  // namespace arena::service
