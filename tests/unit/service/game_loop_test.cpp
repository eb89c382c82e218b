/// @file game_loop_test.cpp
/// @brief Unit tests for the fixed-step GameLoop.

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "arena/service/game_loop.hpp"

using namespace arena::service;
using namespace std::chrono_literals;

// ============================================================================
// Construction
// ============================================================================

class GameLoopTest : public ::testing::Test {
protected:
    GameLoop loop_{20}; // 20 Hz, 50 ms per tick
};

TEST_F(GameLoopTest, TickRateAndFrameTime) {
    EXPECT_EQ(loop_.tickRate(), 20u);
    EXPECT_EQ(loop_.targetFrameTime(), 50000us);
    EXPECT_FLOAT_EQ(loop_.deltaTime(), 0.05f);
}

TEST_F(GameLoopTest, SixtyHertzFrameTime) {
    GameLoop loop(60);
    // 1'000'000 / 60 = 16666 us
    EXPECT_EQ(loop.targetFrameTime().count(), 16666);
    EXPECT_FLOAT_EQ(loop.deltaTime(), 1.0f / 60.0f);
}

TEST_F(GameLoopTest, ZeroTickRateFallsBackToSixty) {
    GameLoop loop(0);
    EXPECT_EQ(loop.tickRate(), 60u);
}

TEST_F(GameLoopTest, InitialState) {
    EXPECT_EQ(loop_.tickCount(), 0u);
    EXPECT_FALSE(loop_.isRunning());
    EXPECT_EQ(loop_.accumulated(), 0us);
}

// ============================================================================
// Manual ticks
// ============================================================================

TEST_F(GameLoopTest, ManualTickPassesFixedStep) {
    std::vector<float> steps;
    loop_.setTickCallback([&](float dt) { steps.push_back(dt); });

    auto first = loop_.tick();
    auto second = loop_.tick();

    ASSERT_EQ(steps.size(), 2u);
    EXPECT_FLOAT_EQ(steps[0], 0.05f);
    EXPECT_EQ(first.tickNumber, 0u);
    EXPECT_EQ(second.tickNumber, 1u);
    EXPECT_EQ(loop_.tickCount(), 2u);
}

TEST_F(GameLoopTest, TickWithoutCallbackStillCounts) {
    auto metrics = loop_.tick();
    EXPECT_EQ(metrics.tickNumber, 0u);
    EXPECT_GE(metrics.updateTime.count(), 0);
    EXPECT_FALSE(metrics.overrun);
    EXPECT_EQ(loop_.tickCount(), 1u);
}

// ============================================================================
// Accumulator
// ============================================================================

TEST_F(GameLoopTest, AdvanceRunsWholeTicksOnly) {
    int calls = 0;
    loop_.setTickCallback([&](float) { ++calls; });

    EXPECT_EQ(loop_.advance(30ms), 0u);
    EXPECT_EQ(loop_.accumulated(), 30ms);

    EXPECT_EQ(loop_.advance(30ms), 1u);
    EXPECT_EQ(loop_.accumulated(), 10ms);
    EXPECT_EQ(calls, 1);
}

TEST_F(GameLoopTest, AdvanceRunsSeveralTicks) {
    EXPECT_EQ(loop_.advance(160ms), 3u);
    EXPECT_EQ(loop_.accumulated(), 10ms);
    EXPECT_EQ(loop_.tickCount(), 3u);
}

TEST_F(GameLoopTest, CatchUpIsCapped) {
    GameLoop loop(20, 4);
    EXPECT_EQ(loop.advance(1s), 4u);
    // The backlog beyond the cap is dropped, not carried.
    EXPECT_LT(loop.accumulated(), loop.targetFrameTime());
    EXPECT_EQ(loop.advance(0us), 0u);
}

TEST_F(GameLoopTest, NegativeElapsedIgnored) {
    EXPECT_EQ(loop_.advance(-100ms), 0u);
    EXPECT_EQ(loop_.accumulated(), 0us);
}

// ============================================================================
// Metrics
// ============================================================================

TEST_F(GameLoopTest, MetricsCallbackSeesEveryTick) {
    std::vector<TickMetrics> seen;
    loop_.setMetricsCallback([&](const TickMetrics& m) { seen.push_back(m); });

    (void)loop_.advance(100ms);

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].tickNumber, 0u);
    EXPECT_EQ(seen[1].tickNumber, 1u);
    EXPECT_EQ(loop_.lastMetrics().tickNumber, 1u);
}

TEST_F(GameLoopTest, SlowTickFlagsOverrun) {
    GameLoop loop(1000); // 1 ms budget
    loop.setTickCallback([](float) { std::this_thread::sleep_for(5ms); });

    auto metrics = loop.tick();
    EXPECT_TRUE(metrics.overrun);
    EXPECT_GT(metrics.budgetUtilization, 1.0f);
}

// ============================================================================
// runUntil
// ============================================================================

TEST_F(GameLoopTest, RunUntilPredicate) {
    int calls = 0;
    loop_.setTickCallback([&](float) { ++calls; });

    auto ran = loop_.runUntil([&] { return calls >= 10; }, false);

    EXPECT_EQ(ran, 10u);
    EXPECT_EQ(loop_.tickCount(), 10u);
    EXPECT_FALSE(loop_.isRunning());
}

TEST_F(GameLoopTest, StopFromCallback) {
    int calls = 0;
    loop_.setTickCallback([&](float) {
        if (++calls == 3) {
            loop_.stop();
        }
    });

    auto ran = loop_.runUntil([] { return false; }, false);
    EXPECT_EQ(ran, 3u);
}

TEST_F(GameLoopTest, RunUntilPacesToRealTime) {
    GameLoop loop(100); // 10 ms per tick
    int calls = 0;
    loop.setTickCallback([&](float) { ++calls; });

    auto start = std::chrono::steady_clock::now();
    (void)loop.runUntil([&] { return calls >= 5; });
    auto elapsed = std::chrono::steady_clock::now() - start;

    // Four sleeps separate five ticks.
    EXPECT_GE(elapsed, 35ms);
}

TEST_F(GameLoopTest, StopFromAnotherThread) {
    std::atomic<bool> started{false};
    loop_.setTickCallback([&](float) { started.store(true); });

    std::thread runner([&] { (void)loop_.runUntil([] { return false; }); });
    while (!started.load()) {
        std::this_thread::sleep_for(1ms);
    }
    loop_.stop();
    runner.join();

    EXPECT_FALSE(loop_.isRunning());
    EXPECT_GE(loop_.tickCount(), 1u);
}
