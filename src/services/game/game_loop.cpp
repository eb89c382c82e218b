/// @file game_loop.cpp
/// @brief GameLoop implementation.

#include "arena/service/game_loop.hpp"

#include <thread>

namespace arena::service {

namespace {

constexpr uint32_t kDefaultTickRate = 60;

} // namespace

GameLoop::GameLoop(uint32_t tickRate, uint32_t maxCatchUpTicks)
    : tickRate_(tickRate > 0 ? tickRate : kDefaultTickRate),
      maxCatchUpTicks_(maxCatchUpTicks > 0 ? maxCatchUpTicks : 1),
      targetFrameTime_(std::chrono::microseconds(1'000'000 / tickRate_)) {}

void GameLoop::setTickCallback(TickCallback callback) {
    tickCallback_ = std::move(callback);
}

void GameLoop::setMetricsCallback(MetricsCallback callback) {
    metricsCallback_ = std::move(callback);
}

uint32_t GameLoop::advance(std::chrono::microseconds elapsed) {
    if (elapsed.count() > 0) {
        accumulator_ += elapsed;
    }

    uint32_t ran = 0;
    while (accumulator_ >= targetFrameTime_ && ran < maxCatchUpTicks_) {
        accumulator_ -= targetFrameTime_;
        executeTick();
        ++ran;
    }

    // Drop whatever the catch-up cap could not absorb.
    if (accumulator_ >= targetFrameTime_) {
        accumulator_ = accumulator_ % targetFrameTime_;
    }
    return ran;
}

TickMetrics GameLoop::tick() {
    return executeTick();
}

uint64_t GameLoop::runUntil(const StopPredicate& done, bool realTime) {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return 0;
    }
    stopRequested_.store(false);

    const uint64_t startCount = tickCount_;
    auto nextTick = std::chrono::steady_clock::now();

    while (!stopRequested_.load()) {
        executeTick();
        if (done && done()) {
            break;
        }

        if (realTime) {
            nextTick += targetFrameTime_;
            auto now = std::chrono::steady_clock::now();
            if (now < nextTick) {
                std::this_thread::sleep_until(nextTick);
            } else {
                // Overrun: reset the target to avoid cascading catch-up.
                nextTick = now;
            }
        }
    }

    running_.store(false);
    return tickCount_ - startCount;
}

void GameLoop::stop() noexcept {
    stopRequested_.store(true);
}

bool GameLoop::isRunning() const noexcept {
    return running_.load();
}

uint32_t GameLoop::tickRate() const noexcept {
    return tickRate_;
}

std::chrono::microseconds GameLoop::targetFrameTime() const noexcept {
    return targetFrameTime_;
}

float GameLoop::deltaTime() const noexcept {
    return 1.0f / static_cast<float>(tickRate_);
}

uint64_t GameLoop::tickCount() const noexcept {
    return tickCount_;
}

std::chrono::microseconds GameLoop::accumulated() const noexcept {
    return accumulator_;
}

TickMetrics GameLoop::lastMetrics() const {
    return lastMetrics_;
}

TickMetrics GameLoop::executeTick() {
    auto start = std::chrono::steady_clock::now();

    if (tickCallback_) {
        tickCallback_(deltaTime());
    }

    auto updateDuration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);

    TickMetrics metrics;
    metrics.updateTime = updateDuration;
    metrics.budgetUtilization =
        targetFrameTime_.count() > 0
            ? static_cast<float>(updateDuration.count()) /
                  static_cast<float>(targetFrameTime_.count())
            : 0.0f;
    metrics.tickNumber = tickCount_++;
    metrics.overrun = updateDuration > targetFrameTime_;

    lastMetrics_ = metrics;
    if (metricsCallback_) {
        metricsCallback_(metrics);
    }
    return metrics;
}

} // namespace arena::service
