#pragma once

/// @file match_state.hpp
/// @brief Match clock, limits and end condition.

#include <cstdint>
#include <string_view>

namespace arena::game {

enum class MatchEndReason : uint8_t {
    None,
    FragLimit,
    TimeLimit
};

constexpr std::string_view matchEndReasonName(MatchEndReason reason) {
    switch (reason) {
        case MatchEndReason::None:      return "None";
        case MatchEndReason::FragLimit: return "FragLimit";
        case MatchEndReason::TimeLimit: return "TimeLimit";
    }
    return "Unknown";
}

/// Clock and end condition of the running match.
struct MatchState {
    uint64_t tick = 0;
    float elapsed = 0.0f;   ///< Seconds since the match started.
    int32_t fragLimit = 0;  ///< 0 disables.
    float timeLimit = 0.0f; ///< 0 disables.
    MatchEndReason endReason = MatchEndReason::None;

    [[nodiscard]] bool IsOver() const noexcept { return endReason != MatchEndReason::None; }

    /// Evaluate the limits at a tick boundary.
    /// @return true if the match ended with this call.
    bool CheckEnd(int32_t topFrags) noexcept {
        if (IsOver()) {
            return false;
        }
        if (fragLimit > 0 && topFrags >= fragLimit) {
            endReason = MatchEndReason::FragLimit;
        } else if (timeLimit > 0.0f && elapsed >= timeLimit) {
            endReason = MatchEndReason::TimeLimit;
        }
        return IsOver();
    }
};

}  // namespace arena::game
