#pragma once

/// @file award_types.hpp
/// @brief Medal kinds and the award history record.

#include <cstdint>
#include <string_view>

#include "arena/foundation/types.hpp"

namespace arena::game {

enum class AwardKind : uint8_t {
    Excellent,    ///< Two frags within the excellent window.
    Impressive,   ///< Railgun kill on an airborne victim.
    Humiliation,  ///< Gauntlet kill.
    Perfect,      ///< Match finished without dying.
    Accuracy      ///< Hit ratio above threshold over enough shots.
};

constexpr std::string_view awardKindName(AwardKind kind) {
    switch (kind) {
        case AwardKind::Excellent:   return "Excellent";
        case AwardKind::Impressive:  return "Impressive";
        case AwardKind::Humiliation: return "Humiliation";
        case AwardKind::Perfect:     return "Perfect";
        case AwardKind::Accuracy:    return "Accuracy";
    }
    return "Unknown";
}

/// Appended once, never mutated; pruned after the history window.
struct AwardRecord {
    AwardKind kind = AwardKind::Excellent;
    foundation::PlayerId player;
    float time = 0.0f;
};

}  // namespace arena::game
