#pragma once

/// @file audio_events.hpp
/// @brief Typed sound cues emitted by the simulation.
///
/// The core never plays anything: it appends AudioEvents to a queue and
/// the audio collaborator drains them after the tick.

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "arena/foundation/types.hpp"
#include "arena/game/award_types.hpp"
#include "arena/game/item_types.hpp"
#include "arena/game/math_types.hpp"
#include "arena/game/weapon_types.hpp"

namespace arena::game {

enum class AudioEventKind : uint8_t {
    WeaponFire,
    WeaponSwitch,
    NoAmmo,
    Explosion,
    GrenadeBounce,
    PlayerPain,
    PlayerDeath,
    PlayerGib,
    PlayerJump,
    PlayerLand,
    PlayerHit,       ///< Hit confirmation for the attacker.
    ItemPickup,      ///< Health.
    ArmorPickup,
    WeaponPickup,
    PowerupPickup,
    ItemRespawn,
    PowerupExpire,
    Telefrag,
    Respawn,
    Award
};

/// One sound cue.  Only the fields relevant to @c kind are set.
struct AudioEvent {
    AudioEventKind kind = AudioEventKind::WeaponFire;
    Vector3 position;
    std::optional<foundation::PlayerId> player;
    std::optional<WeaponKind> weapon;
    std::optional<ItemKind> item;
    std::optional<PowerupKind> powerup;
    std::optional<AwardKind> award;
    int32_t painLevel = 0;  ///< PlayerPain: 25/50/75/100 bucket of remaining health.
    int32_t damage = 0;     ///< PlayerHit: damage dealt.
    bool quad = false;      ///< WeaponFire: quad-boosted shot.
};

/// Pain sound bucket for the remaining health.
constexpr int32_t painLevelFor(int32_t health) {
    if (health < 25) {
        return 25;
    }
    if (health < 50) {
        return 50;
    }
    if (health < 75) {
        return 75;
    }
    return 100;
}

/// Append/drain queue of audio events.
///
/// No replay: Drain() hands the accumulated events over and empties the
/// queue.
class AudioEventQueue {
public:
    void Push(AudioEvent event) { events_.push_back(std::move(event)); }

    /// Take every queued event, leaving the queue empty.
    [[nodiscard]] std::vector<AudioEvent> Drain() {
        std::vector<AudioEvent> out;
        out.swap(events_);
        return out;
    }

    [[nodiscard]] const std::vector<AudioEvent>& Pending() const noexcept { return events_; }
    [[nodiscard]] std::size_t Size() const noexcept { return events_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return events_.empty(); }

private:
    std::vector<AudioEvent> events_;
};

}  // namespace arena::game
