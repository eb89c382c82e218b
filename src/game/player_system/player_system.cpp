/// @file player_system.cpp
/// @brief PlayerSystem implementation.
///
/// Movement is a reduced version of the classic quake pmove: ground
/// friction and acceleration toward the wish direction, weak air control,
/// gravity, and clipping against the arena box instead of a BSP.

#include "arena/game/player_system.hpp"

#include <algorithm>
#include <cmath>

#include "arena/foundation/game_logger.hpp"
#include "arena/game/game_constants.hpp"

namespace arena::game {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::PlayerId;

namespace {

constexpr float kFloorTolerance = 0.01f;

Vector3 horizontal(const Vector3& v) {
    return {v.x, 0.0f, v.z};
}

void applyFriction(Player& player, float deltaTime) {
    Vector3 flat = horizontal(player.velocity);
    const float speed = flat.Length();
    if (speed < 1e-3f) {
        player.velocity.x = 0.0f;
        player.velocity.z = 0.0f;
        return;
    }
    const float control = std::max(speed, kStopSpeed);
    const float newSpeed = std::max(speed - control * kFriction * deltaTime, 0.0f);
    const float scale = newSpeed / speed;
    player.velocity.x *= scale;
    player.velocity.z *= scale;
}

void accelerate(Player& player, const Vector3& wishDir, float wishSpeed, float accel,
                float deltaTime) {
    const float current = player.velocity.Dot(wishDir);
    const float add = wishSpeed - current;
    if (add <= 0.0f) {
        return;
    }
    const float gain = std::min(accel * deltaTime * wishSpeed, add);
    player.velocity += wishDir * gain;
}

} // namespace

PlayerSystem::PlayerSystem(ecs::EntityTable<PlayerId, Player>& players, const Bounds& bounds)
    : players_(players), moveBounds_(bounds.Shrunk(kPlayerRadius)) {}

PlayerStepResult PlayerSystem::Execute(float deltaTime, float now) {
    PlayerStepResult result;

    for (auto id : players_.SortedIds()) {
        auto* player = players_.Find(id);
        if (player == nullptr || !player->IsAlive()) {
            continue;
        }

        if (auto request = player->intent.switchTo) {
            player->intent.switchTo.reset();
            if (BeginSwitch(*player, *request, now)) {
                result.events.push_back(PlayerMotionEvent{PlayerMotionKind::WeaponSwitch, id,
                                                          player->position, *request});
            }
        }

        const LegsState previousLegs = player->legs;
        move(*player, deltaTime, result);
        updateAnimation(*player, previousLegs, deltaTime);
    }
    return result;
}

void PlayerSystem::move(Player& player, float deltaTime, PlayerStepResult& out) {
    const auto& intent = player.intent;
    const bool flying = player.HasPowerup(PowerupKind::Flight);
    const bool wasAirborne = player.IsAirborne();

    Vector3 wish = horizontal(intent.move);
    const float wishLength = std::min(wish.Length(), 1.0f);
    const Vector3 wishDir = wish.Normalized();
    float wishSpeed = kMaxSpeed * wishLength;
    if (intent.crouch && !wasAirborne) {
        wishSpeed *= kCrouchSpeedScale;
    }
    if (player.HasPowerup(PowerupKind::Haste)) {
        wishSpeed *= kHasteScale;
    }

    if (!wasAirborne) {
        applyFriction(player, deltaTime);
        accelerate(player, wishDir, wishSpeed, kGroundAccelerate, deltaTime);
        if (intent.jump && !intent.crouch) {
            player.velocity.y = kJumpVelocity;
            player.legs = LegsState::Air;
            out.events.push_back(
                PlayerMotionEvent{PlayerMotionKind::Jump, player.id, player.position, {}});
        } else {
            player.legs = intent.crouch ? LegsState::Crouching : LegsState::Ground;
        }
    } else {
        accelerate(player, wishDir, wishSpeed, kAirAccelerate, deltaTime);
    }

    if (flying) {
        float target = 0.0f;
        if (intent.jump) {
            target = kMaxSpeed;
        } else if (intent.crouch) {
            target = -kMaxSpeed;
        }
        const float blend = std::min(1.0f, kFlightAccelerate * deltaTime);
        player.velocity.y += (target - player.velocity.y) * blend;
    } else if (player.IsAirborne()) {
        player.velocity.y -= kGravity * deltaTime;
    }

    // Knockback can launch a grounded player.
    if (player.velocity.y > 0.0f) {
        player.legs = LegsState::Air;
    }

    player.position += player.velocity * deltaTime;
    clipToBounds(player, wasAirborne || player.IsAirborne(), out);
}

void PlayerSystem::clipToBounds(Player& player, bool wasAirborne, PlayerStepResult& out) {
    auto& p = player.position;
    auto& v = player.velocity;
    const auto& b = moveBounds_;

    if (p.x < b.min.x || p.x > b.max.x) {
        p.x = std::clamp(p.x, b.min.x, b.max.x);
        v.x = 0.0f;
    }
    if (p.z < b.min.z || p.z > b.max.z) {
        p.z = std::clamp(p.z, b.min.z, b.max.z);
        v.z = 0.0f;
    }
    if (p.y > b.max.y) {
        p.y = b.max.y;
        v.y = std::min(v.y, 0.0f);
    }

    if (p.y <= b.min.y && v.y <= 0.0f) {
        const float impactSpeed = -v.y;
        p.y = b.min.y;
        v.y = 0.0f;
        if (wasAirborne) {
            player.legs = player.intent.crouch ? LegsState::Crouching : LegsState::Ground;
            if (impactSpeed >= kLandingSpeed) {
                player.animation.landingTimer = kLandingTime;
                out.events.push_back(
                    PlayerMotionEvent{PlayerMotionKind::Land, player.id, player.position, {}});
            }
        }
    } else if (p.y > b.min.y + kFloorTolerance) {
        // Walked off a spawn ledge, teleported up, or flying.
        player.legs = LegsState::Air;
    }
}

void PlayerSystem::updateAnimation(Player& player, LegsState previousLegs, float deltaTime) {
    auto& anim = player.animation;
    const bool moving = horizontal(player.velocity).LengthSquared() > 1.0f;

    if (player.legs != previousLegs || moving != anim.moving) {
        anim.legsTimer = 0.0f;
    } else {
        anim.legsTimer += deltaTime;
    }
    anim.moving = moving;
    anim.landingTimer = std::max(anim.landingTimer - deltaTime, 0.0f);
    anim.barrelSpin = std::max(anim.barrelSpin - deltaTime, 0.0f);
}

void PlayerSystem::Spawn(Player& player, const Vector3& position, int32_t machineGunAmmo) {
    player.position = position;
    player.velocity = Vector3::Zero();
    player.health = kSpawnHealth;
    player.armor = kSpawnArmor;

    player.weapons.Clear();
    player.weapons.Give(WeaponKind::Gauntlet, 0);
    player.weapons.Give(WeaponKind::MachineGun, machineGunAmmo);
    player.heldWeapon = WeaponKind::MachineGun;
    player.switchReadyAt = 0.0f;

    player.legs = LegsState::Ground;
    player.animation = AnimationState{};
    player.powerups.Clear();
    player.regenAccumulator = 0.0f;
    player.firePressedLastTick = false;
    player.life = LifeState::Alive;
    player.respawnAt = 0.0f;
}

void PlayerSystem::Kill(Player& player, float now, float respawnDelay) {
    player.health = 0;
    player.velocity = Vector3::Zero();
    player.powerups.Clear();
    player.regenAccumulator = 0.0f;
    player.life = LifeState::Respawning;
    player.respawnAt = now + respawnDelay;
    ++player.deaths;
}

void PlayerSystem::Teleport(Player& player, const Vector3& destination) {
    player.position = destination;
    player.velocity = Vector3::Zero();
}

bool PlayerSystem::BeginSwitch(Player& player, WeaponKind weapon, float now) {
    if (weapon == player.heldWeapon || !player.weapons.Owns(weapon)) {
        return false;
    }
    player.heldWeapon = weapon;
    player.switchReadyAt = now + kWeaponSwitchTime;

    LogContext ctx;
    ctx.playerId = player.id;
    ctx.extra["weapon"] = std::string(weaponKindName(weapon));
    ARENA_LOG_CTX(LogLevel::Debug, LogCategory::Weapon, "weapon switch", ctx);
    return true;
}

} // namespace arena::game
