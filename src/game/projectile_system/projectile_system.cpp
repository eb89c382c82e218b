/// @file projectile_system.cpp
/// @brief ProjectileSystem implementation.

#include "arena/game/projectile_system.hpp"

#include <array>
#include <cassert>
#include <cmath>
#include <string>

#include "arena/foundation/game_logger.hpp"
#include "arena/game/game_constants.hpp"

namespace arena::game {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::PlayerId;
using foundation::ProjectileId;

namespace {

Detonation detonate(ProjectileId id, const Projectile& projectile, const Vector3& at,
                    std::optional<PlayerId> victim) {
    Detonation d;
    d.projectile = id;
    d.kind = projectile.kind;
    d.weapon = projectile.weapon;
    d.owner = projectile.owner;
    d.position = at;
    d.damage = projectile.damage;
    d.splashRadius = projectile.splashRadius;
    d.directVictim = victim;
    return d;
}

LogContext projectileContext(ProjectileId id, const Projectile& projectile) {
    LogContext ctx;
    ctx.projectileId = id;
    ctx.playerId = projectile.owner;
    ctx.extra["kind"] = std::string(projectileKindName(projectile.kind));
    return ctx;
}

} // namespace

ProjectileSystem::ProjectileSystem(
    ecs::EntityTable<ProjectileId, Projectile>& projectiles,
    const ecs::EntityTable<PlayerId, Player>& players,
    const Bounds& bounds)
    : projectiles_(projectiles), players_(players), bounds_(bounds) {}

const ProjectileTraits& ProjectileSystem::TraitsFor(ProjectileKind kind) {
    // radius, lifetime, gravity, bounces, smokeTrail
    static const std::array<ProjectileTraits, kProjectileKindCount> traits = {{
        {1.0f, 15.0f, 0.0f, false, true},            // Rocket
        {1.0f, kGrenadeFuse, kGravity, true, false}, // Grenade
        {0.6f, 10.0f, 0.0f, false, false},           // Plasma
        {4.0f, 10.0f, 0.0f, false, false},           // BFG
    }};
    auto idx = static_cast<std::size_t>(kind);
    assert(idx < kProjectileKindCount && "ProjectileKind out of range");
    return traits[idx];
}

Projectile ProjectileSystem::Spawn(ProjectileId id, PlayerId owner, WeaponKind weapon,
                                   const ProjectileFire& fire, float now) {
    Projectile p;
    p.id = id;
    p.kind = fire.kind;
    p.weapon = weapon;
    p.owner = owner;
    p.position = fire.origin;
    p.velocity = fire.velocity;
    p.spawnTime = now;
    p.lifetime = TraitsFor(fire.kind).lifetime;
    p.damage = fire.damage;
    p.splashRadius = fire.splashRadius;
    return p;
}

ProjectileStepResult ProjectileSystem::Execute(float deltaTime, float now) {
    ProjectileStepResult result;
    std::vector<ProjectileId> finished;

    for (auto id : projectiles_.SortedIds()) {
        auto* projectile = projectiles_.Find(id);
        if (projectile != nullptr && step(id, *projectile, deltaTime, now, result)) {
            finished.push_back(id);
        }
    }

    for (auto id : finished) {
        projectiles_.Erase(id);
    }
    return result;
}

bool ProjectileSystem::step(ProjectileId id, Projectile& projectile, float deltaTime,
                            float now, ProjectileStepResult& out) {
    const auto& traits = TraitsFor(projectile.kind);

    // 1. Lifetime
    if (projectile.IsExpired(now)) {
        if (traits.bounces) {
            out.detonations.push_back(
                detonate(id, projectile, projectile.position, std::nullopt));
            ARENA_LOG_CTX(LogLevel::Debug, LogCategory::Projectile, "fuse expired",
                          projectileContext(id, projectile));
        } else {
            ++out.expired;
            ARENA_LOG_CTX(LogLevel::Debug, LogCategory::Projectile, "lifetime expired",
                          projectileContext(id, projectile));
        }
        return true;
    }

    // 2. Integration
    if (traits.gravity > 0.0f && !projectile.resting) {
        projectile.velocity.y -= traits.gravity * deltaTime;
    }
    const Vector3 from = projectile.position;
    const Vector3 to = from + projectile.velocity * deltaTime;

    // 3. Degenerate state
    const float ceiling = kProjectileSpeedCeiling;
    if (!to.IsFinite() || !projectile.velocity.IsFinite() ||
        projectile.velocity.LengthSquared() > ceiling * ceiling) {
        ++out.degenerate;
        ARENA_LOG_CTX(LogLevel::Warning, LogCategory::Projectile,
                      "degenerate projectile state, removing",
                      projectileContext(id, projectile));
        return true;
    }

    // 4. Nearest direct hit along the swept segment.
    std::optional<PlayerId> victim;
    float victimFraction = 2.0f;
    for (auto playerId : players_.SortedIds()) {
        if (playerId == projectile.owner) {
            continue;
        }
        const auto* player = players_.Find(playerId);
        if (player == nullptr || !player->IsAlive()) {
            continue;
        }
        auto t = CollisionEngine::SegmentSphereIntersection(
            from, to, player->position, kPlayerRadius + traits.radius);
        if (t && *t < victimFraction) {
            victimFraction = *t;
            victim = playerId;
        }
    }

    auto wall = CollisionEngine::SegmentBoundsHit(from, to, bounds_);

    if (victim && (!wall || victimFraction <= wall->fraction)) {
        const Vector3 at = from + (to - from) * victimFraction;
        out.detonations.push_back(detonate(id, projectile, at, victim));
        auto ctx = projectileContext(id, projectile);
        ctx.extra["victim"] = std::to_string(victim->value());
        ARENA_LOG_CTX(LogLevel::Debug, LogCategory::Projectile, "direct hit", ctx);
        return true;
    }

    // 5. Bounds
    if (wall) {
        if (traits.bounces) {
            bounce(projectile, *wall, out);
            return false;
        }
        out.detonations.push_back(
            detonate(id, projectile, wall->point + wall->normal * traits.radius, std::nullopt));
        ARENA_LOG_CTX(LogLevel::Debug, LogCategory::Projectile, "hit geometry",
                      projectileContext(id, projectile));
        return true;
    }

    projectile.position = to;

    if (traits.smokeTrail) {
        projectile.trailAccumulator += deltaTime;
        while (projectile.trailAccumulator >= kRocketTrailInterval) {
            projectile.trailAccumulator -= kRocketTrailInterval;
            out.smokePuffs.push_back(projectile.position);
        }
    }
    return false;
}

void ProjectileSystem::bounce(Projectile& projectile, const BoundsHit& hit,
                              ProjectileStepResult& out) {
    const float normalSpeed = projectile.velocity.Dot(hit.normal);
    const Vector3 normalPart = hit.normal * normalSpeed;
    const Vector3 tangentPart = projectile.velocity - normalPart;

    projectile.position = hit.point;

    const float reboundSpeed = std::abs(normalSpeed) * kGrenadeBounceDamping;
    if (hit.normal.y > 0.5f && reboundSpeed < kGrenadeRestSpeed) {
        projectile.velocity = Vector3::Zero();
        projectile.resting = true;
        return;
    }

    projectile.velocity = tangentPart * kGrenadeSurfaceFriction - normalPart * kGrenadeBounceDamping;
    ++projectile.bounces;
    out.bounces.push_back(hit.point);
}

} // namespace arena::game
