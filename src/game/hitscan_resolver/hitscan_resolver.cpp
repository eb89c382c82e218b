/// @file hitscan_resolver.cpp
/// @brief HitscanResolver implementation.

#include "arena/game/hitscan_resolver.hpp"

#include <algorithm>

#include "arena/game/collision_engine.hpp"
#include "arena/game/game_constants.hpp"

namespace arena::game {

namespace {

struct Candidate {
    float distance = 0.0f;
    const HitscanTarget* target = nullptr;
};

} // namespace

RayTrace HitscanResolver::Trace(const Ray& ray, foundation::PlayerId shooter,
                                WeaponKind weapon, int32_t damage, bool penetrating,
                                std::span<const HitscanTarget> targets,
                                const Bounds& bounds) {
    RayTrace trace;

    // Clip the ray at the arena walls first.
    Ray clipped = ray;
    if (auto wall = CollisionEngine::SegmentBoundsHit(ray.origin, ray.End(), bounds)) {
        clipped.maxRange = ray.maxRange * wall->fraction;
        trace.hitGeometry = true;
    }
    trace.endPoint = clipped.End();

    std::vector<Candidate> candidates;
    for (const auto& target : targets) {
        if (target.id == shooter) {
            continue;
        }
        if (auto t = CollisionEngine::RaySphereIntersection(clipped, target.position,
                                                            kPlayerRadius)) {
            candidates.push_back(Candidate{*t, &target});
        }
    }

    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        if (a.distance != b.distance) {
            return a.distance < b.distance;
        }
        return a.target->id < b.target->id;
    });

    if (!penetrating && candidates.size() > 1) {
        candidates.resize(1);
    }

    for (const auto& c : candidates) {
        CombatEvent event;
        event.attacker = shooter;
        event.victim = c.target->id;
        event.rawDamage = damage;
        event.hitPosition = clipped.PointAt(c.distance);
        event.weapon = weapon;
        event.flags.midAir = c.target->airborne;
        event.distance = c.distance;
        trace.hits.push_back(event);
    }

    if (!penetrating && !trace.hits.empty()) {
        trace.endPoint = trace.hits.front().hitPosition;
        trace.hitGeometry = false;
    }
    return trace;
}

HitscanResult HitscanResolver::Resolve(const HitscanFire& shot, foundation::PlayerId shooter,
                                       WeaponKind weapon,
                                       std::span<const HitscanTarget> targets,
                                       const Bounds& bounds) {
    HitscanResult result;
    result.traces.reserve(shot.rays.size());
    for (const auto& ray : shot.rays) {
        auto trace = Trace(ray, shooter, weapon, shot.damage, shot.penetrating, targets, bounds);
        result.events.insert(result.events.end(), trace.hits.begin(), trace.hits.end());
        result.traces.push_back(std::move(trace));
    }

    std::stable_sort(result.events.begin(), result.events.end(),
                     [](const CombatEvent& a, const CombatEvent& b) {
                         return a.distance < b.distance;
                     });
    return result;
}

} // namespace arena::game
