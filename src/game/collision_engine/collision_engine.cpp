/// @file collision_engine.cpp
/// @brief CollisionEngine implementation.

#include "arena/game/collision_engine.hpp"

#include <algorithm>
#include <cmath>

#include "arena/game/game_constants.hpp"

namespace arena::game {

namespace {

constexpr float kEpsilon = 1e-6f;

float component(const Vector3& v, int axis) {
    return axis == 0 ? v.x : (axis == 1 ? v.y : v.z);
}

Vector3 axisNormal(int axis, float sign) {
    Vector3 n;
    if (axis == 0) {
        n.x = sign;
    } else if (axis == 1) {
        n.y = sign;
    } else {
        n.z = sign;
    }
    return n;
}

} // namespace

bool CollisionEngine::SpheresOverlap(const Vector3& a, float radiusA,
                                     const Vector3& b, float radiusB) noexcept {
    const float reach = radiusA + radiusB;
    return (a - b).LengthSquared() <= reach * reach;
}

bool CollisionEngine::PointInSphere(const Vector3& point,
                                    const Vector3& center, float radius) noexcept {
    return (point - center).LengthSquared() <= radius * radius;
}

std::optional<float> CollisionEngine::SegmentSphereIntersection(
    const Vector3& from, const Vector3& to,
    const Vector3& center, float radius) noexcept {
    const Vector3 f = from - center;
    const float c = f.LengthSquared() - radius * radius;
    if (c <= 0.0f) {
        return 0.0f;
    }

    const Vector3 d = to - from;
    const float a = d.LengthSquared();
    if (a < kEpsilon) {
        return std::nullopt;
    }

    const float b = 2.0f * f.Dot(d);
    const float disc = b * b - 4.0f * a * c;
    if (disc < 0.0f) {
        return std::nullopt;
    }

    const float t = (-b - std::sqrt(disc)) / (2.0f * a);
    if (t < 0.0f || t > 1.0f) {
        return std::nullopt;
    }
    return t;
}

std::optional<float> CollisionEngine::RaySphereIntersection(
    const Ray& ray, const Vector3& center, float radius) noexcept {
    const Vector3 f = ray.origin - center;
    const float c = f.LengthSquared() - radius * radius;
    if (c <= 0.0f) {
        return 0.0f;
    }

    const float b = f.Dot(ray.direction);
    const float disc = b * b - c;
    if (disc < 0.0f) {
        return std::nullopt;
    }

    const float t = -b - std::sqrt(disc);
    if (t < 0.0f || t > ray.maxRange) {
        return std::nullopt;
    }
    return t;
}

float CollisionEngine::ExplosionFalloff(float baseDamage, float distance,
                                        float radius) noexcept {
    if (radius <= 0.0f || distance >= radius) {
        return 0.0f;
    }
    const float d = std::max(distance, 0.0f);
    return baseDamage * std::max(0.0f, 1.0f - d / radius);
}

std::vector<SplashTarget> CollisionEngine::SplashTargets(
    const ecs::EntityTable<foundation::PlayerId, Player>& players,
    const Vector3& center, float radius, int32_t baseDamage) {
    std::vector<SplashTarget> targets;
    for (auto id : players.SortedIds()) {
        const auto* player = players.Find(id);
        if (player == nullptr || !player->IsAlive()) {
            continue;
        }
        // Distance to the body surface, not the origin.
        const float distance = std::max(0.0f, center.DistanceTo(player->position) - kPlayerRadius);
        const auto damage = static_cast<int32_t>(
            ExplosionFalloff(static_cast<float>(baseDamage), distance, radius));
        if (damage >= 1) {
            targets.push_back(SplashTarget{id, distance, damage});
        }
    }
    return targets;
}

std::optional<BoundsHit> CollisionEngine::SegmentBoundsHit(
    const Vector3& from, const Vector3& to, const Bounds& bounds) noexcept {
    if (bounds.Contains(to)) {
        return std::nullopt;
    }

    BoundsHit hit;
    hit.fraction = 1.0f;
    bool found = false;

    for (int axis = 0; axis < 3; ++axis) {
        const float a = component(from, axis);
        const float b = component(to, axis);
        const float lo = component(bounds.min, axis);
        const float hi = component(bounds.max, axis);

        float face = 0.0f;
        float sign = 0.0f;
        if (b < lo) {
            face = lo;
            sign = 1.0f;
        } else if (b > hi) {
            face = hi;
            sign = -1.0f;
        } else {
            continue;
        }

        const float delta = b - a;
        float t = std::abs(delta) > kEpsilon ? (face - a) / delta : 0.0f;
        t = std::clamp(t, 0.0f, 1.0f);
        if (!found || t < hit.fraction) {
            hit.fraction = t;
            hit.normal = axisNormal(axis, sign);
            found = true;
        }
    }

    if (!found) {
        // Only reachable with NaN coordinates.
        return std::nullopt;
    }

    Vector3 p = from + (to - from) * hit.fraction;
    p.x = std::clamp(p.x, bounds.min.x, bounds.max.x);
    p.y = std::clamp(p.y, bounds.min.y, bounds.max.y);
    p.z = std::clamp(p.z, bounds.min.z, bounds.max.z);
    hit.point = p;
    return hit;
}

} // namespace arena::game
