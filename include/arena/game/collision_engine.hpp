#pragma once

/// @file collision_engine.hpp
/// @brief Intersection primitives and explosion falloff.
///
/// Stateless; every function is pure.  Shared by the hitscan resolver,
/// the projectile simulator, telefrag checks and item pickups.

#include <optional>
#include <vector>

#include "arena/ecs/entity_table.hpp"
#include "arena/foundation/types.hpp"
#include "arena/game/map_geometry.hpp"
#include "arena/game/math_types.hpp"
#include "arena/game/player_components.hpp"

namespace arena::game {

/// Exit of a segment through a bounds face.
struct BoundsHit {
    float fraction = 0.0f;  ///< Along the segment, 0..1.
    Vector3 point;
    Vector3 normal;         ///< Inward normal of the face that was crossed.
};

/// A player inside an explosion radius.
struct SplashTarget {
    foundation::PlayerId player;
    float distance = 0.0f;
    int32_t damage = 0;
};

class CollisionEngine {
public:
    CollisionEngine() = delete;

    /// Sphere-sphere overlap (touching counts).
    [[nodiscard]] static bool SpheresOverlap(const Vector3& a, float radiusA,
                                             const Vector3& b, float radiusB) noexcept;

    /// Point inside or on a sphere.
    [[nodiscard]] static bool PointInSphere(const Vector3& point,
                                            const Vector3& center, float radius) noexcept;

    /// First contact of the segment @p from -> @p to with a sphere.
    /// @return Fraction along the segment in [0, 1]; 0 when @p from is
    ///         already inside.
    [[nodiscard]] static std::optional<float> SegmentSphereIntersection(
        const Vector3& from, const Vector3& to,
        const Vector3& center, float radius) noexcept;

    /// Entry distance of a ray into a sphere, within [0, ray.maxRange].
    /// A ray starting inside the sphere hits it at distance 0.
    [[nodiscard]] static std::optional<float> RaySphereIntersection(
        const Ray& ray, const Vector3& center, float radius) noexcept;

    /// Linear falloff: `base * max(0, 1 - distance / radius)`.
    [[nodiscard]] static float ExplosionFalloff(float baseDamage, float distance,
                                                float radius) noexcept;

    /// Every alive player that takes at least 1 point of splash damage,
    /// in ascending player id order.
    [[nodiscard]] static std::vector<SplashTarget> SplashTargets(
        const ecs::EntityTable<foundation::PlayerId, Player>& players,
        const Vector3& center, float radius, int32_t baseDamage);

    /// Where the segment leaves @p bounds, or nullopt if @p to is inside.
    [[nodiscard]] static std::optional<BoundsHit> SegmentBoundsHit(
        const Vector3& from, const Vector3& to, const Bounds& bounds) noexcept;
};

}  // namespace arena::game
