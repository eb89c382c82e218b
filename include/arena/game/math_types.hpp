#pragma once

/// @file math_types.hpp
/// @brief Lightweight math types for the simulation core.
///
/// Vector3 and Ray value types with the handful of operations the physics
/// code needs.  World space is Y-up; distances are world units.

#include <cmath>
#include <cstdint>

namespace arena::game {

/// Three-component floating-point vector.
///
/// Used for position, velocity, direction and impulse.
struct Vector3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    constexpr Vector3() = default;
    constexpr Vector3(float x, float y, float z) : x(x), y(y), z(z) {}

    // Arithmetic operators.
    constexpr Vector3 operator+(const Vector3& rhs) const noexcept {
        return {x + rhs.x, y + rhs.y, z + rhs.z};
    }
    constexpr Vector3 operator-(const Vector3& rhs) const noexcept {
        return {x - rhs.x, y - rhs.y, z - rhs.z};
    }
    constexpr Vector3 operator-() const noexcept { return {-x, -y, -z}; }
    constexpr Vector3 operator*(float scalar) const noexcept {
        return {x * scalar, y * scalar, z * scalar};
    }
    constexpr Vector3 operator/(float scalar) const noexcept {
        return {x / scalar, y / scalar, z / scalar};
    }

    constexpr Vector3& operator+=(const Vector3& rhs) noexcept {
        x += rhs.x;
        y += rhs.y;
        z += rhs.z;
        return *this;
    }

    constexpr Vector3& operator-=(const Vector3& rhs) noexcept {
        x -= rhs.x;
        y -= rhs.y;
        z -= rhs.z;
        return *this;
    }

    constexpr Vector3& operator*=(float scalar) noexcept {
        x *= scalar;
        y *= scalar;
        z *= scalar;
        return *this;
    }

    /// Dot product.
    [[nodiscard]] constexpr float Dot(const Vector3& rhs) const noexcept {
        return x * rhs.x + y * rhs.y + z * rhs.z;
    }

    /// Cross product.
    [[nodiscard]] constexpr Vector3 Cross(const Vector3& rhs) const noexcept {
        return {y * rhs.z - z * rhs.y, z * rhs.x - x * rhs.z, x * rhs.y - y * rhs.x};
    }

    /// Squared magnitude (avoids sqrt).
    [[nodiscard]] constexpr float LengthSquared() const noexcept { return Dot(*this); }

    /// Magnitude.
    [[nodiscard]] float Length() const noexcept { return std::sqrt(LengthSquared()); }

    [[nodiscard]] float DistanceTo(const Vector3& rhs) const noexcept {
        return (*this - rhs).Length();
    }

    /// Return a normalized copy, or zero vector if length is near zero.
    [[nodiscard]] Vector3 Normalized() const noexcept {
        const float len = Length();
        if (len < 1e-6f) {
            return {};
        }
        return {x / len, y / len, z / len};
    }

    /// False if any component is NaN or infinite.
    [[nodiscard]] bool IsFinite() const noexcept {
        return std::isfinite(x) && std::isfinite(y) && std::isfinite(z);
    }

    /// The zero vector.
    [[nodiscard]] static constexpr Vector3 Zero() noexcept { return {}; }

    /// World up (+Y).
    [[nodiscard]] static constexpr Vector3 Up() noexcept { return {0.0f, 1.0f, 0.0f}; }

    constexpr bool operator==(const Vector3&) const = default;
};

/// Scalar * Vector3.
constexpr Vector3 operator*(float scalar, const Vector3& v) noexcept {
    return v * scalar;
}

/// Half-line with a bounded length.
///
/// @c direction is expected to be unit length; Ray::Make normalizes.
struct Ray {
    Vector3 origin;
    Vector3 direction{0.0f, 0.0f, 1.0f};
    float maxRange = 0.0f;

    [[nodiscard]] static Ray Make(const Vector3& origin, const Vector3& direction,
                                  float maxRange) noexcept {
        return {origin, direction.Normalized(), maxRange};
    }

    [[nodiscard]] constexpr Vector3 PointAt(float distance) const noexcept {
        return origin + direction * distance;
    }

    [[nodiscard]] constexpr Vector3 End() const noexcept { return PointAt(maxRange); }
};

}  // namespace arena::game
