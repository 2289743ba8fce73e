#pragma once

/// @file math_types.hpp
/// @brief Vector math for kinematic projectile integration.
///
/// Motion happens on the X/Z ground plane with Y up. Angles on the plane
/// are measured from +X toward +Z, so a heading of angle θ is
/// (cos θ, 0, sin θ).

#include <cmath>
#include <numbers>

namespace cre::game {

struct Vector3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    constexpr Vector3() = default;
    constexpr Vector3(float x, float y, float z) : x(x), y(y), z(z) {}

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

    [[nodiscard]] constexpr float Dot(const Vector3& rhs) const noexcept {
        return x * rhs.x + y * rhs.y + z * rhs.z;
    }

    [[nodiscard]] constexpr float LengthSquared() const noexcept { return Dot(*this); }

    [[nodiscard]] float Length() const noexcept { return std::sqrt(LengthSquared()); }

    /// Normalized copy, or the zero vector if the length is near zero.
    [[nodiscard]] Vector3 Normalized() const noexcept {
        const float len = Length();
        if (len < 1e-6f) {
            return {};
        }
        return {x / len, y / len, z / len};
    }

    /// Rotate about the Y axis by @p radians (ground-plane rotation).
    [[nodiscard]] Vector3 RotatedY(float radians) const noexcept {
        const float c = std::cos(radians);
        const float s = std::sin(radians);
        return {x * c - z * s, y, x * s + z * c};
    }

    /// Ground-plane angle of this vector in radians.
    [[nodiscard]] float Heading() const noexcept { return std::atan2(z, x); }

    [[nodiscard]] static constexpr Vector3 Zero() noexcept { return {}; }

    /// Unit vector on the ground plane at @p radians.
    [[nodiscard]] static Vector3 FromHeading(float radians) noexcept {
        return {std::cos(radians), 0.0f, std::sin(radians)};
    }

    constexpr auto operator<=>(const Vector3&) const = default;
};

constexpr Vector3 operator*(float scalar, const Vector3& v) noexcept {
    return v * scalar;
}

[[nodiscard]] constexpr Vector3 Lerp(const Vector3& a, const Vector3& b, float t) noexcept {
    return a + (b - a) * t;
}

[[nodiscard]] inline float Distance(const Vector3& a, const Vector3& b) noexcept {
    return (b - a).Length();
}

/// Distance ignoring height.
[[nodiscard]] inline float PlanarDistance(const Vector3& a, const Vector3& b) noexcept {
    const float dx = b.x - a.x;
    const float dz = b.z - a.z;
    return std::sqrt(dx * dx + dz * dz);
}

[[nodiscard]] constexpr float DegToRad(float degrees) noexcept {
    return degrees * std::numbers::pi_v<float> / 180.0f;
}

}  // namespace cre::game
