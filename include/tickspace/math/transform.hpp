#pragma once

/// @file transform.hpp
/// @brief Rigid transform (position + orientation) for tick_math

#include "types.hpp"

namespace tick_math {

/// Rigid body transform. Bodies carry no scale.
struct Transform {
    Vec3 position = vec3::ZERO;
    Quat rotation = quat::IDENTITY;

    Transform() noexcept = default;

    Transform(const Vec3& pos, const Quat& rot) noexcept
        : position(pos), rotation(rot) {}

    static Transform from_position(const Vec3& pos) noexcept {
        return Transform(pos, quat::IDENTITY);
    }

    static const Transform& identity() noexcept {
        static const Transform IDENTITY_TRANSFORM;
        return IDENTITY_TRANSFORM;
    }

    [[nodiscard]] Transform with_position(const Vec3& pos) const noexcept {
        return Transform(pos, rotation);
    }

    /// Interpolate toward other (t = 0 gives this, t = 1 gives other)
    [[nodiscard]] Transform lerp(const Transform& other, float t) const noexcept {
        return Transform(
            tick_math::lerp(position, other.position, t),
            tick_math::slerp(rotation, other.rotation, t));
    }

    /// Transform a point from local to world space
    [[nodiscard]] Vec3 transform_point(const Vec3& point) const noexcept {
        return position + rotation * point;
    }

    bool operator==(const Transform& other) const noexcept {
        return position == other.position && rotation == other.rotation;
    }

    bool operator!=(const Transform& other) const noexcept {
        return !(*this == other);
    }
};

[[nodiscard]] inline bool approx_equal(const Transform& a, const Transform& b,
                                       float epsilon = 1e-5f) noexcept {
    return approx_equal(a.position, b.position, epsilon) &&
           approx_equal(a.rotation, b.rotation, epsilon);
}

} // namespace tick_math
