#pragma once

/// @file types.hpp
/// @brief Core type definitions for tick_math

#define GLM_FORCE_RADIANS
#define GLM_ENABLE_EXPERIMENTAL

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/gtx/norm.hpp>

#include "fwd.hpp"

#include <cmath>

namespace tick_math {

namespace vec3 {
    inline constexpr Vec3 ZERO = Vec3(0.0f, 0.0f, 0.0f);
    inline constexpr Vec3 ONE  = Vec3(1.0f, 1.0f, 1.0f);
    inline constexpr Vec3 UP   = Vec3(0.0f, 1.0f, 0.0f);
}

namespace quat {
    inline const Quat IDENTITY = Quat(1.0f, 0.0f, 0.0f, 0.0f); // w, x, y, z
}

/// Standard gravity (m/s^2) pointing down the Y axis
inline constexpr Vec3 STANDARD_GRAVITY = Vec3(0.0f, -9.807f, 0.0f);

// =============================================================================
// Interpolation / comparison
// =============================================================================

/// Linear interpolation
[[nodiscard]] inline Vec3 lerp(const Vec3& a, const Vec3& b, float t) noexcept {
    return glm::mix(a, b, t);
}

/// Spherical linear interpolation
[[nodiscard]] inline Quat slerp(const Quat& a, const Quat& b, float t) noexcept {
    return glm::slerp(a, b, t);
}

[[nodiscard]] inline bool approx_equal(const Vec3& a, const Vec3& b, float epsilon = 1e-5f) noexcept {
    return glm::length2(a - b) <= epsilon * epsilon;
}

/// Quaternions q and -q describe the same rotation
[[nodiscard]] inline bool approx_equal(const Quat& a, const Quat& b, float epsilon = 1e-5f) noexcept {
    return std::abs(std::abs(glm::dot(a, b)) - 1.0f) <= epsilon;
}

} // namespace tick_math
