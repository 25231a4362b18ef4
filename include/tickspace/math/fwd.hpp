#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for tick_math types

#include <glm/fwd.hpp>

namespace tick_math {

// =============================================================================
// GLM aliases
// =============================================================================
using Vec3 = glm::vec3;
using IVec3 = glm::ivec3;
using Quat = glm::quat;

struct Transform;

} // namespace tick_math
