/// @file config.hpp
/// @brief Space configuration for tick_physics

#pragma once

#include "fwd.hpp"

#include <tickspace/core/error.hpp>
#include <tickspace/math/types.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <string>

namespace tick_physics {

/// Space configuration.
///
/// ```json
/// {
///   "max_presim_steps": 10,
///   "gravity": [0.0, -9.807, 0.0],
///   "substeps": 5,
///   "max_elapsed": 0.25,
///   "worker_name": "physics"
/// }
/// ```
///
/// Missing keys keep their defaults; unknown keys are ignored.
struct SpaceConfig {
    /// Warm-up ticks before real elapsed time is applied
    std::uint32_t max_presim_steps = 10;

    /// Constant acceleration handed to every advance
    tick_math::Vec3 gravity = tick_math::STANDARD_GRAVITY;

    /// Solver substeps per live advance
    std::uint32_t substeps = 5;

    /// Upper bound in seconds on the elapsed time of one advance
    float max_elapsed = 0.25f;

    /// Name of the worker a default-constructed space creates
    std::string worker_name = "physics";

    [[nodiscard]] static SpaceConfig defaults() { return SpaceConfig{}; }

    /// Check value ranges
    [[nodiscard]] tick_core::Result<void> validate() const;

    /// Parse from JSON and validate
    [[nodiscard]] static tick_core::Result<SpaceConfig> from_json(const nlohmann::json& j);

    [[nodiscard]] nlohmann::json to_json() const;

    /// Read, parse and validate a JSON file
    [[nodiscard]] static tick_core::Result<SpaceConfig> load(const std::filesystem::path& path);
};

} // namespace tick_physics
