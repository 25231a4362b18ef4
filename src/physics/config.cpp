/// @file config.cpp
/// @brief SpaceConfig JSON loading

#include <tickspace/physics/config.hpp>
#include <tickspace/core/log.hpp>

#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>

namespace tick_physics {

namespace {

constexpr std::uint64_t MAX_U32 = std::numeric_limits<std::uint32_t>::max();

/// True if v is an integer in [min, UINT32_MAX]
bool is_u32_at_least(const nlohmann::json& v, std::uint64_t min) {
    if (v.is_number_unsigned()) {
        auto n = v.get<std::uint64_t>();
        return n >= min && n <= MAX_U32;
    }
    if (v.is_number_integer()) {
        auto n = v.get<std::int64_t>();
        return n >= 0 && static_cast<std::uint64_t>(n) >= min && static_cast<std::uint64_t>(n) <= MAX_U32;
    }
    return false;
}

} // namespace

tick_core::Result<void> SpaceConfig::validate() const {
    if (substeps < 1) {
        return tick_core::Err(tick_core::ConfigError::invalid_value("substeps", "must be at least 1"));
    }
    if (!(max_elapsed > 0.0f) || !std::isfinite(max_elapsed)) {
        return tick_core::Err(tick_core::ConfigError::invalid_value("max_elapsed", "must be a positive number"));
    }
    if (!std::isfinite(gravity.x) || !std::isfinite(gravity.y) || !std::isfinite(gravity.z)) {
        return tick_core::Err(tick_core::ConfigError::invalid_value("gravity", "components must be finite"));
    }
    return tick_core::Ok();
}

tick_core::Result<SpaceConfig> SpaceConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return tick_core::Err<SpaceConfig>(
            tick_core::ConfigError::invalid_value("<root>", "expected an object"));
    }

    SpaceConfig config;

    if (j.contains("max_presim_steps")) {
        const auto& v = j["max_presim_steps"];
        if (!is_u32_at_least(v, 0)) {
            return tick_core::Err<SpaceConfig>(
                tick_core::ConfigError::invalid_value("max_presim_steps",
                    "must be an integer in [0, " + std::to_string(MAX_U32) + "]"));
        }
        config.max_presim_steps = v.get<std::uint32_t>();
    }

    if (j.contains("gravity")) {
        const auto& g = j["gravity"];
        if (!g.is_array() || g.size() != 3 ||
            !g[0].is_number() || !g[1].is_number() || !g[2].is_number()) {
            return tick_core::Err<SpaceConfig>(
                tick_core::ConfigError::invalid_value("gravity", "must be an array of 3 numbers"));
        }
        config.gravity = tick_math::Vec3(g[0].get<float>(), g[1].get<float>(), g[2].get<float>());
    }

    if (j.contains("substeps")) {
        const auto& v = j["substeps"];
        if (!v.is_number_integer()) {
            return tick_core::Err<SpaceConfig>(
                tick_core::ConfigError::invalid_value("substeps", "must be an integer"));
        }
        if (!is_u32_at_least(v, 1)) {
            return tick_core::Err<SpaceConfig>(
                tick_core::ConfigError::invalid_value("substeps",
                    "must be in [1, " + std::to_string(MAX_U32) + "]"));
        }
        config.substeps = v.get<std::uint32_t>();
    }

    if (j.contains("max_elapsed")) {
        const auto& v = j["max_elapsed"];
        if (!v.is_number()) {
            return tick_core::Err<SpaceConfig>(
                tick_core::ConfigError::invalid_value("max_elapsed", "must be a number"));
        }
        config.max_elapsed = v.get<float>();
    }

    if (j.contains("worker_name") && j["worker_name"].is_string()) {
        config.worker_name = j["worker_name"].get<std::string>();
    }

    auto valid = config.validate();
    if (!valid) {
        return tick_core::Err<SpaceConfig>(valid.error());
    }

    return tick_core::Ok(std::move(config));
}

nlohmann::json SpaceConfig::to_json() const {
    nlohmann::json j;
    j["max_presim_steps"] = max_presim_steps;
    j["gravity"] = {gravity.x, gravity.y, gravity.z};
    j["substeps"] = substeps;
    j["max_elapsed"] = max_elapsed;
    j["worker_name"] = worker_name;
    return j;
}

tick_core::Result<SpaceConfig> SpaceConfig::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return tick_core::Err<SpaceConfig>(tick_core::ConfigError::file_not_found(path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::exception& e) {
        return tick_core::Err<SpaceConfig>(tick_core::ConfigError::parse_failed(path.string(), e.what()));
    }

    auto result = from_json(j);
    if (!result) {
        tick_core::Error error = result.error();
        error.with_context("file", path.string());
        return tick_core::Err<SpaceConfig>(std::move(error));
    }

    tick_core::physics_logger()->debug("Loaded space config from '{}'", path.string());
    return result;
}

} // namespace tick_physics
