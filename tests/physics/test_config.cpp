/// @file test_config.cpp
/// @brief Tests for SpaceConfig JSON loading

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <tickspace/physics/config.hpp>

#include <filesystem>
#include <fstream>

using namespace tick_physics;
using Catch::Matchers::WithinAbs;

namespace fs = std::filesystem;

namespace {

fs::path write_temp_file(const std::string& name, const std::string& contents) {
    fs::path path = fs::temp_directory_path() / name;
    std::ofstream out(path);
    out << contents;
    return path;
}

} // namespace

TEST_CASE("SpaceConfig: defaults", "[physics][config]") {
    SpaceConfig config = SpaceConfig::defaults();

    REQUIRE(config.max_presim_steps == 10);
    REQUIRE(config.substeps == 5);
    REQUIRE_THAT(config.max_elapsed, WithinAbs(0.25f, 1e-6f));
    REQUIRE_THAT(config.gravity.y, WithinAbs(-9.807f, 1e-5f));
    REQUIRE(config.gravity.x == 0.0f);
    REQUIRE(config.gravity.z == 0.0f);
    REQUIRE(config.validate().is_ok());
}

TEST_CASE("SpaceConfig: from_json", "[physics][config]") {
    SECTION("empty object keeps defaults") {
        auto result = SpaceConfig::from_json(nlohmann::json::object());
        REQUIRE(result.is_ok());
        REQUIRE(result.value().max_presim_steps == 10);
        REQUIRE(result.value().substeps == 5);
    }

    SECTION("all keys") {
        nlohmann::json j = {
            {"max_presim_steps", 3},
            {"gravity", {0.0, -1.62, 0.0}},
            {"substeps", 8},
            {"max_elapsed", 0.1},
            {"worker_name", "moon"},
            {"unknown_key", true},
        };

        auto result = SpaceConfig::from_json(j);
        REQUIRE(result.is_ok());

        const auto& config = result.value();
        REQUIRE(config.max_presim_steps == 3);
        REQUIRE_THAT(config.gravity.y, WithinAbs(-1.62f, 1e-5f));
        REQUIRE(config.substeps == 8);
        REQUIRE_THAT(config.max_elapsed, WithinAbs(0.1f, 1e-6f));
        REQUIRE(config.worker_name == "moon");
    }

    SECTION("zero warm-up ticks is allowed") {
        auto result = SpaceConfig::from_json({{"max_presim_steps", 0}});
        REQUIRE(result.is_ok());
        REQUIRE(result.value().max_presim_steps == 0);
    }
}

TEST_CASE("SpaceConfig: from_json validation", "[physics][config]") {
    auto expect_invalid = [](const nlohmann::json& j, const std::string& key) {
        auto result = SpaceConfig::from_json(j);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == tick_core::ErrorCode::ValidationError);
        const auto* err = result.error().as<tick_core::ConfigError>();
        REQUIRE(err != nullptr);
        REQUIRE(err->key == key);
    };

    SECTION("substeps below 1") {
        expect_invalid({{"substeps", 0}}, "substeps");
        expect_invalid({{"substeps", -2}}, "substeps");
        expect_invalid({{"substeps", "five"}}, "substeps");
    }

    SECTION("non-positive max_elapsed") {
        expect_invalid({{"max_elapsed", 0.0}}, "max_elapsed");
        expect_invalid({{"max_elapsed", -0.5}}, "max_elapsed");
    }

    SECTION("malformed gravity") {
        expect_invalid({{"gravity", {0.0, -9.8}}}, "gravity");
        expect_invalid({{"gravity", "down"}}, "gravity");
        expect_invalid({{"gravity", {0.0, "x", 0.0}}}, "gravity");
    }

    SECTION("negative warm-up ticks") {
        expect_invalid({{"max_presim_steps", -1}}, "max_presim_steps");
    }

    SECTION("counts wider than 32 bits are rejected, not wrapped") {
        expect_invalid({{"max_presim_steps", 4294967306ULL}}, "max_presim_steps");
        expect_invalid({{"max_presim_steps", 4294967296ULL}}, "max_presim_steps");
        expect_invalid({{"substeps", 4294967296ULL}}, "substeps");
        expect_invalid({{"substeps", 4294967306LL}}, "substeps");
    }

    SECTION("largest 32-bit counts are accepted") {
        auto result = SpaceConfig::from_json({{"max_presim_steps", 4294967295ULL},
                                              {"substeps", 4294967295ULL}});
        REQUIRE(result.is_ok());
        REQUIRE(result.value().max_presim_steps == 4294967295U);
        REQUIRE(result.value().substeps == 4294967295U);
    }

    SECTION("root must be an object") {
        auto result = SpaceConfig::from_json(nlohmann::json::array());
        REQUIRE(result.is_err());
    }
}

TEST_CASE("SpaceConfig: to_json round trips through from_json", "[physics][config]") {
    SpaceConfig config;
    config.max_presim_steps = 4;
    config.substeps = 2;
    config.gravity = tick_math::Vec3(1.0f, 2.0f, 3.0f);

    auto result = SpaceConfig::from_json(config.to_json());
    REQUIRE(result.is_ok());
    REQUIRE(result.value().max_presim_steps == 4);
    REQUIRE(result.value().substeps == 2);
    REQUIRE(result.value().gravity == tick_math::Vec3(1.0f, 2.0f, 3.0f));
}

TEST_CASE("SpaceConfig: load", "[physics][config]") {
    SECTION("missing file") {
        auto result = SpaceConfig::load("/nonexistent/tickspace/space.json");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == tick_core::ErrorCode::NotFound);
    }

    SECTION("malformed JSON") {
        auto path = write_temp_file("tickspace_bad.json", "{ \"substeps\": ");
        auto result = SpaceConfig::load(path);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == tick_core::ErrorCode::ParseError);
        fs::remove(path);
    }

    SECTION("invalid value carries the file as context") {
        auto path = write_temp_file("tickspace_invalid.json", R"({ "substeps": 0 })");
        auto result = SpaceConfig::load(path);
        REQUIRE(result.is_err());
        REQUIRE(result.error().get_context("file") != nullptr);
        fs::remove(path);
    }

    SECTION("valid file") {
        auto path = write_temp_file("tickspace_ok.json", R"({ "max_presim_steps": 2, "substeps": 3 })");
        auto result = SpaceConfig::load(path);
        REQUIRE(result.is_ok());
        REQUIRE(result.value().max_presim_steps == 2);
        REQUIRE(result.value().substeps == 3);
        fs::remove(path);
    }
}
