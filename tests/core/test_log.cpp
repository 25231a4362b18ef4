/// @file test_log.cpp
/// @brief Tests for tick_core logging

#include <catch2/catch_test_macros.hpp>
#include <tickspace/core/log.hpp>

using namespace tick_core;

TEST_CASE("parse_log_level: known names", "[core][log]") {
    REQUIRE(parse_log_level("trace") == spdlog::level::trace);
    REQUIRE(parse_log_level("debug") == spdlog::level::debug);
    REQUIRE(parse_log_level("info") == spdlog::level::info);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("error") == spdlog::level::err);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
}

TEST_CASE("parse_log_level: unknown names", "[core][log]") {
    REQUIRE_FALSE(parse_log_level("loud").has_value());
    REQUIRE_FALSE(parse_log_level("").has_value());
}

TEST_CASE("get_logger: one instance per name", "[core][log]") {
    auto a = get_logger("test_log_shared");
    auto b = get_logger("test_log_shared");

    REQUIRE(a == b);
    REQUIRE(a->name() == "test_log_shared");
    REQUIRE(host_logger()->name() == "tickspace");
    REQUIRE(physics_logger()->name() == "tick_physics");
}

TEST_CASE("configure_logging: physics level is independent", "[core][log]") {
    LogConfig config;
    config.console_enabled = false;
    config.level = spdlog::level::warn;
    config.physics_level = spdlog::level::trace;
    configure_logging(config);

    REQUIRE(host_logger()->level() == spdlog::level::warn);
    REQUIRE(physics_logger()->level() == spdlog::level::trace);
    REQUIRE(get_logger("test_log_other")->level() == spdlog::level::warn);

    SECTION("unset physics level follows the global one") {
        config.physics_level.reset();
        config.level = spdlog::level::err;
        configure_logging(config);

        REQUIRE(physics_logger()->level() == spdlog::level::err);
    }

    configure_logging(LogConfig{});
}

TEST_CASE("TICK_LOG_SCOPE: several scopes in one block", "[core][log]") {
    TICK_LOG_SCOPE("first");
    TICK_LOG_SCOPE("second");
    LogScope explicit_scope("third", physics_logger());
    SUCCEED();
}
