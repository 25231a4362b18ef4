/// @file test_error.cpp
/// @brief Tests for tick_core errors and Result

#include <catch2/catch_test_macros.hpp>
#include <tickspace/core/error.hpp>

#include <string>

using namespace tick_core;

namespace {

Result<int> parse_positive(int raw) {
    if (raw <= 0) {
        return Err<int>(ConfigError::invalid_value("count", "must be positive"));
    }
    return Ok(raw);
}

Result<void> submit_to(bool running) {
    if (!running) {
        return Err(WorkerError::stopped("physics"));
    }
    return Ok();
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

// =============================================================================
// Error
// =============================================================================

TEST_CASE("Error: config errors map to codes", "[core][error]") {
    REQUIRE(Error(ConfigError::file_not_found("a.json")).code() == ErrorCode::NotFound);
    REQUIRE(Error(ConfigError::parse_failed("a.json", "eof")).code() == ErrorCode::ParseError);
    REQUIRE(Error(ConfigError::invalid_value("substeps", "zero")).code() == ErrorCode::ValidationError);
}

TEST_CASE("Error: worker errors map to codes", "[core][error]") {
    Error stopped = WorkerError::stopped("physics");
    REQUIRE(stopped.code() == ErrorCode::Shutdown);
    REQUIRE(stopped.is<WorkerError>());
    REQUIRE(stopped.as<WorkerError>()->worker == "physics");
    REQUIRE(stopped.as<ConfigError>() == nullptr);

    Error failed = WorkerError::task_failed("physics", "diverged");
    REQUIRE(failed.code() == ErrorCode::InvalidState);
    REQUIRE(contains(failed.message(), "diverged"));
}

TEST_CASE("Error: plain messages", "[core][error]") {
    Error err("something broke");
    REQUIRE(err.code() == ErrorCode::Unknown);
    REQUIRE(err.message() == "something broke");
    REQUIRE(err.is<std::string>());

    Error coded(ErrorCode::InvalidState, "not now");
    REQUIRE(coded.code() == ErrorCode::InvalidState);
}

TEST_CASE("Error: context", "[core][error]") {
    Error err = ConfigError::invalid_value("gravity", "not an array");
    err.with_context("file", "space.json").with_context("solver", "null");

    REQUIRE(*err.get_context("file") == "space.json");
    REQUIRE(*err.get_context("solver") == "null");
    REQUIRE(err.get_context("missing") == nullptr);
    REQUIRE(err.context().size() == 2);
}

TEST_CASE("build_error_chain: includes kind details and context", "[core][error]") {
    SECTION("config value") {
        Error err = ConfigError::invalid_value("substeps", "must be at least 1");
        err.with_context("file", "space.json");

        std::string chain = build_error_chain(err);
        REQUIRE(contains(chain, "[ValidationError]"));
        REQUIRE(contains(chain, "[ConfigError]"));
        REQUIRE(contains(chain, "(key: substeps)"));
        REQUIRE(contains(chain, "{file=space.json}"));
    }

    SECTION("config file") {
        std::string chain = build_error_chain(ConfigError::file_not_found("/tmp/none.json"));
        REQUIRE(contains(chain, "[NotFound]"));
        REQUIRE(contains(chain, "(path: /tmp/none.json)"));
    }

    SECTION("worker") {
        std::string chain = build_error_chain(WorkerError::task_failed("w", "boom"));
        REQUIRE(contains(chain, "[WorkerError]"));
        REQUIRE(contains(chain, "boom"));
    }
}

// =============================================================================
// Result
// =============================================================================

TEST_CASE("Result: value or error", "[core][result]") {
    auto ok = parse_positive(3);
    REQUIRE(ok.is_ok());
    REQUIRE(static_cast<bool>(ok));
    REQUIRE(ok.value() == 3);

    auto err = parse_positive(-1);
    REQUIRE(err.is_err());
    REQUIRE_FALSE(static_cast<bool>(err));
    REQUIRE(err.error().as<ConfigError>()->key == "count");
}

TEST_CASE("Result: void", "[core][result]") {
    REQUIRE(submit_to(true).is_ok());

    auto stopped = submit_to(false);
    REQUIRE(stopped.is_err());
    REQUIRE(stopped.error().code() == ErrorCode::Shutdown);
}

TEST_CASE("Result: move the value out", "[core][result]") {
    Result<std::string> r = Ok(std::string("space.json"));
    std::string moved = std::move(r).value();
    REQUIRE(moved == "space.json");
}
