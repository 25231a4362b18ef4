/// @file test_clock.cpp
/// @brief Tests for tick_physics Clock

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <tickspace/physics/clock.hpp>

#include <chrono>

using namespace tick_physics;
using namespace std::chrono_literals;
using Catch::Matchers::WithinAbs;

namespace {

struct ManualTime {
    Clock::TimePoint now{};

    Clock::TimeSource source() {
        return [this]() { return now; };
    }
};

} // namespace

TEST_CASE("Clock: consume reports time since construction", "[physics][clock]") {
    ManualTime time;
    Clock clock(time.source());

    time.now += 40ms;
    REQUIRE(clock.consume() == 40ms);
    REQUIRE(clock.consume_count() == 1);
}

TEST_CASE("Clock: consume is destructive", "[physics][clock]") {
    ManualTime time;
    Clock clock(time.source());

    time.now += 10ms;
    REQUIRE(clock.consume() == 10ms);
    REQUIRE(clock.consume() == Clock::Duration::zero());

    time.now += 25ms;
    REQUIRE(clock.consume() == 25ms);
}

TEST_CASE("Clock: peek does not move the sample point", "[physics][clock]") {
    ManualTime time;
    Clock clock(time.source());

    time.now += 5ms;
    REQUIRE(clock.peek() == 5ms);
    time.now += 5ms;
    REQUIRE(clock.peek() == 10ms);
    REQUIRE(clock.consume() == 10ms);
    REQUIRE(clock.consume_count() == 1);
}

TEST_CASE("Clock: reset discards accumulated time", "[physics][clock]") {
    ManualTime time;
    Clock clock(time.source());

    time.now += 500ms;
    clock.reset();
    time.now += 20ms;

    REQUIRE(clock.consume() == 20ms);
}

TEST_CASE("Clock: to_seconds", "[physics][clock]") {
    REQUIRE_THAT(Clock::to_seconds(std::chrono::milliseconds(250)), WithinAbs(0.25f, 1e-6f));
    REQUIRE_THAT(Clock::to_seconds(Clock::Duration::zero()), WithinAbs(0.0f, 1e-9f));
}

TEST_CASE("Clock: steady clock is monotonic", "[physics][clock]") {
    Clock clock;
    REQUIRE(clock.peek() >= Clock::Duration::zero());
    REQUIRE(clock.consume() >= Clock::Duration::zero());
}
