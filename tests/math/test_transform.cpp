// tick_math transform tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <tickspace/math/transform.hpp>

#include <glm/gtc/constants.hpp>

using namespace tick_math;
using Catch::Matchers::WithinAbs;

// =============================================================================
// Transform Creation Tests
// =============================================================================

TEST_CASE("Transform default", "[math][transform]") {
    Transform t;
    REQUIRE(t.position == vec3::ZERO);
    REQUIRE(approx_equal(t.rotation, quat::IDENTITY));
    REQUIRE(t == Transform::identity());
}

TEST_CASE("Transform from_position", "[math][transform]") {
    Transform t = Transform::from_position(Vec3(1.0f, 2.0f, 3.0f));
    REQUIRE(t.position == Vec3(1.0f, 2.0f, 3.0f));
    REQUIRE(approx_equal(t.rotation, quat::IDENTITY));
}

TEST_CASE("Transform with_position keeps rotation", "[math][transform]") {
    Quat rot = glm::angleAxis(glm::half_pi<float>(), vec3::UP);
    Transform t = Transform(Vec3(0.0f), rot).with_position(Vec3(4.0f, 0.0f, 0.0f));

    REQUIRE(t.position == Vec3(4.0f, 0.0f, 0.0f));
    REQUIRE(approx_equal(t.rotation, rot));
}

// =============================================================================
// Transform Operations
// =============================================================================

TEST_CASE("Transform transform_point", "[math][transform]") {
    Quat rot = glm::angleAxis(glm::half_pi<float>(), vec3::UP);
    Transform t(Vec3(10.0f, 0.0f, 0.0f), rot);

    // +X rotated a quarter turn about +Y lands on -Z
    Vec3 p = t.transform_point(Vec3(1.0f, 0.0f, 0.0f));
    REQUIRE_THAT(p.x, WithinAbs(10.0f, 1e-5f));
    REQUIRE_THAT(p.y, WithinAbs(0.0f, 1e-5f));
    REQUIRE_THAT(p.z, WithinAbs(-1.0f, 1e-5f));
}

TEST_CASE("Transform lerp", "[math][transform]") {
    Transform a = Transform::from_position(Vec3(0.0f, 0.0f, 0.0f));
    Transform b(Vec3(2.0f, 4.0f, 0.0f), glm::angleAxis(glm::half_pi<float>(), vec3::UP));

    SECTION("endpoints") {
        REQUIRE(approx_equal(a.lerp(b, 0.0f), a));
        REQUIRE(approx_equal(a.lerp(b, 1.0f), b));
    }

    SECTION("midpoint") {
        Transform mid = a.lerp(b, 0.5f);
        REQUIRE(approx_equal(mid.position, Vec3(1.0f, 2.0f, 0.0f)));
        REQUIRE(approx_equal(mid.rotation, glm::angleAxis(glm::quarter_pi<float>(), vec3::UP)));
    }
}

TEST_CASE("Quaternion approx_equal treats q and -q alike", "[math][quat]") {
    Quat q = glm::angleAxis(0.3f, vec3::UP);
    REQUIRE(approx_equal(q, -q));
    REQUIRE_FALSE(approx_equal(q, quat::IDENTITY));
}
