/// @file test_registry.cpp
/// @brief Tests for RigidBodyRegistry

#include <catch2/catch_test_macros.hpp>
#include <tickspace/physics/registry.hpp>
#include <tickspace/physics/element.hpp>

using namespace tick_physics;

namespace {

class TestElement : public IPhysicsElement {
public:
    TestElement() : m_body(std::make_shared<ElementRigidBody>(*this)) {}
    std::shared_ptr<ElementRigidBody> rigid_body() const override { return m_body; }

private:
    std::shared_ptr<ElementRigidBody> m_body;
};

} // namespace

TEST_CASE("RigidBodyRegistry: add marks body in world and active", "[physics][registry]") {
    RigidBodyRegistry registry;
    auto body = std::make_shared<GenericRigidBody>();

    REQUIRE(registry.add(body));
    REQUIRE(body->is_in_world());
    REQUIRE(body->is_active());
    REQUIRE(registry.size() == 1);
    REQUIRE(registry.contains(body));
    REQUIRE_FALSE(registry.is_empty());
}

TEST_CASE("RigidBodyRegistry: add is idempotent", "[physics][registry]") {
    RigidBodyRegistry registry;
    auto body = std::make_shared<GenericRigidBody>();

    REQUIRE(registry.add(body));
    REQUIRE_FALSE(registry.add(body));
    REQUIRE(registry.size() == 1);

    REQUIRE_FALSE(registry.add(nullptr));
    REQUIRE(registry.size() == 1);
}

TEST_CASE("RigidBodyRegistry: remove", "[physics][registry]") {
    RigidBodyRegistry registry;
    auto body = std::make_shared<GenericRigidBody>();
    registry.add(body);

    REQUIRE(registry.remove(body));
    REQUIRE_FALSE(body->is_in_world());
    REQUIRE(registry.is_empty());

    SECTION("removing a non-member is a no-op") {
        REQUIRE_FALSE(registry.remove(body));
        REQUIRE_FALSE(registry.remove(nullptr));
        REQUIRE(registry.is_empty());
    }
}

TEST_CASE("RigidBodyRegistry: queries preserve registration order", "[physics][registry]") {
    RigidBodyRegistry registry;
    TestElement e1;
    TestElement e2;
    auto block = std::make_shared<BlockRigidBody>(tick_math::IVec3{0, 0, 0});
    auto generic = std::make_shared<GenericRigidBody>();

    registry.add(e1.rigid_body());
    registry.add(block);
    registry.add(generic);
    registry.add(e2.rigid_body());

    SECTION("query_by_kind") {
        auto elements = registry.query_by_kind(BodyKind::Element);
        REQUIRE(elements.size() == 2);
        REQUIRE(elements[0] == e1.rigid_body());
        REQUIRE(elements[1] == e2.rigid_body());

        REQUIRE(registry.query_by_kind(BodyKind::Block).size() == 1);
        REQUIRE(registry.query_by_kind(BodyKind::Generic).size() == 1);
    }

    SECTION("bodies_of") {
        auto elements = registry.bodies_of<ElementRigidBody>();
        REQUIRE(elements.size() == 2);
        REQUIRE(&elements[0]->element() == &e1);

        REQUIRE(registry.bodies_of<BlockRigidBody>().size() == 1);
        REQUIRE(registry.bodies_of<RigidBody>().size() == 4);
    }

    SECTION("snapshot is a copy") {
        auto snapshot = registry.snapshot();
        registry.remove(block);
        REQUIRE(snapshot.size() == 4);
        REQUIRE(registry.size() == 3);
        REQUIRE(snapshot[1] == block);
    }

    SECTION("find by id") {
        REQUIRE(registry.find(block->id()) == block);
        REQUIRE(registry.find(BodyId::invalid()) == nullptr);
    }
}

TEST_CASE("RigidBodyRegistry: clear", "[physics][registry]") {
    RigidBodyRegistry registry;
    auto a = std::make_shared<GenericRigidBody>();
    auto b = std::make_shared<GenericRigidBody>();
    registry.add(a);
    registry.add(b);

    registry.clear();
    REQUIRE(registry.is_empty());
    REQUIRE_FALSE(a->is_in_world());
    REQUIRE_FALSE(b->is_in_world());
}
