/// @file physics.hpp
/// @brief Main include header for tick_physics
///
/// tick_physics schedules a rigid body simulation against an external tick:
/// - Warm-up ("presimulation") ticks before real time is applied
/// - One advance in flight at a time, solved on a dedicated worker
/// - Per-step world components and element hooks on the caller context
/// - Collision notifications classified by body kind
///
/// ## Quick Start
///
/// ### Creating a Space
/// ```cpp
/// #include <tickspace/physics/physics.hpp>
///
/// auto loaded = tick_physics::SpaceConfig::load("space.json");
/// auto config = loaded ? loaded.value() : tick_physics::SpaceConfig::defaults();
///
/// tick_physics::Space space(config);
/// ```
///
/// ### Bodies and Elements
/// ```cpp
/// // Terrain proxy
/// space.add_body(std::make_shared<tick_physics::BlockRigidBody>(tick_math::IVec3{0, 0, 0}));
///
/// // Element-owned body; reset() is called before it enters the space
/// space.add_element(my_element);
/// ```
///
/// ### Ticking
/// ```cpp
/// // Once per game tick
/// space.step([&] { return !game.is_paused(); });
///
/// // On shutdown
/// space.wait_idle();
/// ```
///
/// ### Collision Callbacks
/// ```cpp
/// space.on_element_collision([](auto& a, auto& b, float impulse) {
///     // a and b are the two IPhysicsElement objects
/// });
///
/// space.on_block_collision([](auto& element, tick_physics::BlockRigidBody& block, float impulse) {
///     // element always comes first
/// });
/// ```
///
/// ### World Components
/// ```cpp
/// space.add_world_component(std::make_shared<tick_physics::FunctionComponent>(
///     [](tick_physics::Space& s) {
///         for (auto& body : s.bodies_of<tick_physics::ElementRigidBody>()) {
///             body->apply_central_force(s.gravity() * body->mass());
///         }
///     }, "gravity"));
/// ```

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "body.hpp"
#include "element.hpp"
#include "clock.hpp"
#include "registry.hpp"
#include "world_component.hpp"
#include "collision.hpp"
#include "solver.hpp"
#include "worker.hpp"
#include "config.hpp"
#include "space.hpp"

namespace tick_physics {

namespace prelude {
    using tick_physics::Space;
    using tick_physics::SpaceConfig;
    using tick_physics::SpaceState;
    using tick_physics::SpaceStats;

    using tick_physics::RigidBody;
    using tick_physics::ElementRigidBody;
    using tick_physics::BlockRigidBody;
    using tick_physics::GenericRigidBody;
    using tick_physics::ElementFrame;
    using tick_physics::IPhysicsElement;
    using tick_physics::BodyId;
    using tick_physics::BodyKind;
    using tick_physics::BodyPtr;

    using tick_physics::IWorldComponent;
    using tick_physics::FunctionComponent;
    using tick_physics::ContactReport;
    using tick_physics::ContactClass;

    using tick_physics::ISolver;
    using tick_physics::NullSolver;
    using tick_physics::IWorker;
    using tick_physics::ThreadWorker;
    using tick_physics::InlineWorker;
    using tick_physics::Clock;
} // namespace prelude

} // namespace tick_physics
