/// @file fwd.hpp
/// @brief Forward declarations for tick_physics

#pragma once

#include <cstdint>
#include <memory>

namespace tick_physics {

// Core Types
struct BodyId;
struct ContactReport;
struct AdvanceRequest;
struct StepCompletion;
struct ElementSample;
struct SpaceConfig;
struct SpaceStats;

// Enums
enum class BodyKind : std::uint8_t;
enum class ContactClass : std::uint8_t;
enum class SpaceState : std::uint8_t;

// Bodies
class RigidBody;
class ElementRigidBody;
class BlockRigidBody;
class GenericRigidBody;
class ElementFrame;
class IPhysicsElement;
class RigidBodyRegistry;

// Pipeline
class IWorldComponent;
class FunctionComponent;
class WorldComponentPipeline;
class CollisionDispatcher;

// Collaborators
class ISolver;
class NullSolver;
class IWorker;
class ThreadWorker;
class InlineWorker;

// Scheduling
class Clock;
class Space;

// Smart pointer aliases
using BodyPtr = std::shared_ptr<RigidBody>;
using WorldComponentPtr = std::shared_ptr<IWorldComponent>;

} // namespace tick_physics
