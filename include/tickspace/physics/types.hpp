/// @file types.hpp
/// @brief Core types for tick_physics

#pragma once

#include "fwd.hpp"

#include <tickspace/math/types.hpp>
#include <tickspace/math/transform.hpp>
#include <tickspace/core/error.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace tick_physics {

// =============================================================================
// Body Kinds
// =============================================================================

/// Kind tag used for collision classification
enum class BodyKind : std::uint8_t {
    Element,        ///< Dynamic body owned by a physics element
    Block,          ///< Static terrain proxy
    Generic,        ///< Anything else; never classified
};

/// Get body kind name
[[nodiscard]] const char* to_string(BodyKind kind);

// =============================================================================
// Contact Classification
// =============================================================================

/// Semantic category of a contact report
enum class ContactClass : std::uint8_t {
    ElementElement,
    ElementBlock,
    Unclassified,
};

/// Get contact class name
[[nodiscard]] const char* to_string(ContactClass contact_class);

// =============================================================================
// Scheduler State
// =============================================================================

/// Step scheduler state. Cyclic, starts and rests at Idle.
enum class SpaceState : std::uint8_t {
    Idle,           ///< No step in flight
    Preparing,      ///< Caller context running hooks and world components
    Solving,        ///< Advance queued on, or running on, the worker
    Completing,     ///< Caller context fanning out collisions
};

/// Get state name
[[nodiscard]] const char* to_string(SpaceState state);

// =============================================================================
// Identifiers
// =============================================================================

/// Body identifier
struct BodyId {
    std::uint64_t value = 0;

    [[nodiscard]] bool is_valid() const noexcept { return value != 0; }
    [[nodiscard]] static BodyId invalid() { return BodyId{0}; }

    bool operator==(const BodyId& other) const noexcept { return value == other.value; }
    bool operator!=(const BodyId& other) const noexcept { return value != other.value; }
    bool operator<(const BodyId& other) const noexcept { return value < other.value; }
};

// =============================================================================
// Advance
// =============================================================================

/// Parameters handed to the solver for one live advance
struct AdvanceRequest {
    float elapsed = 0.0f;                   ///< Seconds to advance
    std::uint32_t substeps = 5;             ///< Solver substeps
    tick_math::Vec3 gravity = tick_math::STANDARD_GRAVITY;
};

/// Raw contact reported by an advance: one per touching pair per step
struct ContactReport {
    BodyPtr body_a;
    BodyPtr body_b;
    float impulse = 0.0f;                   ///< Applied impulse magnitude
};

/// Element body transform sampled on the worker once its advance finished
struct ElementSample {
    std::shared_ptr<ElementRigidBody> body;
    tick_math::Transform transform;
};

/// Result of one queued advance, sent from the worker to the caller context
struct StepCompletion {
    std::vector<ContactReport> contacts;
    std::vector<ElementSample> element_samples;   ///< Every element body of the step
    bool live = false;                      ///< false for a warm-up tick
    float elapsed = 0.0f;                   ///< Seconds advanced (live only)
    std::optional<tick_core::Error> error;  ///< Set when the advance threw
};

// =============================================================================
// Statistics
// =============================================================================

/// Scheduler counters
struct SpaceStats {
    std::uint64_t steps_started = 0;        ///< Prepare phases entered
    std::uint64_t steps_completed = 0;      ///< Continuations run
    std::uint64_t live_advances = 0;
    std::uint64_t warmup_ticks = 0;
    std::uint64_t skipped_in_flight = 0;    ///< step() calls made while stepping
    std::uint64_t contacts_reported = 0;
    std::uint64_t notifications_sent = 0;
    std::uint64_t failed_advances = 0;
    float last_elapsed = 0.0f;
};

// =============================================================================
// Callbacks
// =============================================================================

/// Pre-step notification, fired once per step that actually starts
using StepCallback = std::function<void(Space&)>;

/// Element on element collision
using ElementCollisionCallback =
    std::function<void(IPhysicsElement& a, IPhysicsElement& b, float impulse)>;

/// Element on block collision, always element first
using BlockCollisionCallback =
    std::function<void(IPhysicsElement& element, BlockRigidBody& block, float impulse)>;

/// Step predicate supplied by the caller (e.g. "game is not paused")
using StepPredicate = std::function<bool()>;

} // namespace tick_physics

// =============================================================================
// Hash Specializations
// =============================================================================

template<>
struct std::hash<tick_physics::BodyId> {
    std::size_t operator()(const tick_physics::BodyId& id) const noexcept {
        return std::hash<std::uint64_t>{}(id.value);
    }
};
