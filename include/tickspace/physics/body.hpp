/// @file body.hpp
/// @brief Rigid body definitions for tick_physics

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <tickspace/math/transform.hpp>

#include <memory>

namespace tick_physics {

// =============================================================================
// RigidBody
// =============================================================================

/// Base class for every simulated body.
///
/// Transforms, velocities and the force accumulator belong to the solver on
/// the worker while a step is Solving. The caller context must not read or
/// write them in that window; the Space itself only reads the transform
/// samples the worker hands back with each completed step. Membership is only
/// changed through RigidBodyRegistry.
class RigidBody {
public:
    virtual ~RigidBody() = default;

    RigidBody(const RigidBody&) = delete;
    RigidBody& operator=(const RigidBody&) = delete;

    // =========================================================================
    // Identity
    // =========================================================================

    /// Unique, never-reused body ID
    [[nodiscard]] BodyId id() const noexcept { return m_id; }

    /// Kind tag used for collision classification
    [[nodiscard]] virtual BodyKind kind() const noexcept = 0;

    /// Static bodies are never moved by the solver
    [[nodiscard]] virtual bool is_static() const noexcept { return false; }

    // =========================================================================
    // Membership / activation
    // =========================================================================

    /// True while registered with a RigidBodyRegistry
    [[nodiscard]] bool is_in_world() const noexcept { return m_in_world; }

    [[nodiscard]] bool is_active() const noexcept { return m_active; }

    /// Wake the body so the solver simulates it on its next pass
    void activate() noexcept { m_active = true; }

    void deactivate() noexcept { m_active = false; }

    // =========================================================================
    // Transform
    // =========================================================================

    [[nodiscard]] const tick_math::Transform& transform() const noexcept { return m_transform; }
    void set_transform(const tick_math::Transform& t) noexcept { m_transform = t; }

    [[nodiscard]] const tick_math::Vec3& position() const noexcept { return m_transform.position; }
    void set_position(const tick_math::Vec3& pos) noexcept { m_transform.position = pos; }

    [[nodiscard]] const tick_math::Quat& rotation() const noexcept { return m_transform.rotation; }
    void set_rotation(const tick_math::Quat& rot) noexcept { m_transform.rotation = rot; }

    // =========================================================================
    // Dynamics
    // =========================================================================

    /// Mass in kg (0 for static bodies)
    [[nodiscard]] float mass() const noexcept { return is_static() ? 0.0f : m_mass; }
    void set_mass(float mass) noexcept { m_mass = mass; }

    [[nodiscard]] const tick_math::Vec3& linear_velocity() const noexcept { return m_linear_velocity; }
    void set_linear_velocity(const tick_math::Vec3& v) noexcept { m_linear_velocity = v; }

    [[nodiscard]] const tick_math::Vec3& angular_velocity() const noexcept { return m_angular_velocity; }
    void set_angular_velocity(const tick_math::Vec3& v) noexcept { m_angular_velocity = v; }

    /// Accumulate a force through the center of mass for the next advance
    void apply_central_force(const tick_math::Vec3& force) noexcept;

    /// Forces accumulated since the last clear_forces()
    [[nodiscard]] const tick_math::Vec3& total_force() const noexcept { return m_force; }

    void clear_forces() noexcept { m_force = tick_math::vec3::ZERO; }

protected:
    RigidBody(const tick_math::Transform& transform, float mass);

private:
    friend class RigidBodyRegistry;

    void set_in_world(bool in_world) noexcept { m_in_world = in_world; }

    BodyId m_id;
    tick_math::Transform m_transform;
    tick_math::Vec3 m_linear_velocity{0.0f};
    tick_math::Vec3 m_angular_velocity{0.0f};
    tick_math::Vec3 m_force{0.0f};
    float m_mass;
    bool m_in_world = false;
    bool m_active = false;
};

// =============================================================================
// ElementFrame
// =============================================================================

/// Previous/current transform pair used to interpolate an element between
/// two physics ticks.
class ElementFrame {
public:
    ElementFrame() = default;
    explicit ElementFrame(const tick_math::Transform& t) : m_previous(t), m_current(t) {}

    /// Shift current into previous and record t as current
    void update(const tick_math::Transform& t) noexcept {
        m_previous = m_current;
        m_current = t;
    }

    /// Snap both samples to t (no interpolation across a teleport)
    void reset(const tick_math::Transform& t) noexcept {
        m_previous = t;
        m_current = t;
    }

    [[nodiscard]] const tick_math::Transform& previous() const noexcept { return m_previous; }
    [[nodiscard]] const tick_math::Transform& current() const noexcept { return m_current; }

    /// Interpolated transform, tick_delta in [0, 1]
    [[nodiscard]] tick_math::Transform interpolate(float tick_delta) const noexcept;

    [[nodiscard]] tick_math::Vec3 location(float tick_delta) const noexcept {
        return interpolate(tick_delta).position;
    }

private:
    tick_math::Transform m_previous;
    tick_math::Transform m_current;
};

// =============================================================================
// Body Variants
// =============================================================================

/// Dynamic body belonging to a physics element.
///
/// Holds its element by reference only; the element owns this body and must
/// outlive its registration.
class ElementRigidBody : public RigidBody {
public:
    ElementRigidBody(IPhysicsElement& element,
                     const tick_math::Transform& transform = {},
                     float mass = 1.0f);

    [[nodiscard]] BodyKind kind() const noexcept override { return BodyKind::Element; }

    [[nodiscard]] IPhysicsElement& element() const noexcept { return *m_element; }

    [[nodiscard]] const ElementFrame& frame() const noexcept { return m_frame; }

    /// Transform last handed to the caller context. update_frame() reads
    /// this, never the live transform.
    [[nodiscard]] const tick_math::Transform& published_transform() const noexcept {
        return m_published;
    }

    /// Publish the live transform
    /// @note Caller context only, never while the body is being solved
    void publish_transform() noexcept { m_published = transform(); }

    /// Publish a transform sampled elsewhere (by the worker after an advance)
    void publish_transform(const tick_math::Transform& t) noexcept { m_published = t; }

    /// Record the published transform as the newest interpolation sample
    void update_frame() noexcept { m_frame.update(m_published); }

    /// Publish the live transform and snap the interpolation frame to it
    void reset_frame() noexcept {
        m_published = transform();
        m_frame.reset(m_published);
    }

private:
    IPhysicsElement* m_element;
    tick_math::Transform m_published;
    ElementFrame m_frame;
};

/// Static proxy for one terrain block cell
class BlockRigidBody : public RigidBody {
public:
    explicit BlockRigidBody(const tick_math::IVec3& cell);

    [[nodiscard]] BodyKind kind() const noexcept override { return BodyKind::Block; }
    [[nodiscard]] bool is_static() const noexcept override { return true; }

    /// Grid cell this body stands in for
    [[nodiscard]] const tick_math::IVec3& cell() const noexcept { return m_cell; }

private:
    tick_math::IVec3 m_cell;
};

/// Body with no semantic kind; takes part in simulation, never in
/// collision notifications
class GenericRigidBody : public RigidBody {
public:
    explicit GenericRigidBody(const tick_math::Transform& transform = {},
                              float mass = 1.0f,
                              bool is_static_body = false);

    [[nodiscard]] BodyKind kind() const noexcept override { return BodyKind::Generic; }
    [[nodiscard]] bool is_static() const noexcept override { return m_static; }

private:
    bool m_static;
};

} // namespace tick_physics
