/// @file body.cpp
/// @brief Rigid body implementations for tick_physics

#include <tickspace/physics/body.hpp>

#include <atomic>

namespace tick_physics {

// =============================================================================
// Helper functions
// =============================================================================

namespace {

BodyId next_body_id() {
    static std::atomic<std::uint64_t> s_next_id{1};
    return BodyId{s_next_id.fetch_add(1, std::memory_order_relaxed)};
}

tick_math::Transform cell_center(const tick_math::IVec3& cell) {
    return tick_math::Transform::from_position(tick_math::Vec3(cell) + tick_math::Vec3(0.5f));
}

} // anonymous namespace

// =============================================================================
// RigidBody
// =============================================================================

RigidBody::RigidBody(const tick_math::Transform& transform, float mass)
    : m_id(next_body_id())
    , m_transform(transform)
    , m_mass(mass)
{
}

void RigidBody::apply_central_force(const tick_math::Vec3& force) noexcept {
    if (is_static()) {
        return;
    }
    m_force += force;
}

// =============================================================================
// ElementFrame
// =============================================================================

tick_math::Transform ElementFrame::interpolate(float tick_delta) const noexcept {
    if (tick_delta <= 0.0f) {
        return m_previous;
    }
    if (tick_delta >= 1.0f) {
        return m_current;
    }
    return m_previous.lerp(m_current, tick_delta);
}

// =============================================================================
// ElementRigidBody
// =============================================================================

ElementRigidBody::ElementRigidBody(IPhysicsElement& element,
                                   const tick_math::Transform& transform,
                                   float mass)
    : RigidBody(transform, mass)
    , m_element(&element)
    , m_published(transform)
    , m_frame(transform)
{
}

// =============================================================================
// BlockRigidBody
// =============================================================================

BlockRigidBody::BlockRigidBody(const tick_math::IVec3& cell)
    : RigidBody(cell_center(cell), 0.0f)
    , m_cell(cell)
{
}

// =============================================================================
// GenericRigidBody
// =============================================================================

GenericRigidBody::GenericRigidBody(const tick_math::Transform& transform,
                                   float mass,
                                   bool is_static_body)
    : RigidBody(transform, mass)
    , m_static(is_static_body)
{
}

} // namespace tick_physics
