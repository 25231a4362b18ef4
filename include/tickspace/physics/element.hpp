/// @file element.hpp
/// @brief Physics element interface for tick_physics

#pragma once

#include "fwd.hpp"

#include <memory>

namespace tick_physics {

/// An object outside the space that owns an ElementRigidBody.
///
/// The space calls back into the element during the prepare phase of every
/// step and when it is (re)added. Implementations must outlive the time
/// their body spends in a space. An element handed to Space::add_element()
/// while a step is in flight must also stay alive until that step completes,
/// since the add is applied then; Space::remove_element() cancels such an
/// add and releases the element immediately.
class IPhysicsElement {
public:
    virtual ~IPhysicsElement() = default;

    /// The body this element drives
    [[nodiscard]] virtual std::shared_ptr<ElementRigidBody> rigid_body() const = 0;

    /// Restore the body to its spawn state before it enters a space
    virtual void reset() {}

    /// Per-step hook, run on the caller context before the advance
    virtual void step(Space& space) { (void)space; }
};

} // namespace tick_physics
