/// @file registry.hpp
/// @brief Rigid body membership for tick_physics

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "body.hpp"

#include <memory>
#include <vector>

namespace tick_physics {

/// Authoritative set of bodies participating in simulation.
///
/// Registration order is preserved and is the order the solver and every
/// query see. Not thread-safe; only the caller context mutates it, and the
/// worker only ever sees snapshot() copies.
class RigidBodyRegistry {
public:
    RigidBodyRegistry() = default;

    RigidBodyRegistry(const RigidBodyRegistry&) = delete;
    RigidBodyRegistry& operator=(const RigidBodyRegistry&) = delete;

    // =========================================================================
    // Membership
    // =========================================================================

    /// Register a body. Marks it in-world and activates it.
    /// @return false if body is null or already registered
    bool add(const BodyPtr& body);

    /// Unregister a body and clear its in-world flag
    /// @return false if body is not registered
    bool remove(const BodyPtr& body);

    /// Remove every body
    void clear();

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] bool contains(const BodyPtr& body) const;

    [[nodiscard]] BodyPtr find(BodyId id) const;

    /// Bodies of one kind, in registration order
    [[nodiscard]] std::vector<BodyPtr> query_by_kind(BodyKind kind) const;

    /// Bodies of one concrete type, in registration order
    template<typename T>
    [[nodiscard]] std::vector<std::shared_ptr<T>> bodies_of() const {
        std::vector<std::shared_ptr<T>> result;
        for (const auto& body : m_bodies) {
            if (auto typed = std::dynamic_pointer_cast<T>(body)) {
                result.push_back(std::move(typed));
            }
        }
        return result;
    }

    /// Copy of every member, in registration order
    [[nodiscard]] std::vector<BodyPtr> snapshot() const { return m_bodies; }

    [[nodiscard]] std::size_t size() const noexcept { return m_bodies.size(); }
    [[nodiscard]] bool is_empty() const noexcept { return m_bodies.empty(); }

    /// Iterate members in registration order
    template<typename F>
    void for_each(F&& func) const {
        for (const auto& body : m_bodies) {
            func(*body);
        }
    }

private:
    std::vector<BodyPtr> m_bodies;
};

} // namespace tick_physics
