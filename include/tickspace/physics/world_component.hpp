/// @file world_component.hpp
/// @brief Per-step world mutators for tick_physics

#pragma once

#include "fwd.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace tick_physics {

// =============================================================================
// IWorldComponent
// =============================================================================

/// A mutator applied to the space once per step, on the caller context,
/// before the advance is queued (force generators, buoyancy, and so on).
class IWorldComponent {
public:
    virtual ~IWorldComponent() = default;

    /// Apply this component to the space
    virtual void apply(Space& space) = 0;

    /// Name used in logs
    [[nodiscard]] virtual std::string name() const { return "world_component"; }
};

/// World component wrapping a callable
class FunctionComponent : public IWorldComponent {
public:
    using Function = std::function<void(Space&)>;

    explicit FunctionComponent(Function func, std::string name = "function_component")
        : m_func(std::move(func)), m_name(std::move(name)) {}

    void apply(Space& space) override {
        if (m_func) {
            m_func(space);
        }
    }

    [[nodiscard]] std::string name() const override { return m_name; }

private:
    Function m_func;
    std::string m_name;
};

// =============================================================================
// WorldComponentPipeline
// =============================================================================

/// Ordered, append-only list of world components
class WorldComponentPipeline {
public:
    /// Append a component. Null components are ignored.
    void add(WorldComponentPtr component);

    /// Apply every component once, in registration order
    void apply_all(Space& space);

    [[nodiscard]] std::size_t size() const noexcept { return m_components.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_components.empty(); }

    /// Copy of the registered components
    [[nodiscard]] std::vector<WorldComponentPtr> components() const { return m_components; }

private:
    std::vector<WorldComponentPtr> m_components;
};

} // namespace tick_physics
