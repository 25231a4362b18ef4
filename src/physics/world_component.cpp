/// @file world_component.cpp
/// @brief WorldComponentPipeline implementation

#include <tickspace/physics/world_component.hpp>
#include <tickspace/core/log.hpp>

namespace tick_physics {

void WorldComponentPipeline::add(WorldComponentPtr component) {
    if (!component) {
        return;
    }
    tick_core::physics_logger()->debug("Registered world component '{}'", component->name());
    m_components.push_back(std::move(component));
}

void WorldComponentPipeline::apply_all(Space& space) {
    // Index loop: a component may register another one while applying
    for (std::size_t i = 0; i < m_components.size(); ++i) {
        auto component = m_components[i];
        component->apply(space);
    }
}

} // namespace tick_physics
