/// @file solver.cpp
/// @brief NullSolver implementation

#include <tickspace/physics/solver.hpp>
#include <tickspace/physics/body.hpp>

namespace tick_physics {

std::vector<ContactReport> NullSolver::advance(const AdvanceRequest& /*request*/,
                                               const std::vector<BodyPtr>& bodies) {
    for (const auto& body : bodies) {
        body->clear_forces();
    }
    m_advances.fetch_add(1, std::memory_order_acq_rel);
    return {};
}

} // namespace tick_physics
