/// @file solver.hpp
/// @brief Numerical advance seam for tick_physics

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace tick_physics {

// =============================================================================
// ISolver
// =============================================================================

/// The numerical advance. Runs on the worker, never concurrently with
/// itself or with a prepare phase.
class ISolver {
public:
    virtual ~ISolver() = default;

    /// Integrate bodies forward by request.elapsed seconds
    /// @param request Elapsed time, substep count and gravity
    /// @param bodies Snapshot of the registry taken when the step was queued
    /// @return Contacts detected during the advance, one per touching pair
    /// @throws std::exception on solver failure; the space reports it and
    ///         skips collision fan-out for that step
    virtual std::vector<ContactReport> advance(const AdvanceRequest& request,
                                               const std::vector<BodyPtr>& bodies) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

// =============================================================================
// NullSolver
// =============================================================================

/// Solver that moves nothing and reports no contacts. Consumes accumulated
/// forces so they do not carry over into the next step.
class NullSolver : public ISolver {
public:
    std::vector<ContactReport> advance(const AdvanceRequest& request,
                                       const std::vector<BodyPtr>& bodies) override;

    [[nodiscard]] std::string name() const override { return "null"; }

    [[nodiscard]] std::uint64_t advance_count() const noexcept {
        return m_advances.load(std::memory_order_acquire);
    }

private:
    std::atomic<std::uint64_t> m_advances{0};
};

} // namespace tick_physics
