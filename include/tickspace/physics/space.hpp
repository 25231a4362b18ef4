/// @file space.hpp
/// @brief Physics space and step scheduler for tick_physics
///
/// The Space owns a set of rigid bodies and decides, once per external tick,
/// whether to advance them. The numerical advance runs on a single worker;
/// everything else (prepare phase, collision fan-out, membership changes)
/// runs on the caller context that invokes step().
///
/// One step moves through four states:
///
///     Idle -> Preparing -> Solving -> Completing -> Idle
///
/// Preparing and Completing run on the caller. Solving covers the time the
/// advance is queued on or running on the worker. The Completing phase of a
/// step runs during a later step() or poll() call, once the worker has
/// handed the result back through the completion channel.

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "body.hpp"
#include "clock.hpp"
#include "collision.hpp"
#include "config.hpp"
#include "registry.hpp"
#include "solver.hpp"
#include "worker.hpp"
#include "world_component.hpp"

#include <tickspace/event/channel.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

namespace tick_physics {

/// Physics tick scheduler and simulation space.
///
/// Not thread-safe: every public member must be called from the same caller
/// context. Membership changes made while a step is Solving or Completing
/// are deferred and applied, in call order, when that step completes.
class Space {
public:
    /// Space with a NullSolver and a ThreadWorker named config.worker_name.
    /// Settings that fail SpaceConfig::validate() are logged and replaced by
    /// their defaults.
    explicit Space(SpaceConfig config = SpaceConfig::defaults());

    /// Space with injected collaborators. Null solver or worker fall back to
    /// the defaults above.
    Space(SpaceConfig config,
          std::unique_ptr<ISolver> solver,
          std::unique_ptr<IWorker> worker,
          Clock clock = Clock());

    ~Space();

    Space(const Space&) = delete;
    Space& operator=(const Space&) = delete;

    // =========================================================================
    // Bodies
    // =========================================================================

    /// Register a body (no-op if already registered)
    void add_body(BodyPtr body);

    /// Unregister a body (no-op if not registered)
    void remove_body(BodyPtr body);

    /// Add an element's body. Resets the element first if its body is not
    /// already in a world; always wakes the body.
    /// @note When deferred, the element is held by reference until the
    /// in-flight step completes and must stay alive until then, unless
    /// remove_element() cancels the add first.
    void add_element(IPhysicsElement& element);

    /// Remove an element's body. The body is resolved at call time, so the
    /// element may be destroyed right after this returns.
    void remove_element(IPhysicsElement& element);

    [[nodiscard]] std::vector<BodyPtr> query_by_kind(BodyKind kind) const {
        return m_registry.query_by_kind(kind);
    }

    template<typename T>
    [[nodiscard]] std::vector<std::shared_ptr<T>> bodies_of() const {
        return m_registry.bodies_of<T>();
    }

    [[nodiscard]] bool contains(const BodyPtr& body) const { return m_registry.contains(body); }
    [[nodiscard]] std::size_t body_count() const noexcept { return m_registry.size(); }
    [[nodiscard]] bool is_empty() const noexcept { return m_registry.is_empty(); }

    [[nodiscard]] const RigidBodyRegistry& registry() const noexcept { return m_registry; }

    /// Membership changes waiting for the in-flight step to complete
    [[nodiscard]] std::size_t pending_mutations() const noexcept { return m_pending.size(); }

    // =========================================================================
    // World Components
    // =========================================================================

    void add_world_component(WorldComponentPtr component);

    [[nodiscard]] std::vector<WorldComponentPtr> world_components() const {
        return m_pipeline.components();
    }

    // =========================================================================
    // Stepping
    // =========================================================================

    /// Run one scheduler tick.
    ///
    /// Completes any finished step, refreshes element interpolation frames,
    /// then starts a new step if can_step() and should_step() both hold.
    /// Never blocks on the worker.
    void step(const StepPredicate& should_step);

    /// step() with a predicate that is always true
    void step();

    /// Complete any step the worker has finished, without starting a new one
    /// @return Number of steps completed
    std::size_t poll();

    /// Block until the in-flight step (if any) has been solved, then
    /// complete it
    void wait_idle();

    // =========================================================================
    // State
    // =========================================================================

    [[nodiscard]] SpaceState state() const noexcept { return m_state; }

    /// True from the start of Preparing until the end of Completing
    [[nodiscard]] bool is_stepping() const noexcept { return m_state != SpaceState::Idle; }

    /// True when no step is in flight and there is work to do (warm-up not
    /// finished, or at least one body)
    [[nodiscard]] bool can_step() const noexcept {
        return !is_stepping() && (is_in_presim() || !is_empty());
    }

    [[nodiscard]] bool is_in_presim() const noexcept {
        return presim_steps() < m_config.max_presim_steps;
    }

    /// Warm-up ticks run so far (never exceeds max_presim_steps)
    [[nodiscard]] std::uint32_t presim_steps() const noexcept {
        return m_presim_steps.load(std::memory_order_acquire);
    }

    [[nodiscard]] const SpaceStats& stats() const noexcept { return m_stats; }

    // =========================================================================
    // Notifications
    // =========================================================================

    /// Called at the start of every step that actually starts
    void on_step(StepCallback callback);

    void on_element_collision(ElementCollisionCallback callback);
    void on_block_collision(BlockCollisionCallback callback);

    // =========================================================================
    // Configuration
    // =========================================================================

    [[nodiscard]] const SpaceConfig& config() const noexcept { return m_config; }

    [[nodiscard]] const tick_math::Vec3& gravity() const noexcept { return m_config.gravity; }

    /// Takes effect from the next step queued
    void set_gravity(const tick_math::Vec3& gravity) noexcept { m_config.gravity = gravity; }

    [[nodiscard]] ISolver& solver() noexcept { return *m_solver; }
    [[nodiscard]] IWorker& worker() noexcept { return *m_worker; }

private:
    struct PendingMutation {
        enum class Op : std::uint8_t { AddBody, RemoveBody, AddElement };

        Op op;
        BodyPtr body;
        IPhysicsElement* element = nullptr;
    };

    /// Membership changes are deferred while the worker may hold a snapshot
    [[nodiscard]] bool must_defer() const noexcept {
        return m_state == SpaceState::Solving || m_state == SpaceState::Completing;
    }

    void apply_mutation(const PendingMutation& mutation);
    void apply_add_element(IPhysicsElement& element);
    void apply_remove_element(IPhysicsElement& element);

    void update_element_frames();
    void prepare();
    void submit_advance();
    void run_advance(AdvanceRequest request, const std::vector<BodyPtr>& bodies);
    void complete_step(StepCompletion completion);
    void finish_step();

    SpaceConfig m_config;
    std::unique_ptr<ISolver> m_solver;
    Clock m_clock;

    RigidBodyRegistry m_registry;
    WorldComponentPipeline m_pipeline;
    CollisionDispatcher m_dispatcher;
    std::vector<StepCallback> m_step_callbacks;

    SpaceState m_state = SpaceState::Idle;
    std::atomic<std::uint32_t> m_presim_steps{0};
    std::vector<PendingMutation> m_pending;
    SpaceStats m_stats;

    tick_event::EventChannel<StepCompletion> m_completions;

    // Declared last: destroyed (and joined) before anything its jobs touch
    std::unique_ptr<IWorker> m_worker;
};

} // namespace tick_physics
