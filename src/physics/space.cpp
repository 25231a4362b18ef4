/// @file space.cpp
/// @brief Space step scheduler implementation

#include <tickspace/physics/space.hpp>
#include <tickspace/physics/element.hpp>
#include <tickspace/core/log.hpp>

#include <algorithm>
#include <string>

namespace tick_physics {

namespace {

/// Replace every out-of-range setting with its default, logging each one
SpaceConfig sanitize_config(SpaceConfig config) {
    const SpaceConfig defaults = SpaceConfig::defaults();

    for (auto valid = config.validate(); !valid; valid = config.validate()) {
        const auto* config_error = valid.error().as<tick_core::ConfigError>();
        const std::string key = config_error ? config_error->key : std::string();

        tick_core::physics_logger()->warn("Invalid space config, falling back to default '{}': {}",
            key.empty() ? "<all>" : key, tick_core::build_error_chain(valid.error()));

        if (key == "substeps") {
            config.substeps = defaults.substeps;
        } else if (key == "max_elapsed") {
            config.max_elapsed = defaults.max_elapsed;
        } else if (key == "gravity") {
            config.gravity = defaults.gravity;
        } else {
            SpaceConfig fallback = defaults;
            fallback.max_presim_steps = config.max_presim_steps;
            fallback.worker_name = std::move(config.worker_name);
            config = std::move(fallback);
        }
    }

    return config;
}

} // namespace

// =============================================================================
// Construction
// =============================================================================

Space::Space(SpaceConfig config)
    : Space(std::move(config), nullptr, nullptr)
{
}

Space::Space(SpaceConfig config,
             std::unique_ptr<ISolver> solver,
             std::unique_ptr<IWorker> worker,
             Clock clock)
    : m_config(sanitize_config(std::move(config)))
    , m_solver(std::move(solver))
    , m_clock(std::move(clock))
    , m_worker(std::move(worker))
{
    if (!m_solver) {
        m_solver = std::make_unique<NullSolver>();
    }
    if (!m_worker) {
        m_worker = std::make_unique<ThreadWorker>(m_config.worker_name);
    }

    tick_core::physics_logger()->debug(
        "Space created: {} warm-up ticks, {} substeps, solver '{}', worker '{}'",
        m_config.max_presim_steps, m_config.substeps, m_solver->name(), m_worker->name());
}

Space::~Space() {
    // Finish any queued advance while everything it references is alive
    m_worker->shutdown();

    if (!m_completions.empty()) {
        tick_core::physics_logger()->debug("Space destroyed with {} uncompleted step(s)",
            m_completions.size());
    }
}

// =============================================================================
// Bodies
// =============================================================================

void Space::add_body(BodyPtr body) {
    if (!body) {
        return;
    }
    if (must_defer()) {
        m_pending.push_back({PendingMutation::Op::AddBody, std::move(body), nullptr});
        return;
    }
    m_registry.add(body);
}

void Space::remove_body(BodyPtr body) {
    if (!body) {
        return;
    }
    if (must_defer()) {
        m_pending.push_back({PendingMutation::Op::RemoveBody, std::move(body), nullptr});
        return;
    }
    m_registry.remove(body);
}

void Space::add_element(IPhysicsElement& element) {
    if (must_defer()) {
        m_pending.push_back({PendingMutation::Op::AddElement, nullptr, &element});
        return;
    }
    apply_add_element(element);
}

void Space::remove_element(IPhysicsElement& element) {
    if (must_defer()) {
        // Resolve the body now; the element may be destroyed before the
        // step completes
        for (auto& pending : m_pending) {
            if (pending.op == PendingMutation::Op::AddElement && pending.element == &element) {
                pending.element = nullptr;
            }
        }
        if (auto body = element.rigid_body()) {
            m_pending.push_back({PendingMutation::Op::RemoveBody, std::move(body), nullptr});
        }
        return;
    }
    apply_remove_element(element);
}

void Space::apply_add_element(IPhysicsElement& element) {
    auto body = element.rigid_body();
    if (!body) {
        tick_core::physics_logger()->warn("Ignoring element without a rigid body");
        return;
    }

    if (!body->is_in_world()) {
        element.reset();
        body->reset_frame();
        m_registry.add(body);
    }
    body->activate();
}

void Space::apply_remove_element(IPhysicsElement& element) {
    auto body = element.rigid_body();
    if (body) {
        m_registry.remove(body);
    }
}

void Space::apply_mutation(const PendingMutation& mutation) {
    switch (mutation.op) {
        case PendingMutation::Op::AddBody:
            m_registry.add(mutation.body);
            break;
        case PendingMutation::Op::RemoveBody:
            m_registry.remove(mutation.body);
            break;
        case PendingMutation::Op::AddElement:
            // Null once cancelled by a later remove_element
            if (mutation.element) {
                apply_add_element(*mutation.element);
            }
            break;
    }
}

// =============================================================================
// World Components / Notifications
// =============================================================================

void Space::add_world_component(WorldComponentPtr component) {
    m_pipeline.add(std::move(component));
}

void Space::on_step(StepCallback callback) {
    m_step_callbacks.push_back(std::move(callback));
}

void Space::on_element_collision(ElementCollisionCallback callback) {
    m_dispatcher.on_element_collision(std::move(callback));
}

void Space::on_block_collision(BlockCollisionCallback callback) {
    m_dispatcher.on_block_collision(std::move(callback));
}

// =============================================================================
// Stepping
// =============================================================================

void Space::step() {
    step([]() { return true; });
}

void Space::step(const StepPredicate& should_step) {
    poll();

    update_element_frames();

    if (!can_step()) {
        if (is_stepping()) {
            ++m_stats.skipped_in_flight;
            tick_core::physics_logger()->trace("Step skipped: previous step still {}",
                to_string(m_state));
        }
        return;
    }

    if (should_step && !should_step()) {
        return;
    }

    prepare();
    submit_advance();
}

std::size_t Space::poll() {
    std::size_t completed = 0;
    while (auto completion = m_completions.receive()) {
        complete_step(std::move(*completion));
        ++completed;
    }
    return completed;
}

void Space::wait_idle() {
    if (!is_stepping()) {
        return;
    }
    m_worker->wait_idle();
    poll();
}

void Space::update_element_frames() {
    // While Solving the live transforms belong to the worker; frames then
    // advance from the samples published by the last completed step
    const bool solving = m_state == SpaceState::Solving;

    m_registry.for_each([solving](RigidBody& body) {
        if (body.kind() == BodyKind::Element) {
            auto& element_body = static_cast<ElementRigidBody&>(body);
            if (!solving) {
                element_body.publish_transform();
            }
            element_body.update_frame();
        }
    });
}

void Space::prepare() {
    m_state = SpaceState::Preparing;
    ++m_stats.steps_started;

    try {
        for (auto& callback : m_step_callbacks) {
            callback(*this);
        }

        // Hooks may add or remove bodies; iterate a snapshot
        for (const auto& body : m_registry.bodies_of<ElementRigidBody>()) {
            body->element().step(*this);
        }

        m_pipeline.apply_all(*this);
    } catch (...) {
        m_state = SpaceState::Idle;
        throw;
    }
}

void Space::submit_advance() {
    AdvanceRequest request;
    request.substeps = m_config.substeps;
    request.gravity = m_config.gravity;

    m_state = SpaceState::Solving;

    auto submitted = m_worker->submit(
        [this, request, bodies = m_registry.snapshot()]() {
            run_advance(request, bodies);
        });

    if (!submitted) {
        ++m_stats.failed_advances;
        tick_core::physics_logger()->error("Could not queue advance: {}",
            tick_core::build_error_chain(submitted.error()));
        finish_step();
    }
}

void Space::run_advance(AdvanceRequest request, const std::vector<BodyPtr>& bodies) {
    StepCompletion completion;

    try {
        // Reaching the ceiling ends warm-up, so the call after the last
        // warm-up tick is already live (one tick earlier than a strict
        // greater-than would give)
        if (m_presim_steps.load(std::memory_order_acquire) >= m_config.max_presim_steps) {
            float elapsed = Clock::to_seconds(m_clock.consume());
            request.elapsed = std::clamp(elapsed, 0.0f, m_config.max_elapsed);

            completion.live = true;
            completion.elapsed = request.elapsed;
            completion.contacts = m_solver->advance(request, bodies);
        } else {
            // Warm-up: time spent here is never simulated
            m_presim_steps.fetch_add(1, std::memory_order_acq_rel);
            m_clock.reset();
        }
    } catch (const std::exception& e) {
        completion.contacts.clear();
        completion.error = tick_core::Error(
            tick_core::WorkerError::task_failed(m_worker->name(), e.what()));
        completion.error->with_context("solver", m_solver->name());
        tick_core::physics_logger()->error("Solver '{}' threw during advance: {}",
            m_solver->name(), e.what());
    }

    // Sampled here, after the solver is done with them
    for (const auto& body : bodies) {
        if (body->kind() == BodyKind::Element) {
            completion.element_samples.push_back(
                {std::static_pointer_cast<ElementRigidBody>(body), body->transform()});
        }
    }

    m_completions.send(std::move(completion));
}

void Space::complete_step(StepCompletion completion) {
    m_state = SpaceState::Completing;

    for (const auto& sample : completion.element_samples) {
        sample.body->publish_transform(sample.transform);
    }

    try {
        if (completion.error) {
            ++m_stats.failed_advances;
            tick_core::physics_logger()->error("Step completed without advance: {}",
                tick_core::build_error_chain(*completion.error));
        } else if (completion.live) {
            ++m_stats.live_advances;
            m_stats.last_elapsed = completion.elapsed;
            m_stats.contacts_reported += completion.contacts.size();

            std::uint64_t before = m_dispatcher.notification_count();
            m_dispatcher.dispatch_all(completion.contacts);
            m_stats.notifications_sent += m_dispatcher.notification_count() - before;

            tick_core::physics_logger()->trace("Advanced {:.4f}s, {} contact(s)",
                completion.elapsed, completion.contacts.size());
        } else {
            ++m_stats.warmup_ticks;
            if (!is_in_presim()) {
                tick_core::physics_logger()->debug("Presimulation complete after {} tick(s)",
                    presim_steps());
            }
        }
    } catch (...) {
        // Listener threw: leave the scheduler usable, then propagate
        finish_step();
        throw;
    }

    finish_step();
}

void Space::finish_step() {
    // Mutations issued while applying may themselves defer; drain by index
    m_state = SpaceState::Completing;
    try {
        for (std::size_t i = 0; i < m_pending.size(); ++i) {
            PendingMutation mutation = m_pending[i];
            apply_mutation(mutation);
        }
    } catch (...) {
        m_pending.clear();
        m_state = SpaceState::Idle;
        throw;
    }
    m_pending.clear();

    ++m_stats.steps_completed;
    m_state = SpaceState::Idle;
}

} // namespace tick_physics
