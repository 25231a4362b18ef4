/// @file main.cpp
/// @brief tickspace_demo entry point - drives a headless physics space
///
/// Loads an optional space config (JSON), populates a small scene of
/// elements over a block floor, and ticks the space at a fixed rate on the
/// main thread while advances run on the physics worker.

#include <tickspace/physics/physics.hpp>
#include <tickspace/core/log.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

// =============================================================================
// Demo Element
// =============================================================================

class Crate : public tick_physics::IPhysicsElement {
public:
    Crate(std::string name, const tick_math::Vec3& spawn)
        : m_name(std::move(name))
        , m_spawn(spawn)
        , m_body(std::make_shared<tick_physics::ElementRigidBody>(
              *this, tick_math::Transform::from_position(spawn), 10.0f))
    {
    }

    std::shared_ptr<tick_physics::ElementRigidBody> rigid_body() const override { return m_body; }

    void reset() override {
        m_body->set_transform(tick_math::Transform::from_position(m_spawn));
        m_body->set_linear_velocity(tick_math::vec3::ZERO);
        m_body->clear_forces();
    }

    void step(tick_physics::Space& /*space*/) override { ++m_steps; }

    const std::string& name() const { return m_name; }
    std::uint64_t steps() const { return m_steps; }

private:
    std::string m_name;
    tick_math::Vec3 m_spawn;
    std::shared_ptr<tick_physics::ElementRigidBody> m_body;
    std::uint64_t m_steps = 0;
};

// =============================================================================
// Command Line
// =============================================================================

struct DemoOptions {
    fs::path config_path;
    std::uint32_t ticks = 100;
    std::uint32_t tick_rate = 20;
    std::string log_level = "info";
    std::string physics_log_level;
};

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS] [CONFIG_PATH]\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help            Show this help message\n"
              << "  -v, --version         Show version information\n"
              << "  -n, --ticks N         Number of ticks to run (default: 100)\n"
              << "  -r, --rate HZ         Tick rate in Hz (default: 20)\n"
              << "  -l, --log-level LVL   trace|debug|info|warn|error (default: info)\n"
              << "  -p, --physics-log-level LVL\n"
              << "                        Level for the physics logger (default: --log-level)\n"
              << "\n"
              << "CONFIG_PATH is a JSON space config; defaults are used when omitted.\n";
}

void print_version() {
    std::cout << "tickspace_demo 0.1.0\n";
}

bool parse_count(const std::string& text, std::uint32_t& out) {
    try {
        unsigned long value = std::stoul(text);
        if (value == 0) {
            return false;
        }
        out = static_cast<std::uint32_t>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// =============================================================================
// Entry Point
// =============================================================================

int main(int argc, char** argv) {
    DemoOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            print_version();
            return 0;
        } else if ((arg == "--ticks" || arg == "-n") && i + 1 < argc) {
            if (!parse_count(argv[++i], options.ticks)) {
                std::cerr << "Invalid tick count: " << argv[i] << "\n";
                return 1;
            }
        } else if ((arg == "--rate" || arg == "-r") && i + 1 < argc) {
            if (!parse_count(argv[++i], options.tick_rate)) {
                std::cerr << "Invalid tick rate: " << argv[i] << "\n";
                return 1;
            }
        } else if ((arg == "--log-level" || arg == "-l") && i + 1 < argc) {
            options.log_level = argv[++i];
        } else if ((arg == "--physics-log-level" || arg == "-p") && i + 1 < argc) {
            options.physics_log_level = argv[++i];
        } else if (arg[0] != '-') {
            options.config_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    auto level = tick_core::parse_log_level(options.log_level);
    if (!level) {
        std::cerr << "Unknown log level: " << options.log_level << "\n";
        return 1;
    }

    tick_core::LogConfig log_config;
    log_config.level = *level;
    if (!options.physics_log_level.empty()) {
        log_config.physics_level = tick_core::parse_log_level(options.physics_log_level);
        if (!log_config.physics_level) {
            std::cerr << "Unknown log level: " << options.physics_log_level << "\n";
            return 1;
        }
    }
    tick_core::configure_logging(log_config);

    // Load configuration
    tick_physics::SpaceConfig config = tick_physics::SpaceConfig::defaults();
    if (!options.config_path.empty()) {
        auto loaded = tick_physics::SpaceConfig::load(options.config_path);
        if (!loaded) {
            TICK_LOG_ERROR("Failed to load space config: {}", tick_core::build_error_chain(loaded.error()));
            return 1;
        }
        config = std::move(loaded).value();
    }

    TICK_LOG_INFO("Space config: {}", config.to_json().dump());

    // Build the scene; elements must outlive the space
    std::vector<std::unique_ptr<Crate>> crates;
    crates.push_back(std::make_unique<Crate>("crate_a", tick_math::Vec3{0.0f, 2.0f, 0.0f}));
    crates.push_back(std::make_unique<Crate>("crate_b", tick_math::Vec3{1.0f, 4.0f, 0.0f}));

    tick_physics::Space space(config);

    for (int x = -2; x <= 2; ++x) {
        for (int z = -2; z <= 2; ++z) {
            space.add_body(std::make_shared<tick_physics::BlockRigidBody>(tick_math::IVec3{x, -1, z}));
        }
    }

    for (auto& crate : crates) {
        space.add_element(*crate);
    }

    space.add_world_component(std::make_shared<tick_physics::FunctionComponent>(
        [](tick_physics::Space& s) {
            for (auto& body : s.bodies_of<tick_physics::ElementRigidBody>()) {
                body->apply_central_force(s.gravity() * body->mass());
            }
        }, "gravity"));

    space.on_element_collision([](tick_physics::IPhysicsElement& a, tick_physics::IPhysicsElement& b, float impulse) {
        TICK_LOG_INFO("{} hit {} (impulse {:.2f})",
            static_cast<Crate&>(a).name(), static_cast<Crate&>(b).name(), impulse);
    });
    space.on_block_collision([](tick_physics::IPhysicsElement& element, tick_physics::BlockRigidBody& block, float impulse) {
        const auto& cell = block.cell();
        TICK_LOG_INFO("{} landed on block ({}, {}, {}) (impulse {:.2f})",
            static_cast<Crate&>(element).name(), cell.x, cell.y, cell.z, impulse);
    });

    TICK_LOG_INFO("Running {} ticks at {} Hz with {} bodies", options.ticks, options.tick_rate, space.body_count());

    // Tick loop
    const auto tick_period = std::chrono::microseconds(1'000'000 / options.tick_rate);
    auto next_tick = std::chrono::steady_clock::now();

    {
        TICK_LOG_SCOPE("tick_loop");

        for (std::uint32_t tick = 0; tick < options.ticks; ++tick) {
            space.step();

            next_tick += tick_period;
            std::this_thread::sleep_until(next_tick);
        }

        space.wait_idle();
    }

    const auto& stats = space.stats();
    TICK_LOG_INFO("Done: {} steps started, {} completed, {} live, {} warm-up, {} skipped, {} failed",
        stats.steps_started, stats.steps_completed, stats.live_advances,
        stats.warmup_ticks, stats.skipped_in_flight, stats.failed_advances);
    for (const auto& crate : crates) {
        TICK_LOG_INFO("{} ran {} step hook(s)", crate->name(), crate->steps());
    }

    tick_core::shutdown_logging();
    return 0;
}
