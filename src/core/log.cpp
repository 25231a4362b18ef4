/// @file log.cpp
/// @brief tickspace logger setup

#include <tickspace/core/log.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <map>
#include <mutex>
#include <vector>

namespace tick_core {

namespace {

constexpr const char* HOST_LOGGER = "tickspace";
constexpr const char* PHYSICS_LOGGER = "tick_physics";

struct LogState {
    std::mutex mutex;
    LogConfig config;
    std::vector<spdlog::sink_ptr> sinks;
    bool sinks_built = false;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
};

LogState& state() {
    static LogState s;
    return s;
}

// Caller holds state().mutex
void build_sinks(LogState& s) {
    s.sinks.clear();

    if (s.config.console_enabled) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        s.sinks.push_back(std::move(console));
    }

    if (!s.config.file_path.empty()) {
        try {
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                s.config.file_path, s.config.max_file_size, s.config.max_files);
            file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] [tid %t] %v");
            s.sinks.push_back(std::move(file));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Log file '{}' unavailable: {}", s.config.file_path, e.what());
        }
    }

    s.sinks_built = true;
}

spdlog::level::level_enum level_for(const LogConfig& config, const std::string& name) {
    if (name == PHYSICS_LOGGER && config.physics_level) {
        return *config.physics_level;
    }
    return config.level;
}

} // namespace

// =============================================================================
// Configuration
// =============================================================================

void configure_logging(const LogConfig& config) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    s.config = config;
    build_sinks(s);

    for (auto& [name, logger] : s.loggers) {
        logger->sinks() = s.sinks;
        logger->set_level(level_for(s.config, name));
    }
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    auto level = spdlog::level::from_str(str);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && str != "off") {
        return std::nullopt;
    }
    return level;
}

// =============================================================================
// Loggers
// =============================================================================

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    if (auto it = s.loggers.find(name); it != s.loggers.end()) {
        return it->second;
    }

    if (!s.sinks_built) {
        build_sinks(s);
    }

    auto logger = std::make_shared<spdlog::logger>(name, s.sinks.begin(), s.sinks.end());
    logger->set_level(level_for(s.config, name));
    s.loggers.emplace(name, logger);
    return logger;
}

std::shared_ptr<spdlog::logger> host_logger() {
    return get_logger(HOST_LOGGER);
}

std::shared_ptr<spdlog::logger> physics_logger() {
    return get_logger(PHYSICS_LOGGER);
}

// =============================================================================
// LogScope
// =============================================================================

LogScope::LogScope(std::string name, std::shared_ptr<spdlog::logger> logger)
    : m_name(std::move(name))
    , m_logger(std::move(logger))
    , m_start(std::chrono::steady_clock::now())
{
    m_logger->trace("enter {}", m_name);
}

LogScope::~LogScope() {
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - m_start);
    m_logger->trace("leave {} ({}us)", m_name, elapsed.count());
}

void shutdown_logging() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    for (auto& [name, logger] : s.loggers) {
        logger->flush();
    }
    s.loggers.clear();
    s.sinks.clear();
    s.sinks_built = false;
}

} // namespace tick_core
