#pragma once

/// @file log.hpp
/// @brief Logging for tickspace
///
/// Two named spdlog loggers share one sink setup: "tickspace" for the host
/// and "tick_physics" for the space, its worker and its configuration. The
/// physics logger can run at its own level so per-step trace output can be
/// enabled without flooding the host log.

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

// =============================================================================
// Logging Macros
// =============================================================================

#define TICK_LOG_TRACE(...) ::tick_core::host_logger()->trace(__VA_ARGS__)
#define TICK_LOG_DEBUG(...) ::tick_core::host_logger()->debug(__VA_ARGS__)
#define TICK_LOG_INFO(...) ::tick_core::host_logger()->info(__VA_ARGS__)
#define TICK_LOG_WARN(...) ::tick_core::host_logger()->warn(__VA_ARGS__)
#define TICK_LOG_ERROR(...) ::tick_core::host_logger()->error(__VA_ARGS__)

namespace tick_core {

// =============================================================================
// Configuration
// =============================================================================

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;

    /// Level for the physics logger; follows `level` when unset
    std::optional<spdlog::level::level_enum> physics_level;

    bool console_enabled = true;

    /// Rotating log file; empty disables file output
    std::string file_path;
    std::size_t max_file_size = 4 * 1024 * 1024;
    std::size_t max_files = 3;
};

/// Apply config to every existing and future logger
void configure_logging(const LogConfig& config);

/// "trace", "debug", "info", "warn", "error", "critical" or "off"
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

// =============================================================================
// Loggers
// =============================================================================

/// Named logger, created on first use with the configured sinks
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Logger for the host application ("tickspace")
std::shared_ptr<spdlog::logger> host_logger();

/// Logger for the physics space ("tick_physics")
std::shared_ptr<spdlog::logger> physics_logger();

// =============================================================================
// Scoped Timing
// =============================================================================

/// Logs entry and exit of a block at trace level, with its duration
class LogScope {
public:
    explicit LogScope(std::string name, std::shared_ptr<spdlog::logger> logger = host_logger());
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

#define TICK_LOG_CONCAT_INNER(a, b) a##b
#define TICK_LOG_CONCAT(a, b) TICK_LOG_CONCAT_INNER(a, b)
#define TICK_LOG_SCOPE(name) ::tick_core::LogScope TICK_LOG_CONCAT(tick_log_scope_, __LINE__)(name)

/// Flush and drop every logger created through get_logger()
void shutdown_logging();

} // namespace tick_core
