#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for tick_core module

#include <cstdint>

namespace tick_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct ConfigError;
struct WorkerError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace tick_core
