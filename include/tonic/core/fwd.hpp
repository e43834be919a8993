#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for tonic_core module

#include <cstdint>

namespace tonic_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct ConfigError;
struct LoadError;
struct UsageError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;

} // namespace tonic_core
