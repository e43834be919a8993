#pragma once

/// @file log.hpp
/// @brief Logging utilities for tonic

#include <spdlog/spdlog.h>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

// =============================================================================
// Logging Macros
// =============================================================================

#define TONIC_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define TONIC_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define TONIC_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define TONIC_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define TONIC_LOG_ERROR(...) spdlog::error(__VA_ARGS__)
#define TONIC_LOG_CRITICAL(...) spdlog::critical(__VA_ARGS__)

namespace tonic_core {

/// @brief Initialize the default logger pattern and level
inline void init_logging() {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);
}

// =============================================================================
// Log Configuration
// =============================================================================

/// Sinks shared by every named logger
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;                     ///< Required for the file sink
    std::string file_name = "tonic.log";
    std::size_t max_file_size = 5 * 1024 * 1024;   // 5 MB
    std::size_t max_files = 3;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Rebuild the shared sinks and apply them to every existing logger
void configure_logging(const LogConfig& config);

/// Path of the rotating log file, when the file sink is active
[[nodiscard]] std::optional<std::filesystem::path> log_file_path();

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger writing to the shared sinks
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

// =============================================================================
// Log Level Management
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level);

[[nodiscard]] spdlog::level::level_enum get_global_log_level();

/// Parse log level from string ("trace", "debug", "info", "warn", "error", "critical", "off")
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

[[nodiscard]] const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers();

/// Drop every named logger and shut spdlog down
void shutdown_logging();

} // namespace tonic_core
