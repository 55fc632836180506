#pragma once

/// @file log.hpp
/// @brief Subsystem loggers for relay
///
/// Every relay module logs through its own named spdlog logger (relay_core,
/// relay_hub, relay_ingest). One LogConfig decides where they write and at
/// which level, with optional per-subsystem overrides.

#include "fwd.hpp"
#include "error.hpp"
#include <spdlog/spdlog.h>
#include <string>
#include <map>
#include <memory>
#include <optional>

namespace relay_core {

// =============================================================================
// Log Configuration
// =============================================================================

/// Logger names used by the relay modules
namespace logger_names {
constexpr const char* CORE = "relay_core";
constexpr const char* HUB = "relay_hub";
constexpr const char* INGEST = "relay_ingest";
} // namespace logger_names

/// Destination and verbosity of the relay loggers
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;

    /// Level overrides keyed by logger name
    std::map<std::string, spdlog::level::level_enum> logger_levels;
};

/// Apply a configuration to existing and future loggers
void configure_logging(const LogConfig& config);

/// Build a LogConfig from the "log.*" keys of a configuration
/// (implemented in config.cpp)
Result<LogConfig> log_config_from(const ConfigManager& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

std::shared_ptr<spdlog::logger> core_logger();
std::shared_ptr<spdlog::logger> hub_logger();
std::shared_ptr<spdlog::logger> ingest_logger();

// =============================================================================
// Levels
// =============================================================================

/// Set the level of every logger without an override
void set_global_log_level(spdlog::level::level_enum level);

/// Override the level of one logger (created on demand)
void set_logger_level(const std::string& name, spdlog::level::level_enum level);

spdlog::level::level_enum get_global_log_level();

/// Effective level of a logger: its override, else the global level
spdlog::level::level_enum effective_log_level(const std::string& name);

/// Parse "trace" .. "off" (also "warning", "err", "fatal")
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Structured Logging
// =============================================================================

/// Log a message with key="value" fields appended
void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const std::map<std::string, std::string>& fields);

/// Render fields as ` {key="value", ...}`; empty for no fields
std::string format_fields(const std::map<std::string, std::string>& fields);

} // namespace relay_core
