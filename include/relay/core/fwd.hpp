#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for relay_core module

#include <cstdint>

namespace relay_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct HubError;
struct IngestError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Configuration
// =============================================================================

enum class ConfigLayerPriority : std::int32_t;
class ConfigLayer;
class ConfigManager;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;

} // namespace relay_core
