#pragma once

/// @file config.hpp
/// @brief Layered configuration for relay
///
/// Provides layered configuration with:
/// - Built-in defaults
/// - JSON configuration files (nested objects become dotted keys)
/// - Environment variables
/// - Command-line argument parsing
/// - Runtime modification with change callbacks

#include "fwd.hpp"
#include "error.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace relay_core {

// =============================================================================
// Config Value
// =============================================================================

/// Configuration value variant
using ConfigValue = std::variant<
    bool,
    std::int64_t,
    double,
    std::string,
    std::vector<std::string>
>;

// =============================================================================
// Config Layer
// =============================================================================

/// Configuration layer priority (lower = higher priority)
enum class ConfigLayerPriority : std::int32_t {
    CommandLine = -1000,    ///< Command-line arguments (highest)
    Environment = -500,     ///< Environment variables
    User = 0,               ///< User configuration file
    Project = 100,          ///< Project configuration file
    System = 500,           ///< System defaults
    Default = 1000,         ///< Built-in defaults (lowest)
};

/// A configuration layer
class ConfigLayer {
public:
    explicit ConfigLayer(const std::string& name, ConfigLayerPriority priority = ConfigLayerPriority::User)
        : m_name(name), m_priority(priority) {}

    [[nodiscard]] const std::string& name() const { return m_name; }
    [[nodiscard]] ConfigLayerPriority priority() const { return m_priority; }

    [[nodiscard]] bool contains(const std::string& key) const;
    [[nodiscard]] std::optional<ConfigValue> get(const std::string& key) const;
    void set(const std::string& key, ConfigValue value);
    bool remove(const std::string& key);
    void clear();

    /// Get all keys
    [[nodiscard]] std::vector<std::string> keys() const;

    [[nodiscard]] std::size_t size() const { return m_values.size(); }
    [[nodiscard]] bool empty() const { return m_values.empty(); }

private:
    std::string m_name;
    ConfigLayerPriority m_priority;
    std::map<std::string, ConfigValue> m_values;
};

// =============================================================================
// Config Manager
// =============================================================================

/// Layered configuration manager
class ConfigManager {
public:
    using ChangeCallback = std::function<void(const std::string& key, const ConfigValue& value)>;

    ConfigManager() = default;
    ~ConfigManager() = default;

    // Non-copyable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    // =========================================================================
    // Layer Management
    // =========================================================================

    /// Add a configuration layer (replaces a layer of the same name)
    void add_layer(std::unique_ptr<ConfigLayer> layer);

    /// Get layer by name
    [[nodiscard]] ConfigLayer* get_layer(const std::string& name);
    [[nodiscard]] const ConfigLayer* get_layer(const std::string& name) const;

    bool remove_layer(const std::string& name);

    [[nodiscard]] std::size_t layer_count() const;

    // =========================================================================
    // Value Access (Merged View)
    // =========================================================================

    /// Check if key exists in any layer
    [[nodiscard]] bool contains(const std::string& key) const;

    /// Get value (from highest priority layer that contains it)
    [[nodiscard]] std::optional<ConfigValue> get(const std::string& key) const;

    /// Get value with default
    template<typename T>
    [[nodiscard]] T get_or(const std::string& key, T default_value) const {
        auto value = get(key);
        if (!value) return default_value;

        if constexpr (std::is_same_v<T, bool>) {
            if (auto* v = std::get_if<bool>(&*value)) return *v;
        } else if constexpr (std::is_integral_v<T>) {
            if (auto* v = std::get_if<std::int64_t>(&*value)) return static_cast<T>(*v);
        } else if constexpr (std::is_floating_point_v<T>) {
            if (auto* v = std::get_if<double>(&*value)) return static_cast<T>(*v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            if (auto* v = std::get_if<std::string>(&*value)) return *v;
        } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            if (auto* v = std::get_if<std::vector<std::string>>(&*value)) return *v;
        }

        return default_value;
    }

    [[nodiscard]] bool get_bool(const std::string& key, bool default_value = false) const;
    [[nodiscard]] std::int64_t get_int(const std::string& key, std::int64_t default_value = 0) const;
    [[nodiscard]] double get_float(const std::string& key, double default_value = 0.0) const;
    [[nodiscard]] std::string get_string(const std::string& key, const std::string& default_value = "") const;
    [[nodiscard]] std::vector<std::string> get_string_array(
        const std::string& key,
        const std::vector<std::string>& default_value = {}) const;

    // =========================================================================
    // Value Setting
    // =========================================================================

    /// Set value in specific layer (or user layer by default)
    void set(const std::string& key, ConfigValue value, const std::string& layer_name = "user");

    void set_bool(const std::string& key, bool value, const std::string& layer_name = "user");
    void set_int(const std::string& key, std::int64_t value, const std::string& layer_name = "user");
    void set_float(const std::string& key, double value, const std::string& layer_name = "user");
    void set_string(const std::string& key, const std::string& value, const std::string& layer_name = "user");

    // =========================================================================
    // File Operations
    // =========================================================================

    /// Load configuration from a JSON file into a layer
    Result<void> load_json(const std::filesystem::path& path, const std::string& layer_name);

    /// Load configuration from JSON text into a layer
    Result<void> load_json_string(const std::string& text, const std::string& layer_name);

    /// Save layer to JSON file (dotted keys are written back as nested objects)
    Result<void> save_json(const std::filesystem::path& path, const std::string& layer_name) const;

    // =========================================================================
    // Command Line
    // =========================================================================

    /// Parse command-line arguments (argv[0] is skipped)
    Result<void> parse_args(int argc, char** argv);

    /// Parse command-line arguments from vector
    Result<void> parse_args(const std::vector<std::string>& args);

    // =========================================================================
    // Environment
    // =========================================================================

    /// Load known keys from environment variables (RELAY_HUB_NAME -> hub.name)
    void load_environment(const std::string& prefix = "RELAY_");

    // =========================================================================
    // Events
    // =========================================================================

    /// Set callback for config changes
    void on_change(ChangeCallback callback);

    // =========================================================================
    // Defaults
    // =========================================================================

    /// Create default layers and fill the defaults layer
    void setup_defaults();

    /// Create default layers (cmdline, environment, user, project, system, defaults)
    void create_default_layers();

private:
    /// Find or create a layer (m_mutex held)
    ConfigLayer* ensure_layer_locked(const std::string& name, ConfigLayerPriority priority);

    /// Get layers sorted by priority, highest first (m_mutex held)
    [[nodiscard]] std::vector<const ConfigLayer*> sorted_layers_locked() const;

    void notify_change(const std::string& key, const ConfigValue& value);

private:
    std::vector<std::unique_ptr<ConfigLayer>> m_layers;
    mutable std::mutex m_mutex;
    std::vector<ChangeCallback> m_change_callbacks;
};

// =============================================================================
// Config Keys (Constants)
// =============================================================================

namespace config_keys {

// Hub
constexpr const char* HUB_NAME = "hub.name";
constexpr const char* HUB_OVERFLOW_POLICY = "hub.overflow_policy";
constexpr const char* HUB_BUFFER_CAPACITY = "hub.buffer_capacity";
constexpr const char* HUB_DISPATCH_MODE = "hub.dispatch_mode";
constexpr const char* HUB_KEEP_ALIVE = "hub.keep_alive";

// Ingest
constexpr const char* INGEST_BATCH_SIZE = "ingest.batch_size";
constexpr const char* INGEST_MAX_RETRIES = "ingest.max_retries";
constexpr const char* INGEST_BASE_BACKOFF_MS = "ingest.base_backoff_ms";
constexpr const char* INGEST_MAX_BACKOFF_MS = "ingest.max_backoff_ms";
constexpr const char* INGEST_BACKOFF_MULTIPLIER = "ingest.backoff_multiplier";

// Logging
constexpr const char* LOG_LEVEL = "log.level";
constexpr const char* LOG_CONSOLE = "log.console";
constexpr const char* LOG_FILE = "log.file";
constexpr const char* LOG_DIRECTORY = "log.directory";
constexpr const char* LOG_HUB_LEVEL = "log.hub_level";
constexpr const char* LOG_INGEST_LEVEL = "log.ingest_level";

} // namespace config_keys

} // namespace relay_core
