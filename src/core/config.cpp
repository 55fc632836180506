/// @file config.cpp
/// @brief Configuration system implementation for relay_core

#include <relay/core/config.hpp>
#include <relay/core/log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

namespace relay_core {

namespace {

/// Interpret a textual value from the command line or environment
ConfigValue parse_scalar(const std::string& value) {
    if (value == "true" || value == "false") {
        return ConfigValue{value == "true"};
    }

    std::int64_t int_val = 0;
    const char* first = value.data();
    const char* last = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(first, last, int_val);
    if (ec == std::errc() && ptr == last && !value.empty()) {
        return ConfigValue{int_val};
    }

    if (!value.empty()) {
        char* end = nullptr;
        double float_val = std::strtod(value.c_str(), &end);
        if (end == value.c_str() + value.size()) {
            return ConfigValue{float_val};
        }
    }

    return ConfigValue{value};
}

/// Flatten a JSON object into dotted keys on a layer
Result<void> flatten_json(const nlohmann::json& node, const std::string& prefix, ConfigLayer& layer) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
        const auto& value = it.value();

        if (value.is_object()) {
            auto nested = flatten_json(value, key, layer);
            if (!nested) {
                return nested;
            }
        } else if (value.is_boolean()) {
            layer.set(key, ConfigValue{value.get<bool>()});
        } else if (value.is_number_integer()) {
            layer.set(key, ConfigValue{value.get<std::int64_t>()});
        } else if (value.is_number_float()) {
            layer.set(key, ConfigValue{value.get<double>()});
        } else if (value.is_string()) {
            layer.set(key, ConfigValue{value.get<std::string>()});
        } else if (value.is_array()) {
            std::vector<std::string> items;
            for (const auto& item : value) {
                if (!item.is_string()) {
                    return Err(Error(ErrorCode::ParseError,
                        "Config key '" + key + "' must be an array of strings"));
                }
                items.push_back(item.get<std::string>());
            }
            layer.set(key, ConfigValue{std::move(items)});
        } else if (!value.is_null()) {
            return Err(Error(ErrorCode::ParseError,
                "Unsupported JSON value for config key '" + key + "'"));
        }
    }
    return Ok();
}

/// Insert a dotted key into a nested JSON object
void unflatten_into(nlohmann::json& root, const std::string& key, const ConfigValue& value) {
    nlohmann::json* node = &root;
    std::size_t start = 0;
    std::size_t dot = key.find('.');
    while (dot != std::string::npos) {
        node = &(*node)[key.substr(start, dot - start)];
        start = dot + 1;
        dot = key.find('.', start);
    }

    std::visit([&](const auto& arg) {
        (*node)[key.substr(start)] = arg;
    }, value);
}

} // anonymous namespace

// =============================================================================
// ConfigLayer
// =============================================================================

bool ConfigLayer::contains(const std::string& key) const {
    return m_values.find(key) != m_values.end();
}

std::optional<ConfigValue> ConfigLayer::get(const std::string& key) const {
    auto it = m_values.find(key);
    if (it != m_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

void ConfigLayer::set(const std::string& key, ConfigValue value) {
    m_values[key] = std::move(value);
}

bool ConfigLayer::remove(const std::string& key) {
    return m_values.erase(key) > 0;
}

void ConfigLayer::clear() {
    m_values.clear();
}

std::vector<std::string> ConfigLayer::keys() const {
    std::vector<std::string> result;
    result.reserve(m_values.size());
    for (const auto& [key, _] : m_values) {
        result.push_back(key);
    }
    return result;
}

// =============================================================================
// ConfigManager: Layers
// =============================================================================

void ConfigManager::add_layer(std::unique_ptr<ConfigLayer> layer) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& existing : m_layers) {
        if (existing->name() == layer->name()) {
            existing = std::move(layer);
            return;
        }
    }
    m_layers.push_back(std::move(layer));
}

ConfigLayer* ConfigManager::get_layer(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& layer : m_layers) {
        if (layer->name() == name) {
            return layer.get();
        }
    }
    return nullptr;
}

const ConfigLayer* ConfigManager::get_layer(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& layer : m_layers) {
        if (layer->name() == name) {
            return layer.get();
        }
    }
    return nullptr;
}

bool ConfigManager::remove_layer(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::remove_if(m_layers.begin(), m_layers.end(),
        [&name](const std::unique_ptr<ConfigLayer>& layer) {
            return layer->name() == name;
        });
    if (it != m_layers.end()) {
        m_layers.erase(it, m_layers.end());
        return true;
    }
    return false;
}

std::size_t ConfigManager::layer_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_layers.size();
}

ConfigLayer* ConfigManager::ensure_layer_locked(const std::string& name, ConfigLayerPriority priority) {
    for (auto& layer : m_layers) {
        if (layer->name() == name) {
            return layer.get();
        }
    }
    m_layers.push_back(std::make_unique<ConfigLayer>(name, priority));
    return m_layers.back().get();
}

std::vector<const ConfigLayer*> ConfigManager::sorted_layers_locked() const {
    std::vector<const ConfigLayer*> result;
    result.reserve(m_layers.size());
    for (const auto& layer : m_layers) {
        result.push_back(layer.get());
    }

    // Lower value = higher priority
    std::stable_sort(result.begin(), result.end(),
        [](const ConfigLayer* a, const ConfigLayer* b) {
            return static_cast<int>(a->priority()) < static_cast<int>(b->priority());
        });

    return result;
}

// =============================================================================
// ConfigManager: Value Access
// =============================================================================

bool ConfigManager::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& layer : m_layers) {
        if (layer->contains(key)) {
            return true;
        }
    }
    return false;
}

std::optional<ConfigValue> ConfigManager::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto* layer : sorted_layers_locked()) {
        auto value = layer->get(key);
        if (value) {
            return value;
        }
    }
    return std::nullopt;
}

bool ConfigManager::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<bool>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<std::string>(&*value)) {
        if (*v == "true" || *v == "1" || *v == "yes" || *v == "on") return true;
        if (*v == "false" || *v == "0" || *v == "no" || *v == "off") return false;
        return default_value;
    }
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return *v != 0;
    }

    return default_value;
}

std::int64_t ConfigManager::get_int(const std::string& key, std::int64_t default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<std::string>(&*value)) {
        std::int64_t parsed = 0;
        auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), parsed);
        if (ec == std::errc() && ptr == v->data() + v->size()) {
            return parsed;
        }
        return default_value;
    }
    if (auto* v = std::get_if<double>(&*value)) {
        return static_cast<std::int64_t>(*v);
    }
    if (auto* v = std::get_if<bool>(&*value)) {
        return *v ? 1 : 0;
    }

    return default_value;
}

double ConfigManager::get_float(const std::string& key, double default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<double>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return static_cast<double>(*v);
    }
    if (auto* v = std::get_if<std::string>(&*value)) {
        char* end = nullptr;
        double parsed = std::strtod(v->c_str(), &end);
        if (!v->empty() && end == v->c_str() + v->size()) {
            return parsed;
        }
        return default_value;
    }

    return default_value;
}

std::string ConfigManager::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<std::string>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<bool>(&*value)) {
        return *v ? "true" : "false";
    }
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return std::to_string(*v);
    }
    if (auto* v = std::get_if<double>(&*value)) {
        return std::to_string(*v);
    }

    return default_value;
}

std::vector<std::string> ConfigManager::get_string_array(
    const std::string& key,
    const std::vector<std::string>& default_value) const
{
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<std::vector<std::string>>(&*value)) {
        return *v;
    }

    return default_value;
}

// =============================================================================
// ConfigManager: Value Setting
// =============================================================================

void ConfigManager::set(const std::string& key, ConfigValue value, const std::string& layer_name) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ConfigLayer* layer = ensure_layer_locked(layer_name, ConfigLayerPriority::User);
        layer->set(key, value);
    }
    notify_change(key, value);
}

void ConfigManager::set_bool(const std::string& key, bool value, const std::string& layer_name) {
    set(key, ConfigValue{value}, layer_name);
}

void ConfigManager::set_int(const std::string& key, std::int64_t value, const std::string& layer_name) {
    set(key, ConfigValue{value}, layer_name);
}

void ConfigManager::set_float(const std::string& key, double value, const std::string& layer_name) {
    set(key, ConfigValue{value}, layer_name);
}

void ConfigManager::set_string(const std::string& key, const std::string& value, const std::string& layer_name) {
    set(key, ConfigValue{value}, layer_name);
}

// =============================================================================
// ConfigManager: JSON
// =============================================================================

Result<void> ConfigManager::load_json(
    const std::filesystem::path& path,
    const std::string& layer_name)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err(Error(ErrorCode::IOError, "Failed to open config file: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = load_json_string(buffer.str(), layer_name);
    if (!result) {
        Error err = result.error();
        err.with_context("path", path.string());
        return Err(std::move(err));
    }

    core_logger()->debug("Loaded config layer '{}' from {}", layer_name, path.string());
    return Ok();
}

Result<void> ConfigManager::load_json_string(const std::string& text, const std::string& layer_name) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return Err(Error(ErrorCode::ParseError, std::string("JSON parse error: ") + e.what()));
    }

    if (!j.is_object()) {
        return Err(Error(ErrorCode::ParseError, "Config root must be a JSON object"));
    }

    // Parse into a scratch layer so a bad document leaves the target untouched
    ConfigLayer parsed(layer_name);
    auto flattened = flatten_json(j, "", parsed);
    if (!flattened) {
        return flattened;
    }

    std::vector<std::pair<std::string, ConfigValue>> changed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ConfigLayer* layer = ensure_layer_locked(layer_name, ConfigLayerPriority::User);
        for (const auto& key : parsed.keys()) {
            auto value = parsed.get(key);
            layer->set(key, *value);
            changed.emplace_back(key, *value);
        }
    }

    for (const auto& [key, value] : changed) {
        notify_change(key, value);
    }
    return Ok();
}

Result<void> ConfigManager::save_json(
    const std::filesystem::path& path,
    const std::string& layer_name) const
{
    nlohmann::json root = nlohmann::json::object();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const ConfigLayer* layer = nullptr;
        for (const auto& candidate : m_layers) {
            if (candidate->name() == layer_name) {
                layer = candidate.get();
                break;
            }
        }
        if (!layer) {
            return Err(Error(ErrorCode::NotFound, "Layer not found: " + layer_name));
        }
        for (const auto& key : layer->keys()) {
            unflatten_into(root, key, *layer->get(key));
        }
    }

    std::ofstream file(path);
    if (!file) {
        return Err(Error(ErrorCode::IOError, "Failed to create file: " + path.string()));
    }
    file << root.dump(2) << "\n";

    return Ok();
}

// =============================================================================
// ConfigManager: Command Line
// =============================================================================

Result<void> ConfigManager::parse_args(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse_args(args);
}

Result<void> ConfigManager::parse_args(const std::vector<std::string>& args) {
    std::vector<std::pair<std::string, ConfigValue>> parsed;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        if (arg.starts_with("--")) {
            std::string key_value = arg.substr(2);
            auto eq_pos = key_value.find('=');

            std::string key;
            std::string value;

            if (eq_pos != std::string::npos) {
                key = key_value.substr(0, eq_pos);
                value = key_value.substr(eq_pos + 1);
            } else if (i + 1 < args.size() && !args[i + 1].starts_with("--")) {
                key = key_value;
                value = args[++i];
            } else {
                key = key_value;
                value = "true";
            }

            if (key.empty()) {
                return Err(Error(ErrorCode::InvalidArgument, "Empty option name in '" + arg + "'"));
            }

            // --hub-buffer_capacity -> hub.buffer_capacity
            std::replace(key.begin(), key.end(), '-', '.');
            parsed.emplace_back(key, parse_scalar(value));
        } else {
            return Err(Error(ErrorCode::InvalidArgument, "Unexpected argument: " + arg));
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ConfigLayer* layer = ensure_layer_locked("cmdline", ConfigLayerPriority::CommandLine);
        for (const auto& [key, value] : parsed) {
            layer->set(key, value);
        }
    }

    for (const auto& [key, value] : parsed) {
        notify_change(key, value);
    }
    return Ok();
}

// =============================================================================
// ConfigManager: Environment
// =============================================================================

void ConfigManager::load_environment(const std::string& prefix) {
    static const char* const known_keys[] = {
        config_keys::HUB_NAME,
        config_keys::HUB_OVERFLOW_POLICY,
        config_keys::HUB_BUFFER_CAPACITY,
        config_keys::HUB_DISPATCH_MODE,
        config_keys::HUB_KEEP_ALIVE,
        config_keys::INGEST_BATCH_SIZE,
        config_keys::INGEST_MAX_RETRIES,
        config_keys::INGEST_BASE_BACKOFF_MS,
        config_keys::INGEST_MAX_BACKOFF_MS,
        config_keys::INGEST_BACKOFF_MULTIPLIER,
        config_keys::LOG_LEVEL,
        config_keys::LOG_CONSOLE,
        config_keys::LOG_FILE,
        config_keys::LOG_DIRECTORY,
        config_keys::LOG_HUB_LEVEL,
        config_keys::LOG_INGEST_LEVEL,
    };

    std::vector<std::pair<std::string, ConfigValue>> found;
    for (const char* config_key : known_keys) {
        // hub.overflow_policy -> RELAY_HUB_OVERFLOW_POLICY
        std::string env_name = prefix;
        for (const char* c = config_key; *c != '\0'; ++c) {
            env_name += (*c == '.') ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(*c)));
        }

        const char* value = std::getenv(env_name.c_str());
        if (value) {
            found.emplace_back(config_key, parse_scalar(value));
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ConfigLayer* layer = ensure_layer_locked("environment", ConfigLayerPriority::Environment);
        for (const auto& [key, value] : found) {
            layer->set(key, value);
        }
    }

    for (const auto& [key, value] : found) {
        notify_change(key, value);
    }
}

// =============================================================================
// ConfigManager: Events and Defaults
// =============================================================================

void ConfigManager::on_change(ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_change_callbacks.push_back(std::move(callback));
}

void ConfigManager::setup_defaults() {
    create_default_layers();

    std::lock_guard<std::mutex> lock(m_mutex);
    ConfigLayer* defaults = ensure_layer_locked("defaults", ConfigLayerPriority::Default);

    // Hub defaults
    defaults->set(config_keys::HUB_NAME, ConfigValue{std::string("hub")});
    defaults->set(config_keys::HUB_OVERFLOW_POLICY, ConfigValue{std::string("drop_oldest")});
    defaults->set(config_keys::HUB_BUFFER_CAPACITY, ConfigValue{std::int64_t(1024)});
    defaults->set(config_keys::HUB_DISPATCH_MODE, ConfigValue{std::string("inline")});
    defaults->set(config_keys::HUB_KEEP_ALIVE, ConfigValue{true});

    // Ingest defaults
    defaults->set(config_keys::INGEST_BATCH_SIZE, ConfigValue{std::int64_t(100)});
    defaults->set(config_keys::INGEST_MAX_RETRIES, ConfigValue{std::int64_t(5)});
    defaults->set(config_keys::INGEST_BASE_BACKOFF_MS, ConfigValue{std::int64_t(50)});
    defaults->set(config_keys::INGEST_MAX_BACKOFF_MS, ConfigValue{std::int64_t(2000)});
    defaults->set(config_keys::INGEST_BACKOFF_MULTIPLIER, ConfigValue{2.0});

    // Logging defaults
    defaults->set(config_keys::LOG_LEVEL, ConfigValue{std::string("info")});
    defaults->set(config_keys::LOG_CONSOLE, ConfigValue{true});
    defaults->set(config_keys::LOG_FILE, ConfigValue{false});
    defaults->set(config_keys::LOG_DIRECTORY, ConfigValue{std::string("logs")});
}

void ConfigManager::create_default_layers() {
    std::lock_guard<std::mutex> lock(m_mutex);
    ensure_layer_locked("cmdline", ConfigLayerPriority::CommandLine);
    ensure_layer_locked("environment", ConfigLayerPriority::Environment);
    ensure_layer_locked("user", ConfigLayerPriority::User);
    ensure_layer_locked("project", ConfigLayerPriority::Project);
    ensure_layer_locked("system", ConfigLayerPriority::System);
    ensure_layer_locked("defaults", ConfigLayerPriority::Default);
}

void ConfigManager::notify_change(const std::string& key, const ConfigValue& value) {
    std::vector<ChangeCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        callbacks = m_change_callbacks;
    }
    for (const auto& callback : callbacks) {
        callback(key, value);
    }
}

// =============================================================================
// Logging Configuration
// =============================================================================

Result<LogConfig> log_config_from(const ConfigManager& config) {
    LogConfig log_config;

    std::string level_name = config.get_string(config_keys::LOG_LEVEL, "info");
    auto level = parse_log_level(level_name);
    if (!level) {
        return Err<LogConfig>(Error(ErrorCode::ValidationError,
            "Unknown log level '" + level_name + "'"));
    }

    log_config.level = *level;
    log_config.console_enabled = config.get_bool(config_keys::LOG_CONSOLE, true);
    log_config.file_enabled = config.get_bool(config_keys::LOG_FILE, false);
    log_config.log_directory = config.get_string(config_keys::LOG_DIRECTORY, "logs");

    // Optional per-subsystem levels
    const std::pair<const char*, const char*> overrides[] = {
        {config_keys::LOG_HUB_LEVEL, logger_names::HUB},
        {config_keys::LOG_INGEST_LEVEL, logger_names::INGEST},
    };
    for (const auto& [key, logger] : overrides) {
        if (!config.contains(key)) {
            continue;
        }
        std::string name = config.get_string(key);
        auto parsed = parse_log_level(name);
        if (!parsed) {
            return Err<LogConfig>(Error(ErrorCode::ValidationError,
                "Unknown log level '" + name + "' for " + key));
        }
        log_config.logger_levels[logger] = *parsed;
    }

    if (log_config.file_enabled && log_config.log_directory.empty()) {
        return Err<LogConfig>(Error(ErrorCode::ValidationError,
            "log.file is enabled but log.directory is empty"));
    }

    return Ok(std::move(log_config));
}

} // namespace relay_core
