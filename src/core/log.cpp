/// @file log.cpp
/// @brief Subsystem logger registry for relay_core
///
/// All relay loggers share one set of sinks: a colored stderr sink and,
/// when enabled, a single rotating relay.log. Reconfiguring swaps the shared
/// sinks into every logger already handed out.

#include <relay/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <vector>

namespace relay_core {

namespace {

constexpr const char* kConsolePattern = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";
constexpr const char* kFilePattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] [thread %t] %v";
constexpr const char* kLogFileName = "relay.log";

struct LoggerRegistry {
    std::mutex mutex;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    std::vector<spdlog::sink_ptr> sinks;
    bool sinks_built = false;
    LogConfig config;
};

LoggerRegistry& registry() {
    static LoggerRegistry instance;
    return instance;
}

/// Console and rotating file sinks for a configuration
std::vector<spdlog::sink_ptr> build_sinks(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console_enabled) {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_pattern(kConsolePattern);
        sinks.push_back(std::move(console));
    }

    if (config.file_enabled && !config.log_directory.empty()) {
        auto path = std::filesystem::path(config.log_directory) / kLogFileName;
        try {
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path.string(), config.max_file_size, config.max_files);
            file->set_pattern(kFilePattern);
            sinks.push_back(std::move(file));
        } catch (const spdlog::spdlog_ex& ex) {
            spdlog::warn("relay: cannot open log file '{}': {}", path.string(), ex.what());
        }
    }

    return sinks;
}

/// Sinks handed to new loggers; built from the defaults until configured (mutex held)
const std::vector<spdlog::sink_ptr>& shared_sinks(LoggerRegistry& reg) {
    if (!reg.sinks_built) {
        reg.sinks = build_sinks(reg.config);
        reg.sinks_built = true;
    }
    return reg.sinks;
}

spdlog::level::level_enum level_for(const LoggerRegistry& reg, const std::string& name) {
    auto it = reg.config.logger_levels.find(name);
    return it != reg.config.logger_levels.end() ? it->second : reg.config.level;
}

} // anonymous namespace

// =============================================================================
// Configuration
// =============================================================================

void configure_logging(const LogConfig& config) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.config = config;
    reg.sinks = build_sinks(reg.config);
    reg.sinks_built = true;

    for (auto& [name, logger] : reg.loggers) {
        logger->flush();
        logger->sinks() = reg.sinks;
        logger->set_level(level_for(reg, name));
    }
}

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    auto it = reg.loggers.find(name);
    if (it != reg.loggers.end()) {
        return it->second;
    }

    const auto& sinks = shared_sinks(reg);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level_for(reg, name));
    reg.loggers.emplace(name, logger);
    return logger;
}

std::shared_ptr<spdlog::logger> core_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger(logger_names::CORE);
    return logger;
}

std::shared_ptr<spdlog::logger> hub_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger(logger_names::HUB);
    return logger;
}

std::shared_ptr<spdlog::logger> ingest_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger(logger_names::INGEST);
    return logger;
}

// =============================================================================
// Levels
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.config.level = level;
    for (auto& [name, logger] : reg.loggers) {
        logger->set_level(level_for(reg, name));
    }
}

void set_logger_level(const std::string& name, spdlog::level::level_enum level) {
    auto logger = get_logger(name);

    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    reg.config.logger_levels[name] = level;
    logger->set_level(level);
}

spdlog::level::level_enum get_global_log_level() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.config.level;
}

spdlog::level::level_enum effective_log_level(const std::string& name) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return level_for(reg, name);
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "trace") return spdlog::level::trace;
    if (str == "debug") return spdlog::level::debug;
    if (str == "info") return spdlog::level::info;
    if (str == "warn" || str == "warning") return spdlog::level::warn;
    if (str == "error" || str == "err") return spdlog::level::err;
    if (str == "critical" || str == "fatal") return spdlog::level::critical;
    if (str == "off") return spdlog::level::off;
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

// =============================================================================
// Structured Logging
// =============================================================================

std::string format_fields(const std::map<std::string, std::string>& fields) {
    if (fields.empty()) {
        return {};
    }

    std::ostringstream oss;
    oss << " {";
    const char* separator = "";
    for (const auto& [key, value] : fields) {
        oss << separator << key << "=\"" << value << "\"";
        separator = ", ";
    }
    oss << "}";
    return oss.str();
}

void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const std::map<std::string, std::string>& fields)
{
    auto logger = get_logger(logger_name);
    if (logger->should_log(level)) {
        logger->log(level, "{}{}", message, format_fields(fields));
    }
}

} // namespace relay_core
