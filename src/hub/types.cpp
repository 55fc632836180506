/// @file types.cpp
/// @brief Non-template parts of relay_hub: names, parsing and config binding

#include <relay/hub/types.hpp>
#include <relay/core/config.hpp>

#include <sstream>

namespace relay_hub {

using relay_core::Err;
using relay_core::Error;
using relay_core::ErrorCode;
using relay_core::Ok;
using relay_core::Result;

// =============================================================================
// String Conversion
// =============================================================================

const char* to_string(OverflowPolicy policy) {
    switch (policy) {
        case OverflowPolicy::FailFast: return "fail_fast";
        case OverflowPolicy::DropNewest: return "drop_newest";
        case OverflowPolicy::DropOldest: return "drop_oldest";
        case OverflowPolicy::BlockProducer: return "block_producer";
    }
    return "unknown";
}

const char* to_string(DispatchMode mode) {
    switch (mode) {
        case DispatchMode::Inline: return "inline";
        case DispatchMode::Worker: return "worker";
    }
    return "unknown";
}

const char* to_string(HubState state) {
    switch (state) {
        case HubState::Created: return "created";
        case HubState::Running: return "running";
        case HubState::Completed: return "completed";
        case HubState::Failed: return "failed";
    }
    return "unknown";
}

std::optional<OverflowPolicy> overflow_policy_from_string(const std::string& str) {
    if (str == "fail_fast") return OverflowPolicy::FailFast;
    if (str == "drop_newest") return OverflowPolicy::DropNewest;
    if (str == "drop_oldest") return OverflowPolicy::DropOldest;
    if (str == "block_producer") return OverflowPolicy::BlockProducer;
    return std::nullopt;
}

std::optional<DispatchMode> dispatch_mode_from_string(const std::string& str) {
    if (str == "inline") return DispatchMode::Inline;
    if (str == "worker") return DispatchMode::Worker;
    return std::nullopt;
}

// =============================================================================
// HubConfig
// =============================================================================

Result<void> HubConfig::validate() const {
    if (buffer_capacity == 0) {
        return Err(Error(ErrorCode::ValidationError,
            "Hub '" + name + "': buffer_capacity must be at least 1"));
    }
    if (overflow == OverflowPolicy::BlockProducer && dispatch == DispatchMode::Worker) {
        return Err(Error(ErrorCode::ValidationError,
            "Hub '" + name + "': block_producer requires inline dispatch"));
    }
    return Ok();
}

Result<HubConfig> hub_config_from(const relay_core::ConfigManager& config, const std::string& prefix) {
    HubConfig hub;

    hub.name = config.get_string(prefix + ".name", hub.name);

    std::string policy = config.get_string(prefix + ".overflow_policy", to_string(hub.overflow));
    auto parsed_policy = overflow_policy_from_string(policy);
    if (!parsed_policy) {
        return Err<HubConfig>(Error(ErrorCode::ValidationError,
            "Unknown overflow policy '" + policy + "' for " + prefix + ".overflow_policy"));
    }
    hub.overflow = *parsed_policy;

    std::int64_t capacity = config.get_int(prefix + ".buffer_capacity",
        static_cast<std::int64_t>(hub.buffer_capacity));
    if (capacity < 1) {
        return Err<HubConfig>(Error(ErrorCode::ValidationError,
            prefix + ".buffer_capacity must be at least 1, got " + std::to_string(capacity)));
    }
    hub.buffer_capacity = static_cast<std::size_t>(capacity);

    std::string mode = config.get_string(prefix + ".dispatch_mode", to_string(hub.dispatch));
    auto parsed_mode = dispatch_mode_from_string(mode);
    if (!parsed_mode) {
        return Err<HubConfig>(Error(ErrorCode::ValidationError,
            "Unknown dispatch mode '" + mode + "' for " + prefix + ".dispatch_mode"));
    }
    hub.dispatch = *parsed_mode;

    hub.keep_alive = config.get_bool(prefix + ".keep_alive", hub.keep_alive);

    auto valid = hub.validate();
    if (!valid) {
        return Err<HubConfig>(valid.error());
    }
    return Ok(std::move(hub));
}

// =============================================================================
// HubStats
// =============================================================================

std::string format_stats(const HubStats& stats) {
    std::ostringstream oss;
    oss << "state=" << to_string(stats.state)
        << " pushed=" << stats.elements_pushed
        << " deliveries=" << stats.deliveries
        << " dropped=" << stats.dropped
        << " overflows=" << stats.overflows
        << " attached=" << stats.subscriptions_attached
        << " detached=" << stats.subscriptions_detached
        << " active=" << stats.active_subscribers
        << " anchored=" << (stats.anchored ? "yes" : "no");
    return oss.str();
}

} // namespace relay_hub
