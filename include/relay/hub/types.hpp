#pragma once

/// @file types.hpp
/// @brief Core value types for relay_hub

#include "fwd.hpp"

#include <relay/core/error.hpp>
#include <relay/core/fwd.hpp>

#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace relay_hub {

// =============================================================================
// Policies and State
// =============================================================================

/// What a subscription does when its buffer is full
enum class OverflowPolicy : std::uint8_t {
    FailFast,       ///< Terminate the whole hub with HubFailed
    DropNewest,     ///< Discard the incoming element
    DropOldest,     ///< Evict the oldest buffered element
    BlockProducer,  ///< Wait for the consumer (Inline dispatch only)
};

/// Where fanout runs
enum class DispatchMode : std::uint8_t {
    Inline,  ///< On the producer's thread
    Worker,  ///< On a hub-owned dispatch thread fed by an MPSC queue
};

/// Hub lifecycle state
enum class HubState : std::uint8_t {
    Created,
    Running,
    Completed,
    Failed,
};

[[nodiscard]] inline bool is_terminal(HubState state) {
    return state == HubState::Completed || state == HubState::Failed;
}

[[nodiscard]] const char* to_string(OverflowPolicy policy);
[[nodiscard]] const char* to_string(DispatchMode mode);
[[nodiscard]] const char* to_string(HubState state);

/// Parse "fail_fast", "drop_newest", "drop_oldest", "block_producer"
[[nodiscard]] std::optional<OverflowPolicy> overflow_policy_from_string(const std::string& str);

/// Parse "inline", "worker"
[[nodiscard]] std::optional<DispatchMode> dispatch_mode_from_string(const std::string& str);

// =============================================================================
// SubscriptionId
// =============================================================================

/// Unique subscription identifier (0 = not registered)
struct SubscriptionId {
    std::uint64_t id = 0;

    [[nodiscard]] bool is_valid() const { return id != 0; }

    auto operator<=>(const SubscriptionId&) const = default;
};

// =============================================================================
// HubConfig
// =============================================================================

/// Hub construction parameters, fixed for the hub's lifetime
struct HubConfig {
    std::string name = "hub";
    OverflowPolicy overflow = OverflowPolicy::DropOldest;
    std::size_t buffer_capacity = 1024;
    DispatchMode dispatch = DispatchMode::Inline;
    bool keep_alive = true;

    HubConfig& with_name(std::string value) { name = std::move(value); return *this; }
    HubConfig& with_overflow(OverflowPolicy value) { overflow = value; return *this; }
    HubConfig& with_capacity(std::size_t value) { buffer_capacity = value; return *this; }
    HubConfig& with_dispatch(DispatchMode value) { dispatch = value; return *this; }
    HubConfig& with_keep_alive(bool value) { keep_alive = value; return *this; }

    /// Reject capacity 0 and BlockProducer combined with Worker dispatch
    [[nodiscard]] relay_core::Result<void> validate() const;
};

/// Build a HubConfig from "<prefix>.*" configuration keys
[[nodiscard]] relay_core::Result<HubConfig> hub_config_from(
    const relay_core::ConfigManager& config,
    const std::string& prefix = "hub");

// =============================================================================
// HubStats
// =============================================================================

/// Snapshot of hub counters
struct HubStats {
    std::uint64_t elements_pushed = 0;
    std::uint64_t deliveries = 0;
    std::uint64_t dropped = 0;
    std::uint64_t overflows = 0;
    std::uint64_t subscriptions_attached = 0;
    std::uint64_t subscriptions_detached = 0;
    std::size_t active_subscribers = 0;  ///< Excludes the keep-alive anchor
    bool anchored = false;
    HubState state = HubState::Created;
};

/// One-line human readable summary
[[nodiscard]] std::string format_stats(const HubStats& stats);

} // namespace relay_hub
