#pragma once

/// @file live_hub.hpp
/// @brief Owner of one live broadcast stream

#include "broadcast_core.hpp"
#include "inlet.hpp"
#include "sink.hpp"
#include "subscription.hpp"
#include "types.hpp"

#include <relay/core/error.hpp>
#include <relay/core/log.hpp>

#include <functional>
#include <memory>
#include <utility>

namespace relay_hub {

/// Live broadcast hub
///
/// Builds the core, attaches the keep-alive anchor before any real subscriber,
/// hands the Inlet to one producer and tears everything down on shutdown() or
/// destruction. Subscriptions may come and go at any time; none of them ever
/// re-triggers production.
template<typename T>
class Hub {
public:
    /// Construct or report an invalid config
    [[nodiscard]] static relay_core::Result<Hub> create(HubConfig config = {}) {
        auto core = BroadcastCore<T>::create(std::move(config));
        if (!core) {
            return relay_core::Err<Hub>(core.error());
        }
        return relay_core::Ok(Hub(std::move(core).value()));
    }

    /// Construct; throws std::runtime_error on an invalid config
    explicit Hub(HubConfig config = {})
        : Hub(BroadcastCore<T>::create(std::move(config)).unwrap()) {}

    ~Hub() {
        shutdown();
    }

    Hub(const Hub&) = delete;
    Hub& operator=(const Hub&) = delete;

    Hub(Hub&& other) noexcept = default;

    Hub& operator=(Hub&& other) noexcept {
        if (this != &other) {
            shutdown();
            m_core = std::move(other.m_core);
        }
        return *this;
    }

    // =========================================================================
    // Producer
    // =========================================================================

    /// Hand out the single Inlet; a second call returns InletUnavailable
    [[nodiscard]] relay_core::Result<Inlet<T>> take_inlet() {
        if (!m_core || !m_core->claim_inlet()) {
            relay_core::Error error(relay_core::HubError::inlet_unavailable(name()));
            relay_core::debug::record_error(error);
            relay_core::hub_logger()->warn("{}", error.message());
            return relay_core::Err<Inlet<T>>(std::move(error));
        }
        return relay_core::Ok(Inlet<T>(m_core));
    }

    // =========================================================================
    // Consumers
    // =========================================================================

    [[nodiscard]] Subscription<T> subscribe() {
        return m_core ? m_core->subscribe() : Subscription<T>();
    }

    [[nodiscard]] Subscription<T> subscribe(std::size_t capacity) {
        return m_core ? m_core->subscribe(capacity) : Subscription<T>();
    }

    /// Push-style consumer; callbacks run on the delivery thread
    SubscriptionId attach_callback(
        typename CallbackSink<T>::ElementFn on_element,
        typename CallbackSink<T>::EndFn on_end = {},
        typename CallbackSink<T>::ErrorFn on_error = {})
    {
        return attach(std::make_shared<CallbackSink<T>>(
            name(), std::move(on_element), std::move(on_end), std::move(on_error)));
    }

    SubscriptionId attach(std::shared_ptr<Sink<T>> sink) {
        if (!m_core) {
            sink->finish();
            return SubscriptionId{};
        }
        return m_core->attach(std::move(sink));
    }

    bool detach(SubscriptionId id) {
        return m_core ? m_core->detach(id) : false;
    }

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Explicit owner teardown: removes the anchor and completes every subscription
    void shutdown() {
        if (m_core) {
            m_core->shutdown();
        }
    }

    [[nodiscard]] HubState state() const {
        return m_core ? m_core->state() : HubState::Completed;
    }

    [[nodiscard]] HubStats stats() const {
        return m_core ? m_core->stats() : HubStats{};
    }

    [[nodiscard]] const std::string& name() const {
        static const std::string moved_from = "<moved>";
        return m_core ? m_core->name() : moved_from;
    }

    [[nodiscard]] const HubConfig& config() const {
        static const HubConfig moved_from{};
        return m_core ? m_core->config() : moved_from;
    }

    [[nodiscard]] bool has_anchor() const { return m_core && m_core->has_anchor(); }

    [[nodiscard]] std::size_t subscriber_count() const {
        return m_core ? m_core->subscriber_count() : 0;
    }

    [[nodiscard]] std::optional<relay_core::Error> failure() const {
        return m_core ? m_core->failure() : std::nullopt;
    }

    [[nodiscard]] const std::shared_ptr<BroadcastCore<T>>& core() const noexcept { return m_core; }

private:
    explicit Hub(std::shared_ptr<BroadcastCore<T>> core)
        : m_core(std::move(core)) {
        if (m_core->config().keep_alive) {
            m_core->attach_anchor();
        }
    }

    std::shared_ptr<BroadcastCore<T>> m_core;
};

} // namespace relay_hub
