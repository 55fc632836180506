#pragma once

/// @file subscription.hpp
/// @brief Pull-style consumer handle

#include "subscription_buffer.hpp"
#include "types.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <vector>

namespace relay_hub {

/// Whatever a Subscription detaches from
class ISubscriptionHost {
public:
    virtual ~ISubscriptionHost() = default;

    /// Idempotent; true only for the call that actually removed the id
    virtual bool detach(SubscriptionId id) = 0;
};

/// Move-only handle to one attachment; detaches when destroyed
///
/// Holds only a weak reference to the hub, so an outstanding Subscription
/// never keeps a torn-down hub alive.
template<typename T>
class Subscription {
public:
    Subscription() = default;

    Subscription(std::weak_ptr<ISubscriptionHost> host, SubscriptionId id,
                 std::shared_ptr<SubscriptionBuffer<T>> buffer)
        : m_host(std::move(host))
        , m_id(id)
        , m_buffer(std::move(buffer)) {}

    ~Subscription() {
        detach();
    }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept
        : m_host(std::move(other.m_host))
        , m_id(other.m_id)
        , m_buffer(std::move(other.m_buffer)) {
        other.m_id = SubscriptionId{};
    }

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            detach();
            m_host = std::move(other.m_host);
            m_id = other.m_id;
            m_buffer = std::move(other.m_buffer);
            other.m_id = SubscriptionId{};
        }
        return *this;
    }

    // =========================================================================
    // Reading
    // =========================================================================

    /// Block until the next delivery; terminal deliveries repeat
    [[nodiscard]] Delivery<T> next() {
        if (!m_buffer) {
            return Delivery<T>::end();
        }
        return m_buffer->next();
    }

    [[nodiscard]] std::optional<Delivery<T>> try_next() {
        if (!m_buffer) {
            return Delivery<T>::end();
        }
        return m_buffer->try_next();
    }

    [[nodiscard]] std::optional<Delivery<T>> next_for(std::chrono::milliseconds timeout) {
        if (!m_buffer) {
            return Delivery<T>::end();
        }
        return m_buffer->next_for(timeout);
    }

    /// Everything available now, up to and including a terminal delivery
    [[nodiscard]] std::vector<Delivery<T>> drain() {
        if (!m_buffer) {
            return {};
        }
        return m_buffer->drain();
    }

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Stop receiving; buffered elements stay readable, then End
    bool detach() {
        if (!m_buffer) {
            return false;
        }

        bool removed = false;
        if (m_id.is_valid()) {
            if (auto host = m_host.lock()) {
                removed = host->detach(m_id);
            }
            m_id = SubscriptionId{};
        }
        m_buffer->close();
        return removed;
    }

    // =========================================================================
    // Queries
    // =========================================================================

    /// Registration id; invalid after detach or for a late attach
    [[nodiscard]] SubscriptionId id() const noexcept { return m_id; }

    [[nodiscard]] bool is_attached() const noexcept { return m_id.is_valid(); }

    [[nodiscard]] std::uint64_t dropped_count() const {
        return m_buffer ? m_buffer->dropped_count() : 0;
    }

    [[nodiscard]] std::size_t pending() const {
        return m_buffer ? m_buffer->pending() : 0;
    }

    [[nodiscard]] std::size_t capacity() const {
        return m_buffer ? m_buffer->capacity() : 0;
    }

private:
    std::weak_ptr<ISubscriptionHost> m_host;
    SubscriptionId m_id;
    std::shared_ptr<SubscriptionBuffer<T>> m_buffer;
};

} // namespace relay_hub
