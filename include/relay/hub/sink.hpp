#pragma once

/// @file sink.hpp
/// @brief Delivery endpoints the broadcast core fans out to
///
/// A Sink is whatever sits at the consumer end of one subscription: a bounded
/// pull buffer, a push callback, or the keep-alive anchor.

#include "fwd.hpp"

#include <relay/core/error.hpp>
#include <relay/core/log.hpp>

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <utility>

namespace relay_hub {

/// Outcome of offering one element to a sink
enum class OfferResult : std::uint8_t {
    Accepted,  ///< Stored or consumed
    Dropped,   ///< Accepted under a drop policy with a gap recorded
    Overflow,  ///< Buffer full under FailFast
    Closed,    ///< Sink no longer accepts anything; detach it
};

// =============================================================================
// Sink Interface
// =============================================================================

/// Consumer endpoint of a single subscription
template<typename T>
class Sink {
public:
    virtual ~Sink() = default;

    /// Offer one element (called on the delivery thread)
    [[nodiscard]] virtual OfferResult offer(const T& element) = 0;

    /// Deliver end-of-stream (at most one terminal signal takes effect)
    virtual void finish() = 0;

    /// Deliver a failure
    virtual void fail(const relay_core::Error& error) = 0;

    /// Consumer side went away; wake any waiter without a terminal signal
    virtual void close() = 0;

    [[nodiscard]] virtual bool is_closed() const = 0;
};

// =============================================================================
// AnchorSink
// =============================================================================

/// Keep-alive anchor: permanently attached, discards everything
template<typename T>
class AnchorSink : public Sink<T> {
public:
    [[nodiscard]] OfferResult offer(const T&) override {
        return OfferResult::Accepted;
    }

    void finish() override { m_closed.store(true, std::memory_order_release); }
    void fail(const relay_core::Error&) override { m_closed.store(true, std::memory_order_release); }
    void close() override { m_closed.store(true, std::memory_order_release); }

    [[nodiscard]] bool is_closed() const override {
        return m_closed.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> m_closed{false};
};

// =============================================================================
// CallbackSink
// =============================================================================

/// Push-style consumer invoked on the delivery thread
///
/// A callback that throws closes the sink; the core then detaches it and the
/// failure stays isolated from the producer and sibling subscriptions.
template<typename T>
class CallbackSink : public Sink<T> {
public:
    using ElementFn = std::function<void(const T&)>;
    using EndFn = std::function<void()>;
    using ErrorFn = std::function<void(const relay_core::Error&)>;

    CallbackSink(std::string hub_name, ElementFn on_element, EndFn on_end = {}, ErrorFn on_error = {})
        : m_hub_name(std::move(hub_name))
        , m_on_element(std::move(on_element))
        , m_on_end(std::move(on_end))
        , m_on_error(std::move(on_error)) {}

    [[nodiscard]] OfferResult offer(const T& element) override {
        if (is_closed()) {
            return OfferResult::Closed;
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        if (is_closed()) {
            return OfferResult::Closed;
        }
        if (!m_on_element) {
            return OfferResult::Accepted;
        }

        try {
            m_on_element(element);
        } catch (const std::exception& e) {
            m_closed.store(true, std::memory_order_release);
            relay_core::Error error(relay_core::ErrorCode::Failed,
                std::string("Subscriber callback threw: ") + e.what());
            error.with_context("hub", m_hub_name);
            relay_core::debug::record_error(error);
            relay_core::hub_logger()->error("Hub '{}': subscriber callback threw, detaching: {}",
                m_hub_name, e.what());
            return OfferResult::Closed;
        }
        return OfferResult::Accepted;
    }

    void finish() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        if (!m_on_end) {
            return;
        }
        try {
            m_on_end();
        } catch (const std::exception& e) {
            relay_core::hub_logger()->error("Hub '{}': end-of-stream callback threw: {}",
                m_hub_name, e.what());
        }
    }

    void fail(const relay_core::Error& error) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        if (!m_on_error) {
            return;
        }
        try {
            m_on_error(error);
        } catch (const std::exception& e) {
            relay_core::hub_logger()->error("Hub '{}': error callback threw: {}",
                m_hub_name, e.what());
        }
    }

    /// Does not take the callback mutex, so a callback may detach itself
    void close() override {
        m_closed.store(true, std::memory_order_release);
    }

    [[nodiscard]] bool is_closed() const override {
        return m_closed.load(std::memory_order_acquire);
    }

private:
    std::string m_hub_name;
    ElementFn m_on_element;
    EndFn m_on_end;
    ErrorFn m_on_error;
    std::mutex m_mutex;
    std::atomic<bool> m_closed{false};
};

} // namespace relay_hub
