#pragma once

/// @file subscription_buffer.hpp
/// @brief Bounded per-subscription buffer applying the hub's overflow policy

#include "delivery.hpp"
#include "sink.hpp"
#include "types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace relay_hub {

/// Pull-side buffer of one Subscription
///
/// Gaps introduced by a drop policy are kept next to the element they precede,
/// so a reader sees Dropped(n) exactly where the discarded elements were.
template<typename T>
class SubscriptionBuffer : public Sink<T> {
public:
    SubscriptionBuffer(std::size_t capacity, OverflowPolicy policy)
        : m_capacity(capacity == 0 ? 1 : capacity)
        , m_policy(policy) {}

    // =========================================================================
    // Sink (producer side)
    // =========================================================================

    [[nodiscard]] OfferResult offer(const T& element) override {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (m_closed || m_terminal) {
            return OfferResult::Closed;
        }

        OfferResult result = OfferResult::Accepted;
        if (m_items.size() >= m_capacity) {
            switch (m_policy) {
                case OverflowPolicy::FailFast:
                    return OfferResult::Overflow;

                case OverflowPolicy::DropNewest:
                    ++m_trailing_gap;
                    ++m_dropped_total;
                    m_readable.notify_all();
                    return OfferResult::Dropped;

                case OverflowPolicy::DropOldest: {
                    std::uint64_t carried = m_items.front().gap_before + 1;
                    m_items.pop_front();
                    if (m_items.empty()) {
                        m_trailing_gap += carried;
                    } else {
                        m_items.front().gap_before += carried;
                    }
                    ++m_dropped_total;
                    result = OfferResult::Dropped;
                    break;
                }

                case OverflowPolicy::BlockProducer:
                    m_writable.wait(lock, [this] {
                        return m_items.size() < m_capacity || m_closed || m_terminal.has_value();
                    });
                    if (m_closed || m_terminal) {
                        return OfferResult::Closed;
                    }
                    break;
            }
        }

        m_items.push_back(Slot{element, m_trailing_gap});
        m_trailing_gap = 0;
        m_readable.notify_all();
        return result;
    }

    void finish() override {
        terminate(Delivery<T>::end());
    }

    void fail(const relay_core::Error& error) override {
        terminate(Delivery<T>::failed(error));
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_readable.notify_all();
        m_writable.notify_all();
    }

    [[nodiscard]] bool is_closed() const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

    // =========================================================================
    // Reader side
    // =========================================================================

    /// Block until a delivery is available
    [[nodiscard]] Delivery<T> next() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_readable.wait(lock, [this] { return readable_locked(); });
        return *pop_locked();
    }

    /// Non-blocking read
    [[nodiscard]] std::optional<Delivery<T>> try_next() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return pop_locked();
    }

    /// Block up to timeout
    [[nodiscard]] std::optional<Delivery<T>> next_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (!m_readable.wait_for(lock, timeout, [this] { return readable_locked(); })) {
            return std::nullopt;
        }
        return pop_locked();
    }

    /// Everything readable right now, stopping after a terminal delivery
    [[nodiscard]] std::vector<Delivery<T>> drain() {
        std::vector<Delivery<T>> out;
        std::lock_guard<std::mutex> lock(m_mutex);
        while (auto delivery = pop_locked()) {
            bool terminal = delivery->is_terminal();
            out.push_back(std::move(*delivery));
            if (terminal) {
                break;
            }
        }
        return out;
    }

    [[nodiscard]] std::uint64_t dropped_count() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_dropped_total;
    }

    /// Buffered elements not yet read
    [[nodiscard]] std::size_t pending() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_items.size();
    }

    [[nodiscard]] std::size_t capacity() const noexcept { return m_capacity; }
    [[nodiscard]] OverflowPolicy policy() const noexcept { return m_policy; }

private:
    struct Slot {
        T element;
        std::uint64_t gap_before;
    };

    void terminate(Delivery<T> signal) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_terminal || m_closed) {
                return;
            }
            m_terminal.emplace(std::move(signal));
        }
        m_readable.notify_all();
        m_writable.notify_all();
    }

    bool readable_locked() const {
        return !m_items.empty() || m_trailing_gap > 0 || m_terminal.has_value() || m_closed;
    }

    /// Next delivery; a terminal signal is sticky and returned on every call
    std::optional<Delivery<T>> pop_locked() {
        if (!m_items.empty()) {
            Slot& front = m_items.front();
            if (front.gap_before > 0) {
                std::uint64_t gap = front.gap_before;
                front.gap_before = 0;
                return Delivery<T>::dropped(gap);
            }
            Delivery<T> delivery = Delivery<T>::element(std::move(front.element));
            m_items.pop_front();
            m_writable.notify_one();
            return delivery;
        }
        if (m_trailing_gap > 0) {
            std::uint64_t gap = m_trailing_gap;
            m_trailing_gap = 0;
            return Delivery<T>::dropped(gap);
        }
        if (m_terminal) {
            return *m_terminal;
        }
        if (m_closed) {
            return Delivery<T>::end();
        }
        return std::nullopt;
    }

    const std::size_t m_capacity;
    const OverflowPolicy m_policy;

    mutable std::mutex m_mutex;
    std::condition_variable m_readable;
    std::condition_variable m_writable;

    std::deque<Slot> m_items;
    std::uint64_t m_trailing_gap = 0;
    std::uint64_t m_dropped_total = 0;
    std::optional<Delivery<T>> m_terminal;
    bool m_closed = false;
};

} // namespace relay_hub
