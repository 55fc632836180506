#pragma once

/// @file mpsc_queue.hpp
/// @brief Lock-free MPSC queue for relay_structures
///
/// MpscQueue is an unbounded intrusive queue after Dmitry Vyukov's
/// non-intrusive MPSC node-based design. Any number of threads may push;
/// exactly one thread pops. Producers never block each other: a push is a
/// single atomic exchange followed by a link store.

#include <atomic>
#include <cstddef>
#include <optional>
#include <utility>

namespace relay_structures {

/// Lock-free unbounded MPSC queue
/// @tparam T Stored value type (must be movable)
template<typename T>
class MpscQueue {
private:
    struct Node {
        std::atomic<Node*> next{nullptr};
        std::optional<T> value;

        Node() = default;
        explicit Node(T val) : value(std::move(val)) {}
    };

    // Producers exchange on head_; the consumer owns tail_ (the stub)
    alignas(64) std::atomic<Node*> head_;
    alignas(64) Node* tail_;
    alignas(64) std::atomic<std::size_t> size_{0};

public:
    using value_type = T;
    using size_type = std::size_t;

    // =========================================================================
    // Constructors / Destructor
    // =========================================================================

    MpscQueue() {
        Node* stub = new Node();
        head_.store(stub, std::memory_order_relaxed);
        tail_ = stub;
    }

    /// Destructor frees every node; no producer may be active
    ~MpscQueue() {
        Node* node = tail_;
        while (node != nullptr) {
            Node* next = node->next.load(std::memory_order_relaxed);
            delete node;
            node = next;
        }
    }

    // Non-copyable, non-movable
    MpscQueue(const MpscQueue&) = delete;
    MpscQueue& operator=(const MpscQueue&) = delete;
    MpscQueue(MpscQueue&&) = delete;
    MpscQueue& operator=(MpscQueue&&) = delete;

    // =========================================================================
    // Core Operations
    // =========================================================================

    /// Push value to back of queue (any thread)
    void push(T value) {
        Node* node = new Node(std::move(value));
        size_.fetch_add(1, std::memory_order_relaxed);
        Node* prev = head_.exchange(node, std::memory_order_acq_rel);
        // Between the exchange and this store the chain is briefly broken;
        // pop() observes that as "not yet available"
        prev->next.store(node, std::memory_order_release);
    }

    /// Pop value from front of queue (consumer thread only)
    /// @return Value if available, nullopt if empty or a push is mid-link
    [[nodiscard]] std::optional<T> pop() {
        Node* tail = tail_;
        Node* next = tail->next.load(std::memory_order_acquire);
        if (next == nullptr) {
            return std::nullopt;
        }

        std::optional<T> result(std::move(next->value));
        next->value.reset();
        tail_ = next;
        delete tail;
        size_.fetch_sub(1, std::memory_order_relaxed);
        return result;
    }

    /// Alias for pop()
    [[nodiscard]] std::optional<T> try_pop() {
        return pop();
    }

    // =========================================================================
    // Queries
    // =========================================================================

    /// Approximate emptiness (exact when producers are quiescent)
    [[nodiscard]] bool empty() const noexcept {
        return size_.load(std::memory_order_acquire) == 0;
    }

    /// Approximate element count
    [[nodiscard]] size_type size() const noexcept {
        return size_.load(std::memory_order_acquire);
    }
};

} // namespace relay_structures
