#pragma once

/// @file registry.hpp
/// @brief Copy-on-write set of attached subscriptions

#include "sink.hpp"
#include "types.hpp"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace relay_hub {

/// Tracks attached sinks and the first sequence number each may receive
///
/// Writers copy the entry vector; delivery iterates an immutable snapshot, so
/// attach and detach never wait on a fanout in progress.
template<typename T>
class SubscriptionRegistry {
public:
    struct Entry {
        SubscriptionId id;
        std::shared_ptr<Sink<T>> sink;
        std::uint64_t first_seq = 0;
        bool anchor = false;
    };

    using Entries = std::vector<Entry>;
    using Snapshot = std::shared_ptr<const Entries>;

    SubscriptionRegistry()
        : m_entries(std::make_shared<const Entries>()) {}

    // Non-copyable
    SubscriptionRegistry(const SubscriptionRegistry&) = delete;
    SubscriptionRegistry& operator=(const SubscriptionRegistry&) = delete;

    /// Register a sink; returns its new id
    SubscriptionId add(std::shared_ptr<Sink<T>> sink, std::uint64_t first_seq, bool anchor = false) {
        std::lock_guard<std::mutex> lock(m_mutex);
        SubscriptionId id{m_next_id++};
        auto next = std::make_shared<Entries>(*m_entries);
        next->push_back(Entry{id, std::move(sink), first_seq, anchor});
        m_entries = std::move(next);
        return id;
    }

    /// Unregister; returns the sink, or nullptr if the id is not registered
    /// or names the anchor (only take_all releases the anchor)
    std::shared_ptr<Sink<T>> remove(SubscriptionId id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = std::find_if(m_entries->begin(), m_entries->end(),
            [id](const Entry& entry) { return entry.id == id; });
        if (it == m_entries->end() || it->anchor) {
            return nullptr;
        }

        std::shared_ptr<Sink<T>> sink = it->sink;
        auto next = std::make_shared<Entries>();
        next->reserve(m_entries->size() - 1);
        for (const auto& entry : *m_entries) {
            if (entry.id != id) {
                next->push_back(entry);
            }
        }
        m_entries = std::move(next);
        return sink;
    }

    /// Current entries (O(1))
    [[nodiscard]] Snapshot snapshot() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_entries;
    }

    /// Empty the registry, returning what was attached
    [[nodiscard]] Entries take_all() {
        std::lock_guard<std::mutex> lock(m_mutex);
        Entries taken = *m_entries;
        m_entries = std::make_shared<const Entries>();
        return taken;
    }

    [[nodiscard]] bool contains(SubscriptionId id) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return std::any_of(m_entries->begin(), m_entries->end(),
            [id](const Entry& entry) { return entry.id == id; });
    }

    /// All entries, anchor included
    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_entries->size();
    }

    /// Real subscribers (anchor excluded)
    [[nodiscard]] std::size_t subscriber_count() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return static_cast<std::size_t>(std::count_if(m_entries->begin(), m_entries->end(),
            [](const Entry& entry) { return !entry.anchor; }));
    }

    [[nodiscard]] bool has_anchor() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return std::any_of(m_entries->begin(), m_entries->end(),
            [](const Entry& entry) { return entry.anchor; });
    }

private:
    mutable std::mutex m_mutex;
    Snapshot m_entries;
    std::uint64_t m_next_id = 1;
};

} // namespace relay_hub
