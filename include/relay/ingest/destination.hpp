#pragma once

/// @file destination.hpp
/// @brief Write-constrained external store

#include <relay/core/error.hpp>

#include <cstddef>
#include <mutex>
#include <set>
#include <span>
#include <string>
#include <vector>

namespace relay_ingest {

/// Store that accepts records in batches
///
/// Implementations report a full admission queue as
/// IngestError::BatchWriteRejected; the writer retries only that kind.
template<typename R>
class Destination {
public:
    virtual ~Destination() = default;

    [[nodiscard]] virtual relay_core::Result<void> write_batch(
        const std::string& destination_id, std::span<const R> records) = 0;
};

/// In-process destination that keeps everything it acknowledges
///
/// Write calls listed in the rejection set are refused with
/// BatchWriteRejected, which makes admission pressure reproducible.
template<typename R>
class MemoryDestination : public Destination<R> {
public:
    MemoryDestination() = default;

    /// Refuse the given 0-based write calls
    explicit MemoryDestination(std::set<std::size_t> rejected_calls)
        : m_rejected_calls(std::move(rejected_calls)) {}

    [[nodiscard]] relay_core::Result<void> write_batch(
        const std::string& destination_id, std::span<const R> records) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::size_t call = m_calls++;
        m_batch_sizes.push_back(records.size());

        if (m_rejected_calls.count(call) > 0) {
            return relay_core::Err(relay_core::Error(relay_core::IngestError::batch_write_rejected(
                destination_id, "admission queue full")));
        }

        m_records.insert(m_records.end(), records.begin(), records.end());
        return relay_core::Ok();
    }

    [[nodiscard]] std::vector<R> records() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_records;
    }

    [[nodiscard]] std::size_t calls() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_calls;
    }

    /// Size of every write call, accepted or not
    [[nodiscard]] std::vector<std::size_t> batch_sizes() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_batch_sizes;
    }

private:
    mutable std::mutex m_mutex;
    std::set<std::size_t> m_rejected_calls;
    std::size_t m_calls = 0;
    std::vector<std::size_t> m_batch_sizes;
    std::vector<R> m_records;
};

} // namespace relay_ingest
