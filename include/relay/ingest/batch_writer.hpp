#pragma once

/// @file batch_writer.hpp
/// @brief Size-bounded batch ingestion with retry on admission rejection

#include "destination.hpp"
#include "types.hpp"

#include <relay/core/error.hpp>
#include <relay/core/log.hpp>
#include <relay/hub/subscription.hpp>

#include <algorithm>
#include <chrono>
#include <functional>
#include <span>
#include <string>
#include <thread>
#include <vector>

namespace relay_ingest {

/// Loads a finite record sequence into a Destination in batches
///
/// Only BatchWriteRejected is retried, with exponential backoff; acknowledged
/// batches are never re-sent. A batch that cannot be written is reported and
/// the following batches still run.
template<typename R>
class BatchWriter {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    /// Throws std::runtime_error on an invalid config
    BatchWriter(Destination<R>& destination, IngestConfig config = {}, Sleeper sleeper = {})
        : m_destination(destination)
        , m_config(std::move(config))
        , m_sleeper(std::move(sleeper)) {
        m_config.validate().unwrap();
        if (!m_sleeper) {
            m_sleeper = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
        }
    }

    [[nodiscard]] const IngestConfig& config() const noexcept { return m_config; }

    // =========================================================================
    // Known-size input
    // =========================================================================

    [[nodiscard]] IngestReport write_all(const std::string& destination_id, std::span<const R> records) {
        IngestReport report;
        report.destination = destination_id;
        report.total_records = records.size();

        relay_core::ingest_logger()->info("Ingesting {} records into '{}' (batch size {})",
            records.size(), destination_id, m_config.batch_size);

        for (std::size_t first = 0; first < records.size(); first += m_config.batch_size) {
            std::size_t count = std::min(m_config.batch_size, records.size() - first);
            write_batch(destination_id, records.subspan(first, count), first, report);
        }

        log_report(report);
        return report;
    }

    [[nodiscard]] IngestReport write_all(const std::string& destination_id, const std::vector<R>& records) {
        return write_all(destination_id, std::span<const R>(records.data(), records.size()));
    }

    // =========================================================================
    // Live input
    // =========================================================================

    /// Consume a subscription until End or Failed, flushing every batch_size records
    [[nodiscard]] IngestReport drain(const std::string& destination_id, relay_hub::Subscription<R>& subscription) {
        IngestReport report;
        report.destination = destination_id;

        std::vector<R> pending;
        pending.reserve(m_config.batch_size);
        std::size_t next_first = 0;

        auto flush = [&] {
            if (pending.empty()) {
                return;
            }
            write_batch(destination_id, std::span<const R>(pending.data(), pending.size()), next_first, report);
            next_first += pending.size();
            pending.clear();
        };

        while (true) {
            auto delivery = subscription.next();
            if (delivery.is_element()) {
                pending.push_back(std::move(delivery).value());
                ++report.total_records;
                if (pending.size() >= m_config.batch_size) {
                    flush();
                }
            } else if (delivery.is_dropped()) {
                report.dropped_upstream += delivery.dropped_count();
                relay_core::ingest_logger()->warn("'{}': source dropped {} records before ingestion",
                    destination_id, delivery.dropped_count());
            } else if (delivery.is_failed()) {
                report.upstream_error = delivery.error();
                relay_core::ingest_logger()->error("'{}': source failed: {}",
                    destination_id, delivery.error().message());
                break;
            } else {
                break;
            }
        }

        flush();
        log_report(report);
        return report;
    }

private:
    void write_batch(const std::string& destination_id, std::span<const R> batch,
                     std::size_t first_record, IngestReport& report) {
        BatchResult result;
        result.index = report.batches.size();
        result.first_record = first_record;
        result.count = batch.size();

        while (true) {
            ++result.attempts;
            ++report.write_calls;

            auto written = m_destination.write_batch(destination_id, batch);
            if (written) {
                result.status = BatchStatus::Written;
                report.records_written += batch.size();
                break;
            }

            relay_core::Error error = written.error();
            relay_core::debug::record_error(error);

            if (!error.is_ingest(relay_core::IngestError::Kind::BatchWriteRejected)) {
                result.status = BatchStatus::Failed;
                relay_core::ingest_logger()->error("'{}': batch {} failed: {}",
                    destination_id, result.index, error.message());
                result.error = std::move(error);
                break;
            }

            if (result.attempts > m_config.max_retries) {
                relay_core::Error exhausted(relay_core::IngestError::retries_exhausted(
                    destination_id, result.index, result.attempts));
                exhausted.with_context("last_error", error.message());
                relay_core::debug::record_error(exhausted);
                relay_core::ingest_logger()->error("{}", exhausted.message());
                result.status = BatchStatus::Rejected;
                result.error = std::move(exhausted);
                break;
            }

            auto delay = compute_backoff(m_config, result.attempts);
            relay_core::log_structured(spdlog::level::warn, "relay_ingest", "batch rejected, retrying",
                {{"destination", destination_id},
                 {"batch", std::to_string(result.index)},
                 {"attempt", std::to_string(result.attempts)},
                 {"backoff_ms", std::to_string(delay.count())}});
            m_sleeper(delay);
        }

        report.batches.push_back(std::move(result));
    }

    Destination<R>& m_destination;
    IngestConfig m_config;
    Sleeper m_sleeper;
};

} // namespace relay_ingest
