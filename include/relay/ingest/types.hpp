#pragma once

/// @file types.hpp
/// @brief Configuration and reporting types for relay_ingest

#include <relay/core/error.hpp>
#include <relay/core/fwd.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace relay_ingest {

// =============================================================================
// IngestConfig
// =============================================================================

/// Batching and retry parameters
struct IngestConfig {
    std::size_t batch_size = 100;
    std::uint32_t max_retries = 5;  ///< Retries after the first attempt
    std::chrono::milliseconds base_backoff{50};
    std::chrono::milliseconds max_backoff{2000};
    double backoff_multiplier = 2.0;

    IngestConfig& with_batch_size(std::size_t value) { batch_size = value; return *this; }
    IngestConfig& with_max_retries(std::uint32_t value) { max_retries = value; return *this; }
    IngestConfig& with_base_backoff(std::chrono::milliseconds value) { base_backoff = value; return *this; }
    IngestConfig& with_max_backoff(std::chrono::milliseconds value) { max_backoff = value; return *this; }
    IngestConfig& with_backoff_multiplier(double value) { backoff_multiplier = value; return *this; }

    [[nodiscard]] relay_core::Result<void> validate() const;
};

/// Build an IngestConfig from "ingest.*" configuration keys
[[nodiscard]] relay_core::Result<IngestConfig> ingest_config_from(const relay_core::ConfigManager& config);

/// Delay before retry number `retry` (1-based): base * multiplier^(retry-1), capped at max
[[nodiscard]] std::chrono::milliseconds compute_backoff(const IngestConfig& config, std::uint32_t retry);

// =============================================================================
// Results
// =============================================================================

enum class BatchStatus : std::uint8_t {
    Written,   ///< Acknowledged by the destination
    Rejected,  ///< Admission refused on every attempt
    Failed,    ///< Non-retryable write error
};

[[nodiscard]] const char* to_string(BatchStatus status);

/// Outcome of one batch
struct BatchResult {
    std::size_t index = 0;
    std::size_t first_record = 0;
    std::size_t count = 0;
    std::uint32_t attempts = 0;
    BatchStatus status = BatchStatus::Written;
    std::optional<relay_core::Error> error;
};

/// Outcome of a whole ingestion run
struct IngestReport {
    std::string destination;
    std::size_t total_records = 0;
    std::size_t records_written = 0;
    std::size_t write_calls = 0;
    std::vector<BatchResult> batches;

    /// Gap notices seen while draining a subscription
    std::uint64_t dropped_upstream = 0;
    /// Failure that ended a drained subscription
    std::optional<relay_core::Error> upstream_error;

    /// Every batch written and the source ended cleanly
    [[nodiscard]] bool ok() const;

    [[nodiscard]] std::vector<const BatchResult*> failed_batches() const;

    /// One status per record, in record order
    [[nodiscard]] std::vector<BatchStatus> per_record_status() const;
};

/// Multi-line summary of a report
[[nodiscard]] std::string format_report(const IngestReport& report);

/// Log the report summary on the ingest logger
void log_report(const IngestReport& report);

} // namespace relay_ingest
