/// @file ingest.cpp
/// @brief Non-template parts of relay_ingest

#include <relay/ingest/types.hpp>
#include <relay/core/config.hpp>
#include <relay/core/log.hpp>

#include <algorithm>
#include <sstream>

namespace relay_ingest {

using relay_core::Err;
using relay_core::Error;
using relay_core::ErrorCode;
using relay_core::Ok;
using relay_core::Result;

// =============================================================================
// IngestConfig
// =============================================================================

Result<void> IngestConfig::validate() const {
    if (batch_size == 0) {
        return Err(Error(ErrorCode::ValidationError, "ingest batch_size must be at least 1"));
    }
    if (base_backoff.count() < 0 || max_backoff.count() < 0) {
        return Err(Error(ErrorCode::ValidationError, "ingest backoff delays must not be negative"));
    }
    if (max_backoff < base_backoff) {
        return Err(Error(ErrorCode::ValidationError, "ingest max_backoff must be >= base_backoff"));
    }
    if (backoff_multiplier < 1.0) {
        return Err(Error(ErrorCode::ValidationError, "ingest backoff_multiplier must be >= 1.0"));
    }
    return Ok();
}

Result<IngestConfig> ingest_config_from(const relay_core::ConfigManager& config) {
    namespace keys = relay_core::config_keys;
    IngestConfig ingest;

    std::int64_t batch_size = config.get_int(keys::INGEST_BATCH_SIZE,
        static_cast<std::int64_t>(ingest.batch_size));
    if (batch_size < 1) {
        return Err<IngestConfig>(Error(ErrorCode::ValidationError,
            "ingest.batch_size must be at least 1, got " + std::to_string(batch_size)));
    }
    ingest.batch_size = static_cast<std::size_t>(batch_size);

    std::int64_t max_retries = config.get_int(keys::INGEST_MAX_RETRIES, ingest.max_retries);
    if (max_retries < 0) {
        return Err<IngestConfig>(Error(ErrorCode::ValidationError,
            "ingest.max_retries must not be negative, got " + std::to_string(max_retries)));
    }
    ingest.max_retries = static_cast<std::uint32_t>(max_retries);

    ingest.base_backoff = std::chrono::milliseconds(
        config.get_int(keys::INGEST_BASE_BACKOFF_MS, ingest.base_backoff.count()));
    ingest.max_backoff = std::chrono::milliseconds(
        config.get_int(keys::INGEST_MAX_BACKOFF_MS, ingest.max_backoff.count()));
    ingest.backoff_multiplier = config.get_float(keys::INGEST_BACKOFF_MULTIPLIER, ingest.backoff_multiplier);

    auto valid = ingest.validate();
    if (!valid) {
        return Err<IngestConfig>(valid.error());
    }
    return Ok(std::move(ingest));
}

std::chrono::milliseconds compute_backoff(const IngestConfig& config, std::uint32_t retry) {
    auto delay = config.base_backoff;
    for (std::uint32_t i = 1; i < retry && delay < config.max_backoff; ++i) {
        delay = std::chrono::milliseconds(
            static_cast<long long>(static_cast<double>(delay.count()) * config.backoff_multiplier));
    }
    return std::min(delay, config.max_backoff);
}

// =============================================================================
// Results
// =============================================================================

const char* to_string(BatchStatus status) {
    switch (status) {
        case BatchStatus::Written: return "written";
        case BatchStatus::Rejected: return "rejected";
        case BatchStatus::Failed: return "failed";
    }
    return "unknown";
}

bool IngestReport::ok() const {
    if (upstream_error) {
        return false;
    }
    return std::all_of(batches.begin(), batches.end(),
        [](const BatchResult& batch) { return batch.status == BatchStatus::Written; });
}

std::vector<const BatchResult*> IngestReport::failed_batches() const {
    std::vector<const BatchResult*> failed;
    for (const auto& batch : batches) {
        if (batch.status != BatchStatus::Written) {
            failed.push_back(&batch);
        }
    }
    return failed;
}

std::vector<BatchStatus> IngestReport::per_record_status() const {
    std::vector<BatchStatus> statuses;
    statuses.reserve(total_records);
    for (const auto& batch : batches) {
        statuses.insert(statuses.end(), batch.count, batch.status);
    }
    return statuses;
}

std::string format_report(const IngestReport& report) {
    std::ostringstream oss;
    oss << "Ingestion into '" << report.destination << "': "
        << report.records_written << "/" << report.total_records << " records written in "
        << report.batches.size() << " batches (" << report.write_calls << " write calls)";

    if (report.dropped_upstream > 0) {
        oss << ", " << report.dropped_upstream << " dropped upstream";
    }

    for (const auto* batch : report.failed_batches()) {
        oss << "\n  batch " << batch->index << " [" << batch->first_record << ", "
            << batch->first_record + batch->count << ") " << to_string(batch->status)
            << " after " << batch->attempts << " attempts";
        if (batch->error) {
            oss << ": " << batch->error->message();
        }
    }

    if (report.upstream_error) {
        oss << "\n  source failed: " << report.upstream_error->message();
    }
    return oss.str();
}

void log_report(const IngestReport& report) {
    auto logger = relay_core::ingest_logger();
    if (report.ok()) {
        logger->info("{}", format_report(report));
    } else {
        logger->warn("{}", format_report(report));
    }
}

} // namespace relay_ingest
