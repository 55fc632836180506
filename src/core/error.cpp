/// @file error.cpp
/// @brief Error handling implementation for relay_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities
/// - Process-wide error statistics

#include <relay/core/error.hpp>
#include <atomic>
#include <sstream>
#include <vector>

namespace relay_core {

// =============================================================================
// Error Message Formatting (Out-of-line for complex cases)
// =============================================================================

namespace detail {

const char* hub_kind_name(HubError::Kind kind) {
    switch (kind) {
        case HubError::Kind::ContractViolation: return "ContractViolation";
        case HubError::Kind::SubscriberOverflow: return "SubscriberOverflow";
        case HubError::Kind::HubFailed: return "HubFailed";
        case HubError::Kind::HubClosed: return "HubClosed";
        case HubError::Kind::InletUnavailable: return "InletUnavailable";
    }
    return "Unknown";
}

const char* ingest_kind_name(IngestError::Kind kind) {
    switch (kind) {
        case IngestError::Kind::BatchWriteRejected: return "BatchWriteRejected";
        case IngestError::Kind::WriteFailed: return "WriteFailed";
        case IngestError::Kind::RetriesExhausted: return "RetriesExhausted";
    }
    return "Unknown";
}

/// Format hub error with full context
std::string format_hub_error(const HubError& err) {
    std::ostringstream oss;
    oss << "[HubError:" << hub_kind_name(err.kind) << "] " << err.message;

    if (err.subscription != 0) {
        oss << " (subscription: " << err.subscription << ")";
    }

    return oss.str();
}

/// Format ingestion error with full context
std::string format_ingest_error(const IngestError& err) {
    std::ostringstream oss;
    oss << "[IngestError:" << ingest_kind_name(err.kind) << "] " << err.message;

    if (err.kind == IngestError::Kind::RetriesExhausted) {
        oss << " (batch: " << err.batch_index << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, HubError>) {
            oss << detail::format_hub_error(err);
        } else if constexpr (std::is_same_v<T, IngestError>) {
            oss << detail::format_ingest_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " {" << key << "=" << value << "}";
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::int64_t, Error>;
template class Result<std::uint64_t, Error>;
template class Result<double, Error>;
template class Result<std::string, Error>;

// =============================================================================
// Error Statistics
// =============================================================================

namespace debug {

struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::atomic<std::uint64_t> hub_errors{0};
    std::atomic<std::uint64_t> ingest_errors{0};
    std::atomic<std::uint64_t> generic_errors{0};
};

static ErrorStats s_error_stats;

/// Record error occurrence
void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    if (error.is<HubError>()) {
        s_error_stats.hub_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<IngestError>()) {
        s_error_stats.ingest_errors.fetch_add(1, std::memory_order_relaxed);
    } else {
        s_error_stats.generic_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

std::uint64_t hub_error_count() {
    return s_error_stats.hub_errors.load(std::memory_order_relaxed);
}

std::uint64_t ingest_error_count() {
    return s_error_stats.ingest_errors.load(std::memory_order_relaxed);
}

void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    s_error_stats.hub_errors.store(0, std::memory_order_relaxed);
    s_error_stats.ingest_errors.store(0, std::memory_order_relaxed);
    s_error_stats.generic_errors.store(0, std::memory_order_relaxed);
}

/// Get error statistics as formatted string
std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s_error_stats.total_errors.load() << "\n"
        << "  Hub: " << s_error_stats.hub_errors.load() << "\n"
        << "  Ingest: " << s_error_stats.ingest_errors.load() << "\n"
        << "  Generic: " << s_error_stats.generic_errors.load() << "\n";
    return oss.str();
}

} // namespace debug

} // namespace relay_core
