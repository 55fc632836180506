#pragma once

/// @file error.hpp
/// @brief Error handling types for relay_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>
#include <type_traits>

namespace relay_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    ValidationError,
    Timeout,
    ContractViolation,
    Overflow,
    Failed,
    Closed,
    Rejected,
    NotSupported,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::ContractViolation: return "ContractViolation";
        case ErrorCode::Overflow: return "Overflow";
        case ErrorCode::Failed: return "Failed";
        case ErrorCode::Closed: return "Closed";
        case ErrorCode::Rejected: return "Rejected";
        case ErrorCode::NotSupported: return "NotSupported";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Broadcast hub errors
struct HubError {
    enum class Kind : std::uint8_t {
        ContractViolation,   // Producer pushed after complete()/fail()
        SubscriberOverflow,  // A subscription could not keep pace
        HubFailed,           // Producer failure or fail-fast overflow
        HubClosed,           // Hub was torn down
        InletUnavailable,    // Inlet already taken or moved from
    };

    Kind kind;
    std::string message;
    std::string hub;
    std::uint64_t subscription = 0;  // For SubscriberOverflow

    [[nodiscard]] static HubError contract_violation(const std::string& hub_name, const std::string& what) {
        return HubError{Kind::ContractViolation,
            "Hub '" + hub_name + "' contract violation: " + what, hub_name, 0};
    }

    [[nodiscard]] static HubError subscriber_overflow(
        const std::string& hub_name, std::uint64_t subscription_id, std::size_t capacity) {
        return HubError{Kind::SubscriberOverflow,
            "Hub '" + hub_name + "' subscription " + std::to_string(subscription_id) +
            " overflowed its buffer of " + std::to_string(capacity),
            hub_name, subscription_id};
    }

    [[nodiscard]] static HubError hub_failed(const std::string& hub_name, const std::string& reason) {
        return HubError{Kind::HubFailed, "Hub '" + hub_name + "' failed: " + reason, hub_name, 0};
    }

    [[nodiscard]] static HubError hub_closed(const std::string& hub_name) {
        return HubError{Kind::HubClosed, "Hub '" + hub_name + "' is closed", hub_name, 0};
    }

    [[nodiscard]] static HubError inlet_unavailable(const std::string& hub_name) {
        return HubError{Kind::InletUnavailable,
            "Hub '" + hub_name + "' inlet is not available", hub_name, 0};
    }
};

/// Batch ingestion errors
struct IngestError {
    enum class Kind : std::uint8_t {
        BatchWriteRejected,  // Destination admission queue refused the batch
        WriteFailed,         // Destination failed the write
        RetriesExhausted,    // Rejected batch still refused after all retries
    };

    Kind kind;
    std::string message;
    std::string destination;
    std::size_t batch_index = 0;

    [[nodiscard]] static IngestError batch_write_rejected(
        const std::string& destination_id, const std::string& reason) {
        return IngestError{Kind::BatchWriteRejected,
            "Write rejected by '" + destination_id + "': " + reason, destination_id, 0};
    }

    [[nodiscard]] static IngestError write_failed(
        const std::string& destination_id, const std::string& reason) {
        return IngestError{Kind::WriteFailed,
            "Write to '" + destination_id + "' failed: " + reason, destination_id, 0};
    }

    [[nodiscard]] static IngestError retries_exhausted(
        const std::string& destination_id, std::size_t batch, std::uint32_t attempts) {
        return IngestError{Kind::RetriesExhausted,
            "Batch " + std::to_string(batch) + " to '" + destination_id +
            "' still rejected after " + std::to_string(attempts) + " attempts",
            destination_id, batch};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        HubError,
        IngestError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(HubError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(IngestError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// True if this is a HubError of the given kind
    [[nodiscard]] bool is_hub(HubError::Kind kind) const {
        const auto* err = as<HubError>();
        return err != nullptr && err->kind == kind;
    }

    /// True if this is an IngestError of the given kind
    [[nodiscard]] bool is_ingest(IngestError::Kind kind) const {
        const auto* err = as<IngestError>();
        return err != nullptr && err->kind == kind;
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(HubError::Kind kind) {
        switch (kind) {
            case HubError::Kind::ContractViolation: return ErrorCode::ContractViolation;
            case HubError::Kind::SubscriberOverflow: return ErrorCode::Overflow;
            case HubError::Kind::HubFailed: return ErrorCode::Failed;
            case HubError::Kind::HubClosed: return ErrorCode::Closed;
            case HubError::Kind::InletUnavailable: return ErrorCode::InvalidState;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(IngestError::Kind kind) {
        switch (kind) {
            case IngestError::Kind::BatchWriteRejected: return ErrorCode::Rejected;
            case IngestError::Kind::WriteFailed: return ErrorCode::IOError;
            case IngestError::Kind::RetriesExhausted: return ErrorCode::Rejected;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type carrying either a value or an error
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error: " + describe(m_error));
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error: " + describe(m_error));
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

    /// Chain operations
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        using ResultType = decltype(func(std::declval<T>()));
        return ResultType(std::move(m_error));
    }

private:
    static std::string describe(const E& error) {
        if constexpr (std::is_same_v<E, Error>) {
            return error.message();
        } else {
            return "unknown";
        }
    }

    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    /// Static factory for success
    [[nodiscard]] static Result ok() { return Result(); }

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    /// Get error
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Operator bool
    explicit operator bool() const noexcept { return m_has_value; }

    /// Unwrap (throws if error)
    void unwrap() const {
        if (!m_has_value) {
            if constexpr (std::is_same_v<E, Error>) {
                throw std::runtime_error("Result contains error: " + m_error.message());
            } else {
                throw std::runtime_error("Result contains error");
            }
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with code, payload details and context
std::string build_error_chain(const Error& error);

namespace debug {

/// Record error occurrence (for statistics)
void record_error(const Error& error);

/// Get total error count
std::uint64_t total_error_count();

/// Get count of recorded hub errors
std::uint64_t hub_error_count();

/// Get count of recorded ingestion errors
std::uint64_t ingest_error_count();

/// Reset error statistics
void reset_error_stats();

/// Get error statistics as formatted string
std::string error_stats_summary();

} // namespace debug

} // namespace relay_core
