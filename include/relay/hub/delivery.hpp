#pragma once

/// @file delivery.hpp
/// @brief What a pull consumer reads from its subscription

#include "fwd.hpp"

#include <relay/core/error.hpp>

#include <cstdint>
#include <optional>
#include <utility>

namespace relay_hub {

/// One item read from a Subscription: an element, a gap notice, or a terminal signal
template<typename T>
class Delivery {
public:
    enum class Kind : std::uint8_t {
        Element,  ///< A pushed element
        Dropped,  ///< Explicit gap: count elements were discarded at this position
        End,      ///< Normal end of stream
        Failed,   ///< Abnormal termination
    };

    [[nodiscard]] static Delivery element(T value) {
        Delivery d(Kind::Element);
        d.m_value.emplace(std::move(value));
        return d;
    }

    [[nodiscard]] static Delivery dropped(std::uint64_t count) {
        Delivery d(Kind::Dropped);
        d.m_dropped = count;
        return d;
    }

    [[nodiscard]] static Delivery end() {
        return Delivery(Kind::End);
    }

    [[nodiscard]] static Delivery failed(relay_core::Error error) {
        Delivery d(Kind::Failed);
        d.m_error.emplace(std::move(error));
        return d;
    }

    [[nodiscard]] Kind kind() const noexcept { return m_kind; }

    [[nodiscard]] bool is_element() const noexcept { return m_kind == Kind::Element; }
    [[nodiscard]] bool is_dropped() const noexcept { return m_kind == Kind::Dropped; }
    [[nodiscard]] bool is_end() const noexcept { return m_kind == Kind::End; }
    [[nodiscard]] bool is_failed() const noexcept { return m_kind == Kind::Failed; }
    [[nodiscard]] bool is_terminal() const noexcept { return is_end() || is_failed(); }

    /// Element value (only for Kind::Element)
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Number of discarded elements (only for Kind::Dropped)
    [[nodiscard]] std::uint64_t dropped_count() const noexcept { return m_dropped; }

    /// Termination cause (only for Kind::Failed)
    [[nodiscard]] const relay_core::Error& error() const { return *m_error; }

private:
    explicit Delivery(Kind kind) : m_kind(kind) {}

    Kind m_kind;
    std::optional<T> m_value;
    std::uint64_t m_dropped = 0;
    std::optional<relay_core::Error> m_error;
};

} // namespace relay_hub
