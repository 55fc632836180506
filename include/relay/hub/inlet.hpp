#pragma once

/// @file inlet.hpp
/// @brief Producer handle of a hub

#include "broadcast_core.hpp"

#include <relay/core/error.hpp>

#include <memory>
#include <utility>

namespace relay_hub {

/// Move-only ingress capability bound to exactly one hub
///
/// Safe to call from any thread, including a foreign callback thread. Keeps the
/// core alive, but pushes into a torn-down hub return HubClosed.
template<typename T>
class Inlet {
public:
    Inlet() = default;

    explicit Inlet(std::shared_ptr<BroadcastCore<T>> core)
        : m_core(std::move(core)) {}

    Inlet(const Inlet&) = delete;
    Inlet& operator=(const Inlet&) = delete;

    Inlet(Inlet&& other) noexcept = default;
    Inlet& operator=(Inlet&& other) noexcept = default;

    relay_core::Result<void> push(T element) {
        if (!m_core) {
            return unavailable();
        }
        return m_core->push(std::move(element));
    }

    relay_core::Result<void> complete() {
        if (!m_core) {
            return unavailable();
        }
        return m_core->complete();
    }

    relay_core::Result<void> fail(relay_core::Error error) {
        if (!m_core) {
            return unavailable();
        }
        return m_core->fail(std::move(error));
    }

    [[nodiscard]] bool is_valid() const noexcept { return m_core != nullptr; }

    [[nodiscard]] explicit operator bool() const noexcept { return is_valid(); }

private:
    static relay_core::Result<void> unavailable() {
        relay_core::Error error(relay_core::HubError::inlet_unavailable("<none>"));
        relay_core::debug::record_error(error);
        return relay_core::Err(std::move(error));
    }

    std::shared_ptr<BroadcastCore<T>> m_core;
};

} // namespace relay_hub
