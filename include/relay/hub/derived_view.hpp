#pragma once

/// @file derived_view.hpp
/// @brief Shared transformation stage between two hubs
///
/// A DerivedView subscribes once to an upstream hub, runs a Transform on each
/// element and pushes the output into its own downstream hub. However many
/// consumers attach downstream, the transform runs exactly once per upstream
/// element. Views compose: the output of one view is a valid upstream.

#include "live_hub.hpp"
#include "types.hpp"

#include <relay/core/error.hpp>
#include <relay/core/log.hpp>

#include <atomic>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace relay_hub {

// =============================================================================
// Transform
// =============================================================================

/// Stateful or stateless element transformation
template<typename In, typename Out>
class Transform {
public:
    using Emit = std::function<void(Out)>;

    virtual ~Transform() = default;

    /// Consume one input; emit zero or more outputs
    virtual void apply(const In& input, const Emit& emit) = 0;

    /// Upstream completed; emit whatever is still held
    virtual void flush(const Emit& emit) { (void)emit; }
};

/// One output per input
template<typename In, typename Out>
class MapTransform : public Transform<In, Out> {
public:
    using Fn = std::function<Out(const In&)>;

    explicit MapTransform(Fn fn) : m_fn(std::move(fn)) {}

    void apply(const In& input, const typename Transform<In, Out>::Emit& emit) override {
        emit(m_fn(input));
    }

private:
    Fn m_fn;
};

/// Passes inputs matching a predicate
template<typename T>
class FilterTransform : public Transform<T, T> {
public:
    using Predicate = std::function<bool(const T&)>;

    explicit FilterTransform(Predicate predicate) : m_predicate(std::move(predicate)) {}

    void apply(const T& input, const typename Transform<T, T>::Emit& emit) override {
        if (m_predicate(input)) {
            emit(input);
        }
    }

private:
    Predicate m_predicate;
};

/// Count-based sliding window
///
/// Emits aggregate(window) each time the window holds `size` elements, then
/// advances by `step`. On flush a partially filled window holding elements not
/// yet covered by an emitted window is aggregated once more.
template<typename In, typename Out>
class SlidingWindow : public Transform<In, Out> {
public:
    using Aggregate = std::function<Out(const std::vector<In>&)>;

    SlidingWindow(std::size_t size, std::size_t step, Aggregate aggregate)
        : m_size(size == 0 ? 1 : size)
        , m_step(step == 0 ? 1 : step)
        , m_aggregate(std::move(aggregate)) {}

    void apply(const In& input, const typename Transform<In, Out>::Emit& emit) override {
        if (m_skip > 0) {
            --m_skip;
            return;
        }

        m_window.push_back(input);
        ++m_fresh;
        if (m_window.size() < m_size) {
            return;
        }

        emit(m_aggregate(std::vector<In>(m_window.begin(), m_window.end())));
        m_fresh = 0;

        if (m_step >= m_size) {
            m_skip = m_step - m_size;
            m_window.clear();
        } else {
            m_window.erase(m_window.begin(), m_window.begin() + static_cast<std::ptrdiff_t>(m_step));
        }
    }

    void flush(const typename Transform<In, Out>::Emit& emit) override {
        if (m_fresh > 0 && !m_window.empty()) {
            emit(m_aggregate(std::vector<In>(m_window.begin(), m_window.end())));
        }
        m_window.clear();
        m_fresh = 0;
    }

private:
    const std::size_t m_size;
    const std::size_t m_step;
    Aggregate m_aggregate;
    std::deque<In> m_window;
    std::size_t m_fresh = 0;
    std::size_t m_skip = 0;
};

/// Running aggregate; emits the accumulator after every input
template<typename In, typename Acc>
class ScanTransform : public Transform<In, Acc> {
public:
    using Fn = std::function<Acc(Acc, const In&)>;

    ScanTransform(Acc initial, Fn fn)
        : m_acc(std::move(initial))
        , m_fn(std::move(fn)) {}

    void apply(const In& input, const typename Transform<In, Acc>::Emit& emit) override {
        m_acc = m_fn(std::move(m_acc), input);
        emit(m_acc);
    }

private:
    Acc m_acc;
    Fn m_fn;
};

template<typename In, typename Out>
[[nodiscard]] std::unique_ptr<Transform<In, Out>> make_map(std::function<Out(const In&)> fn) {
    return std::make_unique<MapTransform<In, Out>>(std::move(fn));
}

template<typename T>
[[nodiscard]] std::unique_ptr<Transform<T, T>> make_filter(std::function<bool(const T&)> predicate) {
    return std::make_unique<FilterTransform<T>>(std::move(predicate));
}

template<typename In, typename Out>
[[nodiscard]] std::unique_ptr<Transform<In, Out>> make_window(
    std::size_t size, std::size_t step, std::function<Out(const std::vector<In>&)> aggregate) {
    return std::make_unique<SlidingWindow<In, Out>>(size, step, std::move(aggregate));
}

template<typename In, typename Acc>
[[nodiscard]] std::unique_ptr<Transform<In, Acc>> make_scan(Acc initial, std::function<Acc(Acc, const In&)> fn) {
    return std::make_unique<ScanTransform<In, Acc>>(std::move(initial), std::move(fn));
}

// =============================================================================
// DerivedView
// =============================================================================

/// Nested hub fed by a transform attached once to an upstream hub
template<typename In, typename Out>
class DerivedView {
public:
    /// Attach to upstream; throws std::runtime_error on an invalid downstream config
    DerivedView(Hub<In>& upstream, std::unique_ptr<Transform<In, Out>> transform,
                HubConfig downstream_config = {})
        : m_output(std::move(downstream_config))
        , m_stage(std::make_shared<Stage>())
        , m_upstream(upstream.core())
    {
        m_stage->transform = std::move(transform);
        m_stage->inlet = m_output.take_inlet().unwrap();
        m_stage->name = m_output.name();

        std::shared_ptr<Stage> stage = m_stage;
        m_upstream_id = upstream.attach_callback(
            [stage](const In& element) { stage->on_element(element); },
            [stage] { stage->on_end(); },
            [stage](const relay_core::Error& error) { stage->on_error(error); });

        relay_core::hub_logger()->debug("Derived view '{}' attached to '{}'",
            m_output.name(), upstream.name());
    }

    ~DerivedView() {
        if (auto upstream = m_upstream.lock()) {
            upstream->detach(m_upstream_id);
        }
    }

    DerivedView(const DerivedView&) = delete;
    DerivedView& operator=(const DerivedView&) = delete;

    /// Downstream hub real consumers attach to
    [[nodiscard]] Hub<Out>& output() noexcept { return m_output; }

    [[nodiscard]] Subscription<Out> subscribe() { return m_output.subscribe(); }
    [[nodiscard]] Subscription<Out> subscribe(std::size_t capacity) { return m_output.subscribe(capacity); }

    SubscriptionId attach_callback(
        typename CallbackSink<Out>::ElementFn on_element,
        typename CallbackSink<Out>::EndFn on_end = {},
        typename CallbackSink<Out>::ErrorFn on_error = {})
    {
        return m_output.attach_callback(std::move(on_element), std::move(on_end), std::move(on_error));
    }

    /// Number of upstream elements the transform has processed
    [[nodiscard]] std::uint64_t invocations() const noexcept {
        return m_stage->invocations.load(std::memory_order_relaxed);
    }

    /// Registration on the upstream hub (invalid if upstream had already terminated)
    [[nodiscard]] SubscriptionId upstream_id() const noexcept { return m_upstream_id; }

private:
    /// Shared with the upstream callback so an in-flight delivery stays valid
    struct Stage {
        std::unique_ptr<Transform<In, Out>> transform;
        Inlet<Out> inlet;
        std::string name;
        std::atomic<std::uint64_t> invocations{0};
        std::atomic<bool> failed{false};

        void emit(Out value) {
            auto pushed = inlet.push(std::move(value));
            if (!pushed) {
                relay_core::hub_logger()->debug("Derived view '{}': output rejected: {}",
                    name, pushed.error().message());
            }
        }

        void on_element(const In& element) {
            if (failed.load(std::memory_order_acquire)) {
                return;
            }
            invocations.fetch_add(1, std::memory_order_relaxed);
            try {
                transform->apply(element, [this](Out value) { emit(std::move(value)); });
            } catch (const std::exception& e) {
                transform_threw("apply", e);
            }
        }

        void on_end() {
            if (failed.load(std::memory_order_acquire)) {
                return;
            }
            try {
                transform->flush([this](Out value) { emit(std::move(value)); });
            } catch (const std::exception& e) {
                transform_threw("flush", e);
                return;
            }
            auto completed = inlet.complete();
            if (!completed) {
                relay_core::hub_logger()->debug("Derived view '{}': complete rejected: {}",
                    name, completed.error().message());
            }
        }

        /// A throwing transform fails the downstream hub; later input is ignored
        void transform_threw(const char* stage, const std::exception& e) {
            failed.store(true, std::memory_order_release);
            relay_core::Error error(relay_core::HubError::hub_failed(name,
                std::string("transform threw in ") + stage + ": " + e.what()));
            error.with_context("stage", stage);
            relay_core::debug::record_error(error);
            relay_core::hub_logger()->error("Derived view '{}': transform threw in {}: {}",
                name, stage, e.what());
            on_error(error);
        }

        void on_error(const relay_core::Error& error) {
            auto failed = inlet.fail(error);
            if (!failed) {
                relay_core::hub_logger()->debug("Derived view '{}': fail rejected: {}",
                    name, failed.error().message());
            }
        }
    };

    Hub<Out> m_output;
    std::shared_ptr<Stage> m_stage;
    std::weak_ptr<BroadcastCore<In>> m_upstream;
    SubscriptionId m_upstream_id;
};

} // namespace relay_hub
