#pragma once

/// @file broadcast_core.hpp
/// @brief Shared fanout engine behind every Hub
///
/// BroadcastCore provides:
/// - Fanout of each pushed element to every attached sink, in push order
/// - Sequence-number gating so late subscribers never see earlier elements
/// - Inline (producer thread) or Worker (dispatch thread) delivery
/// - Per-subscription overflow handling
/// - Idle teardown when the last subscription detaches
///
/// Lock order: delivery mutex, then lifecycle mutex, then registry mutex.
/// Terminal transitions and detach never take the delivery mutex, so they can
/// always wake a producer blocked under BlockProducer.

#include "registry.hpp"
#include "sink.hpp"
#include "subscription.hpp"
#include "subscription_buffer.hpp"
#include "types.hpp"

#include <relay/core/error.hpp>
#include <relay/core/log.hpp>
#include <relay/structures/mpsc_queue.hpp>

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace relay_hub {

template<typename T>
class BroadcastCore : public ISubscriptionHost,
                      public std::enable_shared_from_this<BroadcastCore<T>> {
    struct PrivateTag {};

public:
    using Registry = SubscriptionRegistry<T>;

    /// Validate the config, build the core and start the dispatch thread if needed
    [[nodiscard]] static relay_core::Result<std::shared_ptr<BroadcastCore>> create(HubConfig config) {
        auto valid = config.validate();
        if (!valid) {
            relay_core::debug::record_error(valid.error());
            relay_core::hub_logger()->error("{}", valid.error().message());
            return relay_core::Err<std::shared_ptr<BroadcastCore>>(valid.error());
        }

        auto core = std::make_shared<BroadcastCore>(PrivateTag{}, std::move(config));
        if (core->m_config.dispatch == DispatchMode::Worker) {
            core->start_worker();
        }

        relay_core::hub_logger()->info(
            "Hub '{}' created (overflow={}, capacity={}, dispatch={}, keep_alive={})",
            core->m_config.name, to_string(core->m_config.overflow),
            core->m_config.buffer_capacity, to_string(core->m_config.dispatch),
            core->m_config.keep_alive);
        return relay_core::Ok(std::move(core));
    }

    BroadcastCore(PrivateTag, HubConfig config)
        : m_config(std::move(config)) {}

    ~BroadcastCore() override {
        shutdown();
    }

    BroadcastCore(const BroadcastCore&) = delete;
    BroadcastCore& operator=(const BroadcastCore&) = delete;

    // =========================================================================
    // Producer Side
    // =========================================================================

    /// Fan one element out to every subscription attached before this call
    relay_core::Result<void> push(T element) {
        if (m_config.dispatch == DispatchMode::Worker) {
            return push_queued(std::move(element));
        }
        return push_inline(element);
    }

    /// Signal normal end of stream
    relay_core::Result<void> complete() {
        return close_producer(std::nullopt);
    }

    /// Signal abnormal termination; every subscription receives the error
    relay_core::Result<void> fail(relay_core::Error error) {
        return close_producer(std::move(error));
    }

    // =========================================================================
    // Consumer Side
    // =========================================================================

    /// Attach a sink. After termination the sink receives the terminal
    /// signal immediately and the returned id is invalid.
    SubscriptionId attach(std::shared_ptr<Sink<T>> sink) {
        return attach_impl(std::move(sink), false);
    }

    /// Attach the keep-alive anchor (at most once)
    SubscriptionId attach_anchor() {
        if (m_registry.has_anchor()) {
            return SubscriptionId{};
        }
        return attach_impl(std::make_shared<AnchorSink<T>>(), true);
    }

    /// Attach a pull subscription with the hub's buffer capacity
    [[nodiscard]] Subscription<T> subscribe() {
        return subscribe(m_config.buffer_capacity);
    }

    /// Attach a pull subscription with its own buffer capacity
    [[nodiscard]] Subscription<T> subscribe(std::size_t capacity) {
        auto buffer = std::make_shared<SubscriptionBuffer<T>>(capacity, m_config.overflow);
        SubscriptionId id = attach(buffer);
        std::weak_ptr<ISubscriptionHost> host = this->shared_from_this();
        return Subscription<T>(std::move(host), id, std::move(buffer));
    }

    bool detach(SubscriptionId id) override {
        return detach_impl(id, "detached");
    }

    /// Owner teardown: stop the dispatch thread and complete every subscription
    void shutdown() {
        stop_worker();
        terminate(HubState::Completed, std::nullopt, "shutdown");
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] HubState state() const {
        return m_state.load(std::memory_order_acquire);
    }

    [[nodiscard]] const HubConfig& config() const noexcept { return m_config; }
    [[nodiscard]] const std::string& name() const noexcept { return m_config.name; }

    [[nodiscard]] std::size_t subscriber_count() const { return m_registry.subscriber_count(); }
    [[nodiscard]] bool has_anchor() const { return m_registry.has_anchor(); }

    /// Cause of a Failed state
    [[nodiscard]] std::optional<relay_core::Error> failure() const {
        std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
        return m_failure;
    }

    [[nodiscard]] HubStats stats() const {
        HubStats s;
        s.elements_pushed = m_pushed.load(std::memory_order_relaxed);
        s.deliveries = m_deliveries.load(std::memory_order_relaxed);
        s.dropped = m_dropped.load(std::memory_order_relaxed);
        s.overflows = m_overflows.load(std::memory_order_relaxed);
        s.subscriptions_attached = m_attached.load(std::memory_order_relaxed);
        s.subscriptions_detached = m_detached.load(std::memory_order_relaxed);
        s.active_subscribers = m_registry.subscriber_count();
        s.anchored = m_registry.has_anchor();
        s.state = state();
        return s;
    }

    /// Exclusive inlet hand-out flag used by Hub::take_inlet
    [[nodiscard]] bool claim_inlet() {
        return !m_inlet_taken.exchange(true, std::memory_order_acq_rel);
    }

private:
    // =========================================================================
    // Worker Channel
    // =========================================================================

    struct Command {
        enum class Kind : std::uint8_t { Element, Complete, Fail };

        Kind kind = Kind::Element;
        std::uint64_t seq = 0;
        std::optional<T> element;
        std::optional<relay_core::Error> error;
    };

    /// Outlives the core when the last owner drops it on the dispatch thread
    struct WorkerChannel {
        relay_structures::MpscQueue<Command> queue;
        std::mutex doorbell_mutex;
        std::condition_variable doorbell;
        std::atomic<bool> stop{false};

        void ring() {
            { std::lock_guard<std::mutex> lock(doorbell_mutex); }
            doorbell.notify_one();
        }
    };

    void start_worker() {
        m_channel = std::make_shared<WorkerChannel>();
        std::weak_ptr<BroadcastCore> weak = this->weak_from_this();
        std::shared_ptr<WorkerChannel> channel = m_channel;
        m_worker = std::thread([weak, channel] { run_worker(weak, channel); });
    }

    static void run_worker(std::weak_ptr<BroadcastCore> weak, std::shared_ptr<WorkerChannel> channel) {
        while (!channel->stop.load(std::memory_order_acquire)) {
            auto command = channel->queue.pop();
            if (!command) {
                if (!channel->queue.empty()) {
                    // A producer is between exchange and link
                    std::this_thread::yield();
                    continue;
                }
                std::unique_lock<std::mutex> lock(channel->doorbell_mutex);
                channel->doorbell.wait(lock, [&channel] {
                    return channel->stop.load(std::memory_order_acquire) || !channel->queue.empty();
                });
                continue;
            }

            auto core = weak.lock();
            if (!core) {
                return;
            }
            core->process(std::move(*command));
        }
    }

    void stop_worker() {
        if (!m_channel) {
            return;
        }
        m_channel->stop.store(true, std::memory_order_release);
        m_channel->ring();
        if (m_worker.joinable()) {
            if (m_worker.get_id() == std::this_thread::get_id()) {
                m_worker.detach();
            } else {
                m_worker.join();
            }
        }
    }

    void process(Command command) {
        switch (command.kind) {
            case Command::Kind::Element: {
                if (is_terminal(state())) {
                    return;
                }
                auto snapshot = m_registry.snapshot();
                auto result = deliver(*command.element, command.seq, snapshot);
                if (!result) {
                    relay_core::hub_logger()->error("Hub '{}': dispatch stopped: {}",
                        m_config.name, result.error().message());
                }
                return;
            }
            case Command::Kind::Complete:
                terminate(HubState::Completed, std::nullopt, "producer completed");
                return;
            case Command::Kind::Fail:
                terminate(HubState::Failed, command.error, "producer failed");
                return;
        }
    }

    // =========================================================================
    // Push Paths
    // =========================================================================

    /// Error for a push that cannot be accepted (lifecycle mutex held)
    std::optional<relay_core::Error> reject_push_locked(const char* operation) const {
        if (m_producer_closed) {
            return relay_core::Error(relay_core::HubError::contract_violation(
                m_config.name, std::string(operation) + " after complete()/fail()"));
        }
        HubState current = m_state.load(std::memory_order_acquire);
        if (current == HubState::Failed) {
            return relay_core::Error(relay_core::HubError::hub_failed(
                m_config.name, m_failure ? m_failure->message() : "hub failed"));
        }
        if (current == HubState::Completed) {
            return relay_core::Error(relay_core::HubError::hub_closed(m_config.name));
        }
        return std::nullopt;
    }

    relay_core::Result<void> report_rejected(relay_core::Error error, const char* operation) {
        relay_core::debug::record_error(error);
        if (error.is_hub(relay_core::HubError::Kind::ContractViolation)) {
            relay_core::log_structured(spdlog::level::warn, "relay_hub", "contract violation",
                {{"hub", m_config.name}, {"operation", operation}});
        } else {
            relay_core::hub_logger()->debug("Hub '{}': {} rejected: {}",
                m_config.name, operation, error.message());
        }
        return relay_core::Err(std::move(error));
    }

    relay_core::Result<void> push_inline(const T& element) {
        std::lock_guard<std::mutex> deliver_lock(m_deliver_mutex);

        std::uint64_t seq = 0;
        typename Registry::Snapshot snapshot;
        {
            std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
            if (auto rejected = reject_push_locked("push")) {
                return report_rejected(std::move(*rejected), "push");
            }
            enter_running_locked();
            seq = m_next_seq++;
            snapshot = m_registry.snapshot();
        }

        m_pushed.fetch_add(1, std::memory_order_relaxed);
        return deliver(element, seq, snapshot);
    }

    relay_core::Result<void> push_queued(T element) {
        {
            std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
            if (auto rejected = reject_push_locked("push")) {
                return report_rejected(std::move(*rejected), "push");
            }
            enter_running_locked();

            Command command;
            command.kind = Command::Kind::Element;
            command.seq = m_next_seq++;
            command.element.emplace(std::move(element));
            m_channel->queue.push(std::move(command));
        }

        m_pushed.fetch_add(1, std::memory_order_relaxed);
        m_channel->ring();
        return relay_core::Ok();
    }

    relay_core::Result<void> close_producer(std::optional<relay_core::Error> error) {
        const char* operation = error ? "fail" : "complete";

        if (m_config.dispatch == DispatchMode::Worker) {
            {
                std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
                if (auto rejected = reject_push_locked(operation)) {
                    return report_rejected(std::move(*rejected), operation);
                }
                m_producer_closed = true;

                Command command;
                command.kind = error ? Command::Kind::Fail : Command::Kind::Complete;
                command.error = error;
                m_channel->queue.push(std::move(command));
            }
            m_channel->ring();
            return relay_core::Ok();
        }

        // Inline: ordered after any delivery in progress
        std::lock_guard<std::mutex> deliver_lock(m_deliver_mutex);
        {
            std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
            if (auto rejected = reject_push_locked(operation)) {
                return report_rejected(std::move(*rejected), operation);
            }
            m_producer_closed = true;
        }

        if (error) {
            terminate(HubState::Failed, std::move(error), "producer failed");
        } else {
            terminate(HubState::Completed, std::nullopt, "producer completed");
        }
        return relay_core::Ok();
    }

    // =========================================================================
    // Fanout
    // =========================================================================

    relay_core::Result<void> deliver(const T& element, std::uint64_t seq,
                                     const typename Registry::Snapshot& snapshot) {
        std::vector<SubscriptionId> closed;
        std::optional<SubscriptionId> overflowed;

        for (const auto& entry : *snapshot) {
            if (entry.anchor || seq < entry.first_seq) {
                continue;
            }

            switch (entry.sink->offer(element)) {
                case OfferResult::Accepted:
                    m_deliveries.fetch_add(1, std::memory_order_relaxed);
                    break;
                case OfferResult::Dropped:
                    m_deliveries.fetch_add(1, std::memory_order_relaxed);
                    m_dropped.fetch_add(1, std::memory_order_relaxed);
                    break;
                case OfferResult::Overflow:
                    overflowed = entry.id;
                    break;
                case OfferResult::Closed:
                    closed.push_back(entry.id);
                    break;
            }

            if (overflowed) {
                break;
            }
        }

        for (SubscriptionId id : closed) {
            detach_impl(id, "sink closed");
        }

        if (overflowed) {
            m_overflows.fetch_add(1, std::memory_order_relaxed);

            relay_core::Error cause(relay_core::HubError::subscriber_overflow(
                m_config.name, overflowed->id, m_config.buffer_capacity));
            relay_core::debug::record_error(cause);
            relay_core::hub_logger()->warn("{}", cause.message());

            relay_core::Error failure(relay_core::HubError::hub_failed(m_config.name, cause.message()));
            failure.with_context("cause", "SubscriberOverflow");
            failure.with_context("subscription", std::to_string(overflowed->id));
            terminate(HubState::Failed, failure, "fail-fast overflow");
            return relay_core::Err(std::move(failure));
        }

        return relay_core::Ok();
    }

    // =========================================================================
    // Attach / Detach / Terminate
    // =========================================================================

    /// Created -> Running (lifecycle mutex held)
    void enter_running_locked() {
        HubState expected = HubState::Created;
        m_state.compare_exchange_strong(expected, HubState::Running, std::memory_order_acq_rel);
    }

    SubscriptionId attach_impl(std::shared_ptr<Sink<T>> sink, bool anchor) {
        SubscriptionId id;
        bool terminal = false;
        std::optional<relay_core::Error> terminal_error;
        {
            std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
            if (is_terminal(m_state.load(std::memory_order_acquire))) {
                terminal = true;
                terminal_error = m_failure;
            } else {
                enter_running_locked();
                id = m_registry.add(sink, m_next_seq, anchor);
                m_attached.fetch_add(1, std::memory_order_relaxed);
            }
        }

        if (terminal) {
            relay_core::hub_logger()->debug("Hub '{}': late attach receives terminal signal", m_config.name);
            if (terminal_error) {
                sink->fail(*terminal_error);
            } else {
                sink->finish();
            }
            return SubscriptionId{};
        }

        relay_core::hub_logger()->debug("Hub '{}': {} {} attached", m_config.name,
            anchor ? "anchor" : "subscription", id.id);
        return id;
    }

    bool detach_impl(SubscriptionId id, const char* reason) {
        std::shared_ptr<Sink<T>> sink;
        bool idle = false;
        {
            std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
            sink = m_registry.remove(id);
            if (!sink) {
                return false;
            }
            m_detached.fetch_add(1, std::memory_order_relaxed);
            idle = m_state.load(std::memory_order_acquire) == HubState::Running && m_registry.size() == 0;
        }

        sink->close();
        relay_core::hub_logger()->debug("Hub '{}': subscription {} {}", m_config.name, id.id, reason);

        if (idle) {
            terminate(HubState::Completed, std::nullopt, "idle teardown");
        }
        return true;
    }

    /// Enter a terminal state once; signal every sink outside the locks
    bool terminate(HubState final_state, std::optional<relay_core::Error> error, const char* reason) {
        typename Registry::Entries entries;
        {
            std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
            if (is_terminal(m_state.load(std::memory_order_acquire))) {
                return false;
            }
            if (error) {
                m_failure = error;
            }
            m_state.store(final_state, std::memory_order_release);
            entries = m_registry.take_all();
        }

        for (auto& entry : entries) {
            if (error) {
                entry.sink->fail(*error);
            } else {
                entry.sink->finish();
            }
        }

        if (error) {
            relay_core::debug::record_error(*error);
            relay_core::log_structured(spdlog::level::err, "relay_hub", "hub failed",
                {{"hub", m_config.name}, {"reason", reason}, {"error", error->message()},
                 {"subscriptions", std::to_string(entries.size())}});
        } else {
            relay_core::log_structured(spdlog::level::info, "relay_hub", "hub completed",
                {{"hub", m_config.name}, {"reason", reason},
                 {"subscriptions", std::to_string(entries.size())}});
        }
        return true;
    }

    // =========================================================================
    // State
    // =========================================================================

    const HubConfig m_config;
    Registry m_registry;

    mutable std::mutex m_lifecycle_mutex;
    std::mutex m_deliver_mutex;
    std::atomic<HubState> m_state{HubState::Created};
    std::optional<relay_core::Error> m_failure;
    std::uint64_t m_next_seq = 0;
    bool m_producer_closed = false;
    std::atomic<bool> m_inlet_taken{false};

    std::shared_ptr<WorkerChannel> m_channel;
    std::thread m_worker;

    std::atomic<std::uint64_t> m_pushed{0};
    std::atomic<std::uint64_t> m_deliveries{0};
    std::atomic<std::uint64_t> m_dropped{0};
    std::atomic<std::uint64_t> m_overflows{0};
    std::atomic<std::uint64_t> m_attached{0};
    std::atomic<std::uint64_t> m_detached{0};
};

} // namespace relay_hub
