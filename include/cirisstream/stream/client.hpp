#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "cirisstream/core/config/client.hpp"
#include "cirisstream/core/delivery/queue.hpp"
#include "cirisstream/core/transport/state.hpp"
#include "cirisstream/core/transport/websocket_concept.hpp"
#include "cirisstream/core/protocol/ciris/session.hpp"
#include "cirisstream/core/protocol/ciris/schema/filter.hpp"
#include "cirisstream/core/protocol/ciris/schema/message.hpp"
#include "cirisstream/core/protocol/ciris/schema/subscribe.hpp"
#include "cirisstream/stream/error.hpp"
#include "lcr/optional.hpp"
#include "lcr/log/logger.hpp"


namespace cirisstream::stream {

/*
===============================================================================
 cirisstream::stream::Client
===============================================================================

Self-healing stream client. Composes a protocol Session with a bounded
delivery queue and runs the pump on a dedicated worker thread.

Threads:
  - worker      Session::poll() in a loop (timers, replay, decoding)
  - transport   WebSocket receive thread (owned by the transport)
  - consumer    any caller thread blocked in pop()
  - callers     subscribe(), unsubscribe() and send() from any thread

Lifecycle:
  Idle --connect()--> Connecting --> Running --disconnect()--> Stopped
                                 \--> Finished (terminal failure)

connect() performs the first connection attempt on the calling thread.
With automatic reconnection enabled a retryable failure is not an error:
the worker keeps retrying. Otherwise the error is returned, the client is
Finished and the queue is closed.

The stream also finishes when the worker sees the connection Failed (a
non-retryable error or the attempt limit), or lost while automatic
reconnection is disabled. The queue is closed so blocked consumers get
false once; subscribe(), unsubscribe() and send() return InvalidState from
then on.

disconnect() marks the client Disconnected, cancels a connection attempt in
progress, stops and joins the worker, closes the transport and closes the
queue, which wakes every blocked consumer. Idempotent; the destructor calls
it. Callers of subscribe() never wait on a connection attempt.
===============================================================================
*/

template <core::transport::WebSocketConcept WS>
class Client {
    using Session = core::protocol::ciris::Session<WS>;

    enum class Lifecycle : std::uint8_t { Idle, Connecting, Running, Finished, Stopped };

public:
    using Message = core::protocol::ciris::schema::Message;
    using Filter  = core::protocol::ciris::schema::Filter;

    explicit Client(core::config::Client cfg)
        : cfg_(std::move(cfg))
        , queue_(cfg_.backpressure)
        , session_(queue_, cfg_)
    {
    }

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    ~Client() {
        disconnect();
    }

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------
    [[nodiscard]]
    inline Error connect() {
        Lifecycle expected = Lifecycle::Idle;
        if (!lifecycle_.compare_exchange_strong(expected, Lifecycle::Connecting)) {
            CS_WARN("[CLIENT] connect() called while not idle (" << static_cast<int>(expected) << "). Ignoring.");
            return Error::InvalidState;
        }
        // Held across the first attempt; disconnect() cancels it before waiting here
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        const auto err = session_.connect();
        publish_state_();
        if (err == core::transport::Error::InvalidUrl) {
            expected = Lifecycle::Connecting;
            (void)lifecycle_.compare_exchange_strong(expected, Lifecycle::Idle);
            return Error::InvalidUrl;
        }
        if (err == core::transport::Error::Cancelled) {
            CS_WARN("[CLIENT] Disconnected while connecting");
            return Error::InvalidState;
        }
        if (err != core::transport::Error::None && session_.state() == core::transport::State::Failed) {
            CS_ERROR("[CLIENT] Connection failed: " << core::transport::to_string(err));
            finish_(Lifecycle::Connecting);
            return from_transport(err);
        }
        expected = Lifecycle::Connecting;
        if (!lifecycle_.compare_exchange_strong(expected, Lifecycle::Running)) {
            CS_WARN("[CLIENT] Disconnected while connecting");
            return Error::InvalidState;
        }
        worker_ = std::thread(&Client::run_, this);
        return Error::None;
    }

    inline void disconnect() {
        const Lifecycle prev = lifecycle_.exchange(Lifecycle::Stopped, std::memory_order_acq_rel);
        if (prev == Lifecycle::Stopped) {
            return;
        }
        // No more reconnects from here on
        state_.store(core::transport::State::Disconnected, std::memory_order_release);
        stop_.store(true, std::memory_order_release);
        session_.cancel();
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (worker_.joinable()) {
            worker_.join();
        }
        session_.close();
        session_.clear_subscriptions();
        queue_.close();
        state_.store(core::transport::State::Disconnected, std::memory_order_release);
        CS_INFO("[CLIENT] Disconnected");
    }

    // -------------------------------------------------------------------------
    // Subscriptions (any thread)
    // -------------------------------------------------------------------------
    [[nodiscard]]
    inline Error subscribe(std::string channel, lcr::optional<Filter> filter = {}) {
        if (!running_()) {
            return Error::InvalidState;
        }
        session_.subscribe(std::move(channel), std::move(filter));
        return Error::None;
    }

    [[nodiscard]]
    inline Error subscribe(const core::protocol::ciris::schema::Subscribe& req) {
        if (!running_()) {
            return Error::InvalidState;
        }
        session_.subscribe(req);
        return Error::None;
    }

    [[nodiscard]]
    inline Error unsubscribe(const std::vector<std::string>& channels) {
        if (!running_()) {
            return Error::InvalidState;
        }
        session_.unsubscribe(channels);
        return Error::None;
    }

    // Arbitrary JSON text frame. Requires a live connection.
    [[nodiscard]]
    inline Error send(std::string frame) {
        if (!running_() || !session_.send(std::move(frame))) {
            return Error::InvalidState;
        }
        return Error::None;
    }

    // Current desired subscription set
    [[nodiscard]]
    inline core::protocol::ciris::schema::Subscribe subscriptions() const {
        return session_.subscriptions().snapshot();
    }

    // -------------------------------------------------------------------------
    // Consumption (any thread)
    // -------------------------------------------------------------------------

    // Blocks until a message is available (true) or the client is
    // disconnected (false)
    [[nodiscard]]
    inline bool pop(Message& out) {
        return queue_.pop(out);
    }

    [[nodiscard]]
    inline bool try_pop(Message& out) {
        return queue_.try_pop(out);
    }

    [[nodiscard]]
    inline bool pop_for(Message& out, std::chrono::milliseconds timeout) {
        return queue_.pop_for(out, timeout);
    }

    // True once no further message will be delivered (disconnect() or a
    // terminal connection failure)
    [[nodiscard]]
    inline bool closed() const {
        return queue_.closed();
    }

    // -------------------------------------------------------------------------
    // Observability (any thread)
    // -------------------------------------------------------------------------
    [[nodiscard]]
    inline core::transport::State state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]]
    inline bool is_connected() const noexcept {
        return state() == core::transport::State::Connected;
    }

    [[nodiscard]]
    inline std::uint64_t epoch() const noexcept {
        return epoch_.load(std::memory_order_acquire);
    }

    [[nodiscard]]
    inline std::size_t queued() const {
        return queue_.size();
    }

    [[nodiscard]]
    inline std::uint64_t dropped() const {
        return queue_.dropped();
    }

    [[nodiscard]]
    inline const core::config::Client& config() const noexcept {
        return cfg_;
    }

    [[nodiscard]]
    inline const core::protocol::ciris::telemetry::Session& telemetry() const noexcept {
        return session_.telemetry();
    }

    [[nodiscard]]
    inline const core::transport::telemetry::Connection& transport_telemetry() const noexcept {
        return session_.transport_telemetry();
    }

private:
    core::config::Client cfg_;
    core::delivery::Queue<Message> queue_;
    Session session_;

    std::mutex lifecycle_mutex_;                      // serializes connect() and disconnect() work
    std::atomic<Lifecycle> lifecycle_{Lifecycle::Idle};
    std::atomic<bool> stop_{false};
    std::thread worker_;

    std::atomic<core::transport::State> state_{core::transport::State::Disconnected};
    std::atomic<std::uint64_t> epoch_{0};

private:
    // subscribe(), unsubscribe() and send() are accepted from connect() on,
    // until disconnect() or a terminal failure
    inline bool running_() const noexcept {
        const Lifecycle l = lifecycle_.load(std::memory_order_acquire);
        return l == Lifecycle::Connecting || l == Lifecycle::Running;
    }

    // Terminal failure: consumers are released once
    inline void finish_(Lifecycle from) {
        if (lifecycle_.compare_exchange_strong(from, Lifecycle::Finished, std::memory_order_acq_rel)) {
            CS_ERROR("[CLIENT] Stream finished (" << core::transport::to_string(session_.last_error()) << ")");
        }
        queue_.close();
    }

    inline void publish_state_() noexcept {
        state_.store(session_.state(), std::memory_order_release);
        epoch_.store(session_.epoch(), std::memory_order_release);
    }

    // Worker loop
    inline void run_() {
        CS_DEBUG("[CLIENT] Worker started");
        while (!stop_.load(std::memory_order_acquire)) {
            const std::size_t handled = session_.poll();
            if (stop_.load(std::memory_order_acquire)) {
                break;
            }
            publish_state_();
            if (session_.finished()) {
                finish_(Lifecycle::Running);
                break;
            }
            if (handled == 0) {
                std::this_thread::sleep_for(cfg_.idle_interval);
            }
        }
        CS_DEBUG("[CLIENT] Worker stopped");
    }
};

} // namespace cirisstream::stream
