#pragma once

#include <string>
#include <string_view>
#include <chrono>
#include <memory>
#include <mutex>
#include <exception>
#include <cstdint>

#include "cirisstream/core/config/client.hpp"
#include "cirisstream/core/config/transport.hpp"
#include "cirisstream/core/transport/websocket_concept.hpp"
#include "cirisstream/core/transport/telemetry/connection.hpp"
#include "cirisstream/core/transport/parse_url.hpp"
#include "cirisstream/core/transport/backoff.hpp"
#include "cirisstream/core/transport/state.hpp"
#include "cirisstream/core/transport/connection/signal.hpp"
#include "cirisstream/core/transport/websocket/events.hpp"
#include "cirisstream/core/telemetry.hpp"
#include "lcr/optional.hpp"
#include "lcr/lockfree/spsc_ring.hpp"
#include "lcr/log/logger.hpp"


namespace cirisstream::core::transport {

/*
===============================================================================
 cirisstream::core::transport::Connection
===============================================================================

Generic transport-level connection, parameterized by a WebSocket transport
conforming to transport::WebSocketConcept.

A Connection represents a *logical* connection whose identity remains stable
across transient transport failures and automatic reconnections. It is
decoupled from any message format.

-------------------------------------------------------------------------------
 State machine
-------------------------------------------------------------------------------

  Disconnected --open()-----------------------------> Connecting
  Connecting   --transport up------------------------> Connected     (epoch++, attempts = 0)
  Connecting   --failure, retryable, auto-reconnect--> Reconnecting  (backoff armed)
  Connecting   --failure, otherwise -----------------> Failed
  Connected    --close/error/liveness/abort, auto----> Reconnecting
  Connected    --lost, auto-reconnect disabled-------> Disconnected
  Connected    --lost, non-retryable error-----------> Failed
  Reconnecting --backoff elapsed---------------------> Connecting
  Reconnecting --attempt limit exhausted-------------> Failed
  Connecting   --cancel()----------------------------> Disconnected
  any          --close()-----------------------------> Disconnected

Attempt n (1-based) waits backoff_delay(policy, n) before connecting.

-------------------------------------------------------------------------------
 Observability
-------------------------------------------------------------------------------
- epoch(): incremented on every successful connect, never otherwise
- connection::Signal: edge-triggered Connected / Disconnected /
  RetryScheduled / Failed, drained with poll_signal()

-------------------------------------------------------------------------------
 Liveness
-------------------------------------------------------------------------------
While Connected, any inbound frame refreshes liveness. If no frame arrives
within `liveness_timeout` (zero disables the check) the transport is
force-closed and the loss is handled like a transport failure.

-------------------------------------------------------------------------------
 Usage
-------------------------------------------------------------------------------
- Call open(url) once to activate the connection
- Drive all progress by calling poll() regularly from one thread
- Pull inbound frames with poll_message()
- No background threads here; the transport owns its receive thread
- cancel() is the only call allowed from another thread. It interrupts a
  blocking attempt and refuses new ones until close()
===============================================================================
*/

template <transport::WebSocketConcept WS>
class Connection {
public:
    explicit Connection(telemetry::Connection& telemetry,
                        config::Reconnect policy = {},
                        std::chrono::milliseconds liveness_timeout = std::chrono::milliseconds{0}) noexcept
        : telemetry_(telemetry)
        , policy_(policy)
        , liveness_timeout_(liveness_timeout)
    {
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Reconnection is not attempted after object lifetime ends
    ~Connection() {
        close();
    }

    // Connection lifecycle
    //
    // Returns Error::None once Connected. On a failed first attempt the
    // transport error is returned and the state is Reconnecting (retry armed)
    // or Failed.
    [[nodiscard]]
    inline Error open(const std::string& url, const std::string& bearer_token = {}) noexcept {
        CS_DEBUG("[CONN] Connecting to: " << url);
        CS_TL1( telemetry_.open_calls_total.inc() );
        // 0) PRECONDITION: must be idle
        if (state_ != State::Disconnected && state_ != State::Failed) {
            CS_WARN("[CONN] open() called while not idle (state: " << to_string(state_) << "). Ignoring.");
            return Error::InvalidState;
        }
        // 1) PRECONDITION: parse and validate URL
        ParsedUrl tmp;
        const Error parsed = parse_url(url, tmp);
        if (parsed != Error::None) {
            CS_ERROR("[CONN] Invalid stream URL: " << url);
            last_error_ = parsed;
            return parsed;
        }
        last_url_ = url;
        bearer_token_ = bearer_token;
        parsed_url_ = std::move(tmp);
        retry_attempts_ = 0;
        last_error_ = Error::None;
        // 2) Enter FSM and attempt the first connection
        transition_(Event::OpenRequested);
        return connect_();
    }

    // Unconditional shutdown. Cancels any pending reconnection. Idempotent.
    inline void close() noexcept {
        {
            std::lock_guard<std::mutex> lock(attempt_mutex_);
            cancelled_ = false;
        }
        if (state_ == State::Disconnected) {
            return;
        }
        CS_TL1( telemetry_.close_calls_total.inc() );
        transition_(Event::CloseRequested);
    }

    // Any thread. Interrupts the attempt in progress on the polling thread
    // and makes further attempts fail with Error::Cancelled until close().
    inline void cancel() noexcept {
        std::lock_guard<std::mutex> lock(attempt_mutex_);
        if (cancelled_) {
            return;
        }
        CS_DEBUG("[CONN] Cancel requested");
        cancelled_ = true;
        if (attempt_) {
            attempt_->cancel();
        }
    }

    // Forces the current transport down as a local failure. Normal
    // reconnection policy applies. No-op unless Connected.
    inline void abort(Error reason) noexcept {
        if (state_ != State::Connected) {
            return;
        }
        CS_WARN("[CONN] Aborting transport (" << to_string(reason) << ")");
        transition_(Event::AbortRequested, reason);
    }

    [[nodiscard]]
    inline bool send(std::string_view text) noexcept {
        CS_TL1( telemetry_.send_calls_total.inc() );
        if (state_ != State::Connected) {
            CS_WARN("[CONN] send() called while not connected (state: " << to_string(state_) << "). Ignoring.");
            CS_TL1( telemetry_.send_rejected_total.inc() );
            return false;
        }
        if (!ws_->send(text)) {
            return false;
        }
        ++tx_messages_;
        return true;
    }

    // Event loop step: transport events, retry timer, liveness.
    inline void poll() noexcept {
        // === Drain transport events ===
        if (ws_) {
            websocket::Event ev;
            while (ws_ && ws_->poll_event(ev)) {
                switch (ev.type) {
                    case websocket::EventType::Error:
                        on_transport_error_(ev.error);
                        break;
                    case websocket::EventType::Close:
                        on_transport_closed_();
                        break;
                }
            }
        }
        const auto now = std::chrono::steady_clock::now();
        // === Reconnection logic ===
        if (state_ == State::Reconnecting && now >= next_retry_) {
            reconnect_();
        }
        // === Liveness logic (Connected only) ===
        if (state_ == State::Connected && liveness_timeout_.count() > 0) {
            if (now - last_rx_ts_ > liveness_timeout_) {
                CS_WARN("[CONN] Liveness timeout: no inbound traffic for " << liveness_timeout_.count() << " ms (forcing reconnect)");
                transition_(Event::LivenessExpired, Error::Timeout);
            }
        }
    }

    // Pulls the next inbound frame of the live transport.
    [[nodiscard]]
    inline bool poll_message(std::string& out) noexcept {
        if (state_ != State::Connected) {
            return false;
        }
        if (!ws_->poll_message(out)) {
            return false;
        }
        CS_TL1( telemetry_.messages_forwarded_total.inc() );
        ++rx_messages_;
        last_rx_ts_ = std::chrono::steady_clock::now();
        return true;
    }

    [[nodiscard]]
    inline bool poll_signal(connection::Signal& out) noexcept {
        return signals_.pop(out);
    }

    // Accessors
    [[nodiscard]]
    inline State state() const noexcept {
        return state_;
    }

    [[nodiscard]]
    inline std::uint64_t epoch() const noexcept {
        return epoch_;
    }

    [[nodiscard]]
    inline Error last_error() const noexcept {
        return last_error_;
    }

    [[nodiscard]]
    inline DisconnectReason disconnect_reason() const noexcept {
        return disconnect_reason_;
    }

    // Number of reconnection attempts made in the current retry cycle
    [[nodiscard]]
    inline std::uint32_t retry_attempts() const noexcept {
        return retry_attempts_;
    }

    // Delay armed by the most recent retry scheduling
    [[nodiscard]]
    inline std::chrono::milliseconds last_backoff() const noexcept {
        return last_backoff_;
    }

    [[nodiscard]]
    inline std::uint64_t rx_messages() const noexcept {
        return rx_messages_;
    }

    [[nodiscard]]
    inline std::uint64_t tx_messages() const noexcept {
        return tx_messages_;
    }

    [[nodiscard]]
    inline const std::string& url() const noexcept {
        return last_url_;
    }

#ifdef CS_UNIT_TEST
public:
    // Makes a pending retry due on the next poll()
    inline void force_retry_due() noexcept {
        next_retry_ = std::chrono::steady_clock::now();
    }

    inline void force_last_rx(std::chrono::steady_clock::time_point ts) noexcept {
        last_rx_ts_ = ts;
    }

    [[nodiscard]]
    inline bool has_transport() const noexcept {
        return static_cast<bool>(ws_);
    }

    WS& ws() {
        return *ws_;
    }
#endif // CS_UNIT_TEST

private:
    std::string last_url_;
    std::string bearer_token_;
    lcr::optional<ParsedUrl> parsed_url_;           // Invariant: has() once open() passed validation

    transport::telemetry::Connection& telemetry_;   // not owned
    std::unique_ptr<WS> ws_;                        // one instance per attempt

    config::Reconnect policy_;
    std::chrono::milliseconds liveness_timeout_;

    std::uint64_t epoch_{0};

    std::uint64_t rx_messages_{0};
    std::uint64_t tx_messages_{0};
    std::chrono::steady_clock::time_point last_rx_ts_{std::chrono::steady_clock::now()};

    Error last_error_{Error::None};
    DisconnectReason disconnect_reason_{DisconnectReason::None};

    State state_{State::Disconnected};
    std::chrono::steady_clock::time_point next_retry_{};
    std::chrono::milliseconds last_backoff_{0};
    std::uint32_t retry_attempts_{0};

    lcr::lockfree::spsc_ring<connection::Signal, config::SIGNAL_RING_CAPACITY> signals_;

    std::mutex attempt_mutex_;
    WS* attempt_{nullptr};      // transport inside connect(), guarded by attempt_mutex_
    bool cancelled_{false};     // guarded by attempt_mutex_

    inline void emit_(connection::Signal sig) noexcept {
        CS_TRACE("[CONN] Emitting signal: " << to_string(sig));
        if (signals_.push(sig)) [[likely]] {
            return;
        }
        // Signals are informational; the owner reads state() for correctness
        CS_WARN("[CONN] Signal ring full, dropping '" << to_string(sig) << "' (owner is not draining signals)");
    }

    inline void set_state_(State new_state) noexcept {
        CS_TRACE("[CONN] State: " << to_string(state_) << " -> " << to_string(new_state));
        state_ = new_state;
    }

    // State machine transition function
    inline void transition_(Event event, Error error = Error::None) noexcept {
        const State state = state_;

        CS_TRACE("[FSM] (" << to_string(state) << ") --" << to_string(event) << "-->");

        // Explicit close wins from every state
        if (event == Event::CloseRequested) {
            const bool was_connected = (state == State::Connected);
            disconnect_reason_ = DisconnectReason::LocalClose;
            destroy_transport_();
            set_state_(State::Disconnected);
            if (was_connected) {
                emit_(connection::Signal::Disconnected);
                CS_INFO("[CONN] Disconnected from server: " << last_url_);
            }
            return;
        }

        switch (state) {

        // ================================================================
        case State::Disconnected:
        case State::Failed:
            switch (event) {
            case Event::OpenRequested:
                set_state_(State::Connecting);
                break;
            default:
                break;
            }
            break;

        // ================================================================
        case State::Connecting:
            switch (event) {
            case Event::TransportConnected:
                set_state_(State::Connected);
                // Only incremented here (never on retries or disconnections)
                ++epoch_;
                retry_attempts_ = 0;
                last_error_ = Error::None;
                disconnect_reason_ = DisconnectReason::None;
                last_rx_ts_ = std::chrono::steady_clock::now();
                CS_TL1( telemetry_.connect_success_total.inc() );
                emit_(connection::Signal::Connected);
                break;

            case Event::TransportConnectFailed:
                CS_TL1( telemetry_.connect_failure_total.inc() );
                last_error_ = error;
                destroy_transport_();
                if (policy_.enabled && is_retryable(error)) {
                    if (policy_.max_attempts != 0 && retry_attempts_ >= policy_.max_attempts) {
                        CS_ERROR("[CONN] Giving up after " << retry_attempts_ << " reconnection attempt(s)");
                        fail_();
                    } else {
                        set_state_(State::Reconnecting);
                        schedule_next_retry_();
                    }
                } else {
                    fail_();
                }
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Connected:
            switch (event) {
            case Event::LivenessExpired:
                CS_TL1( telemetry_.liveness_timeouts_total.inc() );
                disconnect_reason_ = DisconnectReason::LivenessTimeout;
                lose_connection_(error);
                break;

            case Event::AbortRequested:
                disconnect_reason_ = DisconnectReason::Aborted;
                lose_connection_(error);
                break;

            case Event::TransportClosed:
                if (disconnect_reason_ == DisconnectReason::None) {
                    disconnect_reason_ = DisconnectReason::TransportError;
                }
                lose_connection_(error);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Reconnecting:
            switch (event) {
            case Event::RetryTimerExpired:
                set_state_(State::Connecting);
                break;
            default:
                break;
            }
            break;
        }
    }

    // Connected transport is gone: decide between retry, idle and failure
    inline void lose_connection_(Error error) noexcept {
        CS_TL1( telemetry_.disconnect_events_total.inc() );
        last_error_ = (error == Error::None) ? Error::RemoteClosed : error;
        destroy_transport_();
        emit_(connection::Signal::Disconnected);
        CS_INFO("[CONN] Connection lost: " << last_url_ << " (reason: " << to_string(disconnect_reason_)
                << ", error: " << to_string(last_error_) << ")");
        if (!policy_.enabled) {
            set_state_(State::Disconnected);
            return;
        }
        if (!is_retryable(last_error_)) {
            fail_();
            return;
        }
        retry_attempts_ = 0;
        set_state_(State::Reconnecting);
        schedule_next_retry_();
    }

    inline void fail_() noexcept {
        CS_TL1( telemetry_.failures_total.inc() );
        set_state_(State::Failed);
        emit_(connection::Signal::Failed);
        CS_ERROR("[CONN] Connection failed: " << last_url_ << " (" << to_string(last_error_) << ")");
    }

    [[nodiscard]]
    inline bool create_transport_() noexcept {
        destroy_transport_();
        try {
            ws_ = std::make_unique<WS>(telemetry_.websocket);
        }
        catch (const std::exception& e) {
            CS_ERROR("[CONN] Failed to create transport: " << e.what());
            return false;
        }
        return true;
    }

    // Joins the receive thread and drops any undelivered frames
    inline void destroy_transport_() noexcept {
        if (ws_) {
            ws_->close();
            ws_.reset();
        }
    }

    inline void on_transport_error_(Error error) noexcept {
        CS_WARN("[CONN] Transport error: " << to_string(error));
        last_error_ = error;
    }

    inline void on_transport_closed_() noexcept {
        if (state_ != State::Connected) {
            return;
        }
        const Error cause = (last_error_ == Error::None) ? Error::RemoteClosed : last_error_;
        transition_(Event::TransportClosed, cause);
    }

    // Creates a fresh transport and performs one synchronous attempt
    inline Error connect_() noexcept {
        // INVARIANT: parsed_url_ must be valid here
        if (!parsed_url_.has()) {
            transition_(Event::TransportConnectFailed, Error::InvalidUrl);
            return Error::InvalidUrl;
        }
        if (!create_transport_()) {
            transition_(Event::TransportConnectFailed, Error::TransportFailure);
            return Error::TransportFailure;
        }
        Error err = Error::Cancelled;
        {
            std::lock_guard<std::mutex> lock(attempt_mutex_);
            if (!cancelled_) {
                attempt_ = ws_.get();
                err = Error::None;
            }
        }
        if (err == Error::None) {
            err = ws_->connect(parsed_url_.value(), bearer_token_);
            std::lock_guard<std::mutex> lock(attempt_mutex_);
            attempt_ = nullptr;
        }
        if (err == Error::Cancelled) {
            CS_INFO("[CONN] Connection attempt cancelled: " << last_url_);
            last_error_ = err;
            transition_(Event::CloseRequested);
            return err;
        }
        if (err != Error::None) {
            CS_ERROR("[CONN] Connection attempt failed (" << to_string(err) << ")");
            transition_(Event::TransportConnectFailed, err);
            return err;
        }
        transition_(Event::TransportConnected);
        CS_INFO("[CONN] Connected to server: " << last_url_ << " (epoch " << epoch_ << ")");
        return Error::None;
    }

    inline void reconnect_() noexcept {
        ++retry_attempts_;
        CS_TL1( telemetry_.retry_attempts_total.inc() );
        CS_DEBUG("[CONN] Reconnecting to: " << last_url_ << " (attempt " << retry_attempts_ << ")");
        transition_(Event::RetryTimerExpired);
        (void)connect_();
    }

    // Arms the timer for attempt retry_attempts_ + 1
    inline void schedule_next_retry_() noexcept {
        last_backoff_ = backoff_delay(policy_, retry_attempts_ + 1);
        next_retry_ = std::chrono::steady_clock::now() + last_backoff_;
        emit_(connection::Signal::RetryScheduled);
        CS_INFO("[CONN] Next reconnection attempt (" << (retry_attempts_ + 1) << ") in " << last_backoff_.count() << " ms");
    }
};

} // namespace cirisstream::core::transport
