/*
===============================================================================
CIRIS stream protocol Session
===============================================================================

Implements the CIRIS v1 event stream on top of the generic
transport::Connection.

Architecture:
  - transport::*              → WebSocket transport (Beast, mockable)
  - transport::Connection     → lifecycle, reconnection, liveness, epochs
  - protocol::ciris           → protocol-specific logic
                                 • control frame serialization
                                 • frame routing and schema validation
                                 • sequencing per epoch
                                 • subscription replay
                                 • heartbeat

The Session owns the Connection and exposes a protocol-oriented API
(subscribe, unsubscribe, send). Decoded data messages are pushed into a
delivery::Queue supplied by the owner. No callbacks.

-------------------------------------------------------------------------------
 Pump step: poll()
-------------------------------------------------------------------------------
  1. Drive the Connection (transport events, retry timer, liveness)
  2. Handle connection signals
       Connected    → Sequencer::reset(epoch), replay the subscription set,
                      arm the heartbeat
       Disconnected → subscription manager offline, heartbeat disarmed
       Failed       → as Disconnected; the stream is finished
  3. Flush queued control frames (FIFO)
  4. Fire the heartbeat when due
  5. Drain inbound frames: error notices are logged, pongs discarded,
     data messages pass the Sequencer and are pushed into the queue.
     Malformed frames are logged, counted and skipped.

Replay always happens before any frame of the new connection is read, so
no message of an epoch is delivered before its subscriptions were sent.

finished() turns true when no further message can arrive without a new
connect(): the connection Failed, or it was lost while automatic
reconnection is disabled. The owner decides what to do with the queue.

Threading:
  - poll(), connect() and close() from one thread (the pump owner)
  - subscribe(), unsubscribe(), send() and cancel() from any thread
===============================================================================
*/
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "cirisstream/core/config/client.hpp"
#include "cirisstream/core/delivery/queue.hpp"
#include "cirisstream/core/transport/connection.hpp"
#include "cirisstream/core/transport/endpoint.hpp"
#include "cirisstream/core/protocol/ciris/parser/router.hpp"
#include "cirisstream/core/protocol/ciris/schema/filter.hpp"
#include "cirisstream/core/protocol/ciris/schema/message.hpp"
#include "cirisstream/core/protocol/ciris/schema/ping.hpp"
#include "cirisstream/core/protocol/ciris/schema/subscribe.hpp"
#include "cirisstream/core/protocol/ciris/sequencer.hpp"
#include "cirisstream/core/protocol/ciris/subscription/manager.hpp"
#include "cirisstream/core/protocol/ciris/telemetry/session.hpp"
#include "cirisstream/core/telemetry.hpp"
#include "lcr/optional.hpp"
#include "lcr/log/logger.hpp"


namespace cirisstream::core::protocol::ciris {

// Upper bound of inbound frames handled per pump step, so timers stay
// responsive under a continuous stream
inline constexpr std::size_t MAX_FRAMES_PER_POLL = 256;

template <transport::WebSocketConcept WS>
class Session {
public:
    using MessageQueue = delivery::Queue<schema::Message>;

    Session(MessageQueue& queue, const config::Client& cfg)
        : cfg_(cfg)
        , queue_(queue)
        , connection_(transport_telemetry_, cfg.reconnect, cfg.heartbeat.liveness_timeout)
    {
    }

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Opens the stream endpoint derived from config::Client::endpoint
    [[nodiscard]]
    inline transport::Error connect() {
        return connect(transport::stream_endpoint(cfg_.endpoint));
    }

    [[nodiscard]]
    inline transport::Error connect(const std::string& url) {
        CS_INFO("[SESSION] Connecting to " << url);
        finished_ = false;
        return connection_.open(url, cfg_.api_key);
    }

    // Closes the transport. Subscriptions are kept unless clear_subscriptions().
    inline void close() {
        connection_.close();
        manager_.on_disconnected();
        heartbeat_armed_ = false;
        transport::connection::Signal sig;
        while (connection_.poll_signal(sig)) {
        }
    }

    // Any thread. Interrupts a connection attempt in progress; see
    // transport::Connection::cancel()
    inline void cancel() noexcept {
        connection_.cancel();
    }

    inline void clear_subscriptions() {
        manager_.clear();
    }

    // -------------------------------------------------------------------------
    // Subscription API (any thread)
    // -------------------------------------------------------------------------
    inline void subscribe(std::string channel, lcr::optional<schema::Filter> filter = {}) {
        manager_.subscribe(std::move(channel), std::move(filter));
    }

    inline void subscribe(const schema::Subscribe& req) {
        manager_.subscribe(req);
    }

    inline void unsubscribe(const std::vector<std::string>& channels) {
        manager_.unsubscribe(channels);
    }

    // Queues an arbitrary outbound text frame. Only accepted while live.
    [[nodiscard]]
    inline bool send(std::string frame) {
        return manager_.enqueue(std::move(frame));
    }

    // -------------------------------------------------------------------------
    // Pump step. Returns the number of inbound frames handled.
    // -------------------------------------------------------------------------
    inline std::size_t poll() {
        connection_.poll();
        handle_signals_();
        if (connection_.state() != transport::State::Connected) {
            return 0;
        }
        flush_outbox_();
        fire_heartbeat_();
        return drain_frames_();
    }

    // Accessors
    [[nodiscard]]
    inline transport::State state() const noexcept {
        return connection_.state();
    }

    [[nodiscard]]
    inline std::uint64_t epoch() const noexcept {
        return connection_.epoch();
    }

    [[nodiscard]]
    inline transport::Error last_error() const noexcept {
        return connection_.last_error();
    }

    [[nodiscard]]
    inline bool finished() const noexcept {
        return finished_;
    }

    [[nodiscard]]
    inline const Sequencer& sequencer() const noexcept {
        return sequencer_;
    }

    [[nodiscard]]
    inline const subscription::Manager& subscriptions() const noexcept {
        return manager_;
    }

    [[nodiscard]]
    inline const ciris::telemetry::Session& telemetry() const noexcept {
        return telemetry_;
    }

    [[nodiscard]]
    inline const transport::telemetry::Connection& transport_telemetry() const noexcept {
        return transport_telemetry_;
    }

#ifdef CS_UNIT_TEST
public:
    transport::Connection<WS>& connection() noexcept {
        return connection_;
    }

    // Makes the heartbeat due on the next poll()
    void force_heartbeat_due() noexcept {
        next_heartbeat_ = std::chrono::steady_clock::now();
    }
#endif // CS_UNIT_TEST

private:
    config::Client cfg_;
    MessageQueue& queue_;

    transport::telemetry::Connection transport_telemetry_;
    transport::Connection<WS> connection_;

    ciris::telemetry::Session telemetry_;
    parser::Router router_;
    parser::Frame frame_;
    std::string raw_;

    Sequencer sequencer_;
    subscription::Manager manager_;

    bool heartbeat_armed_{false};
    std::chrono::steady_clock::time_point next_heartbeat_{};
    bool finished_{false};

private:
    inline void handle_signals_() {
        transport::connection::Signal sig;
        while (connection_.poll_signal(sig)) {
            switch (sig) {
                case transport::connection::Signal::Connected:
                    on_connected_();
                    break;
                case transport::connection::Signal::Disconnected:
                    CS_INFO("[SESSION] Stream lost (epoch " << connection_.epoch() << ")");
                    manager_.on_disconnected();
                    heartbeat_armed_ = false;
                    if (!cfg_.reconnect.enabled && connection_.state() == transport::State::Disconnected) {
                        CS_WARN("[SESSION] Automatic reconnection disabled, stream finished");
                        finished_ = true;
                    }
                    break;
                case transport::connection::Signal::RetryScheduled:
                    CS_DEBUG("[SESSION] Reconnect scheduled in " << connection_.last_backoff().count() << " ms");
                    break;
                case transport::connection::Signal::Failed:
                    CS_ERROR("[SESSION] Connection failed permanently (" << transport::to_string(connection_.last_error()) << ")");
                    manager_.on_disconnected();
                    heartbeat_armed_ = false;
                    finished_ = true;
                    break;
                default:
                    break;
            }
        }
    }

    inline void on_connected_() {
        // A Connected signal may be stale if the transport already dropped
        if (connection_.state() != transport::State::Connected) {
            return;
        }
        const std::uint64_t epoch = connection_.epoch();
        CS_INFO("[SESSION] Stream connected (epoch " << epoch << ")");
        sequencer_.reset(epoch);
        auto replay = manager_.on_connected();
        if (replay.has()) {
            CS_TL1( telemetry_.replays_total.inc() );
            if (!connection_.send(replay.value().to_json())) {
                CS_WARN("[SESSION] Subscription replay failed to send");
                connection_.abort(transport::Error::SendFailed);
                return;
            }
        }
        if (cfg_.heartbeat.interval.count() > 0) {
            heartbeat_armed_ = true;
            next_heartbeat_ = std::chrono::steady_clock::now() + cfg_.heartbeat.interval;
        }
    }

    inline void flush_outbox_() {
        auto frames = manager_.take_outbox();
        for (auto& frame : frames) {
            if (!connection_.send(frame)) {
                CS_WARN("[SESSION] Control frame could not be sent, transport will be recycled");
                connection_.abort(transport::Error::SendFailed);
                return;
            }
            CS_TL1( telemetry_.control_frames_total.inc() );
        }
    }

    inline void fire_heartbeat_() {
        if (!heartbeat_armed_ || connection_.state() != transport::State::Connected) {
            return;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now < next_heartbeat_) {
            return;
        }
        next_heartbeat_ = now + cfg_.heartbeat.interval;
        const std::string ping = schema::Ping{core::now()}.to_json();
        if (!connection_.send(ping)) {
            CS_TL1( telemetry_.heartbeat_failures_total.inc() );
            CS_WARN("[SESSION] Heartbeat failed, transport will be recycled");
            heartbeat_armed_ = false;
            connection_.abort(transport::Error::SendFailed);
            return;
        }
        CS_TL1( telemetry_.heartbeats_total.inc() );
        CS_TRACE("[SESSION] Heartbeat sent");
    }

    inline std::size_t drain_frames_() {
        std::size_t handled = 0;
        while (handled < MAX_FRAMES_PER_POLL && connection_.poll_message(raw_)) {
            ++handled;
            CS_TL1( telemetry_.frames_total.inc() );
            handle_frame_(raw_);
        }
        return handled;
    }

    inline void handle_frame_(std::string_view raw) {
        const parser::Result r = router_.parse(raw, frame_);
        switch (r) {
            case parser::Result::Ok:
                break;
            case parser::Result::Ignored:
                CS_TL1( telemetry_.ignored_total.inc() );
                return;
            default:
                CS_TL1( telemetry_.malformed_total.inc() );
                return;
        }
        switch (frame_.kind) {
            case parser::FrameKind::Pong:
                CS_TL1( telemetry_.pongs_total.inc() );
                return;
            case parser::FrameKind::ErrorNotice:
                CS_TL1( telemetry_.error_notices_total.inc() );
                CS_ERROR("[SESSION] Server error: " << frame_.error.message);
                return;
            case parser::FrameKind::Data:
                deliver_(frame_.message);
                return;
            default:
                return;
        }
    }

    inline void deliver_(schema::Message& msg) {
        CS_TL1( telemetry_.data_messages_total.inc() );
        msg.epoch = connection_.epoch();
        if (sequencer_.observe(msg.sequence) == SequenceStatus::GapDetected) {
            CS_TL1( telemetry_.sequence_gaps_total.inc() );
        }
        switch (queue_.push(std::move(msg))) {
            case delivery::PushResult::Queued:
                CS_TL1( telemetry_.delivered_total.inc() );
                break;
            case delivery::PushResult::DroppedOldest:
                CS_TL1( telemetry_.delivered_total.inc() );
                CS_TL1( telemetry_.dropped_total.inc() );
                break;
            case delivery::PushResult::DroppedNewest:
                CS_TL1( telemetry_.dropped_total.inc() );
                break;
            case delivery::PushResult::Closed:
                CS_TRACE("[SESSION] Delivery queue closed, message discarded");
                break;
        }
        msg = schema::Message{};
    }
};

} // namespace cirisstream::core::protocol::ciris
