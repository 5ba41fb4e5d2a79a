/*
===============================================================================
WebSocketConcept (Pull-Based)
===============================================================================

Defines the minimal transport contract required by transport::Connection.

The WebSocket implementation:

  • Is constructed with a reference to its telemetry block
  • Owns its receive thread
  • Pushes complete text frames into an internal SPSC ring
  • Pushes control-plane events (Error, then Close exactly once) into a
    second SPSC ring
  • Is fully lifecycle-managed by Connection (one instance per attempt)

No callbacks. No dynamic dispatch.

-------------------------------------------------------------------------------
Threading Model
-------------------------------------------------------------------------------

Producer thread:  WebSocket receive thread
Consumer thread:  Connection::poll() / Connection::poll_message() caller

Single-producer / single-consumer only. send() and close() are called from
the consumer thread.

cancel() is the exception: it may be called from any thread while connect()
is blocked on the consumer thread. connect() then returns Error::Cancelled
promptly, and so does every later connect() on the same instance.
===============================================================================
*/
#pragma once

#include <string>
#include <string_view>
#include <concepts>

#include "cirisstream/core/transport/error.hpp"
#include "cirisstream/core/transport/parse_url.hpp"
#include "cirisstream/core/transport/websocket/events.hpp"
#include "cirisstream/core/transport/telemetry/websocket.hpp"


namespace cirisstream::core::transport {

template<class WS>
concept WebSocketConcept =
    std::constructible_from<WS, telemetry::WebSocket&> &&
    requires(
        WS ws,
        const ParsedUrl& url,
        const std::string& bearer_token,
        std::string_view msg,
        websocket::Event& ev,
        std::string& frame
    )
{
    // Lifecycle
    { ws.connect(url, bearer_token) } noexcept -> std::same_as<Error>;
    { ws.close() } noexcept -> std::same_as<void>;
    { ws.cancel() } noexcept -> std::same_as<void>;

    // Sending
    { ws.send(msg) } noexcept -> std::same_as<bool>;

    // Control-plane polling
    { ws.poll_event(ev) } noexcept -> std::same_as<bool>;

    // Data-plane polling
    { ws.poll_message(frame) } noexcept -> std::same_as<bool>;
};

} // namespace cirisstream::core::transport
