#pragma once

/*
================================================================================
cirisstream Core
================================================================================

Poll-driven building blocks of the stream client:

    cirisstream::core::Session     protocol Session over the Beast transport

It is a thin, explicit composition of:
  - a transport-level Connection (lifecycle, backoff, liveness)
  - a protocol-level CIRIS Session (replay, sequencing, heartbeat)
  - a concrete WebSocket backend (Boost.Beast)

-------------------------------------------------------------------------------
Execution Model
-------------------------------------------------------------------------------

    [1] Transport thread    owned by the WebSocket; reads frames into a ring
    [2] Pump thread         calls Session::poll(); owns all protocol state
    [3] Consumer thread(s)  drain the delivery queue

Session::poll() never blocks, so a slow consumer cannot stall the transport
for longer than one bounded ring wait, and a broken connection never blocks
subscribe() callers.

stream::Client (cirisstream.hpp) runs [2] on a worker thread for you.
================================================================================
*/

#include "cirisstream/core/config/client.hpp"
#include "cirisstream/core/delivery/queue.hpp"
#include "cirisstream/core/transport/beast/websocket.hpp"
#include "cirisstream/core/protocol/ciris/session.hpp"


namespace cirisstream::core {

using Session = protocol::ciris::Session<transport::beast::WebSocket>;
using MessageQueue = delivery::Queue<protocol::ciris::schema::Message>;

} // namespace cirisstream::core
