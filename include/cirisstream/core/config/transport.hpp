/*
================================================================================
cirisstream Transport Configuration (compile-time)
================================================================================

Fixed capacities of the lock-free rings between the WebSocket receive thread,
the Connection and the Session. Runtime behavior (backoff, heartbeat, queue
capacity) lives in config/client.hpp.

The receive ring bounds how far the receive thread may run ahead of the pump.
When it is full the receive thread waits; the pump never blocks, so the wait
is bounded by one pump step.
================================================================================
*/
#pragma once

#include <cstddef>


namespace cirisstream::core::config {

// Complete text frames buffered between the receive thread and the pump
inline constexpr std::size_t WS_MESSAGE_RING_CAPACITY = 1024;

// Control-plane events (Error, Close) per transport instance
inline constexpr std::size_t WS_EVENT_RING_CAPACITY = 16;

// Edge-triggered connection signals awaiting the session
inline constexpr std::size_t SIGNAL_RING_CAPACITY = 64;

// Initial capacity of the receive buffer (grows for larger frames)
inline constexpr std::size_t RX_BUFFER_SIZE = 8 * 1024;

static_assert((WS_MESSAGE_RING_CAPACITY & (WS_MESSAGE_RING_CAPACITY - 1)) == 0, "WS_MESSAGE_RING_CAPACITY must be a power of two");
static_assert((WS_EVENT_RING_CAPACITY & (WS_EVENT_RING_CAPACITY - 1)) == 0, "WS_EVENT_RING_CAPACITY must be a power of two");
static_assert((SIGNAL_RING_CAPACITY & (SIGNAL_RING_CAPACITY - 1)) == 0, "SIGNAL_RING_CAPACITY must be a power of two");

} // namespace cirisstream::core::config
