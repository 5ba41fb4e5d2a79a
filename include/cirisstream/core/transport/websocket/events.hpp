#pragma once

/*
===============================================================================
 cirisstream::core::transport::websocket::Event
===============================================================================

Control-plane event emitted by a WebSocket transport implementation and
delivered to the owning Connection via a lock-free SPSC ring.

    • Error  → transport-level failure (always followed by Close)
    • Close  → transport closed (local or remote), emitted exactly once

Data frames never travel through this channel.
===============================================================================
*/

#include <cstdint>
#include <type_traits>

#include "cirisstream/core/transport/error.hpp"

namespace cirisstream::core::transport::websocket {

enum class EventType : std::uint8_t {
    Close = 0,
    Error = 1,
};

struct Event {
    EventType type{EventType::Close};
    transport::Error error{transport::Error::None}; // meaningful only if type == Error

    static constexpr Event make_close() noexcept {
        return Event{EventType::Close, transport::Error::None};
    }

    static constexpr Event make_error(transport::Error e) noexcept {
        return Event{EventType::Error, e};
    }
};

static_assert(std::is_trivially_copyable_v<Event>, "websocket::Event must be trivially copyable");

} // namespace cirisstream::core::transport::websocket
