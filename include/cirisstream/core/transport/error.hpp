#pragma once

#include <string_view>

namespace cirisstream::core {
namespace transport {

/*
===============================================================================
 transport::Error
===============================================================================

Transport-level error classification.

This enum represents *semantic transport failures*, abstracted away from
library-specific error codes (Boost.Beast, Asio, OpenSSL).

Higher layers (transport::Connection, the protocol session, the stream
client) use this classification to decide whether and how to recover.
===============================================================================
*/

enum class Error {
    None = 0,

    // --- Control / contract errors (caller responsibility) ------------------
    InvalidUrl,       // Malformed or unsupported URL (scheme, host, port)
    InvalidState,     // Operation not allowed in current state
    Cancelled,        // Connection attempt interrupted by cancel()

    // --- Expected / benign termination --------------------------------------
    LocalShutdown,    // Connection was closed intentionally by the local endpoint
    RemoteClosed,     // Remote endpoint closed the connection (CLOSE frame or EOF)

    // --- Transient / recoverable failures -----------------------------------
    Timeout,          // No traffic within the liveness window, or I/O timeout
    ConnectionFailed, // Resolve / TCP connect failed
    HandshakeFailed,  // TLS or WebSocket upgrade failed
    AuthFailed,       // Upgrade rejected with 401 / 403
    SendFailed,       // Outbound frame could not be written (heartbeat, control)

    // --- Protocol / framing issues ------------------------------------------
    ProtocolError,    // Invalid frame or protocol violation

    // --- Unspecified transport failure --------------------------------------
    TransportFailure,
};


inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:              return "None";
    case Error::InvalidUrl:        return "InvalidUrl";
    case Error::InvalidState:      return "InvalidState";
    case Error::Cancelled:         return "Cancelled";
    case Error::LocalShutdown:     return "LocalShutdown";
    case Error::RemoteClosed:      return "RemoteClosed";
    case Error::Timeout:           return "Timeout";
    case Error::ConnectionFailed:  return "ConnectionFailed";
    case Error::HandshakeFailed:   return "HandshakeFailed";
    case Error::AuthFailed:        return "AuthFailed";
    case Error::SendFailed:        return "SendFailed";
    case Error::ProtocolError:     return "ProtocolError";
    case Error::TransportFailure:  return "TransportFailure";
    default:                       return "Unknown";
    }
}

// Transient external conditions are retried. Caller misuse, protocol
// corruption, cancellation and intentional shutdown are not.
[[nodiscard]]
inline constexpr bool is_retryable(Error err) noexcept {
    switch (err) {
    case Error::RemoteClosed:
    case Error::Timeout:
    case Error::ConnectionFailed:
    case Error::HandshakeFailed:
    case Error::AuthFailed:
    case Error::SendFailed:
    case Error::TransportFailure:
        return true;
    default:
        return false;
    }
}

} // namespace transport
} // namespace cirisstream::core
