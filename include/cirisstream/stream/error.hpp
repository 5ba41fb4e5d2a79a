#pragma once

#include <cstdint>
#include <string_view>

#include "cirisstream/core/transport/error.hpp"

namespace cirisstream::stream {

/*
===============================================================================
Stream Error Model
===============================================================================

Errors observable by users of stream::Client. They abstract transport
details into a small stable set.

[InvalidState] the call is not allowed in the current lifecycle state:
connect() twice, disconnect() while connect() was still attempting, or
subscribe/unsubscribe/send before connect(), after disconnect() or after
the stream finished. send() additionally requires a live connection.

[InvalidUrl] the configured endpoint cannot be turned into a ws:// or
wss:// URL. Nothing was attempted.

[AuthFailed] the server rejected the credentials during the upgrade.

[ConnectionFailed] the first connection attempt failed for any other
transport reason. Reported by connect() only when automatic reconnection is
disabled or the error is not retryable; otherwise the client keeps retrying
in the background.
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,
    InvalidState,
    InvalidUrl,
    AuthFailed,
    ConnectionFailed
};

[[nodiscard]]
inline constexpr std::string_view to_string(Error e) noexcept {
    switch (e) {
        case Error::None:             return "None";
        case Error::InvalidState:     return "InvalidState";
        case Error::InvalidUrl:       return "InvalidUrl";
        case Error::AuthFailed:       return "AuthFailed";
        case Error::ConnectionFailed: return "ConnectionFailed";
        default:                      return "Unknown";
    }
}

[[nodiscard]]
inline constexpr Error from_transport(core::transport::Error e) noexcept {
    using core::transport::Error;
    switch (e) {
        case Error::None:         return stream::Error::None;
        case Error::InvalidUrl:   return stream::Error::InvalidUrl;
        case Error::InvalidState: return stream::Error::InvalidState;
        case Error::AuthFailed:   return stream::Error::AuthFailed;
        default:                  return stream::Error::ConnectionFailed;
    }
}

} // namespace cirisstream::stream
