#pragma once

#include <cstdint>
#include <string_view>


namespace cirisstream::core::transport {

// ===============================================================
// CONNECTION STATE ENUM
// ===============================================================
enum class State : uint8_t {
    Disconnected,   // Idle: never opened, closed by the caller, or lost with auto-reconnect disabled
    Connecting,     // Transport connect / upgrade in progress
    Connected,      // Transport established, upgrade accepted
    Reconnecting,   // Waiting for the backoff delay before the next attempt
    Failed          // Terminal until the caller opens again
};

[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
        case State::Disconnected:  return "Disconnected";
        case State::Connecting:    return "Connecting";
        case State::Connected:     return "Connected";
        case State::Reconnecting:  return "Reconnecting";
        case State::Failed:        return "Failed";
        default:                   return "Unknown";
    }
}


// ===============================================================
// EVENT ENUM
// ===============================================================
enum class Event : uint8_t {
    // --- User intent ---
    OpenRequested,
    CloseRequested,
    AbortRequested,          // Local failure decision (e.g. heartbeat could not be sent)

    // --- Transport lifecycle ---
    TransportConnected,
    TransportConnectFailed,
    TransportClosed,

    // --- Liveness ---
    LivenessExpired,

    // --- Retry ---
    RetryTimerExpired
};

[[nodiscard]]
inline constexpr std::string_view to_string(Event e) noexcept {
    switch (e) {
        case Event::OpenRequested:           return "OpenRequested";
        case Event::CloseRequested:          return "CloseRequested";
        case Event::AbortRequested:          return "AbortRequested";
        case Event::TransportConnected:      return "TransportConnected";
        case Event::TransportConnectFailed:  return "TransportConnectFailed";
        case Event::TransportClosed:         return "TransportClosed";
        case Event::LivenessExpired:         return "LivenessExpired";
        case Event::RetryTimerExpired:       return "RetryTimerExpired";
        default:                             return "UnknownEvent";
    }
}


// ===============================================================
// DISCONNECT REASON ENUM
// ===============================================================
enum class DisconnectReason : uint8_t {
    None,
    LocalClose,        // explicit close() by the caller
    TransportError,    // websocket / IO error or remote close
    LivenessTimeout,   // no inbound traffic within the liveness window
    Aborted            // abort() by the owning session
};

[[nodiscard]]
inline constexpr std::string_view to_string(DisconnectReason r) noexcept {
    switch (r) {
        case DisconnectReason::None:            return "None";
        case DisconnectReason::LocalClose:      return "LocalClose";
        case DisconnectReason::TransportError:  return "TransportError";
        case DisconnectReason::LivenessTimeout: return "LivenessTimeout";
        case DisconnectReason::Aborted:         return "Aborted";
        default:                                return "Unknown";
    }
}

} // namespace cirisstream::core::transport
