/*
===============================================================================
 Connection Signals
===============================================================================

connection::Signal represents externally observable, edge-triggered facts
emitted by transport::Connection via its poll_signal() interface.

Signals are:
  - Edge-triggered (not level- or state-based)
  - Single-shot per occurrence
  - Poll-driven, allocation-free and callback-free

-------------------------------------------------------------------------------
 Signal Meanings
-------------------------------------------------------------------------------

Connected
  A WebSocket connection has been established and the upgrade accepted.
  Emitted once per transport lifetime. The epoch has already been
  incremented when this signal is observed.

Disconnected
  A previously Connected transport became unusable (remote close, error,
  liveness timeout, abort or local close). Emitted at most once per epoch.

RetryScheduled
  A reconnection attempt has been scheduled according to the backoff policy.

Failed
  The connection gave up: non-retryable error, auto-reconnect disabled on a
  failed attempt, or the maximum number of attempts was exhausted.

===============================================================================
*/
#pragma once

#include <cstdint>
#include <string_view>


namespace cirisstream::core::transport::connection {

enum class Signal : uint8_t {
    None,
    Connected,
    Disconnected,
    RetryScheduled,
    Failed
};

[[nodiscard]]
inline std::string_view to_string(Signal sig) noexcept {
    switch (sig) {
        case Signal::None:            return "None";
        case Signal::Connected:       return "Connected";
        case Signal::Disconnected:    return "Disconnected";
        case Signal::RetryScheduled:  return "RetryScheduled";
        case Signal::Failed:          return "Failed";
        default:                      return "Unknown";
    }
}

} // namespace cirisstream::core::transport::connection
