#pragma once

#include <ostream>
#include <type_traits>

#include "cirisstream/core/transport/telemetry/websocket.hpp"

#include "lcr/metrics/atomic/counter.hpp"
#include "lcr/format.hpp"

namespace cirisstream::core::transport::telemetry {

// ============================================================================
// Connection Telemetry
//
// Observes connection-level state transitions and decisions.
// Does NOT duplicate WebSocket telemetry.
// ============================================================================

struct alignas(64) Connection final {
    // ---------------------------------------------------------------------
    // Lifecycle & state transitions
    // ---------------------------------------------------------------------

    // open() invoked by the caller
    lcr::metrics::atomic::counter32 open_calls_total;

    // Reached State::Connected (initial or reconnect)
    lcr::metrics::atomic::counter32 connect_success_total;

    // Any connect attempt that did not reach Connected
    lcr::metrics::atomic::counter32 connect_failure_total;

    // Explicit close() invoked by the caller
    lcr::metrics::atomic::counter32 close_calls_total;

    // Connected transport lost (any cause)
    lcr::metrics::atomic::counter32 disconnect_events_total;

    // ---------------------------------------------------------------------
    // Liveness decisions
    // ---------------------------------------------------------------------
    lcr::metrics::atomic::counter32 liveness_timeouts_total;

    // ---------------------------------------------------------------------
    // Retry mechanics
    // ---------------------------------------------------------------------

    // Reconnect attempt initiated after a backoff delay
    lcr::metrics::atomic::counter32 retry_attempts_total;

    // Gave up (entered State::Failed)
    lcr::metrics::atomic::counter32 failures_total;

    // ---------------------------------------------------------------------
    // Message handoff (transport → session)
    // ---------------------------------------------------------------------
    lcr::metrics::atomic::counter64 messages_forwarded_total;

    // ---------------------------------------------------------------------
    // Send gating
    // ---------------------------------------------------------------------
    lcr::metrics::atomic::counter64 send_calls_total;
    lcr::metrics::atomic::counter64 send_rejected_total;

    // ---------------------------------------------------------------------
    // Sub-telemetry
    // ---------------------------------------------------------------------
    transport::telemetry::WebSocket websocket;

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== Connection Telemetry ===\n";
        os << "Lifecycle\n";
        os << "  Open calls            : " << lcr::format_number_exact(open_calls_total.load()) << '\n';
        os << "  Connect success       : " << lcr::format_number_exact(connect_success_total.load()) << '\n';
        os << "  Connect failure       : " << lcr::format_number_exact(connect_failure_total.load()) << '\n';
        os << "  Close calls           : " << lcr::format_number_exact(close_calls_total.load()) << '\n';
        os << "  Disconnect events     : " << lcr::format_number_exact(disconnect_events_total.load()) << '\n';
        os << "\nLiveness\n";
        os << "  Liveness timeouts     : " << lcr::format_number_exact(liveness_timeouts_total.load()) << '\n';
        os << "\nRetry\n";
        os << "  Retry attempts        : " << lcr::format_number_exact(retry_attempts_total.load()) << '\n';
        os << "  Failures              : " << lcr::format_number_exact(failures_total.load()) << '\n';
        os << "\nMessage handoff\n";
        os << "  Messages forwarded    : " << lcr::format_number_exact(messages_forwarded_total.load()) << '\n';
        os << "\nSend\n";
        os << "  Send calls            : " << lcr::format_number_exact(send_calls_total.load()) << '\n';
        os << "  Send rejected         : " << lcr::format_number_exact(send_rejected_total.load()) << '\n';
        websocket.debug_dump(os);
    }
};

static_assert(std::is_standard_layout_v<Connection>, "telemetry::Connection must be standard layout");
static_assert(!std::is_polymorphic_v<Connection>, "telemetry::Connection must not be polymorphic");
static_assert(alignof(Connection) == 64, "telemetry::Connection must be cache-line aligned");

} // namespace cirisstream::core::transport::telemetry
