#pragma once

#include <ostream>
#include <type_traits>

#include "lcr/metrics/atomic/counter.hpp"
#include "lcr/format.hpp"

namespace cirisstream::core::transport::telemetry {

// ============================================================================
// WebSocket Telemetry
//
// Transport-level observability shared by all WebSocket backends.
// Captures only mechanical socket behavior. Written by the receive thread
// and the sending thread, read by anyone.
// ============================================================================

struct alignas(64) WebSocket final {
    // Throughput (cumulative, monotonic)
    lcr::metrics::atomic::counter64 bytes_rx_total;
    lcr::metrics::atomic::counter64 bytes_tx_total;
    lcr::metrics::atomic::counter64 messages_rx_total;
    lcr::metrics::atomic::counter64 messages_tx_total;

    // Errors & lifecycle
    lcr::metrics::atomic::counter32 receive_errors_total;
    lcr::metrics::atomic::counter32 send_errors_total;
    lcr::metrics::atomic::counter32 close_events_total;

    // Receive ring was full and the reader had to wait
    lcr::metrics::atomic::counter32 rx_ring_full_total;

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== WebSocket Telemetry ===\n";
        os << "Traffic\n";
        os << "  RX bytes      : " << lcr::format_bytes(bytes_rx_total.load()) << '\n';
        os << "  TX bytes      : " << lcr::format_bytes(bytes_tx_total.load()) << '\n';
        os << "  RX messages   : " << lcr::format_number_exact(messages_rx_total.load()) << '\n';
        os << "  TX messages   : " << lcr::format_number_exact(messages_tx_total.load()) << '\n';
        os << "\nErrors / lifecycle\n";
        os << "  Receive errors: " << lcr::format_number_exact(receive_errors_total.load()) << '\n';
        os << "  Send errors   : " << lcr::format_number_exact(send_errors_total.load()) << '\n';
        os << "  Close events  : " << lcr::format_number_exact(close_events_total.load()) << '\n';
        os << "  RX ring full  : " << lcr::format_number_exact(rx_ring_full_total.load()) << '\n';
    }
};

static_assert(std::is_standard_layout_v<WebSocket>, "telemetry::WebSocket must be standard layout");
static_assert(!std::is_polymorphic_v<WebSocket>, "telemetry::WebSocket must not be polymorphic");

} // namespace cirisstream::core::transport::telemetry
