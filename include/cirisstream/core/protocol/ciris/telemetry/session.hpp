#pragma once

#include <ostream>
#include <type_traits>

#include "lcr/metrics/atomic/counter.hpp"
#include "lcr/format.hpp"

namespace cirisstream::core::protocol::ciris::telemetry {

// ============================================================================
// Session Telemetry
//
// Protocol-level counters written by the pump thread. Atomic so any thread
// may read them while the client runs.
// ============================================================================

struct alignas(64) Session final {
    // Inbound classification
    lcr::metrics::atomic::counter64 frames_total;
    lcr::metrics::atomic::counter64 data_messages_total;
    lcr::metrics::atomic::counter64 pongs_total;
    lcr::metrics::atomic::counter32 error_notices_total;
    lcr::metrics::atomic::counter32 malformed_total;
    lcr::metrics::atomic::counter32 ignored_total;

    // Ordering
    lcr::metrics::atomic::counter32 sequence_gaps_total;

    // Delivery
    lcr::metrics::atomic::counter64 delivered_total;
    lcr::metrics::atomic::counter64 dropped_total;

    // Outbound control plane
    lcr::metrics::atomic::counter32 replays_total;
    lcr::metrics::atomic::counter32 control_frames_total;
    lcr::metrics::atomic::counter32 heartbeats_total;
    lcr::metrics::atomic::counter32 heartbeat_failures_total;

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== Session Telemetry ===\n";
        os << "Inbound\n";
        os << "  Frames              : " << lcr::format_number_exact(frames_total.load()) << '\n';
        os << "  Data messages       : " << lcr::format_number_exact(data_messages_total.load()) << '\n';
        os << "  Pongs               : " << lcr::format_number_exact(pongs_total.load()) << '\n';
        os << "  Error notices       : " << lcr::format_number_exact(error_notices_total.load()) << '\n';
        os << "  Malformed           : " << lcr::format_number_exact(malformed_total.load()) << '\n';
        os << "  Ignored             : " << lcr::format_number_exact(ignored_total.load()) << '\n';
        os << "\nOrdering\n";
        os << "  Sequence gaps       : " << lcr::format_number_exact(sequence_gaps_total.load()) << '\n';
        os << "\nDelivery\n";
        os << "  Delivered           : " << lcr::format_number_exact(delivered_total.load()) << '\n';
        os << "  Dropped             : " << lcr::format_number_exact(dropped_total.load()) << '\n';
        os << "\nControl plane\n";
        os << "  Replays             : " << lcr::format_number_exact(replays_total.load()) << '\n';
        os << "  Control frames      : " << lcr::format_number_exact(control_frames_total.load()) << '\n';
        os << "  Heartbeats          : " << lcr::format_number_exact(heartbeats_total.load()) << '\n';
        os << "  Heartbeat failures  : " << lcr::format_number_exact(heartbeat_failures_total.load()) << '\n';
    }
};

static_assert(std::is_standard_layout_v<Session>, "telemetry::Session must be standard layout");
static_assert(!std::is_polymorphic_v<Session>, "telemetry::Session must not be polymorphic");

} // namespace cirisstream::core::protocol::ciris::telemetry
