#pragma once

#include <cstdint>
#include <string_view>

#include "lcr/log/logger.hpp"


namespace cirisstream::core::protocol::ciris {

enum class SequenceStatus : std::uint8_t {
    InOrder,
    GapDetected
};

[[nodiscard]]
inline constexpr std::string_view to_string(SequenceStatus s) noexcept {
    switch (s) {
        case SequenceStatus::InOrder:     return "InOrder";
        case SequenceStatus::GapDetected: return "GapDetected";
        default:                          return "unknown";
    }
}

/*
===============================================================================
 Sequencer
===============================================================================

Tracks the last observed sequence number within one connection epoch.
Sequence numbers only have meaning inside the epoch they were received in.

  reset(epoch)   once per successful connection, last = 0 (none)
  observe(seq)   GapDetected when seq > last + 1, InOrder otherwise;
                 always advances last = seq

Streams start at 1, so a first observation above 1 is a gap. A regression
(seq <= last) is logged as an anomaly and reported InOrder.

Observability only: nothing is reordered or retransmitted.
Owned by the pump thread; not synchronized.
===============================================================================
*/
class Sequencer {
public:
    inline void reset(std::uint64_t epoch) noexcept {
        CS_DEBUG("[SEQ] Reset for epoch " << epoch << " (previous epoch " << epoch_ << ", last " << last_ << ")");
        epoch_ = epoch;
        last_ = 0;
    }

    [[nodiscard]]
    inline SequenceStatus observe(std::int64_t seq) noexcept {
        SequenceStatus status = SequenceStatus::InOrder;
        if (seq > last_ + 1) {
            ++gaps_;
            CS_WARN("[SEQ] Message gap detected: expected " << (last_ + 1) << ", got " << seq << " (epoch " << epoch_ << ")");
            status = SequenceStatus::GapDetected;
        }
        else if (seq <= last_ && last_ != 0) {
            ++regressions_;
            CS_WARN("[SEQ] Sequence regression: last " << last_ << ", got " << seq << " (epoch " << epoch_ << ")");
        }
        last_ = seq;
        return status;
    }

    // Last observed sequence, 0 when nothing was observed in this epoch
    [[nodiscard]]
    inline std::int64_t last() const noexcept {
        return last_;
    }

    [[nodiscard]]
    inline std::uint64_t epoch() const noexcept {
        return epoch_;
    }

    // Cumulative across epochs
    [[nodiscard]]
    inline std::uint64_t gaps() const noexcept {
        return gaps_;
    }

    [[nodiscard]]
    inline std::uint64_t regressions() const noexcept {
        return regressions_;
    }

private:
    std::uint64_t epoch_{0};
    std::int64_t last_{0};
    std::uint64_t gaps_{0};
    std::uint64_t regressions_{0};
};

} // namespace cirisstream::core::protocol::ciris
