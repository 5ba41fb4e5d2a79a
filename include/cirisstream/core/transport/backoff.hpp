#pragma once

#include <chrono>
#include <cstdint>
#include <algorithm>

#include "cirisstream/core/config/client.hpp"


namespace cirisstream::core::transport {

// Delay before reconnection attempt `attempt` (1-based):
//
//     min(initial_interval * 2^(attempt - 1), max_interval)
//
// No jitter. With the defaults (1s, 60s): 1, 2, 4, 8, 16, 32, 60, 60, ...
[[nodiscard]]
inline std::chrono::milliseconds backoff_delay(const config::Reconnect& policy, std::uint32_t attempt) noexcept {
    const auto base = std::max(policy.initial_interval, std::chrono::milliseconds{0});
    const auto cap  = std::max(policy.max_interval, base);
    if (attempt <= 1) {
        return std::min(base, cap);
    }
    auto delay = base;
    for (std::uint32_t i = 1; i < attempt; ++i) {
        // Stop doubling once the cap is reached (avoids overflow on long outages)
        if (delay >= cap / 2) {
            return cap;
        }
        delay *= 2;
    }
    return std::min(delay, cap);
}

} // namespace cirisstream::core::transport
