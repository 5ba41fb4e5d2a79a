/*
================================================================================
cirisstream Runtime Configuration
================================================================================

Plain aggregates with defaults. Every field can be overridden with designated
initializers:

    config::Client cfg{
        .endpoint = "https://agent.local:8080",
        .api_key  = token,
        .reconnect = {.max_attempts = 10},
    };

Durations are milliseconds. A zero duration disables the corresponding timer.
================================================================================
*/
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "cirisstream/core/delivery/drop_policy.hpp"


namespace cirisstream::core::config {

// Automatic reconnection with exponential backoff
struct Reconnect {
    bool enabled = true;
    std::chrono::milliseconds initial_interval{1000};
    std::chrono::milliseconds max_interval{60000};
    std::uint32_t max_attempts = 0;   // 0 = unlimited
};

// Bounded delivery queue
struct Backpressure {
    std::size_t capacity = 1000;
    delivery::DropPolicy drop_policy = delivery::DropPolicy::Oldest;
    double warn_ratio = 0.8;          // high-water mark as a fraction of capacity
};

// Keep-alive and dead-peer detection
struct Heartbeat {
    std::chrono::milliseconds interval{30000};          // ping period while Connected
    std::chrono::milliseconds liveness_timeout{0};      // max inbound silence while Connected
};

struct Client {
    std::string endpoint;             // http(s):// base or ws(s):// stream URL
    std::string api_key;              // sent as "Authorization: Bearer <api_key>" when not empty

    Reconnect reconnect{};
    Backpressure backpressure{};
    Heartbeat heartbeat{};

    // Worker sleep between pump steps when no frame was processed
    std::chrono::milliseconds idle_interval{1};
};

} // namespace cirisstream::core::config
