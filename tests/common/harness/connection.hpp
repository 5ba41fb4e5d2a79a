/*
===============================================================================
 Connection Test Harness
===============================================================================

Minimal, deterministic harness for transport::Connection FSM tests.

- Telemetry outlives the Connection
- Connection lifetime is explicit (make / destroy)
- Signals are drained into counters and an ordered log
- No callbacks, no threads, no sleeps: retry timers are forced due
===============================================================================
*/
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

#include "cirisstream/core/config/client.hpp"
#include "cirisstream/core/transport/connection.hpp"
#include "cirisstream/core/transport/connection/signal.hpp"
#include "cirisstream/core/transport/telemetry/connection.hpp"
#include "common/mock_websocket.hpp"
#include "common/test_check.hpp"

// -----------------------------------------------------------------------------
// Setup environment
// -----------------------------------------------------------------------------
using namespace cirisstream::core;
using namespace cirisstream::core::transport;

using WebSocketUnderTest = test::MockWebSocket;
using ConnectionUnderTest = Connection<WebSocketUnderTest>;

inline constexpr const char* TEST_URL = "wss://agent.example.com/v1/stream";


namespace cirisstream::core::transport::test {
namespace harness {

struct Connection {
    telemetry::Connection telemetry;
    std::unique_ptr<ConnectionUnderTest> connection;

    // Signal counters
    std::uint32_t connect_signals{0};
    std::uint32_t disconnect_signals{0};
    std::uint32_t retry_schedule_signals{0};
    std::uint32_t failed_signals{0};

    // Ordered signal log
    std::vector<connection::Signal> signals;

    explicit Connection(config::Reconnect policy = {},
                        std::chrono::milliseconds liveness = std::chrono::milliseconds{0})
    {
        WebSocketUnderTest::reset();
        make_connection(policy, liveness);
    }

    inline void make_connection(config::Reconnect policy = {},
                                std::chrono::milliseconds liveness = std::chrono::milliseconds{0})
    {
        connection = std::make_unique<ConnectionUnderTest>(telemetry, policy, liveness);
    }

    inline void destroy_connection() {
        connection.reset(); // ~Connection() runs here
    }

    inline void drain_signals() {
        if (!connection) {
            return;
        }
        connection::Signal sig;
        while (connection->poll_signal(sig)) {
            switch (sig) {
            case connection::Signal::Connected:
                ++connect_signals;
                break;
            case connection::Signal::Disconnected:
                ++disconnect_signals;
                break;
            case connection::Signal::RetryScheduled:
                ++retry_schedule_signals;
                break;
            case connection::Signal::Failed:
                ++failed_signals;
                break;
            case connection::Signal::None:
            default:
                break;
            }
            signals.push_back(sig);
        }
    }

    // Forces the pending retry due and runs one poll()
    inline void fire_retry() {
        connection->force_retry_due();
        connection->poll();
        drain_signals();
    }

    inline void reset_counters() {
        connect_signals = 0;
        disconnect_signals = 0;
        retry_schedule_signals = 0;
        failed_signals = 0;
        signals.clear();
    }
};

} // namespace harness

using ConnectionHarness = harness::Connection;

} // namespace cirisstream::core::transport::test
