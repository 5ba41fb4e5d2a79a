/*
===============================================================================
 Session Test Harness
===============================================================================

Owns a delivery queue and a Session over the MockWebSocket. Everything runs
on the test thread; timers are forced due through CS_UNIT_TEST hooks.
===============================================================================
*/
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "cirisstream/core/config/client.hpp"
#include "cirisstream/core/delivery/queue.hpp"
#include "cirisstream/core/protocol/ciris/session.hpp"
#include "cirisstream/core/protocol/ciris/schema/message.hpp"
#include "common/mock_websocket.hpp"
#include "common/json_helpers.hpp"
#include "common/test_check.hpp"


// -----------------------------------------------------------------------------
// Setup environment
// -----------------------------------------------------------------------------
using namespace cirisstream::core;
using namespace cirisstream::core::protocol::ciris;

using WebSocketUnderTest = transport::test::MockWebSocket;
using SessionUnderTest = Session<WebSocketUnderTest>;
using MessageQueue = delivery::Queue<schema::Message>;


namespace cirisstream::core::protocol::ciris::test {
namespace harness {

inline config::Client default_config() {
    config::Client cfg;
    cfg.endpoint = "https://agent.example.com";
    cfg.api_key = "secret-token";
    return cfg;
}

struct Session {
    config::Client cfg;
    MessageQueue queue;
    SessionUnderTest session;

    explicit Session(config::Client c = default_config())
        : cfg(c)
        , queue(cfg.backpressure)
        , session((WebSocketUnderTest::reset(), queue), cfg)
    {
    }

    // Connect and process the Connected edge (replay, heartbeat arm)
    inline transport::Error connect() {
        const auto err = session.connect();
        (void)session.poll();
        return err;
    }

    // Remote close, then one poll to observe the loss
    inline void drop() {
        WebSocketUnderTest::emit_close();
        (void)session.poll();
    }

    // Forces the pending retry due and polls until the Connected edge is handled
    inline void reconnect() {
        session.connection().force_retry_due();
        (void)session.poll();
    }

    inline std::size_t pump(int steps = 1) {
        std::size_t handled = 0;
        for (int i = 0; i < steps; ++i) {
            handled += session.poll();
        }
        return handled;
    }

    inline std::vector<schema::Message> drain_queue() {
        std::vector<schema::Message> out;
        schema::Message msg;
        while (queue.try_pop(msg)) {
            out.push_back(msg);
        }
        return out;
    }

    // Frames sent by the session, excluding heartbeats
    static inline std::vector<std::string> control_frames() {
        std::vector<std::string> out;
        for (auto& f : WebSocketUnderTest::sent_frames()) {
            if (f.find("\"type\":\"ping\"") == std::string::npos) {
                out.push_back(f);
            }
        }
        return out;
    }
};

} // namespace harness

using SessionHarness = harness::Session;

} // namespace cirisstream::core::protocol::ciris::test
