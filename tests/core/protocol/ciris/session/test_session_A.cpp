/*
===============================================================================
 ciris::Session: Group A Unit Tests (subscription replay)
===============================================================================

Covered Requirements:
---------------------
A1. Subscriptions made before connecting are sent once on connect
A2. Every reconnect replays the desired set exactly once, including
    changes made while offline
A3. No replay frame when nothing is subscribed
A4. Live changes and user frames are flushed in FIFO order
A5. A replay that cannot be sent recycles the transport; the next
    connection replays again
===============================================================================
*/

#include <iostream>
#include <string>

#include "common/harness/session.hpp"

using cirisstream::core::protocol::ciris::test::SessionHarness;


static schema::Filter level(const char* lvl) {
    schema::Filter f;
    f.level = std::string(lvl);
    return f;
}

// -----------------------------------------------------------------------------
// Group A1
// -----------------------------------------------------------------------------
void test_initial_subscriptions_sent_on_connect() {
    std::cout << "[TEST] Group A1: subscriptions sent on connect\n";
    SessionHarness h;

    h.session.subscribe("reasoning");
    h.session.subscribe("logs", level("WARNING"));
    TEST_CHECK(WebSocketUnderTest::sent_frames().empty());

    TEST_CHECK(h.connect() == transport::Error::None);
    TEST_CHECK(h.session.state() == transport::State::Connected);

    const auto frames = SessionHarness::control_frames();
    TEST_CHECK(frames.size() == 1);
    TEST_CHECK(frames[0] ==
        R"({"action":"subscribe","channels":{"reasoning":{},"logs":{"level":"WARNING"}}})");

    // Nothing more on later pumps
    h.pump(5);
    TEST_CHECK(SessionHarness::control_frames().size() == 1);
    TEST_CHECK(h.session.telemetry().replays_total.load() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group A2
// -----------------------------------------------------------------------------
void test_replay_once_per_reconnect() {
    std::cout << "[TEST] Group A2: replay once per reconnect\n";
    SessionHarness h;

    h.session.subscribe("reasoning");
    TEST_CHECK(h.connect() == transport::Error::None);

    h.session.subscribe("telemetry");  // live: its own frame
    h.pump();
    TEST_CHECK(SessionHarness::control_frames().size() == 2);

    h.drop();
    TEST_CHECK(h.session.state() == transport::State::Reconnecting);

    // Offline edits
    h.session.subscribe("logs", level("ERROR"));
    h.session.unsubscribe({"reasoning"});
    h.pump(3);
    TEST_CHECK(SessionHarness::control_frames().size() == 2);

    WebSocketUnderTest::clear_sent();
    h.reconnect();
    TEST_CHECK(h.session.state() == transport::State::Connected);
    TEST_CHECK(h.session.epoch() == 2);

    const auto frames = SessionHarness::control_frames();
    TEST_CHECK(frames.size() == 1);
    TEST_CHECK(frames[0] ==
        R"({"action":"subscribe","channels":{"telemetry":{},"logs":{"level":"ERROR"}}})");

    // Byte-identical on the next reconnect
    WebSocketUnderTest::clear_sent();
    h.drop();
    h.reconnect();
    const auto again = SessionHarness::control_frames();
    TEST_CHECK(again.size() == 1);
    TEST_CHECK(again[0] == frames[0]);
    TEST_CHECK(h.session.telemetry().replays_total.load() == 3);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group A3
// -----------------------------------------------------------------------------
void test_no_replay_without_subscriptions() {
    std::cout << "[TEST] Group A3: no replay without subscriptions\n";
    SessionHarness h;

    TEST_CHECK(h.connect() == transport::Error::None);
    h.drop();
    h.reconnect();
    h.pump(2);

    TEST_CHECK(SessionHarness::control_frames().empty());
    TEST_CHECK(h.session.telemetry().replays_total.load() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group A4
// -----------------------------------------------------------------------------
void test_live_frames_fifo() {
    std::cout << "[TEST] Group A4: live frames in FIFO order\n";
    SessionHarness h;

    TEST_CHECK(h.connect() == transport::Error::None);

    h.session.subscribe("logs");
    TEST_CHECK(h.session.send(R"({"type":"custom","n":1})"));
    h.session.unsubscribe({"logs"});
    h.pump();

    const auto frames = SessionHarness::control_frames();
    TEST_CHECK(frames.size() == 3);
    TEST_CHECK(frames[0] == R"({"action":"subscribe","channels":{"logs":{}}})");
    TEST_CHECK(frames[1] == R"({"type":"custom","n":1})");
    TEST_CHECK(frames[2] == R"({"action":"unsubscribe","channels":["logs"]})");

    // Not accepted while offline
    h.drop();
    TEST_CHECK(!h.session.send("{}"));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group A5
// -----------------------------------------------------------------------------
void test_replay_send_failure() {
    std::cout << "[TEST] Group A5: replay send failure\n";
    SessionHarness h;

    h.session.subscribe("reasoning");
    TEST_CHECK(h.connect() == transport::Error::None);
    h.drop();

    WebSocketUnderTest::set_send_result(false);
    h.reconnect();
    TEST_CHECK(h.session.state() == transport::State::Reconnecting);
    TEST_CHECK(h.session.last_error() == transport::Error::SendFailed);

    WebSocketUnderTest::set_send_result(true);
    WebSocketUnderTest::clear_sent();
    h.reconnect();
    TEST_CHECK(h.session.state() == transport::State::Connected);

    const auto frames = SessionHarness::control_frames();
    TEST_CHECK(frames.size() == 1);
    TEST_CHECK(frames[0] == R"({"action":"subscribe","channels":{"reasoning":{}}})");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_initial_subscriptions_sent_on_connect();
    test_replay_once_per_reconnect();
    test_no_replay_without_subscriptions();
    test_live_frames_fifo();
    test_replay_send_failure();

    std::cout << "\n[GROUP A - SESSION REPLAY TESTS PASSED]\n";
    return 0;
}
