/*
===============================================================================
 ciris::subscription::Manager: Unit Tests
===============================================================================

Covered Requirements:
---------------------
M1. Offline changes update the desired set without queueing frames
M2. on_connected() replays the whole set once, in insertion order
M3. While live, subscribe/unsubscribe queue exactly their own frame
M4. Re-subscribing replaces the filter; unsubscribe removes the channel
M5. Offline edits fold into the next replay (no duplicates, no removed
    channels)
M6. Stale control frames are discarded on reconnect
M7. Arbitrary frames are only accepted while live
M8. Empty set: nothing to replay
===============================================================================
*/

#include <iostream>
#include <string>
#include <vector>

#include "cirisstream/core/protocol/ciris/subscription/manager.hpp"
#include "common/test_check.hpp"

using namespace cirisstream::core::protocol::ciris;


static schema::Filter level(const char* lvl) {
    schema::Filter f;
    f.level = std::string(lvl);
    return f;
}

void test_offline_changes() {
    std::cout << "[TEST] Group M1: offline changes\n";

    subscription::Manager mgr;
    mgr.subscribe("reasoning");
    mgr.subscribe("logs", level("INFO"));

    TEST_CHECK(!mgr.live());
    TEST_CHECK(mgr.size() == 2);
    TEST_CHECK(mgr.contains("logs"));
    TEST_CHECK(mgr.take_outbox().empty());

    std::cout << "[TEST] OK\n";
}

void test_replay_on_connect() {
    std::cout << "[TEST] Group M2: replay on connect\n";

    subscription::Manager mgr;
    mgr.subscribe("reasoning");
    mgr.subscribe("logs", level("INFO"));

    auto replay = mgr.on_connected();
    TEST_CHECK(replay.has());
    TEST_CHECK(replay.value().to_json() ==
        R"({"action":"subscribe","channels":{"reasoning":{},"logs":{"level":"INFO"}}})");
    TEST_CHECK(mgr.live());
    TEST_CHECK(mgr.take_outbox().empty());

    std::cout << "[TEST] OK\n";
}

void test_live_changes_queue_frames() {
    std::cout << "[TEST] Group M3: live changes queue their own frame\n";

    subscription::Manager mgr;
    (void)mgr.on_connected();

    mgr.subscribe("telemetry");
    mgr.unsubscribe({"telemetry"});

    auto frames = mgr.take_outbox();
    TEST_CHECK(frames.size() == 2);
    TEST_CHECK(frames[0] == R"({"action":"subscribe","channels":{"telemetry":{}}})");
    TEST_CHECK(frames[1] == R"({"action":"unsubscribe","channels":["telemetry"]})");
    TEST_CHECK(mgr.take_outbox().empty());
    TEST_CHECK(mgr.size() == 0);

    std::cout << "[TEST] OK\n";
}

void test_replace_and_remove() {
    std::cout << "[TEST] Group M4: replace filter, remove channel\n";

    subscription::Manager mgr;
    mgr.subscribe("logs", level("INFO"));
    mgr.subscribe("telemetry");
    mgr.subscribe("logs", level("ERROR"));
    mgr.unsubscribe({"telemetry", "unknown"});

    const auto snap = mgr.snapshot();
    TEST_CHECK(snap.size() == 1);
    TEST_CHECK(snap.channels[0].channel == "logs");
    TEST_CHECK(snap.channels[0].filter.value() == level("ERROR"));
    TEST_CHECK(!mgr.contains("telemetry"));

    std::cout << "[TEST] OK\n";
}

void test_offline_edits_fold_into_replay() {
    std::cout << "[TEST] Group M5: offline edits fold into replay\n";

    subscription::Manager mgr;
    mgr.subscribe("reasoning");
    mgr.subscribe("logs", level("INFO"));
    (void)mgr.on_connected();
    mgr.on_disconnected();

    // While offline
    mgr.subscribe("logs", level("WARNING"));
    mgr.unsubscribe({"reasoning"});
    mgr.subscribe("telemetry");
    mgr.subscribe("telemetry");
    TEST_CHECK(mgr.take_outbox().empty());

    auto replay = mgr.on_connected();
    TEST_CHECK(replay.has());
    TEST_CHECK(replay.value().to_json() ==
        R"({"action":"subscribe","channels":{"logs":{"level":"WARNING"},"telemetry":{}}})");

    std::cout << "[TEST] OK\n";
}

void test_stale_frames_discarded() {
    std::cout << "[TEST] Group M6: stale frames discarded on reconnect\n";

    subscription::Manager mgr;
    (void)mgr.on_connected();
    mgr.subscribe("logs");
    TEST_CHECK(mgr.enqueue(R"({"type":"custom"})"));

    // The connection dropped before the pump flushed
    auto replay = mgr.on_connected();
    TEST_CHECK(replay.has());
    TEST_CHECK(replay.value().size() == 1);
    TEST_CHECK(mgr.take_outbox().empty());

    std::cout << "[TEST] OK\n";
}

void test_enqueue_requires_live() {
    std::cout << "[TEST] Group M7: arbitrary frames require a live connection\n";

    subscription::Manager mgr;
    TEST_CHECK(!mgr.enqueue("{}"));
    (void)mgr.on_connected();
    TEST_CHECK(mgr.enqueue("{}"));
    mgr.on_disconnected();
    TEST_CHECK(!mgr.enqueue("{}"));
    TEST_CHECK(mgr.take_outbox().empty());

    std::cout << "[TEST] OK\n";
}

void test_empty_set_no_replay() {
    std::cout << "[TEST] Group M8: empty set\n";

    subscription::Manager mgr;
    TEST_CHECK(!mgr.on_connected().has());

    mgr.subscribe("logs");
    mgr.clear();
    TEST_CHECK(mgr.size() == 0);
    TEST_CHECK(!mgr.live());
    TEST_CHECK(!mgr.on_connected().has());

    // Empty requests are ignored
    mgr.subscribe(schema::Subscribe{});
    mgr.unsubscribe({});
    TEST_CHECK(mgr.take_outbox().empty());

    std::cout << "[TEST] OK\n";
}

#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_offline_changes();
    test_replay_on_connect();
    test_live_changes_queue_frames();
    test_replace_and_remove();
    test_offline_edits_fold_into_replay();
    test_stale_frames_discarded();
    test_enqueue_requires_live();
    test_empty_set_no_replay();

    std::cout << "\n[GROUP M - SUBSCRIPTION MANAGER TESTS PASSED]\n";
    return 0;
}
