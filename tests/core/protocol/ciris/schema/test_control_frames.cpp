#include <iostream>
#include <string>
#include <vector>

#include "cirisstream/core/protocol/ciris/schema/filter.hpp"
#include "cirisstream/core/protocol/ciris/schema/subscribe.hpp"
#include "cirisstream/core/protocol/ciris/schema/unsubscribe.hpp"
#include "cirisstream/core/protocol/ciris/schema/ping.hpp"
#include "cirisstream/core/timestamp.hpp"
#include "common/test_check.hpp"

using namespace cirisstream::core;
using namespace cirisstream::core::protocol::ciris;

/*
================================================================================
CIRIS Control Frames: Unit Tests
================================================================================

These tests validate JSON serialization of the frames the client sends:
subscribe (with per-channel filters), unsubscribe and the heartbeat ping.

Design goals enforced by this test suite:
  • Deterministic JSON output (same request, same bytes)
  • Absent filter fields never appear in the payload
  • Unfiltered channels are written as an empty object
  • Strings are escaped
================================================================================
*/

void test_empty_filter() {
    std::cout << "[TEST] Filter (empty)..." << std::endl;

    schema::Filter f;
    TEST_CHECK(f.empty());
    TEST_CHECK(f.to_json() == "{}");

    std::cout << "[TEST] OK\n";
}

void test_full_filter_field_order() {
    std::cout << "[TEST] Filter (all fields, fixed order)..." << std::endl;

    schema::Filter f;
    f.min_depth = std::int64_t{2};
    f.task_id = std::string("task-42");
    f.author = std::string("alice");
    f.service = std::string("llm");
    f.level = std::string("WARNING");
    f.metrics = std::vector<std::string>{"cpu", "memory"};
    f.services = std::vector<std::string>{"llm", "memory"};

    TEST_CHECK(!f.empty());
    TEST_CHECK(f.to_json() ==
        R"({"services":["llm","memory"],"metrics":["cpu","memory"],"level":"WARNING",)"
        R"("service":"llm","author":"alice","task_id":"task-42","min_depth":2})");

    std::cout << "[TEST] OK\n";
}

void test_partial_filter() {
    std::cout << "[TEST] Filter (partial)..." << std::endl;

    schema::Filter f;
    f.level = std::string("ERROR");

    const std::string json = f.to_json();
    TEST_CHECK(json == R"({"level":"ERROR"})");
    TEST_CHECK(json.find("\"services\"") == std::string::npos);
    TEST_CHECK(json.find("\"min_depth\"") == std::string::npos);

    // An explicitly empty list is still present
    schema::Filter g;
    g.services = std::vector<std::string>{};
    TEST_CHECK(g.to_json() == R"({"services":[]})");

    std::cout << "[TEST] OK\n";
}

void test_filter_escaping() {
    std::cout << "[TEST] Filter (string escaping)..." << std::endl;

    schema::Filter f;
    f.author = std::string("a\"b\\c");
    TEST_CHECK(f.to_json() == R"({"author":"a\"b\\c"})");

    std::cout << "[TEST] OK\n";
}

void test_subscribe_frame() {
    std::cout << "[TEST] Subscribe (mixed filters)..." << std::endl;

    schema::Filter logs;
    logs.level = std::string("WARNING");

    schema::Subscribe sub;
    sub.add("reasoning");
    sub.add("logs", logs);

    TEST_CHECK(sub.size() == 2);
    TEST_CHECK(sub.to_json() ==
        R"({"action":"subscribe","channels":{"reasoning":{},"logs":{"level":"WARNING"}}})");

    std::cout << "[TEST] OK\n";
}

void test_subscribe_replaces_in_place() {
    std::cout << "[TEST] Subscribe (re-adding a channel replaces its filter)..." << std::endl;

    schema::Filter warn;
    warn.level = std::string("WARNING");
    schema::Filter err;
    err.level = std::string("ERROR");

    schema::Subscribe sub;
    sub.add("logs", warn);
    sub.add("telemetry");
    sub.add("logs", err);

    TEST_CHECK(sub.size() == 2);
    TEST_CHECK(sub.channels[0].channel == "logs");
    TEST_CHECK(sub.channels[0].filter.value() == err);
    TEST_CHECK(sub.to_json() ==
        R"({"action":"subscribe","channels":{"logs":{"level":"ERROR"},"telemetry":{}}})");

    std::cout << "[TEST] OK\n";
}

void test_subscribe_deterministic() {
    std::cout << "[TEST] Subscribe (equal requests serialize identically)..." << std::endl;

    auto build = [] {
        schema::Filter f;
        f.services = std::vector<std::string>{"llm"};
        f.min_depth = std::int64_t{1};
        schema::Subscribe s;
        s.add("telemetry", f);
        s.add("reasoning");
        return s;
    };

    const schema::Subscribe a = build();
    const schema::Subscribe b = build();
    TEST_CHECK(a == b);
    TEST_CHECK(a.to_json() == b.to_json());

    std::cout << "[TEST] OK\n";
}

void test_unsubscribe_frame() {
    std::cout << "[TEST] Unsubscribe..." << std::endl;

    schema::Unsubscribe u{{"logs", "telemetry"}};
    TEST_CHECK(u.to_json() == R"({"action":"unsubscribe","channels":["logs","telemetry"]})");

    schema::Unsubscribe none;
    TEST_CHECK(none.to_json() == R"({"action":"unsubscribe","channels":[]})");

    std::cout << "[TEST] OK\n";
}

void test_ping_frame() {
    std::cout << "[TEST] Ping..." << std::endl;

    Timestamp ts;
    TEST_CHECK(parse_iso8601("2025-01-15T10:30:00.250Z", ts));

    schema::Ping ping{ts};
    TEST_CHECK(ping.to_json() == R"({"type":"ping","timestamp":"2025-01-15T10:30:00.250000Z"})");

    std::cout << "[TEST] OK\n";
}

int main() {
    test_empty_filter();
    test_full_filter_field_order();
    test_partial_filter();
    test_filter_escaping();
    test_subscribe_frame();
    test_subscribe_replaces_in_place();
    test_subscribe_deterministic();
    test_unsubscribe_frame();
    test_ping_frame();

    std::cout << "\n[CIRIS CONTROL FRAME TESTS PASSED]\n";
    return 0;
}
