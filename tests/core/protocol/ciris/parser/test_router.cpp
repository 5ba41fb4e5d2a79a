#include <iostream>
#include <string>

#include "cirisstream/core/protocol/ciris/parser/router.hpp"
#include "cirisstream/core/timestamp.hpp"
#include "common/json_helpers.hpp"
#include "common/test_check.hpp"

using namespace cirisstream::core;
using namespace cirisstream::core::protocol::ciris;
using parser::FrameKind;
using parser::Result;

/*
================================================================================
CIRIS Frame Router: Unit Tests
================================================================================

Validates classification and decoding of inbound frames.

  • Data messages decode channel, event_type, timestamp, sequence and the
    opaque data object
  • Control frames ("pong", "error") are recognized by their type field
  • Malformed frames are rejected with a Result, never delivered
  • Unknown but well-formed frames are ignored
================================================================================
*/

void test_data_message() {
    std::cout << "[TEST] Router: data message..." << std::endl;

    parser::Router router;
    parser::Frame frame;

    const std::string raw = json::frame::data("reasoning", 7,
        R"({"thought":"hello","depth":3,"tags":["a","b"]})", "thought");
    TEST_CHECK(router.parse(raw, frame) == Result::Ok);
    TEST_CHECK(frame.kind == FrameKind::Data);

    const auto& msg = frame.message;
    TEST_CHECK(msg.channel == "reasoning");
    TEST_CHECK(msg.event_type == "thought");
    TEST_CHECK(msg.sequence == 7);
    TEST_CHECK(msg.epoch == 0);
    TEST_CHECK(cirisstream::core::to_string(msg.timestamp) == "2025-01-15T10:30:00.000000Z");

    TEST_CHECK(msg.data == R"({"thought":"hello","depth":3,"tags":["a","b"]})");
    TEST_CHECK(msg.payload.size() == 3);
    TEST_CHECK(msg.find("thought") != nullptr);
    TEST_CHECK(*msg.find("thought") == "\"hello\"");
    TEST_CHECK(*msg.find("depth") == "3");
    TEST_CHECK(*msg.find("tags") == R"(["a","b"])");
    TEST_CHECK(msg.find("missing") == nullptr);

    std::cout << "[TEST] OK\n";
}

void test_timestamp_offset_normalized() {
    std::cout << "[TEST] Router: timestamp offset normalized to UTC..." << std::endl;

    parser::Router router;
    parser::Frame frame;

    const std::string raw =
        R"({"channel":"logs","event_type":"log","timestamp":"2025-01-15T12:30:00.5+02:00",)"
        R"("data":{},"sequence":1})";
    TEST_CHECK(router.parse(raw, frame) == Result::Ok);
    TEST_CHECK(cirisstream::core::to_string(frame.message.timestamp) == "2025-01-15T10:30:00.500000Z");
    TEST_CHECK(frame.message.data == "{}");
    TEST_CHECK(frame.message.payload.empty());

    std::cout << "[TEST] OK\n";
}

void test_timestamp_variants() {
    std::cout << "[TEST] Router: naive and compact-offset timestamps..." << std::endl;

    parser::Router router;
    parser::Frame frame;

    const auto with_ts = [](const std::string& ts) {
        return R"({"channel":"logs","event_type":"log","timestamp":")" + ts +
               R"(","data":{},"sequence":1})";
    };

    // No zone designator: taken as UTC
    TEST_CHECK(router.parse(with_ts("2025-07-01T12:00:00"), frame) == Result::Ok);
    TEST_CHECK(cirisstream::core::to_string(frame.message.timestamp) == "2025-07-01T12:00:00.000000Z");

    TEST_CHECK(router.parse(with_ts("2025-07-01T12:00:00.123456"), frame) == Result::Ok);
    TEST_CHECK(cirisstream::core::to_string(frame.message.timestamp) == "2025-07-01T12:00:00.123456Z");

    // Offsets without a colon
    TEST_CHECK(router.parse(with_ts("2025-07-01T12:00:00+0000"), frame) == Result::Ok);
    TEST_CHECK(cirisstream::core::to_string(frame.message.timestamp) == "2025-07-01T12:00:00.000000Z");

    TEST_CHECK(router.parse(with_ts("2025-07-01T12:00:00.25-0130"), frame) == Result::Ok);
    TEST_CHECK(cirisstream::core::to_string(frame.message.timestamp) == "2025-07-01T13:30:00.250000Z");

    // Still rejected
    TEST_CHECK(router.parse(with_ts("2025-07-01T12:00:00+00"), frame) == Result::InvalidValue);
    TEST_CHECK(router.parse(with_ts("2025-07-01T12:00:00+00:0"), frame) == Result::InvalidValue);
    TEST_CHECK(router.parse(with_ts("2025-07-01T12:00:00 UTC"), frame) == Result::InvalidValue);
    TEST_CHECK(router.parse(with_ts("2025-07-01T12:00"), frame) == Result::InvalidValue);

    std::cout << "[TEST] OK\n";
}

void test_pong_and_error() {
    std::cout << "[TEST] Router: control frames..." << std::endl;

    parser::Router router;
    parser::Frame frame;

    TEST_CHECK(router.parse(json::frame::pong(), frame) == Result::Ok);
    TEST_CHECK(frame.kind == FrameKind::Pong);

    TEST_CHECK(router.parse(json::frame::error("channel not allowed"), frame) == Result::Ok);
    TEST_CHECK(frame.kind == FrameKind::ErrorNotice);
    TEST_CHECK(frame.error.message == "channel not allowed");

    // An error notice without message is still an error notice
    TEST_CHECK(router.parse(R"({"type":"error"})", frame) == Result::Ok);
    TEST_CHECK(frame.kind == FrameKind::ErrorNotice);
    TEST_CHECK(!frame.error.message.empty());

    // A control type wins over data fields
    TEST_CHECK(router.parse(R"({"type":"pong","channel":"logs","sequence":1})", frame) == Result::Ok);
    TEST_CHECK(frame.kind == FrameKind::Pong);

    std::cout << "[TEST] OK\n";
}

void test_malformed_frames() {
    std::cout << "[TEST] Router: malformed frames..." << std::endl;

    parser::Router router;
    parser::Frame frame;

    TEST_CHECK(router.parse("{not json", frame) == Result::InvalidJson);
    TEST_CHECK(frame.kind == FrameKind::None);

    TEST_CHECK(router.parse("[1,2,3]", frame) == Result::InvalidSchema);
    TEST_CHECK(router.parse("42", frame) == Result::InvalidSchema);

    // Missing sequence
    TEST_CHECK(router.parse(
        R"({"channel":"logs","event_type":"log","timestamp":"2025-01-15T10:30:00Z","data":{}})",
        frame) == Result::InvalidSchema);

    // Sequence with the wrong type
    TEST_CHECK(router.parse(
        R"({"channel":"logs","event_type":"log","timestamp":"2025-01-15T10:30:00Z","data":{},"sequence":"5"})",
        frame) == Result::InvalidValue);

    // Unparseable timestamp
    TEST_CHECK(router.parse(
        R"({"channel":"logs","event_type":"log","timestamp":"yesterday","data":{},"sequence":5})",
        frame) == Result::InvalidValue);

    // data is not an object
    TEST_CHECK(router.parse(
        R"({"channel":"logs","event_type":"log","timestamp":"2025-01-15T10:30:00Z","data":[1],"sequence":5})",
        frame) == Result::InvalidSchema);

    // Missing event_type
    TEST_CHECK(router.parse(
        R"({"channel":"logs","timestamp":"2025-01-15T10:30:00Z","data":{},"sequence":5})",
        frame) == Result::InvalidSchema);

    TEST_CHECK(frame.kind == FrameKind::None);

    std::cout << "[TEST] OK\n";
}

void test_unknown_frames_ignored() {
    std::cout << "[TEST] Router: unknown frames..." << std::endl;

    parser::Router router;
    parser::Frame frame;

    TEST_CHECK(router.parse(R"({"type":"welcome","version":1})", frame) == Result::Ignored);
    TEST_CHECK(router.parse(R"({"status":"ok"})", frame) == Result::Ignored);
    TEST_CHECK(frame.kind == FrameKind::None);

    std::cout << "[TEST] OK\n";
}

void test_router_reuse() {
    std::cout << "[TEST] Router: reuse across frames..." << std::endl;

    parser::Router router;
    parser::Frame frame;

    for (int i = 1; i <= 50; ++i) {
        TEST_CHECK(router.parse(json::frame::data("telemetry", i), frame) == Result::Ok);
        TEST_CHECK(frame.message.sequence == i);
        TEST_CHECK(*frame.message.find("value") == "1");
    }

    std::cout << "[TEST] OK\n";
}

#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_data_message();
    test_timestamp_offset_normalized();
    test_timestamp_variants();
    test_pong_and_error();
    test_malformed_frames();
    test_unknown_frames_ignored();
    test_router_reuse();

    std::cout << "\n[CIRIS ROUTER TESTS PASSED]\n";
    return 0;
}
