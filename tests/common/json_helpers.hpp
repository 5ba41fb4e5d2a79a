#pragma once

#include <string>
#include <cstdint>

// ----------------------------------------------------------------------------
// Inbound frames as the stream server sends them
// ----------------------------------------------------------------------------

namespace json::frame {

static std::string data(const std::string& channel,
                        std::int64_t sequence,
                        const std::string& payload = R"({"value":1})",
                        const std::string& event_type = "update") {
    return R"({"channel":")" + channel +
           R"(","event_type":")" + event_type +
           R"(","timestamp":"2025-01-15T10:30:00Z","data":)" + payload +
           R"(,"sequence":)" + std::to_string(sequence) + "}";
}

static std::string pong() {
    return R"({"type":"pong","timestamp":"2025-01-15T10:30:00Z"})";
}

static std::string error(const std::string& message) {
    return R"({"type":"error","message":")" + message + R"("})";
}

} // namespace json::frame
