#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <simdjson.h>

#include "cirisstream/core/protocol/ciris/parser/result.hpp"
#include "cirisstream/core/protocol/ciris/parser/helpers.hpp"
#include "cirisstream/core/protocol/ciris/schema/message.hpp"
#include "cirisstream/core/protocol/ciris/schema/error_notice.hpp"
#include "lcr/log/logger.hpp"


namespace cirisstream::core::protocol::ciris::parser {

/*
================================================================================
CIRIS Stream Frame Router
================================================================================

Classifies one inbound text frame and decodes it into its typed form.

  {"type":"pong", ...}                            → FrameKind::Pong
  {"type":"error","message":"..."}                → FrameKind::ErrorNotice
  {"channel":..,"event_type":..,"timestamp":..,
   "data":{..},"sequence":<int>}                  → FrameKind::Data
  any other well-formed object                    → Result::Ignored

Control frames are recognized by their "type" field before any data field
is inspected, so a control frame is never mistaken for a data message.

Failures are logged here with the offending frame and returned as a Result;
the caller only counts them and moves on.
================================================================================
*/

enum class FrameKind : std::uint8_t {
    None,
    Data,
    ErrorNotice,
    Pong
};

[[nodiscard]]
inline constexpr std::string_view to_string(FrameKind k) noexcept {
    switch (k) {
        case FrameKind::None:        return "None";
        case FrameKind::Data:        return "Data";
        case FrameKind::ErrorNotice: return "ErrorNotice";
        case FrameKind::Pong:        return "Pong";
        default:                     return "unknown";
    }
}

// Decoded frame. Only the member matching `kind` is meaningful.
struct Frame {
    FrameKind kind{FrameKind::None};
    schema::Message message;
    schema::ErrorNotice error;
};


class Router {
public:
    Router() = default;

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    // Main entry point
    [[nodiscard]]
    inline Result parse(std::string_view raw_msg, Frame& out) {
        out.kind = FrameKind::None;
        simdjson::dom::element root;
        auto error = parser_.parse(raw_msg.data(), raw_msg.size()).get(root);
        if (error) {
            CS_WARN("[PARSER] JSON parse error: " << error << " in message: " << raw_msg);
            return Result::InvalidJson;
        }
        if (helper::require_object(root) != Result::Ok) {
            CS_WARN("[PARSER] Frame is not a JSON object -> ignore message: " << raw_msg);
            return Result::InvalidSchema;
        }

        // CONTROL DISPATCH
        std::string_view type;
        bool has_type = false;
        if (helper::parse_string_optional(root, "type", type, has_type) != Result::Ok) {
            CS_WARN("[PARSER] Field 'type' has wrong type -> ignore message: " << raw_msg);
            return Result::InvalidSchema;
        }
        if (has_type) {
            if (type == "pong") {
                out.kind = FrameKind::Pong;
                return Result::Ok;
            }
            if (type == "error") {
                return parse_error_notice_(root, out);
            }
        }

        // DATA DISPATCH
        if (root["channel"].error()) {
            CS_DEBUG("[PARSER] Unrecognized frame -> ignore message: " << raw_msg);
            return Result::Ignored;
        }
        return parse_data_(root, raw_msg, out);
    }

private:
    // Underlying simdjson parser (reused across frames)
    simdjson::dom::parser parser_;

private:
    [[nodiscard]]
    inline Result parse_error_notice_(const simdjson::dom::element& root, Frame& out) {
        std::string_view message;
        bool present = false;
        if (helper::parse_string_optional(root, "message", message, present) != Result::Ok) {
            CS_WARN("[PARSER] Field 'message' has wrong type in error notice.");
            present = false;
        }
        out.error.message.assign(present ? message : std::string_view{"<no message>"});
        out.kind = FrameKind::ErrorNotice;
        return Result::Ok;
    }

    [[nodiscard]]
    inline Result parse_data_(const simdjson::dom::element& root, std::string_view raw_msg, Frame& out) {
        schema::Message& msg = out.message;

        // channel (required)
        std::string_view channel;
        if (helper::parse_string_required(root, "channel", channel) != Result::Ok || channel.empty()) {
            CS_WARN("[PARSER] Field 'channel' missing or invalid -> ignore message: " << raw_msg);
            return Result::InvalidSchema;
        }
        // event_type (required)
        std::string_view event_type;
        if (helper::parse_string_required(root, "event_type", event_type) != Result::Ok) {
            CS_WARN("[PARSER] Field 'event_type' missing or invalid -> ignore message: " << raw_msg);
            return Result::InvalidSchema;
        }
        // timestamp (required)
        auto r = helper::parse_timestamp_required(root, "timestamp", msg.timestamp);
        if (r != Result::Ok) {
            CS_WARN("[PARSER] Field 'timestamp' missing or invalid -> ignore message: " << raw_msg);
            return r;
        }
        // sequence (required)
        r = helper::parse_int64_required(root, "sequence", msg.sequence);
        if (r != Result::Ok) {
            CS_WARN("[PARSER] Field 'sequence' missing or invalid -> ignore message: " << raw_msg);
            return r;
        }
        // data (required object)
        simdjson::dom::object data;
        if (helper::parse_object_required(root, "data", data) != Result::Ok) {
            CS_WARN("[PARSER] Field 'data' missing or not an object -> ignore message: " << raw_msg);
            return Result::InvalidSchema;
        }
        (void)helper::capture_payload(data, msg.data, msg.payload);

        msg.channel.assign(channel);
        msg.event_type.assign(event_type);
        msg.epoch = 0;
        out.kind = FrameKind::Data;
        return Result::Ok;
    }
};

} // namespace cirisstream::core::protocol::ciris::parser
