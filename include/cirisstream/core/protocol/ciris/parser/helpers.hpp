#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "cirisstream/core/protocol/ciris/parser/result.hpp"
#include "cirisstream/core/protocol/ciris/schema/message.hpp"
#include "cirisstream/core/timestamp.hpp"

#include "simdjson.h"

/*
================================================================================
CIRIS JSON Parsing Helpers (Low-Level Primitives)
================================================================================

Helpers extract primitive JSON values from simdjson DOM elements.

Responsibilities:
  • Enforce basic JSON structural rules (object presence, type correctness)
  • Parse primitive field types (string, integer, timestamp)
  • Capture raw JSON text of opaque values

Helpers never interpret values, never log and never throw. Callers decide
what a failure means for the frame as a whole.
================================================================================
*/


namespace cirisstream::core::protocol::ciris::parser::helper {

// ============================================================================
// ROOT TYPE
// ============================================================================

[[nodiscard]]
inline Result require_object(const simdjson::dom::element& root) noexcept {
    return (root.type() == simdjson::dom::element_type::OBJECT) ? Result::Ok : Result::InvalidSchema;
}

// ------------------------------------------------------------
// REQUIRED OBJECT FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_object_required(const simdjson::dom::element& parent, const char* key, simdjson::dom::object& out) noexcept {
    if (require_object(parent) != Result::Ok) {
        return Result::InvalidSchema;
    }
    if (parent[key].get(out)) {
        return Result::InvalidSchema; // missing or not an object
    }
    return Result::Ok;
}

// ------------------------------------------------------------
// REQUIRED STRING FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_string_required(const simdjson::dom::element& obj, const char* key, std::string_view& out) noexcept {
    if (require_object(obj) != Result::Ok) {
        return Result::InvalidSchema;
    }
    if (obj[key].get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Ok;
}

// ------------------------------------------------------------
// OPTIONAL STRING FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_string_optional(const simdjson::dom::element& obj, const char* key, std::string_view& out, bool& present) noexcept {
    present = false;
    if (require_object(obj) != Result::Ok) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::Ok; // optional, not present
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    present = true;
    return Result::Ok;
}

// ------------------------------------------------------------
// REQUIRED INTEGER FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_int64_required(const simdjson::dom::element& obj, const char* key, std::int64_t& out) noexcept {
    if (require_object(obj) != Result::Ok) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidValue; // wrong type, fraction or out of range
    }
    return Result::Ok;
}

// ------------------------------------------------------------
// REQUIRED TIMESTAMP FIELD (ISO-8601, normalized to UTC)
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_timestamp_required(const simdjson::dom::element& obj, const char* key, Timestamp& out) noexcept {
    std::string_view sv;
    auto r = parse_string_required(obj, key, sv);
    if (r != Result::Ok) {
        return r;
    }
    if (!parse_iso8601(sv, out)) {
        return Result::InvalidValue;
    }
    return Result::Ok;
}

// ------------------------------------------------------------
// OPAQUE OBJECT → raw text + key/raw-value map
// ------------------------------------------------------------
[[nodiscard]]
inline Result capture_payload(const simdjson::dom::object& obj, std::string& raw, schema::Payload& out) {
    raw = simdjson::minify(obj);
    out.clear();
    for (auto field : obj) {
        out.emplace(std::string(field.key), simdjson::minify(field.value));
    }
    return Result::Ok;
}

} // namespace cirisstream::core::protocol::ciris::parser::helper
