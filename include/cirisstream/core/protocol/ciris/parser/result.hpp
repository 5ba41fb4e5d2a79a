#pragma once

#include <cstdint>
#include <string_view>


namespace cirisstream::core::protocol::ciris::parser {

// ===============================================
// PARSER RESULT ENUM
// ===============================================
enum class Result : std::uint8_t {
    Ok             = 0,            // Field or frame structurally valid
    Ignored        = 1,            // Well-formed but not applicable (unknown frame type)
    InvalidJson    = 2,            // Not JSON at all
    InvalidSchema  = 3,            // Missing required field, type mismatch, etc.
    InvalidValue   = 4             // Field present but semantically invalid
};

// -----------------------------------------------------------------------------
// Convert enum → string (for logging / diagnostics)
// -----------------------------------------------------------------------------
[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::Ok:             return "Ok";
        case Result::Ignored:        return "Ignored";
        case Result::InvalidJson:    return "InvalidJson";
        case Result::InvalidSchema:  return "InvalidSchema";
        case Result::InvalidValue:   return "InvalidValue";
        default:                     return "unknown";
    }
}

} // namespace cirisstream::core::protocol::ciris::parser
