#pragma once

#include <string>
#include <string_view>

#include "cirisstream/core/timestamp.hpp"
#include "lcr/json.hpp"


namespace cirisstream::core::protocol::ciris::schema {

// Application-level heartbeat: {"type":"ping","timestamp":"<ISO-8601 UTC>"}
struct Ping {
    Timestamp timestamp{};

    inline void write_json(std::string& out) const {
        static constexpr std::string_view prefix = "{\"type\":\"ping\",\"timestamp\":";
        out += prefix;
        lcr::json::append_string(out, core::to_string(timestamp));
        out += '}';
    }

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out;
        write_json(out);
        return out;
    }
};

} // namespace cirisstream::core::protocol::ciris::schema
