#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "lcr/json.hpp"


namespace cirisstream::core::protocol::ciris::schema {

// {"action":"unsubscribe","channels":["<channel>",...]}
struct Unsubscribe {
    std::vector<std::string> channels;

    inline void write_json(std::string& out) const {
        static constexpr std::string_view prefix = "{\"action\":\"unsubscribe\",\"channels\":[";
        out += prefix;
        for (std::size_t i = 0; i < channels.size(); ++i) {
            if (i) out += ',';
            lcr::json::append_string(out, channels[i]);
        }
        out += "]}";
    }

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out;
        write_json(out);
        return out;
    }
};

} // namespace cirisstream::core::protocol::ciris::schema
