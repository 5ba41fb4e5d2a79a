#pragma once

#include <map>
#include <string>
#include <cstdint>
#include <ostream>

#include "cirisstream/core/timestamp.hpp"


namespace cirisstream::core::protocol::ciris::schema {

// Opaque event body: top-level key of "data" -> raw JSON text of its value
// (strings keep their quotes). The client does not interpret payloads.
using Payload = std::map<std::string, std::string>;

// ===============================================
// Inbound data message
// ===============================================
struct Message {
    std::string channel;
    std::string event_type;
    Timestamp timestamp{};
    Payload payload;
    std::string data;                 // raw JSON text of the "data" object
    std::int64_t sequence{0};
    std::uint64_t epoch{0};           // connection epoch it was received in

    // Raw JSON text of payload key `key`, or nullptr when absent
    [[nodiscard]]
    inline const std::string* find(const std::string& key) const {
        auto it = payload.find(key);
        return (it == payload.end()) ? nullptr : &it->second;
    }

    inline void dump(std::ostream& os) const {
        os << "[MESSAGE] {channel=" << channel
           << ", event_type=" << event_type
           << ", timestamp=" << core::to_string(timestamp)
           << ", sequence=" << sequence
           << ", epoch=" << epoch
           << ", data=" << data
           << "}";
    }
};

inline std::ostream& operator<<(std::ostream& os, const Message& msg) {
    msg.dump(os);
    return os;
}

} // namespace cirisstream::core::protocol::ciris::schema
