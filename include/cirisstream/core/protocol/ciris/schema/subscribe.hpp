#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "cirisstream/core/protocol/ciris/schema/filter.hpp"
#include "lcr/json.hpp"
#include "lcr/optional.hpp"


namespace cirisstream::core::protocol::ciris::schema {

// One channel of a subscribe frame. An absent filter means "unrestricted"
// and is written as {}.
struct ChannelSubscription {
    std::string channel;
    lcr::optional<Filter> filter{};

    friend inline bool operator==(const ChannelSubscription& a, const ChannelSubscription& b) {
        return a.channel == b.channel && a.filter == b.filter;
    }
};

// {"action":"subscribe","channels":{"<channel>":<filter>,...}}
//
// Channels keep insertion order. Adding a channel that is already present
// replaces its filter in place.
struct Subscribe {
    std::vector<ChannelSubscription> channels;

    inline void add(std::string channel, lcr::optional<Filter> filter = {}) {
        for (auto& entry : channels) {
            if (entry.channel == channel) {
                entry.filter = std::move(filter);
                return;
            }
        }
        channels.push_back(ChannelSubscription{std::move(channel), std::move(filter)});
    }

    [[nodiscard]]
    inline bool empty() const noexcept {
        return channels.empty();
    }

    [[nodiscard]]
    inline std::size_t size() const noexcept {
        return channels.size();
    }

    inline void write_json(std::string& out) const {
        static constexpr std::string_view prefix = "{\"action\":\"subscribe\",\"channels\":{";
        out += prefix;
        for (std::size_t i = 0; i < channels.size(); ++i) {
            if (i) out += ',';
            lcr::json::append_string(out, channels[i].channel);
            out += ':';
            if (channels[i].filter.has()) {
                channels[i].filter.value().write_json(out);
            } else {
                out += "{}";
            }
        }
        out += "}}";
    }

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out;
        out.reserve(64 + 32 * channels.size());
        write_json(out);
        return out;
    }

    friend inline bool operator==(const Subscribe& a, const Subscribe& b) {
        return a.channels == b.channels;
    }
};

} // namespace cirisstream::core::protocol::ciris::schema
