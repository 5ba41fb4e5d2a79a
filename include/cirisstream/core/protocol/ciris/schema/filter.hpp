#pragma once

#include <string>
#include <vector>
#include <cstdint>

#include "lcr/json.hpp"
#include "lcr/optional.hpp"


namespace cirisstream::core::protocol::ciris::schema {

// Per-channel subscription criteria. The client never interprets these
// fields; they are forwarded to the server verbatim.
//
// Absent fields are omitted from the JSON. Fields are always written in
// declaration order, so equal filters serialize to identical bytes.
struct Filter {
    lcr::optional<std::vector<std::string>> services{};
    lcr::optional<std::vector<std::string>> metrics{};
    lcr::optional<std::string> level{};       // minimum log level
    lcr::optional<std::string> service{};
    lcr::optional<std::string> author{};
    lcr::optional<std::string> task_id{};
    lcr::optional<std::int64_t> min_depth{};

    [[nodiscard]]
    inline bool empty() const noexcept {
        return !services.has() && !metrics.has() && !level.has() && !service.has() &&
               !author.has() && !task_id.has() && !min_depth.has();
    }

    inline void write_json(std::string& out) const {
        out += '{';
        bool first = true;
        auto key = [&](const char* k) {
            if (!first) out += ',';
            first = false;
            lcr::json::append_string(out, k);
            out += ':';
        };
        auto list = [&](const std::vector<std::string>& values) {
            out += '[';
            for (std::size_t i = 0; i < values.size(); ++i) {
                if (i) out += ',';
                lcr::json::append_string(out, values[i]);
            }
            out += ']';
        };
        if (services.has())  { key("services");  list(services.value()); }
        if (metrics.has())   { key("metrics");   list(metrics.value()); }
        if (level.has())     { key("level");     lcr::json::append_string(out, level.value()); }
        if (service.has())   { key("service");   lcr::json::append_string(out, service.value()); }
        if (author.has())    { key("author");    lcr::json::append_string(out, author.value()); }
        if (task_id.has())   { key("task_id");   lcr::json::append_string(out, task_id.value()); }
        if (min_depth.has()) { key("min_depth"); lcr::json::append(out, min_depth.value()); }
        out += '}';
    }

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out;
        write_json(out);
        return out;
    }

    friend inline bool operator==(const Filter& a, const Filter& b) {
        return a.services == b.services && a.metrics == b.metrics && a.level == b.level &&
               a.service == b.service && a.author == b.author && a.task_id == b.task_id &&
               a.min_depth == b.min_depth;
    }

    friend inline bool operator!=(const Filter& a, const Filter& b) {
        return !(a == b);
    }
};

} // namespace cirisstream::core::protocol::ciris::schema
