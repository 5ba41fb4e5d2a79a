#pragma once

#include <string>
#include <string_view>


namespace cirisstream::core::transport {

// Path every stream endpoint must end with
inline constexpr std::string_view STREAM_PATH = "/v1/stream";

// ---------------------------------------------------------------------
// Derives the stream endpoint from an API base address.
//
//   http://host:8080        -> ws://host:8080/v1/stream
//   https://host/           -> wss://host/v1/stream
//   wss://host/v1/stream    -> wss://host/v1/stream   (unchanged)
//
// Only the scheme prefix is rewritten. Trailing slashes are removed before
// the stream path is appended. Any other scheme is passed through and
// rejected later by parse_url().
// ---------------------------------------------------------------------
[[nodiscard]]
inline std::string stream_endpoint(std::string_view base) {
    std::string url;
    if (base.substr(0, 7) == "http://") {
        url = "ws://";
        url.append(base.substr(7));
    }
    else if (base.substr(0, 8) == "https://") {
        url = "wss://";
        url.append(base.substr(8));
    }
    else {
        url.assign(base);
    }
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    const bool has_suffix = url.size() >= STREAM_PATH.size() &&
        std::string_view(url).substr(url.size() - STREAM_PATH.size()) == STREAM_PATH;
    if (!has_suffix) {
        url.append(STREAM_PATH);
    }
    return url;
}

} // namespace cirisstream::core::transport
