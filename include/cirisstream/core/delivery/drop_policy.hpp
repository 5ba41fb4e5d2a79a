#pragma once

#include <cstdint>
#include <string_view>


namespace cirisstream::core::delivery {

// Which element is discarded when a push finds the queue full
enum class DropPolicy : std::uint8_t {
    Oldest,   // evict the head, keep the incoming message
    Newest    // keep the queue, discard the incoming message
};

[[nodiscard]]
inline constexpr std::string_view to_string(DropPolicy p) noexcept {
    switch (p) {
        case DropPolicy::Oldest: return "oldest";
        case DropPolicy::Newest: return "newest";
        default:                 return "unknown";
    }
}

[[nodiscard]]
inline constexpr bool parse_drop_policy(std::string_view name, DropPolicy& out) noexcept {
    if (name == "oldest") { out = DropPolicy::Oldest; return true; }
    if (name == "newest") { out = DropPolicy::Newest; return true; }
    return false;
}

} // namespace cirisstream::core::delivery
