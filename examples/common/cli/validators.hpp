#pragma once

#include <initializer_list>
#include <string>

#include <CLI/CLI.hpp>

#include "cirisstream/core/delivery/drop_policy.hpp"
#include "lcr/log/logger.hpp"


namespace cirisstream::examples::cli {

// -------------------------------------------------------------
// Endpoint validator (API base address or stream URL)
// -------------------------------------------------------------
inline auto endpoint_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        for (const char* scheme : {"http://", "https://", "ws://", "wss://"}) {
            if (value.rfind(scheme, 0) == 0) {
                return {};
            }
        }
        return "Endpoint must start with http://, https://, ws:// or wss://";
    },
    "Endpoint validator"
);


// -------------------------------------------------------------
// Channel name validator
// -------------------------------------------------------------
inline auto channel_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.empty() || value.find_first_of(" \t\"") != std::string::npos) {
            return "Channel must be a non-empty name without spaces or quotes";
        }
        return {};
    },
    "Channel validator"
);


// -------------------------------------------------------------
// Drop policy validator
// -------------------------------------------------------------
inline auto drop_policy_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        core::delivery::DropPolicy policy;
        if (core::delivery::parse_drop_policy(value, policy)) {
            return {};
        }
        return "Drop policy must be one of: oldest, newest";
    },
    "Drop policy validator"
);


// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        lcr::log::Level level;
        if (lcr::log::parse_level(value, level)) {
            return {};
        }
        return "Log level must be one of: trace, debug, info, warn, error, fatal";
    },
    "Log level validator"
);

} // namespace cirisstream::examples::cli
