#pragma once

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <CLI/CLI.hpp>

#include "cirisstream/core/config/client.hpp"
#include "cirisstream/core/delivery/drop_policy.hpp"
#include "common/cli/validators.hpp"
#include "common/logger.hpp"


namespace cirisstream::examples::cli::stream {

    // -------------------------------------------------------------
    // Stream example parameters
    // -------------------------------------------------------------
    struct Params {
        std::string endpoint              = "http://localhost:8080";
        std::string api_key               = {};
        std::vector<std::string> channels = {"reasoning", "telemetry"};
        std::string level                 = {};      // logs channel filter
        std::size_t buffer                = 1000;
        std::string drop_policy           = "oldest";
        std::uint32_t max_attempts        = 0;
        bool no_reconnect                 = false;
        std::uint32_t heartbeat_ms        = 30000;
        std::uint32_t liveness_ms         = 0;
        std::string log_level             = "info";

        inline void dump(const std::string& header, std::ostream& os) const {
            os << header << ":\n"
               << "  Endpoint     : " << endpoint << "\n"
               << "  API key      : " << (api_key.empty() ? "<none>" : "<set>") << "\n"
               << "  Channels     : ";
            for (const auto& c : channels) { os << c << " "; }
            os << "\n"
               << "  Log filter   : " << (level.empty() ? "<none>" : level) << "\n"
               << "  Buffer       : " << buffer << " (" << drop_policy << ")\n"
               << "  Reconnect    : " << (no_reconnect ? "disabled" : "enabled")
               << " (max attempts " << max_attempts << ")\n"
               << "  Heartbeat    : " << heartbeat_ms << " ms\n"
               << "  Liveness     : " << liveness_ms << " ms\n"
               << "  Log Level    : " << log_level << "\n";
        }

        [[nodiscard]]
        inline core::config::Client to_config() const {
            core::config::Client cfg;
            cfg.endpoint = endpoint;
            cfg.api_key = api_key;
            cfg.reconnect.enabled = !no_reconnect;
            cfg.reconnect.max_attempts = max_attempts;
            cfg.backpressure.capacity = buffer;
            (void)core::delivery::parse_drop_policy(drop_policy, cfg.backpressure.drop_policy);
            cfg.heartbeat.interval = std::chrono::milliseconds{heartbeat_ms};
            cfg.heartbeat.liveness_timeout = std::chrono::milliseconds{liveness_ms};
            return cfg;
        }
    };

    // -------------------------------------------------------------
    // Build CLI for stream examples
    // -------------------------------------------------------------
    [[nodiscard]]
    inline Params configure(int argc, char** argv, std::string_view description) {
        CLI::App app{std::string(description)};
        Params params{};

        if (const char* key = std::getenv("CIRIS_API_KEY")) {
            params.api_key = key;
        }

        app.add_option("-e,--endpoint,--url", params.endpoint, "Agent base address or stream URL")->check(endpoint_validator)->default_val(params.endpoint);
        app.add_option("-k,--api-key", params.api_key, "Bearer token (default: $CIRIS_API_KEY)");
        app.add_option("-c,--channel", params.channels, "Channel(s) to tail (e.g. -c reasoning -c logs)")->check(channel_validator)->default_val(params.channels);
        app.add_option("--level", params.level, "Minimum log level filter for the logs channel");
        app.add_option("-b,--buffer", params.buffer, "Delivery queue capacity")->check(CLI::PositiveNumber)->default_val(params.buffer);
        app.add_option("--drop-policy", params.drop_policy, "Overflow policy: oldest | newest")->check(drop_policy_validator)->default_val(params.drop_policy);
        app.add_option("--max-attempts", params.max_attempts, "Reconnection attempts before giving up (0 = unlimited)")->default_val(params.max_attempts);
        app.add_flag("--no-reconnect", params.no_reconnect, "Disable automatic reconnection");
        app.add_option("--heartbeat", params.heartbeat_ms, "Heartbeat interval in ms (0 = disabled)")->default_val(params.heartbeat_ms);
        app.add_option("--liveness", params.liveness_ms, "Max inbound silence in ms before reconnecting (0 = disabled)")->default_val(params.liveness_ms);
        app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);

        app.footer(
            "This example runs until interrupted.\n"
            "Press Ctrl+C to disconnect and exit cleanly."
        );

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            std::exit(app.exit(e, std::cout, std::cerr));
        }

        // -------------------------------------------------------------
        // Logging
        // -------------------------------------------------------------
        set_log_level(params.log_level);
        return params;
    }

} // namespace cirisstream::examples::cli::stream
