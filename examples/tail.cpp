// ============================================================================
// tail
//
// Tails one or more CIRIS stream channels and prints every message.
//
// Demonstrates:
// - Configuring the client from the command line
// - Per-channel filters (minimum level on the logs channel)
// - Consuming on the main thread while the client heals itself
// - Graceful shutdown using Ctrl+C
// ============================================================================

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

#include "cirisstream.hpp"

#include "common/cli/stream_params.hpp"

// -----------------------------------------------------------------------------
// Ctrl+C handling
// -----------------------------------------------------------------------------
std::atomic<bool> running{true};

void on_signal(int) {
    running.store(false);
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    using namespace cirisstream;

    const auto params = examples::cli::stream::configure(argc, argv, "CIRIS stream tail");
    params.dump("=== Stream Parameters ===", std::cout);

    std::signal(SIGINT, on_signal);

    // -------------------------------------------------------------
    // Client setup
    // -------------------------------------------------------------
    Client client{params.to_config()};

    const Error err = client.connect();
    if (err != Error::None) {
        std::cerr << "[tail] Failed to connect: " << stream::to_string(err) << "\n";
        return -1;
    }

    for (const auto& channel : params.channels) {
        lcr::optional<Filter> filter;
        if (channel == "logs" && !params.level.empty()) {
            Filter f;
            f.level = params.level;
            filter = f;
        }
        if (client.subscribe(channel, filter) != Error::None) {
            std::cerr << "[tail] Failed to subscribe to " << channel << "\n";
        }
    }

    std::cout << "[tail] Streaming. Press Ctrl+C to exit.\n";

    // -------------------------------------------------------------
    // Consumption loop
    // -------------------------------------------------------------
    Message msg;
    std::uint64_t received = 0;
    while (running.load(std::memory_order_relaxed)) {
        if (!client.pop_for(msg, std::chrono::milliseconds(250))) {
            if (client.closed()) {
                std::cerr << "[tail] Stream finished (" << core::transport::to_string(client.state()) << ")\n";
                break;
            }
            continue;
        }
        ++received;
        std::cout << msg << std::endl;
    }

    // -------------------------------------------------------------
    // Shutdown
    // -------------------------------------------------------------
    client.disconnect();

    std::cout << "\n=== Summary ===\n"
              << "  Received : " << received << "\n"
              << "  Dropped  : " << client.dropped() << "\n"
              << "  Epochs   : " << client.epoch() << "\n";
#ifdef CIRISSTREAM_ENABLE_TELEMETRY_L1
    client.telemetry().debug_dump(std::cout);
    client.transport_telemetry().debug_dump(std::cout);
#endif
    return 0;
}
