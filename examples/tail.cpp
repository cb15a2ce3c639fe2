// ============================================================================
// wiregate-tail
//
// Follows one or more log channels on a gateway and prints every client
// event to stdout as a JSON line:
//
//   wiregate-tail --url wss://gw.example.com/connection/websocket \
//                 --token $TOKEN -c app -c worker
//
// Handles are the logical channel names themselves.
// Exits on Ctrl+C or when the session terminates.
// ============================================================================

#include <atomic>
#include <csignal>
#include <chrono>
#include <iostream>
#include <mutex>
#include <thread>

#include "wiregate.hpp"

#include "common/cli/tail.hpp"

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
    using namespace wiregate::examples;

    const auto params = cli::tail::configure(argc, argv, "wiregate-tail: follow gateway log channels");
    params.dump("=== Runtime Parameters ===", std::cerr);

    std::signal(SIGINT, on_signal);

    // -------------------------------------------------------------
    // Client setup
    // -------------------------------------------------------------
    std::mutex out_mutex;
    std::atomic<bool> terminated{false};

    wiregate::client_config cfg;
    cfg.channel_prefix = params.prefix;

    wiregate::Client client{
        [&](const wiregate::Event& ev) {
            {
                std::lock_guard<std::mutex> lock(out_mutex);
                std::cout << wiregate::to_json(ev) << std::endl;
            }
            if (ev.is_terminal()) {
                terminated.store(true);
            }
        },
        cfg
    };

    if (auto err = client.connect(params.url, params.token); err != wiregate::CommandError::None) {
        std::cerr << "[wiregate] Failed to connect: " << wiregate::to_string(err) << std::endl;
        return -1;
    }

    for (const auto& name : params.channels) {
        if (auto err = client.subscribe(name, name); err != wiregate::CommandError::None) {
            std::cerr << "[wiregate] Failed to subscribe '" << name << "': " << wiregate::to_string(err) << std::endl;
        }
    }

    std::cerr << "[wiregate] Following " << params.channels.size() << " channel(s). Press Ctrl+C to exit." << std::endl;

    // -------------------------------------------------------------
    // Main loop
    // -------------------------------------------------------------
    while (running.load(std::memory_order_relaxed) && !terminated.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    std::cerr << "[wiregate] Shutting down..." << std::endl;

    client.disconnect();
    client.wait();

    std::cerr << "[wiregate] Final status: " << client.status() << std::endl;
    return terminated.load() && client.status().is_error() ? 1 : 0;
}
