#include "Config.h"
#include "DroneRelay.h"
#include "PosixProcessLauncher.h"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <functional>
#include <iostream>

int main(int argc, char* argv[]) {
    std::cout << "=== Drone Video/Telemetry Relay ===" << std::endl;
    std::cout << "Version 1.0.0" << std::endl;
    std::cout << std::endl;

    // Check arguments
    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <config.yaml>" << std::endl;
        return 1;
    }

    std::string config_file = argv[1];

    // Load configuration
    Config config;
    if (!config.loadFromFile(config_file)) {
        std::cerr << "[Main] Failed to load configuration from " << config_file << std::endl;
        return 1;
    }

    std::cout << "[Main] Configuration loaded successfully" << std::endl;
    config.print();
    std::cout << std::endl;

    // Broken pipes are reported through write errors instead
    std::signal(SIGPIPE, SIG_IGN);

    try {
        boost::asio::io_context io;
        PosixProcessLauncher launcher(io);
        DroneRelay relay(io, config, launcher);

        if (!relay.initialize()) {
            std::cerr << "[Main] Failed to initialize relay" << std::endl;
            return 1;
        }

        // Setup signal handlers for graceful shutdown; a second signal exits at once
        boost::asio::signal_set signals(io, SIGINT, SIGTERM, SIGQUIT);
        std::function<void(const boost::system::error_code&, int)> on_signal =
            [&](const boost::system::error_code& ec, int signal) {
                if (ec) {
                    return;
                }
                if (relay.isShuttingDown()) {
                    std::cerr << "\n[Main] Received signal " << signal << " again, exiting now" << std::endl;
                    io.stop();
                    return;
                }
                std::cout << "\n[Main] Received signal " << signal << ", shutting down..." << std::endl;
                relay.stop();
                signals.async_wait(on_signal);
            };
        signals.async_wait(on_signal);

        std::cout << "[Main] Relay running (press Ctrl+C to stop)..." << std::endl;
        std::cout << std::endl;

        relay.run();
    } catch (const std::exception& e) {
        std::cerr << "[Main] Fatal error: " << e.what() << std::endl;
        return 1;
    }

    // Clean shutdown
    std::cout << "[Main] Shutdown complete" << std::endl;
    return 0;
}
