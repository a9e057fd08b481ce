/**
 * @file main.cpp
 * @brief Entry point for the bitcrush server
 *
 * Accepts image uploads over HTTP, degrades them with the bitcrush
 * transform and serves the results from memory.
 *
 * Usage:
 *   bitcrush_server [OPTIONS]
 *
 * Options:
 *   --bind <addr>            Address to bind (default: 0.0.0.0)
 *   --port <port>            Port to listen on (default: 3000)
 *   --threads <n>            HTTP worker threads (default: 4)
 *   --workers <n>            Transform worker threads (default: 2)
 *   --templates <dir>        Page template directory (default: ./templates)
 *   --log-level <level>      Log level (default: info)
 *   --log-dir <dir>          Directory for rotating log files
 *   --max-body-size <bytes>  Largest accepted upload (default: 10 MiB)
 *   --help                   Show help message
 */

#include "config.hpp"
#include "server_app.hpp"

#include <atomic>
#include <csignal>
#include <iostream>

namespace {

/// Global pointer to server app for signal handling
std::atomic<bitcrush::app::bitcrush_server_app*> g_server{nullptr};

/// Signal handler for graceful shutdown
void signal_handler(int /*signal*/) {
    auto* server = g_server.load();
    if (server) {
        server->request_shutdown();
    }
}

/// Install signal handlers
void install_signal_handlers() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
#ifndef _WIN32
    std::signal(SIGHUP, signal_handler);
#endif
}

}  // namespace

int main(int argc, char* argv[]) {
    std::cout << R"(
  _     _ _                      _
 | |__ (_) |_ ___ _ __ _   _ ___| |__
 | '_ \| | __/ __| '__| | | / __| '_ \
 | |_) | | || (__| |  | |_| \__ \ | | |
 |_.__/|_|\__\___|_|   \__,_|___/_| |_|

            Lossy Image Degradation Service
)" << "\n";

    // Parse command line arguments
    auto config = bitcrush::app::server_config::parse_args(argc, argv);
    if (!config) {
        return 1;
    }

    // Install signal handlers
    install_signal_handlers();

    // Create and initialize server
    bitcrush::app::bitcrush_server_app server(config.value());
    g_server = &server;

    if (!server.initialize()) {
        std::cerr << "Failed to initialize bitcrush server\n";
        g_server = nullptr;
        return 1;
    }

    if (!server.start()) {
        std::cerr << "Failed to start bitcrush server\n";
        g_server = nullptr;
        return 1;
    }

    // Wait for shutdown
    server.wait_for_shutdown();
    std::cout << "\nShutting down...\n";

    server.stop();
    server.print_statistics();

    g_server = nullptr;

    std::cout << "bitcrush server terminated\n";
    return 0;
}
