/*
 * RoomRelay server entry point
 */

#include "config.hpp"
#include "hub.hpp"
#include "server.hpp"
#include "utils.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

using namespace roomrelay;

namespace {
std::atomic<bool> g_running{true};

void handle_signal(int) {
    g_running = false;
}
} // namespace

int main(int argc, char** argv) {
    ServerConfig config;
    try {
        config = parse_server_args(argc, argv);
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << "\n"
                  << "Usage: relay_server [port] [bind-address] [directory-token] [log-level]\n";
        return 1;
    }

    set_log_level(config.log_level);

    try {
        Hub hub;
        hub.start();
        RelayServer server(config, hub);

        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        server.start();
        std::cout << "RoomRelay server running on "
                  << (config.bind_address.empty() ? "0.0.0.0" : config.bind_address) << ":"
                  << server.port() << std::endl;

        // Block until termination signal.
        while (g_running.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        server.stop();
        hub.stop();
    } catch (const std::exception& ex) {
        log_error(std::string("Server error: ") + ex.what());
        return 1;
    }

    return 0;
}
