/*
 * RoomRelay client entry point
 */

#include "client.hpp"
#include "config.hpp"
#include "utils.hpp"

#include <iostream>
#include <stdexcept>

using namespace roomrelay;

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: relay_client <server-host> <port> [room] [username] [create|join] [password] [private]\n";
        return 1;
    }

    std::string host = argv[1];
    uint16_t port = 0;
    try {
        port = parse_port(argv[2]);
    } catch (const std::invalid_argument& ex) {
        std::cerr << ex.what() << "\n";
        return 1;
    }

    JoinRequest request;
    request.room = (argc >= 4) ? argv[3] : "";
    request.username = (argc >= 5) ? argv[4] : "";
    request.action = (argc >= 6) ? argv[5] : kActionJoin;
    request.password = (argc >= 7) ? argv[6] : "";
    if (argc >= 8) {
        std::string visibility = argv[7];
        request.is_private = visibility == "private" || visibility == "true";
    }

    RelayClient client;
    if (!client.connect_to_server(host, port, request)) {
        const HandshakeReply& reply = client.last_reply();
        if (!reply.accepted()) {
            std::cerr << "Could not join room: " << reply.reason << "\n";
        } else {
            std::cerr << "Could not reach " << host << ":" << port << "\n";
        }
        return 1;
    }

    std::cout << "Connected to " << host << ":" << port << std::endl;
    std::cout << "Type /help for commands.\n";
    client.run();
    return 0;
}
