/*
 * RoomRelay - server configuration
 */

#include "config.hpp"

#include <stdexcept>

namespace roomrelay {

uint16_t parse_port(const std::string& text) {
    std::size_t consumed = 0;
    unsigned long value = 0;
    try {
        value = std::stoul(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid port: " + text);
    }
    if (consumed != text.size() || value > 65535) {
        throw std::invalid_argument("Invalid port: " + text);
    }
    return static_cast<uint16_t>(value);
}

ServerConfig parse_server_args(int argc, const char* const* argv) {
    ServerConfig config;
    if (argc >= 2) {
        config.port = parse_port(argv[1]);
    }
    if (argc >= 3) {
        config.bind_address = argv[2];
    }
    if (argc >= 4) {
        config.directory_token = argv[3];
        if (config.directory_token.empty()) {
            throw std::invalid_argument("Directory token must not be empty");
        }
    }
    if (argc >= 5) {
        config.log_level = parse_log_level(argv[4]);
    }
    return config;
}

} // namespace roomrelay
