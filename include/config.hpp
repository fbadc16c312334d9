/*
 * RoomRelay - server configuration
 */

#pragma once

#include "utils.hpp"

#include <cstdint>
#include <string>

namespace roomrelay {

constexpr uint16_t kDefaultPort = 8080;
constexpr const char* kDefaultDirectoryToken = "public-chat-token";
constexpr const char* kDefaultLogFile = "logs/server.log";

struct ServerConfig {
    std::string bind_address;
    uint16_t port = kDefaultPort;
    std::string directory_token = kDefaultDirectoryToken;
    LogLevel log_level = LogLevel::Info;
    std::string log_file = kDefaultLogFile;
};

// relay_server [port] [bind-address] [directory-token] [log-level]
// Throws std::invalid_argument on a bad port or log level.
ServerConfig parse_server_args(int argc, const char* const* argv);

uint16_t parse_port(const std::string& text);

} // namespace roomrelay
