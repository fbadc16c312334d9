/*
 * RoomRelay - client
 */

#pragma once

#include "protocol.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace roomrelay {

// Opens a TCP connection; returns -1 and logs on failure.
int connect_tcp(const std::string& host, uint16_t port);

// One-shot directory query on its own connection. nullopt when the server
// refuses the token or the connection fails.
std::optional<std::vector<RoomInfo>> fetch_directory(const std::string& host,
                                                     uint16_t port,
                                                     const std::string& token);

class RelayClient {
public:
    RelayClient();
    ~RelayClient();

    RelayClient(const RelayClient&) = delete;
    RelayClient& operator=(const RelayClient&) = delete;

    // Performs the handshake. On rejection the reply is kept in last_reply().
    bool connect_to_server(const std::string& host, uint16_t port, const JoinRequest& request);

    void run();

    bool send_message(const std::string& body);

    const HandshakeReply& last_reply() const { return last_reply_; }

private:
    bool perform_handshake(const JoinRequest& request);
    void reader_loop();
    void process_user_input(const std::string& line);
    void print_directory(const std::string& token);
    void show_prompt();
    void close_socket();

    std::string host_;
    uint16_t port_ = 0;
    std::string room_;

    int socket_fd_ = -1;
    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::thread reader_thread_;
    std::mutex io_mutex_;
    std::mutex write_mutex_;
    HandshakeReply last_reply_;
};

} // namespace roomrelay
