/*
 * RoomRelay - relay server
 */

#pragma once

#include "config.hpp"
#include "connection.hpp"
#include "hub.hpp"
#include "protocol.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace roomrelay {

class RelayServer {
public:
    // The hub must outlive the server and be started by the caller.
    RelayServer(ServerConfig config, Hub& hub);
    ~RelayServer();

    RelayServer(const RelayServer&) = delete;
    RelayServer& operator=(const RelayServer&) = delete;

    void start();

    // Closes the listener and every live connection, then waits for all
    // reader threads to hand their unregister events to the hub.
    void stop();

    // The bound port; differs from the configured one when that was 0.
    uint16_t port() const { return bound_port_; }

private:
    void accept_loop();
    void handle_client(uint64_t conn_id, std::shared_ptr<SocketConnection> connection);
    void serve_directory(const std::shared_ptr<SocketConnection>& connection, const Frame& request);
    void serve_session(const std::shared_ptr<SocketConnection>& connection, const Frame& request);
    bool send_reply(const std::shared_ptr<SocketConnection>& connection, const HandshakeReply& reply);
    void forget_client(uint64_t conn_id);

    ServerConfig config_;
    Hub& hub_;
    int listen_fd_ = -1;
    uint16_t bound_port_ = 0;
    std::atomic<bool> running_{false};
    std::thread accept_thread_;

    std::mutex clients_mutex_;
    std::condition_variable clients_cv_;
    std::map<uint64_t, std::shared_ptr<SocketConnection>> clients_;
    uint64_t next_conn_id_ = 1;
};

} // namespace roomrelay
