/*
 * RoomRelay - connection abstraction
 *
 * A Connection is the negotiated, bidirectional text stream of one client.
 * The hub only ever writes to it and closes it; the reader thread owning the
 * session is the only caller of receive_text().
 */

#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>

namespace roomrelay {

class Connection {
public:
    virtual ~Connection() = default;

    // Returns false when the peer is gone; the caller treats that as a disconnect.
    virtual bool send_text(const std::string& text) = 0;

    // Blocks until the next message arrives. nullopt means closed or faulted.
    virtual std::optional<std::string> receive_text() = 0;

    // Safe to call more than once and from any thread. Wakes a blocked reader.
    virtual void close() = 0;

    virtual std::string describe() const = 0;
};

class SocketConnection : public Connection {
public:
    SocketConnection(int socket_fd, std::string peer);
    ~SocketConnection() override;

    SocketConnection(const SocketConnection&) = delete;
    SocketConnection& operator=(const SocketConnection&) = delete;

    bool send_text(const std::string& text) override;
    std::optional<std::string> receive_text() override;
    void close() override;
    std::string describe() const override;

    int socket_fd() const { return socket_fd_; }

private:
    int socket_fd_;
    std::string peer_;
    std::mutex write_mutex_;
    std::atomic<bool> closed_{false};
};

} // namespace roomrelay
