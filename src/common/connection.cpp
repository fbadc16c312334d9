/*
 * RoomRelay - socket connection
 */

#include "connection.hpp"

#include "protocol.hpp"
#include "utils.hpp"

#include <sys/socket.h>
#include <unistd.h>

namespace roomrelay {

SocketConnection::SocketConnection(int socket_fd, std::string peer)
    : socket_fd_(socket_fd), peer_(std::move(peer)) {}

SocketConnection::~SocketConnection() {
    close();
    // The descriptor is released only here so a concurrent writer never
    // touches a reused fd number.
    if (socket_fd_ >= 0) {
        ::close(socket_fd_);
        socket_fd_ = -1;
    }
}

bool SocketConnection::send_text(const std::string& text) {
    if (closed_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(write_mutex_);
    return send_frame(socket_fd_, text_frame(MessageKind::Text, text));
}

std::optional<std::string> SocketConnection::receive_text() {
    while (!closed_) {
        auto frame_opt = receive_frame(socket_fd_);
        if (!frame_opt.has_value()) {
            return std::nullopt;
        }
        if (frame_opt->kind != MessageKind::Text) {
            log_warn("Ignoring frame kind " + std::to_string(static_cast<int>(frame_opt->kind)) +
                     " from " + peer_);
            continue;
        }
        return frame_text(frame_opt.value());
    }
    return std::nullopt;
}

void SocketConnection::close() {
    if (closed_.exchange(true)) {
        return;
    }
    if (socket_fd_ >= 0) {
        ::shutdown(socket_fd_, SHUT_RDWR);
    }
}

std::string SocketConnection::describe() const {
    return peer_;
}

} // namespace roomrelay
