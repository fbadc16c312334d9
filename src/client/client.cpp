/*
 * RoomRelay - client implementation
 */

#include "client.hpp"

#include "config.hpp"
#include "protocol.hpp"
#include "utils.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>

namespace roomrelay {

int connect_tcp(const std::string& host, uint16_t port) {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* results = nullptr;
    int rc = ::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &results);
    if (rc != 0) {
        log_error("Unable to resolve host " + host + ": " + gai_strerror(rc));
        return -1;
    }

    int fd = -1;
    for (addrinfo* entry = results; entry != nullptr; entry = entry->ai_next) {
        fd = ::socket(entry->ai_family, entry->ai_socktype, entry->ai_protocol);
        if (fd < 0) {
            continue;
        }
        if (::connect(fd, entry->ai_addr, entry->ai_addrlen) == 0) {
            break;
        }
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(results);

    if (fd < 0) {
        log_error("connect() to " + host + ":" + std::to_string(port) + " failed: " + std::strerror(errno));
    }
    return fd;
}

std::optional<std::vector<RoomInfo>> fetch_directory(const std::string& host,
                                                     uint16_t port,
                                                     const std::string& token) {
    int fd = connect_tcp(host, port);
    if (fd < 0) {
        return std::nullopt;
    }

    std::optional<std::vector<RoomInfo>> rooms;
    if (send_frame(fd, text_frame(MessageKind::DirectoryRequest, kv_string({{"token", token}})))) {
        auto frame = receive_frame(fd);
        if (frame.has_value() && frame->kind == MessageKind::DirectoryResponse) {
            try {
                rooms = decode_directory(frame_text(frame.value()));
            } catch (const std::invalid_argument& ex) {
                log_warn(ex.what());
            }
        } else if (frame.has_value() && frame->kind == MessageKind::Handshake) {
            auto reply = decode_handshake_reply(frame_text(frame.value()));
            log_warn("Directory refused: " + (reply.has_value() ? reply->reason : std::string("bad reply")));
        }
    }
    ::close(fd);
    return rooms;
}

RelayClient::RelayClient() = default;

RelayClient::~RelayClient() {
    running_ = false;
    close_socket();
    if (reader_thread_.joinable()) {
        reader_thread_.join();
    }
    if (socket_fd_ >= 0) {
        ::close(socket_fd_);
        socket_fd_ = -1;
    }
}

bool RelayClient::connect_to_server(const std::string& host, uint16_t port, const JoinRequest& request) {
    host_ = host;
    port_ = port;

    socket_fd_ = connect_tcp(host_, port_);
    if (socket_fd_ < 0) {
        return false;
    }

    if (!perform_handshake(request)) {
        ::close(socket_fd_);
        socket_fd_ = -1;
        return false;
    }

    running_ = true;
    connected_ = true;
    reader_thread_ = std::thread(&RelayClient::reader_loop, this);
    return true;
}

bool RelayClient::perform_handshake(const JoinRequest& request) {
    if (!send_frame(socket_fd_, text_frame(MessageKind::Handshake, encode_join_request(request)))) {
        log_error("Failed to send join request");
        return false;
    }

    auto frame_opt = receive_frame(socket_fd_);
    if (!frame_opt.has_value() || frame_opt->kind != MessageKind::Handshake) {
        log_error("Server closed the connection during the handshake");
        return false;
    }
    auto reply = decode_handshake_reply(frame_text(frame_opt.value()));
    if (!reply.has_value()) {
        log_error("Malformed handshake reply");
        return false;
    }
    last_reply_ = reply.value();
    if (!last_reply_.accepted()) {
        log_error("Join refused (" + std::to_string(static_cast<int>(last_reply_.status)) + "): " +
                  last_reply_.reason);
        return false;
    }
    room_ = last_reply_.room;
    log_info("Connected as session #" + std::to_string(last_reply_.session_id) + " in room " + room_);
    return true;
}

void RelayClient::run() {
    if (!connected_) {
        std::cerr << "Not connected to any server.\n";
        return;
    }

    show_prompt();
    std::string line;
    while (running_ && std::getline(std::cin, line)) {
        process_user_input(line);
        if (!running_) {
            break;
        }
        show_prompt();
    }

    running_ = false;
    close_socket();
    if (reader_thread_.joinable()) {
        reader_thread_.join();
    }
}

bool RelayClient::send_message(const std::string& body) {
    if (!connected_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(write_mutex_);
    return send_frame(socket_fd_, text_frame(MessageKind::Text, body));
}

void RelayClient::reader_loop() {
    while (running_) {
        auto frame_opt = receive_frame(socket_fd_);
        if (!frame_opt.has_value()) {
            if (running_) {
                log_warn("Server disconnected.");
            }
            running_ = false;
            connected_ = false;
            break;
        }
        if (frame_opt->kind != MessageKind::Text) {
            log_warn("Unexpected frame kind " + std::to_string(static_cast<int>(frame_opt->kind)));
            continue;
        }
        std::string text = frame_text(frame_opt.value());
        std::lock_guard<std::mutex> lock(io_mutex_);
        if (is_system_notice(text)) {
            std::cout << "\n* " << text.substr(std::strlen(kSystemPrefix)) << std::endl;
        } else {
            std::cout << "\n" << text << std::endl;
        }
    }
}

void RelayClient::process_user_input(const std::string& line) {
    std::string trimmed = trim(line);
    if (trimmed.empty()) {
        return;
    }
    if (trimmed == "/quit") {
        running_ = false;
        return;
    }
    if (trimmed == "/help") {
        std::lock_guard<std::mutex> lock(io_mutex_);
        std::cout << "\nCommands:\n"
                  << "  /rooms [token]  - list public rooms\n"
                  << "  /quit           - exit client\n"
                  << "  <text>          - send message to the room\n";
        return;
    }
    if (trimmed.rfind("/rooms", 0) == 0) {
        auto parts = split(trimmed, ' ');
        print_directory(parts.size() >= 2 ? parts[1] : kDefaultDirectoryToken);
        return;
    }
    if (!send_message(trimmed)) {
        log_warn("Failed to send chat message");
    }
}

void RelayClient::print_directory(const std::string& token) {
    auto rooms = fetch_directory(host_, port_, token);
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (!rooms.has_value()) {
        std::cout << "\n[error] Directory unavailable" << std::endl;
        return;
    }
    std::cout << "\nRooms:\n";
    for (const auto& room : rooms.value()) {
        std::cout << "  " << room.name << " (" << room.user_count << " online"
                  << (room.has_password ? ", password" : "") << ")\n";
    }
    std::cout.flush();
}

void RelayClient::show_prompt() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    std::cout << "[" << room_ << "]> " << std::flush;
}

void RelayClient::close_socket() {
    if (socket_fd_ >= 0) {
        ::shutdown(socket_fd_, SHUT_RDWR);
    }
}

} // namespace roomrelay
