/*
 * RoomRelay - relay server implementation
 */

#include "server.hpp"

#include "utils.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <stdexcept>

namespace roomrelay {

namespace {
std::string peer_name(const sockaddr_in& addr) {
    char buffer[INET_ADDRSTRLEN] = {0};
    if (inet_ntop(AF_INET, &addr.sin_addr, buffer, sizeof(buffer)) == nullptr) {
        return "unknown";
    }
    return std::string(buffer) + ":" + std::to_string(ntohs(addr.sin_port));
}

void open_log_file(const std::string& path) {
    if (path.empty()) {
        return;
    }
    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            log_warn("Failed to create log directory " + parent.string() + ": " + ec.message());
            return;
        }
    }
    attach_log_file(std::make_shared<FileLogger>(path));
}
} // namespace

RelayServer::RelayServer(ServerConfig config, Hub& hub)
    : config_(std::move(config)), hub_(hub) {}

RelayServer::~RelayServer() {
    stop();
}

void RelayServer::start() {
    if (running_) {
        return;
    }

    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
        throw std::runtime_error("Failed to create socket: " + std::string(std::strerror(errno)));
    }

    int opt = 1;
    if (::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        log_warn("SO_REUSEADDR failed: " + std::string(std::strerror(errno)));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.port);
    if (config_.bind_address.empty()) {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, config_.bind_address.c_str(), &addr.sin_addr) != 1) {
        ::close(listen_fd_);
        listen_fd_ = -1;
        throw std::invalid_argument("Invalid bind address: " + config_.bind_address);
    }

    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
        throw std::runtime_error("Failed to bind: " + std::string(std::strerror(errno)));
    }

    if (::listen(listen_fd_, 64) < 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
        throw std::runtime_error("Failed to listen: " + std::string(std::strerror(errno)));
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = config_.port;
    }

    open_log_file(config_.log_file);
    log_info("RoomRelay server listening on port " + std::to_string(bound_port_));
    running_ = true;
    accept_thread_ = std::thread(&RelayServer::accept_loop, this);
}

void RelayServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (listen_fd_ >= 0) {
        ::shutdown(listen_fd_, SHUT_RDWR);
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    std::unique_lock<std::mutex> lock(clients_mutex_);
    for (auto& [id, connection] : clients_) {
        connection->close();
    }
    clients_cv_.wait(lock, [this] { return clients_.empty(); });
    log_info("RoomRelay server stopped");
}

void RelayServer::accept_loop() {
    while (running_) {
        sockaddr_in client_addr{};
        socklen_t addr_len = sizeof(client_addr);
        int client_fd = ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&client_addr), &addr_len);
        if (client_fd < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (!running_) {
                break;
            }
            log_warn("Accept failed: " + std::string(std::strerror(errno)));
            continue;
        }

        auto connection = std::make_shared<SocketConnection>(client_fd, peer_name(client_addr));
        uint64_t conn_id = 0;
        {
            std::lock_guard<std::mutex> lock(clients_mutex_);
            conn_id = next_conn_id_++;
            clients_[conn_id] = connection;
        }
        std::thread(&RelayServer::handle_client, this, conn_id, connection).detach();
    }
}

void RelayServer::handle_client(uint64_t conn_id, std::shared_ptr<SocketConnection> connection) {
    log_debug("Client connected " + connection->describe());
    try {
        auto first = receive_frame(connection->socket_fd());
        if (!first.has_value()) {
            log_debug("Client " + connection->describe() + " left before the handshake");
        } else if (first->kind == MessageKind::DirectoryRequest) {
            serve_directory(connection, first.value());
        } else if (first->kind == MessageKind::Handshake) {
            serve_session(connection, first.value());
        } else {
            log_warn("Unexpected first frame kind " + std::to_string(static_cast<int>(first->kind)) +
                     " from " + connection->describe());
        }
    } catch (const std::exception& ex) {
        log_error("Client " + connection->describe() + " failed: " + ex.what());
    }
    connection->close();
    log_debug("Client disconnected " + connection->describe());
    forget_client(conn_id);
}

void RelayServer::serve_directory(const std::shared_ptr<SocketConnection>& connection, const Frame& request) {
    auto kv = parse_kv_string(frame_text(request));
    auto token_it = kv.find("token");
    if (token_it == kv.end() || token_it->second.empty() || token_it->second != config_.directory_token) {
        log_info("Directory request from " + connection->describe() + " rejected: bad token");
        HandshakeReply reply;
        reply.status = ReplyStatus::Unauthorized;
        reply.reason = "Unauthorized";
        send_reply(connection, reply);
        return;
    }
    std::string body = encode_directory(hub_.directory());
    if (!send_frame(connection->socket_fd(), text_frame(MessageKind::DirectoryResponse, body))) {
        log_debug("Directory reply to " + connection->describe() + " failed");
    }
}

void RelayServer::serve_session(const std::shared_ptr<SocketConnection>& connection, const Frame& request) {
    JoinRequest join = decode_join_request(frame_text(request));
    Admission admission = hub_.admit(join, connection);
    if (!admission.accepted()) {
        log_info("Join of " + (join.room.empty() ? std::string(kDefaultRoomName) : join.room) + " from " +
                 connection->describe() + " rejected: " + admission.reason);
        HandshakeReply reply;
        reply.status = reply_status_for(admission.status);
        reply.reason = admission.reason;
        send_reply(connection, reply);
        return;
    }

    auto session = admission.session;
    HandshakeReply reply;
    reply.status = ReplyStatus::Ok;
    reply.session_id = session->id;
    if (auto room = session->room.lock()) {
        reply.room = room->name();
    }

    // From here on the hub must see an unregister for this session, whatever
    // happens to the connection.
    try {
        if (send_reply(connection, reply)) {
            hub_.register_session(session);
            while (auto text = connection->receive_text()) {
                hub_.broadcast(session, std::move(text.value()));
            }
        }
    } catch (const std::exception& ex) {
        log_error("Session #" + std::to_string(session->id) + " failed: " + ex.what());
    }
    hub_.unregister_session(session);
}

bool RelayServer::send_reply(const std::shared_ptr<SocketConnection>& connection, const HandshakeReply& reply) {
    if (!send_frame(connection->socket_fd(), text_frame(MessageKind::Handshake, encode_handshake_reply(reply)))) {
        log_debug("Handshake reply to " + connection->describe() + " failed");
        return false;
    }
    return true;
}

void RelayServer::forget_client(uint64_t conn_id) {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    clients_.erase(conn_id);
    clients_cv_.notify_all();
}

} // namespace roomrelay
