/*
 * RoomRelay - room membership implementation
 */

#include "room.hpp"

#include "crypto.hpp"
#include "protocol.hpp"
#include "utils.hpp"

#include <mutex>

namespace roomrelay {

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Connecting:
            return "connecting";
        case SessionState::Active:
            return "active";
        case SessionState::Closed:
            return "closed";
        default:
            return "unknown";
    }
}

Room::Room(std::string name, std::string password_hash, bool is_private)
    : name_(std::move(name)), password_hash_(std::move(password_hash)), private_(is_private) {}

bool Room::check_password(const std::string& password) const {
    if (password_hash_.empty()) {
        return true;
    }
    return verify_password(password_hash_, password);
}

std::size_t Room::add(const std::shared_ptr<Session>& session) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    members_[session->connection.get()] = session;
    if (pending_joins_ > 0) {
        --pending_joins_;
    }
    return members_.size();
}

std::size_t Room::remove(const Connection* connection) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    members_.erase(connection);
    return members_.size();
}

bool Room::contains(const Connection* connection) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return members_.find(connection) != members_.end();
}

std::size_t Room::member_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return members_.size();
}

bool Room::username_taken_locked(const std::string& candidate) const {
    for (const auto& [connection, session] : members_) {
        if (session->username == candidate) {
            return true;
        }
    }
    return false;
}

std::string Room::unique_username(const std::string& requested) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (!username_taken_locked(requested)) {
        return requested;
    }
    for (int suffix = 1; suffix <= kMaxUsernameSuffix; ++suffix) {
        std::string candidate = requested + std::to_string(suffix);
        if (!username_taken_locked(candidate)) {
            return candidate;
        }
    }
    return requested + nanos_token() + hex_encode(random_bytes(2));
}

std::size_t Room::broadcast(const std::string& payload) {
    if (payload.size() > kMaxFramePayload) {
        log_error("Refusing to broadcast " + std::to_string(payload.size()) + " bytes to room " + name_);
        return 0;
    }

    std::vector<std::shared_ptr<Session>> failed;
    std::size_t delivered = 0;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& [connection, session] : members_) {
            if (session->connection->send_text(payload)) {
                ++delivered;
            } else {
                failed.push_back(session);
            }
        }
    }

    if (failed.empty()) {
        return delivered;
    }

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (const auto& session : failed) {
            members_.erase(session->connection.get());
        }
    }
    for (const auto& session : failed) {
        session->connection->close();
        log_warn("Dropped " + session->username + " from room " + name_ +
                 " after failed write to " + session->connection->describe());
    }
    return delivered;
}

void Room::reserve_join() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    ++pending_joins_;
}

void Room::release_join() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (pending_joins_ > 0) {
        --pending_joins_;
    }
}

std::size_t Room::pending_joins() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return pending_joins_;
}

} // namespace roomrelay
