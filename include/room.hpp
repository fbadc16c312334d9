/*
 * RoomRelay - room membership
 */

#pragma once

#include "session.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>

namespace roomrelay {

constexpr int kMaxUsernameSuffix = 100;

class Room {
public:
    Room(std::string name, std::string password_hash, bool is_private);

    Room(const Room&) = delete;
    Room& operator=(const Room&) = delete;

    const std::string& name() const { return name_; }
    bool has_password() const { return !password_hash_.empty(); }
    bool is_private() const { return private_; }

    // True when the room has no password or the password matches its hash.
    bool check_password(const std::string& password) const;

    // Each add() consumes one reservation taken by reserve_join().
    std::size_t add(const std::shared_ptr<Session>& session);
    std::size_t remove(const Connection* connection);
    bool contains(const Connection* connection) const;
    std::size_t member_count() const;

    std::string unique_username(const std::string& requested) const;

    // Writes payload to every member. Members whose write fails are dropped
    // and their connections closed before this returns. Returns the number
    // of successful deliveries; a payload over kMaxFramePayload is refused
    // without touching membership.
    std::size_t broadcast(const std::string& payload);

    void reserve_join();
    void release_join();
    std::size_t pending_joins() const;

private:
    friend class Hub;

    bool idle_locked() const { return members_.empty() && pending_joins_ == 0; }
    bool username_taken_locked(const std::string& candidate) const;

    const std::string name_;
    const std::string password_hash_;
    const bool private_;

    mutable std::shared_mutex mutex_;
    std::map<const Connection*, std::shared_ptr<Session>> members_;
    std::size_t pending_joins_ = 0;
};

} // namespace roomrelay
