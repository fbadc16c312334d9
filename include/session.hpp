/*
 * RoomRelay - session state
 */

#pragma once

#include "connection.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace roomrelay {

class Room;

enum class SessionState {
    Connecting,
    Active,
    Closed
};

const char* session_state_name(SessionState state);

// One admitted connection. id, connection and room never change; username
// and state are written only by the hub's event thread once the session has
// been handed to it.
struct Session {
    Session(uint64_t session_id,
            std::string requested_name,
            std::shared_ptr<Connection> conn,
            std::weak_ptr<Room> owner)
        : id(session_id),
          username(std::move(requested_name)),
          connection(std::move(conn)),
          room(std::move(owner)) {}

    const uint64_t id;
    std::string username;
    const std::shared_ptr<Connection> connection;
    const std::weak_ptr<Room> room;
    SessionState state = SessionState::Connecting;
};

} // namespace roomrelay
