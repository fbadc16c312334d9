/*
 * RoomRelay - hub implementation
 */

#include "hub.hpp"

#include "crypto.hpp"
#include "utils.hpp"

#include <stdexcept>

namespace roomrelay {

ReplyStatus reply_status_for(AdmitStatus status) {
    switch (status) {
        case AdmitStatus::Accepted:
            return ReplyStatus::Ok;
        case AdmitStatus::Invalid:
            return ReplyStatus::BadRequest;
        case AdmitStatus::Conflict:
            return ReplyStatus::Conflict;
        case AdmitStatus::Unauthorized:
            return ReplyStatus::Unauthorized;
        case AdmitStatus::Internal:
        default:
            return ReplyStatus::Internal;
    }
}

PasswordHasher default_password_hasher() {
    return [](const std::string& password) { return hash_password(password); };
}

Hub::Hub(PasswordHasher hasher) : hasher_(std::move(hasher)) {
    if (!hasher_) {
        throw std::invalid_argument("Hub requires a password hasher");
    }
}

Hub::~Hub() {
    stop();
}

void Hub::start() {
    if (worker_.joinable()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        shutdown_ = false;
    }
    running_ = true;
    worker_ = std::thread(&Hub::event_loop, this);
}

void Hub::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        shutdown_ = true;
    }
    queue_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
        return;
    }
    // Never started: apply whatever was queued on the caller's thread.
    event_loop();
}

CreateResult Hub::create_room(const std::string& name, const std::string& password, bool is_private) {
    return create_room_impl(name, password, is_private, false);
}

CreateResult Hub::create_room_impl(const std::string& name,
                                   const std::string& password,
                                   bool is_private,
                                   bool reserve) {
    {
        std::shared_lock<std::shared_mutex> lock(rooms_mutex_);
        if (rooms_.find(name) != rooms_.end()) {
            return {CreateStatus::AlreadyExists, nullptr};
        }
    }

    std::string password_hash;
    if (!password.empty()) {
        try {
            password_hash = hasher_(password);
        } catch (const std::exception& ex) {
            log_error("Failed to hash password for room " + name + ": " + ex.what());
            return {CreateStatus::HashFailed, nullptr};
        }
        if (password_hash.empty()) {
            log_error("Password hasher returned an empty hash for room " + name);
            return {CreateStatus::HashFailed, nullptr};
        }
    }

    auto room = std::make_shared<Room>(name, std::move(password_hash), is_private);
    std::unique_lock<std::shared_mutex> lock(rooms_mutex_);
    if (!rooms_.emplace(name, room).second) {
        return {CreateStatus::AlreadyExists, nullptr};
    }
    if (reserve) {
        room->reserve_join();
    }
    log_info("Created room " + name + (room->has_password() ? " (password)" : "") +
             (is_private ? " (private)" : ""));
    return {CreateStatus::Created, room};
}

std::shared_ptr<Room> Hub::get_room(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(rooms_mutex_);
    auto it = rooms_.find(name);
    if (it == rooms_.end()) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<Room> Hub::reserve_existing(const std::string& name) {
    // Holding the registry shared lock keeps remove_if_empty() out until the
    // reservation is in place.
    std::shared_lock<std::shared_mutex> lock(rooms_mutex_);
    auto it = rooms_.find(name);
    if (it == rooms_.end()) {
        return nullptr;
    }
    it->second->reserve_join();
    return it->second;
}

bool Hub::verify_password(const std::string& name, const std::string& password) const {
    auto room = get_room(name);
    if (!room) {
        return false;
    }
    return room->check_password(password);
}

bool Hub::remove_if_empty(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(rooms_mutex_);
    auto it = rooms_.find(name);
    if (it == rooms_.end()) {
        return false;
    }
    std::unique_lock<std::shared_mutex> room_lock(it->second->mutex_);
    if (!it->second->idle_locked()) {
        return false;
    }
    room_lock.unlock();
    rooms_.erase(it);
    log_info("Removed empty room " + name);
    return true;
}

std::vector<RoomInfo> Hub::directory() const {
    std::vector<RoomInfo> listing;
    std::shared_lock<std::shared_mutex> lock(rooms_mutex_);
    listing.reserve(rooms_.size());
    for (const auto& [name, room] : rooms_) {
        if (room->is_private()) {
            continue;
        }
        listing.push_back(RoomInfo{name, room->has_password(), room->member_count()});
    }
    return listing;
}

std::size_t Hub::room_count() const {
    std::shared_lock<std::shared_mutex> lock(rooms_mutex_);
    return rooms_.size();
}

Admission Hub::admit(const JoinRequest& request, std::shared_ptr<Connection> connection) {
    if (request.room.size() > kMaxNameLength || request.username.size() > kMaxNameLength) {
        log_info("Rejected join with a room or user name over " + std::to_string(kMaxNameLength) + " bytes");
        return {AdmitStatus::Invalid, nullptr, "Name too long"};
    }

    const std::string room_name = request.room.empty() ? kDefaultRoomName : request.room;
    const uint64_t id = next_id();
    const std::string username = request.username.empty() ? "Guest" + std::to_string(id) : request.username;

    std::shared_ptr<Room> room;
    if (request.wants_create()) {
        auto created = create_room_impl(room_name, request.password, request.is_private, true);
        if (created.status == CreateStatus::AlreadyExists) {
            log_info("Rejected create of existing room " + room_name);
            return {AdmitStatus::Conflict, nullptr, "Room already exists"};
        }
        if (created.status == CreateStatus::HashFailed) {
            return {AdmitStatus::Internal, nullptr, "Failed to create room"};
        }
        room = created.room;
    } else {
        while (!room) {
            room = reserve_existing(room_name);
            if (room) {
                break;
            }
            // Joining an unknown room opens it without a password.
            auto created = create_room_impl(room_name, "", false, true);
            if (created.ok()) {
                room = created.room;
            }
        }
        if (!room->check_password(request.password)) {
            room->release_join();
            remove_if_empty(room_name);
            log_info("Rejected join of room " + room_name + ": invalid password");
            return {AdmitStatus::Unauthorized, nullptr, "Invalid password"};
        }
    }

    auto session = std::make_shared<Session>(id, username, std::move(connection), room);
    return {AdmitStatus::Accepted, session, ""};
}

void Hub::register_session(std::shared_ptr<Session> session) {
    enqueue(Event{EventKind::Register, std::move(session), {}});
}

void Hub::unregister_session(std::shared_ptr<Session> session) {
    enqueue(Event{EventKind::Unregister, std::move(session), {}});
}

void Hub::broadcast(std::shared_ptr<Session> sender, std::string body) {
    enqueue(Event{EventKind::Broadcast, std::move(sender), std::move(body)});
}

void Hub::enqueue(Event event) {
    if (!event.session) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_) {
            log_debug("Hub stopped, dropping event for session #" + std::to_string(event.session->id));
            return;
        }
        queue_.push_back(std::move(event));
    }
    queue_cv_.notify_one();
}

void Hub::event_loop() {
    while (true) {
        Event event;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return shutdown_ || !queue_.empty(); });
            if (queue_.empty()) {
                break;
            }
            event = std::move(queue_.front());
            queue_.pop_front();
        }
        process(event);
    }
    running_ = false;
}

void Hub::process(const Event& event) {
    try {
        switch (event.kind) {
            case EventKind::Register:
                handle_register(event.session);
                break;
            case EventKind::Unregister:
                handle_unregister(event.session);
                break;
            case EventKind::Broadcast:
                handle_broadcast(event.session, event.body);
                break;
        }
    } catch (const std::exception& ex) {
        log_error("Hub event for session #" + std::to_string(event.session->id) + " failed: " + ex.what());
        if (event.kind == EventKind::Register) {
            // The reader thread sees the close and queues the unregister
            // that releases the session's place in the room.
            event.session->connection->close();
        }
    }
}

void Hub::handle_register(const std::shared_ptr<Session>& session) {
    if (session->state != SessionState::Connecting) {
        log_debug("Ignoring register for session #" + std::to_string(session->id) + " in state " +
                  session_state_name(session->state));
        return;
    }
    auto room = session->room.lock();
    if (!room) {
        session->state = SessionState::Closed;
        session->connection->close();
        return;
    }

    session->username = room->unique_username(session->username);
    std::size_t count = room->add(session);
    session->state = SessionState::Active;
    log_info(session->username + " (#" + std::to_string(session->id) + ") joined " + room->name() +
             ", members=" + std::to_string(count));
    room->broadcast(joined_notice(session->username, count));
}

void Hub::handle_unregister(const std::shared_ptr<Session>& session) {
    auto room = session->room.lock();
    switch (session->state) {
        case SessionState::Closed:
            return;
        case SessionState::Connecting:
            session->state = SessionState::Closed;
            session->connection->close();
            if (room) {
                room->release_join();
                remove_if_empty(room->name());
            }
            return;
        case SessionState::Active:
            break;
    }

    session->state = SessionState::Closed;
    session->connection->close();
    if (!room) {
        return;
    }
    std::size_t count = room->remove(session->connection.get());
    log_info(session->username + " (#" + std::to_string(session->id) + ") left " + room->name() +
             ", members=" + std::to_string(count));
    room->broadcast(left_notice(session->username, count));
    if (room->member_count() == 0) {
        remove_if_empty(room->name());
    }
}

void Hub::handle_broadcast(const std::shared_ptr<Session>& session, const std::string& body) {
    if (session->state != SessionState::Active) {
        return;
    }
    auto room = session->room.lock();
    if (!room || !room->contains(session->connection.get())) {
        // Dropped by an earlier failed write; its unregister is on the way.
        return;
    }
    std::string line = chat_line(session->username, body);
    if (line.size() > kMaxFramePayload) {
        // Only the sender is at fault; its reader thread will unregister it.
        log_warn("Closing session #" + std::to_string(session->id) + ": chat line of " +
                 std::to_string(line.size()) + " bytes exceeds the frame limit");
        session->connection->close();
        return;
    }
    room->broadcast(line);
}

} // namespace roomrelay
