/*
 * RoomRelay - hub
 *
 * The hub owns the room registry and is the single point where membership
 * changes and fan-out happen. Reader threads and the admission path never
 * mutate rooms themselves; they queue register, unregister and broadcast
 * events, which one event thread applies strictly in arrival order. A
 * joining member therefore sees exactly one "joined" notice for itself, and
 * a departing member's "left" notice is emitted before anything queued after
 * its disconnect.
 *
 * Registry lookups (admission, directory) run on the caller's thread under a
 * shared lock; creation and deletion take the registry exclusively. The lock
 * order is always registry before room.
 */

#pragma once

#include "connection.hpp"
#include "protocol.hpp"
#include "room.hpp"
#include "session.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

namespace roomrelay {

enum class CreateStatus {
    Created,
    AlreadyExists,
    HashFailed
};

struct CreateResult {
    CreateStatus status = CreateStatus::AlreadyExists;
    std::shared_ptr<Room> room;

    bool ok() const { return status == CreateStatus::Created; }
};

enum class AdmitStatus {
    Accepted,
    Invalid,
    Conflict,
    Unauthorized,
    Internal
};

struct Admission {
    AdmitStatus status = AdmitStatus::Internal;
    std::shared_ptr<Session> session;
    std::string reason;

    bool accepted() const { return status == AdmitStatus::Accepted; }
};

ReplyStatus reply_status_for(AdmitStatus status);

// Turns a plaintext password into the opaque value stored on a Room.
// Failures are reported by throwing.
using PasswordHasher = std::function<std::string(const std::string&)>;

PasswordHasher default_password_hasher();

class Hub {
public:
    explicit Hub(PasswordHasher hasher = default_password_hasher());
    ~Hub();

    Hub(const Hub&) = delete;
    Hub& operator=(const Hub&) = delete;

    void start();

    // Applies every event queued so far, then stops the event thread.
    void stop();

    bool running() const { return running_; }

    CreateResult create_room(const std::string& name, const std::string& password, bool is_private);
    std::shared_ptr<Room> get_room(const std::string& name) const;
    bool verify_password(const std::string& name, const std::string& password) const;
    bool remove_if_empty(const std::string& name);
    std::vector<RoomInfo> directory() const;
    std::size_t room_count() const;

    // Resolves a join request into a session bound to a room. An accepted
    // session holds a pending join on its room until register_session() or
    // unregister_session() is processed for it, so exactly one of the two
    // must follow.
    Admission admit(const JoinRequest& request, std::shared_ptr<Connection> connection);

    void register_session(std::shared_ptr<Session> session);
    void unregister_session(std::shared_ptr<Session> session);
    void broadcast(std::shared_ptr<Session> sender, std::string body);

    uint64_t next_id() { return ++next_id_; }

private:
    enum class EventKind {
        Register,
        Unregister,
        Broadcast
    };

    struct Event {
        EventKind kind = EventKind::Broadcast;
        std::shared_ptr<Session> session;
        std::string body;
    };

    CreateResult create_room_impl(const std::string& name,
                                  const std::string& password,
                                  bool is_private,
                                  bool reserve);
    std::shared_ptr<Room> reserve_existing(const std::string& name);

    void enqueue(Event event);
    void event_loop();
    void process(const Event& event);
    void handle_register(const std::shared_ptr<Session>& session);
    void handle_unregister(const std::shared_ptr<Session>& session);
    void handle_broadcast(const std::shared_ptr<Session>& session, const std::string& body);

    PasswordHasher hasher_;

    mutable std::shared_mutex rooms_mutex_;
    std::map<std::string, std::shared_ptr<Room>> rooms_;

    std::atomic<uint64_t> next_id_{0};

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<Event> queue_;
    bool shutdown_ = false;
    std::atomic<bool> running_{false};
    std::thread worker_;
};

} // namespace roomrelay
