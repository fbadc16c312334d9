/*
 * RoomRelay - protocol helpers header
 *
 * This header defines the framing used between relay clients and the server,
 * the handshake request and reply carried in the first frame of every
 * connection, the plain-text formats of system notifications and chat lines,
 * and the JSON body returned by the room directory.
 *
 * Implementations are provided separately in src/common/protocol.cpp.
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace roomrelay {

enum class MessageKind : uint8_t {
    Handshake = 0x01,
    Text = 0x20,
    DirectoryRequest = 0x30,
    DirectoryResponse = 0x31
};

constexpr std::size_t kMaxFramePayload = 1 << 20;

// Room names and usernames are echoed in notices, replies and the directory,
// so they are capped well below the frame limit.
constexpr std::size_t kMaxNameLength = 256;

struct Frame {
    MessageKind kind;
    std::vector<uint8_t> payload;
};

bool send_frame(int socket_fd, const Frame& frame);

// Returns nullopt on EOF, I/O error or an oversized payload.
std::optional<Frame> receive_frame(int socket_fd);

Frame text_frame(MessageKind kind, const std::string& text);

std::string frame_text(const Frame& frame);

constexpr const char* kDefaultRoomName = "default";
constexpr const char* kActionCreate = "create";
constexpr const char* kActionJoin = "join";

struct JoinRequest {
    std::string room;
    std::string username;
    std::string action;
    std::string password;
    bool is_private = false;

    bool wants_create() const { return action == kActionCreate; }
};

std::string encode_join_request(const JoinRequest& request);

JoinRequest decode_join_request(const std::string& payload);

enum class ReplyStatus : int {
    Ok = 200,
    BadRequest = 400,
    Unauthorized = 401,
    Conflict = 409,
    Internal = 500
};

struct HandshakeReply {
    ReplyStatus status = ReplyStatus::Ok;
    uint64_t session_id = 0;
    std::string room;
    std::string reason;

    bool accepted() const { return status == ReplyStatus::Ok; }
};

std::string encode_handshake_reply(const HandshakeReply& reply);

std::optional<HandshakeReply> decode_handshake_reply(const std::string& payload);

// System notifications: "SYS: <name> joined. Users in room: <n>".
constexpr const char* kSystemPrefix = "SYS: ";
constexpr const char* kMemberCountPhrase = "Users in room: ";

std::string joined_notice(const std::string& username, std::size_t member_count);

std::string left_notice(const std::string& username, std::size_t member_count);

bool is_system_notice(const std::string& text);

std::optional<std::size_t> parse_member_count(const std::string& text);

std::string chat_line(const std::string& username, const std::string& body);

struct RoomInfo {
    std::string name;
    bool has_password = false;
    std::size_t user_count = 0;
};

std::string encode_directory(const std::vector<RoomInfo>& rooms);

// Throws std::invalid_argument on a malformed body.
std::vector<RoomInfo> decode_directory(const std::string& body);

} // namespace roomrelay
