/*
 * RoomRelay - protocol helpers implementation
 */

#include "protocol.hpp"

#include "utils.hpp"

#include <arpa/inet.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cctype>
#include <cstring>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace roomrelay {

using json = nlohmann::json;

namespace {
constexpr std::size_t kHeaderSize = 5; // kind (1) + length (4)

bool send_all(int fd, const uint8_t* data, std::size_t len) {
    std::size_t total = 0;
    while (total < len) {
        ssize_t written = ::send(fd, data + total, len - total, MSG_NOSIGNAL);
        if (written <= 0) {
            return false;
        }
        total += static_cast<std::size_t>(written);
    }
    return true;
}

bool recv_all(int fd, uint8_t* data, std::size_t len) {
    std::size_t total = 0;
    while (total < len) {
        ssize_t read_bytes = ::recv(fd, data + total, len - total, MSG_WAITALL);
        if (read_bytes <= 0) {
            return false;
        }
        total += static_cast<std::size_t>(read_bytes);
    }
    return true;
}

std::string notice(const std::string& username, const char* verb, std::size_t member_count) {
    return std::string(kSystemPrefix) + username + " " + verb + ". " + kMemberCountPhrase +
           std::to_string(member_count);
}
} // namespace

bool send_frame(int socket_fd, const Frame& frame) {
    if (frame.payload.size() > kMaxFramePayload) {
        return false;
    }
    uint8_t header[kHeaderSize];
    header[0] = static_cast<uint8_t>(frame.kind);
    uint32_t len = htonl(static_cast<uint32_t>(frame.payload.size()));
    std::memcpy(header + 1, &len, sizeof(uint32_t));

    if (!send_all(socket_fd, header, sizeof(header))) {
        return false;
    }
    if (!frame.payload.empty()) {
        return send_all(socket_fd, frame.payload.data(), frame.payload.size());
    }
    return true;
}

std::optional<Frame> receive_frame(int socket_fd) {
    uint8_t header[kHeaderSize];
    if (!recv_all(socket_fd, header, sizeof(header))) {
        return std::nullopt;
    }
    uint32_t len = 0;
    std::memcpy(&len, header + 1, sizeof(uint32_t));
    len = ntohl(len);
    if (len > kMaxFramePayload) {
        log_warn("Refusing frame of " + std::to_string(len) + " bytes");
        return std::nullopt;
    }

    Frame frame;
    frame.kind = static_cast<MessageKind>(header[0]);
    frame.payload.resize(len);
    if (len > 0) {
        if (!recv_all(socket_fd, frame.payload.data(), len)) {
            return std::nullopt;
        }
    }
    return frame;
}

Frame text_frame(MessageKind kind, const std::string& text) {
    return Frame{kind, std::vector<uint8_t>(text.begin(), text.end())};
}

std::string frame_text(const Frame& frame) {
    return std::string(frame.payload.begin(), frame.payload.end());
}

std::string encode_join_request(const JoinRequest& request) {
    return kv_string({
        {"action", request.action},
        {"room", request.room},
        {"username", request.username},
        {"password", request.password},
        {"private", request.is_private ? "true" : "false"}
    });
}

JoinRequest decode_join_request(const std::string& payload) {
    auto kv = parse_kv_string(payload);
    JoinRequest request;
    request.action = kv["action"];
    request.room = kv["room"];
    request.username = kv["username"];
    request.password = kv["password"];
    request.is_private = kv["private"] == "true";
    return request;
}

std::string encode_handshake_reply(const HandshakeReply& reply) {
    if (reply.accepted()) {
        return kv_string({
            {"type", "accept"},
            {"id", std::to_string(reply.session_id)},
            {"room", reply.room}
        });
    }
    return kv_string({
        {"type", "reject"},
        {"status", std::to_string(static_cast<int>(reply.status))},
        {"reason", reply.reason}
    });
}

std::optional<HandshakeReply> decode_handshake_reply(const std::string& payload) {
    auto kv = parse_kv_string(payload);
    HandshakeReply reply;
    try {
        if (kv["type"] == "accept") {
            reply.status = ReplyStatus::Ok;
            reply.session_id = std::stoull(kv["id"]);
            reply.room = kv["room"];
            return reply;
        }
        if (kv["type"] == "reject") {
            reply.status = static_cast<ReplyStatus>(std::stoi(kv["status"]));
            reply.reason = kv["reason"];
            return reply;
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }
    return std::nullopt;
}

std::string joined_notice(const std::string& username, std::size_t member_count) {
    return notice(username, "joined", member_count);
}

std::string left_notice(const std::string& username, std::size_t member_count) {
    return notice(username, "left", member_count);
}

bool is_system_notice(const std::string& text) {
    return text.rfind(kSystemPrefix, 0) == 0;
}

std::optional<std::size_t> parse_member_count(const std::string& text) {
    if (!is_system_notice(text)) {
        return std::nullopt;
    }
    auto pos = text.rfind(kMemberCountPhrase);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    std::string digits = text.substr(pos + std::strlen(kMemberCountPhrase));
    if (digits.empty()) {
        return std::nullopt;
    }
    for (char ch : digits) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            return std::nullopt;
        }
    }
    try {
        return static_cast<std::size_t>(std::stoull(digits));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::string chat_line(const std::string& username, const std::string& body) {
    return "[" + username + "] " + body;
}

std::string encode_directory(const std::vector<RoomInfo>& rooms) {
    json entries = json::array();
    for (const auto& room : rooms) {
        entries.push_back({
            {"name", room.name},
            {"hasPass", room.has_password},
            {"userCount", room.user_count}
        });
    }
    json body;
    body["rooms"] = entries;
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::vector<RoomInfo> decode_directory(const std::string& body) {
    std::vector<RoomInfo> rooms;
    try {
        auto parsed = json::parse(body);
        for (const auto& entry : parsed.at("rooms")) {
            RoomInfo info;
            info.name = entry.at("name").get<std::string>();
            info.has_password = entry.at("hasPass").get<bool>();
            info.user_count = entry.at("userCount").get<std::size_t>();
            rooms.push_back(info);
        }
    } catch (const json::exception& ex) {
        throw std::invalid_argument(std::string("Malformed directory body: ") + ex.what());
    }
    return rooms;
}

} // namespace roomrelay
