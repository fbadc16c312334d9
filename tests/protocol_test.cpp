/*
 * RoomRelay - protocol and utility tests
 */

#include "protocol.hpp"

#include "utils.hpp"

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstring>
#include <stdexcept>

namespace roomrelay {
namespace {

TEST(ProtocolTest, JoinRequestSurvivesSeparatorsInPassword) {
    JoinRequest request;
    request.room = "r=1";
    request.username = "alice";
    request.action = kActionCreate;
    request.password = "a;b=c%3B";
    request.is_private = true;

    JoinRequest decoded = decode_join_request(encode_join_request(request));
    EXPECT_EQ(decoded.room, "r=1");
    EXPECT_EQ(decoded.username, "alice");
    EXPECT_TRUE(decoded.wants_create());
    EXPECT_EQ(decoded.password, "a;b=c%3B");
    EXPECT_TRUE(decoded.is_private);
}

TEST(ProtocolTest, JoinRequestDefaultsWhenFieldsMissing) {
    JoinRequest decoded = decode_join_request("room=lobby;private=yes");
    EXPECT_EQ(decoded.room, "lobby");
    EXPECT_TRUE(decoded.username.empty());
    EXPECT_FALSE(decoded.wants_create());
    EXPECT_FALSE(decoded.is_private);
}

TEST(ProtocolTest, HandshakeReplies) {
    HandshakeReply accept;
    accept.session_id = 42;
    accept.room = "lobby";
    auto decoded = decode_handshake_reply(encode_handshake_reply(accept));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded->accepted());
    EXPECT_EQ(decoded->session_id, 42u);
    EXPECT_EQ(decoded->room, "lobby");

    HandshakeReply reject;
    reject.status = ReplyStatus::Conflict;
    reject.reason = "Room already exists";
    decoded = decode_handshake_reply(encode_handshake_reply(reject));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_FALSE(decoded->accepted());
    EXPECT_EQ(decoded->status, ReplyStatus::Conflict);
    EXPECT_EQ(decoded->reason, "Room already exists");

    EXPECT_FALSE(decode_handshake_reply("type=hello").has_value());
    EXPECT_FALSE(decode_handshake_reply("type=accept;id=abc").has_value());
}

TEST(ProtocolTest, SystemNoticesUseTheFixedPhrase) {
    EXPECT_EQ(joined_notice("alice", 3), "SYS: alice joined. Users in room: 3");
    EXPECT_EQ(left_notice("bob", 0), "SYS: bob left. Users in room: 0");
    EXPECT_TRUE(is_system_notice(joined_notice("alice", 1)));
    EXPECT_FALSE(is_system_notice("[alice] SYS: fake"));
}

TEST(ProtocolTest, MemberCountParsesFromNotices) {
    EXPECT_EQ(parse_member_count(joined_notice("alice", 12)), 12u);
    EXPECT_EQ(parse_member_count(left_notice("Users in room: 7", 2)), 2u);
    EXPECT_FALSE(parse_member_count("[alice] Users in room: 4").has_value());
    EXPECT_FALSE(parse_member_count("SYS: hello").has_value());
    EXPECT_FALSE(parse_member_count("SYS: x joined. Users in room: many").has_value());
}

TEST(ProtocolTest, ChatLineFormat) {
    EXPECT_EQ(chat_line("alice", "hi there"), "[alice] hi there");
    EXPECT_EQ(chat_line("bob", ""), "[bob] ");
}

TEST(ProtocolTest, DirectoryBodyListsRooms) {
    std::vector<RoomInfo> rooms = {{"lobby", false, 3}, {"vault", true, 1}};
    std::string body = encode_directory(rooms);
    EXPECT_NE(body.find("\"rooms\""), std::string::npos);
    EXPECT_NE(body.find("\"hasPass\":true"), std::string::npos);
    EXPECT_NE(body.find("\"userCount\":3"), std::string::npos);

    auto decoded = decode_directory(body);
    ASSERT_EQ(decoded.size(), 2u);
    EXPECT_EQ(decoded[1].name, "vault");
    EXPECT_TRUE(decoded[1].has_password);
    EXPECT_EQ(decoded[0].user_count, 3u);

    EXPECT_EQ(encode_directory({}), "{\"rooms\":[]}");
    EXPECT_THROW(decode_directory("{\"rooms\":"), std::invalid_argument);
    EXPECT_THROW(decode_directory("{}"), std::invalid_argument);
}

TEST(ProtocolTest, DirectoryBodyReplacesInvalidUtf8) {
    std::vector<RoomInfo> rooms = {{"\xff\xfe", false, 1}, {"lobby", false, 2}};
    std::string body;
    ASSERT_NO_THROW(body = encode_directory(rooms));

    auto decoded = decode_directory(body);
    ASSERT_EQ(decoded.size(), 2u);
    EXPECT_NE(decoded[0].name, "\xff\xfe");
    EXPECT_FALSE(decoded[0].name.empty());
    EXPECT_EQ(decoded[1].name, "lobby");
}

class FrameTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds_), 0);
    }

    void TearDown() override {
        ::close(fds_[0]);
        ::close(fds_[1]);
    }

    int fds_[2] = {-1, -1};
};

TEST_F(FrameTest, TextFrameCrossesTheSocket) {
    ASSERT_TRUE(send_frame(fds_[0], text_frame(MessageKind::Text, "hello")));
    ASSERT_TRUE(send_frame(fds_[0], text_frame(MessageKind::Handshake, "")));

    auto first = receive_frame(fds_[1]);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->kind, MessageKind::Text);
    EXPECT_EQ(frame_text(first.value()), "hello");

    auto second = receive_frame(fds_[1]);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->kind, MessageKind::Handshake);
    EXPECT_TRUE(second->payload.empty());
}

TEST_F(FrameTest, OversizedFrameIsRefused) {
    uint8_t header[5];
    header[0] = static_cast<uint8_t>(MessageKind::Text);
    uint32_t len = htonl(static_cast<uint32_t>(kMaxFramePayload + 1));
    std::memcpy(header + 1, &len, sizeof(len));
    ASSERT_EQ(::write(fds_[0], header, sizeof(header)), static_cast<ssize_t>(sizeof(header)));

    EXPECT_FALSE(receive_frame(fds_[1]).has_value());
}

TEST_F(FrameTest, ClosedPeerEndsTheStream) {
    ::shutdown(fds_[0], SHUT_WR);
    EXPECT_FALSE(receive_frame(fds_[1]).has_value());
}

TEST(UtilsTest, KvStringRoundTripsEscapes) {
    auto kv = parse_kv_string(kv_string({{"a", "1;2"}, {"b", "x=y"}, {"c", "100%"}}));
    EXPECT_EQ(kv["a"], "1;2");
    EXPECT_EQ(kv["b"], "x=y");
    EXPECT_EQ(kv["c"], "100%");
}

TEST(UtilsTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level(" warn "), LogLevel::Warn);
    EXPECT_THROW(parse_log_level("loud"), std::invalid_argument);
}

TEST(UtilsTest, Base64RoundTrip) {
    std::vector<uint8_t> data = {0x00, 0xff, 0x10, 0x20, 0x30};
    auto decoded = base64_decode(base64_encode(data));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), data);
    EXPECT_FALSE(base64_decode("abc").has_value());
}

} // namespace
} // namespace roomrelay
