/*
 * RoomRelay - configuration tests
 */

#include "config.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace roomrelay {
namespace {

TEST(ConfigTest, DefaultsWithoutArguments) {
    const char* argv[] = {"relay_server"};
    ServerConfig config = parse_server_args(1, argv);
    EXPECT_EQ(config.port, kDefaultPort);
    EXPECT_TRUE(config.bind_address.empty());
    EXPECT_EQ(config.directory_token, "public-chat-token");
    EXPECT_EQ(config.log_level, LogLevel::Info);
    EXPECT_EQ(config.log_file, "logs/server.log");
}

TEST(ConfigTest, PositionalArguments) {
    const char* argv[] = {"relay_server", "9000", "127.0.0.1", "s3cret", "debug"};
    ServerConfig config = parse_server_args(5, argv);
    EXPECT_EQ(config.port, 9000);
    EXPECT_EQ(config.bind_address, "127.0.0.1");
    EXPECT_EQ(config.directory_token, "s3cret");
    EXPECT_EQ(config.log_level, LogLevel::Debug);
}

TEST(ConfigTest, RejectsBadValues) {
    const char* bad_port[] = {"relay_server", "80a"};
    const char* big_port[] = {"relay_server", "70000"};
    const char* empty_token[] = {"relay_server", "8080", "", ""};
    const char* bad_level[] = {"relay_server", "8080", "", "tok", "chatty"};
    EXPECT_THROW(parse_server_args(2, bad_port), std::invalid_argument);
    EXPECT_THROW(parse_server_args(2, big_port), std::invalid_argument);
    EXPECT_THROW(parse_server_args(4, empty_token), std::invalid_argument);
    EXPECT_THROW(parse_server_args(5, bad_level), std::invalid_argument);
}

TEST(ConfigTest, ParsePort) {
    EXPECT_EQ(parse_port("0"), 0);
    EXPECT_EQ(parse_port("65535"), 65535);
    EXPECT_THROW(parse_port(""), std::invalid_argument);
    EXPECT_THROW(parse_port("-1"), std::invalid_argument);
}

} // namespace
} // namespace roomrelay
