/*
 * RoomRelay - password hashing tests
 */

#include "crypto.hpp"

#include "utils.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace roomrelay {
namespace {

TEST(CryptoTest, HashUsesSaltedPbkdf2Format) {
    std::string hash = hash_password("secret", 1000);
    auto parts = split(hash, '$');
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[0], "pbkdf2-sha256");
    EXPECT_EQ(parts[1], "1000");
    EXPECT_EQ(hash.find("secret"), std::string::npos);
}

TEST(CryptoTest, SamePasswordHashesDifferently) {
    EXPECT_NE(hash_password("secret", 1000), hash_password("secret", 1000));
}

TEST(CryptoTest, VerifyAcceptsOnlyTheHashedPassword) {
    std::string hash = hash_password("secret", 1000);
    EXPECT_TRUE(verify_password(hash, "secret"));
    EXPECT_FALSE(verify_password(hash, "wrong"));
    EXPECT_FALSE(verify_password(hash, ""));
    EXPECT_FALSE(verify_password(hash, "secret "));
}

TEST(CryptoTest, DefaultIterationsVerify) {
    std::string hash = hash_password("correct horse");
    EXPECT_NE(hash.find("$" + std::to_string(kDefaultPbkdf2Iterations) + "$"), std::string::npos);
    EXPECT_TRUE(verify_password(hash, "correct horse"));
}

TEST(CryptoTest, MalformedHashesNeverVerify) {
    EXPECT_FALSE(verify_password("", ""));
    EXPECT_FALSE(verify_password("secret", "secret"));
    EXPECT_FALSE(verify_password("bcrypt$1000$c2FsdA==$aGFzaA==", "x"));
    EXPECT_FALSE(verify_password("pbkdf2-sha256$zero$c2FsdA==$aGFzaA==", "x"));
    EXPECT_FALSE(verify_password("pbkdf2-sha256$0$c2FsdA==$aGFzaA==", "x"));
    EXPECT_FALSE(verify_password("pbkdf2-sha256$1000$$aGFzaA==", "x"));
    EXPECT_FALSE(verify_password("pbkdf2-sha256$1000$c2FsdA==$***", "x"));
}

TEST(CryptoTest, RejectsUnreasonableIterationCounts) {
    EXPECT_THROW(hash_password("pw", 0), std::invalid_argument);
}

} // namespace
} // namespace roomrelay
