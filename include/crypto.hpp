/*
 * RoomRelay - password hashing helpers
 */

#pragma once

#include <cstdint>
#include <string>

namespace roomrelay {

constexpr uint32_t kDefaultPbkdf2Iterations = 100000;

// Returns "pbkdf2-sha256$<iterations>$<salt b64>$<hash b64>".
// Throws std::runtime_error if OpenSSL fails.
std::string hash_password(const std::string& password,
                          uint32_t iterations = kDefaultPbkdf2Iterations);

// Constant-time check of password against a value produced by hash_password.
// A malformed encoded hash never verifies.
bool verify_password(const std::string& encoded_hash, const std::string& password);

} // namespace roomrelay
