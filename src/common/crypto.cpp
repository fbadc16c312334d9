/*
 * RoomRelay - password hashing implementation
 */

#include "crypto.hpp"

#include "utils.hpp"

#include <limits>
#include <stdexcept>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace roomrelay {

namespace {
constexpr const char* kSchemeName = "pbkdf2-sha256";
constexpr std::size_t kSaltSize = 16;
constexpr std::size_t kDerivedKeySize = 32;
constexpr uint32_t kMaxIterations = 10000000;

std::vector<uint8_t> pbkdf2_sha256(const std::string& password,
                                   const std::vector<uint8_t>& salt,
                                   uint32_t iterations,
                                   std::size_t length) {
    std::vector<uint8_t> output(length);
    if (PKCS5_PBKDF2_HMAC(password.data(),
                          static_cast<int>(password.size()),
                          salt.data(),
                          static_cast<int>(salt.size()),
                          static_cast<int>(iterations),
                          EVP_sha256(),
                          static_cast<int>(output.size()),
                          output.data()) != 1) {
        throw std::runtime_error("PKCS5_PBKDF2_HMAC failed");
    }
    return output;
}
} // namespace

std::string hash_password(const std::string& password, uint32_t iterations) {
    if (iterations == 0 || iterations > kMaxIterations) {
        throw std::invalid_argument("PBKDF2 iteration count out of range");
    }
    auto salt = random_bytes(kSaltSize);
    auto derived = pbkdf2_sha256(password, salt, iterations, kDerivedKeySize);
    return std::string(kSchemeName) + "$" + std::to_string(iterations) + "$" +
           base64_encode(salt) + "$" + base64_encode(derived);
}

bool verify_password(const std::string& encoded_hash, const std::string& password) {
    auto parts = split(encoded_hash, '$');
    if (parts.size() != 4 || parts[0] != kSchemeName) {
        return false;
    }

    uint32_t iterations = 0;
    try {
        unsigned long parsed = std::stoul(parts[1]);
        if (parsed == 0 || parsed > kMaxIterations) {
            return false;
        }
        iterations = static_cast<uint32_t>(parsed);
    } catch (const std::exception&) {
        return false;
    }

    auto salt = base64_decode(parts[2]);
    auto expected = base64_decode(parts[3]);
    if (!salt.has_value() || !expected.has_value() || salt->empty() || expected->empty()) {
        return false;
    }

    std::vector<uint8_t> actual;
    try {
        actual = pbkdf2_sha256(password, salt.value(), iterations, expected->size());
    } catch (const std::exception& ex) {
        log_error(std::string("Password verification failed: ") + ex.what());
        return false;
    }
    return CRYPTO_memcmp(actual.data(), expected->data(), actual.size()) == 0;
}

} // namespace roomrelay
