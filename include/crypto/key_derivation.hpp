#ifndef DAGSYNC_CRYPTO_KEY_DERIVATION_HPP
#define DAGSYNC_CRYPTO_KEY_DERIVATION_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "crypto_error.hpp"

namespace dagsync::crypto {

static constexpr size_t SALT_SIZE = 16;
static constexpr size_t KEY_CHECK_SIZE = 16;

// Cipher key plus a value that identifies it without revealing it
struct DerivedKey {
    std::vector<uint8_t> key;
    std::vector<uint8_t> key_check;
};

// Cryptographically random bytes. Throws InitializationError.
std::vector<uint8_t> random_bytes(size_t count);

// PBKDF2-HMAC-SHA256 over the password. The first 32 output bytes are the
// AES key, the next KEY_CHECK_SIZE bytes are the check value.
DerivedKey derive_key(const std::string& password, const std::vector<uint8_t>& salt,
                      uint32_t iterations);

// Constant-time comparison of the derived check value against a stored one
bool key_matches(const DerivedKey& derived, const std::vector<uint8_t>& key_check);

} // namespace dagsync::crypto

#endif // DAGSYNC_CRYPTO_KEY_DERIVATION_HPP
