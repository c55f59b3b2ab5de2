#include "crypto/key_derivation.hpp"
#include "crypto/crypto_stream.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <limits>
#include <boost/log/trivial.hpp>

namespace dagsync::crypto {

std::vector<uint8_t> random_bytes(size_t count) {
  std::vector<uint8_t> out(count);
  if (count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
    throw KeyDerivationError("failed to generate random bytes");
  }
  return out;
}

DerivedKey derive_key(const std::string& password, const std::vector<uint8_t>& salt,
                      uint32_t iterations) {
  if (iterations == 0 || iterations > static_cast<uint32_t>(std::numeric_limits<int>::max())) {
    throw KeyDerivationError("invalid PBKDF2 iteration count " + std::to_string(iterations));
  }
  if (salt.empty()) {
    throw KeyDerivationError("empty PBKDF2 salt");
  }

  std::vector<uint8_t> material(CryptoStream::KEY_SIZE + KEY_CHECK_SIZE);
  if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                        salt.data(), static_cast<int>(salt.size()),
                        static_cast<int>(iterations), EVP_sha256(),
                        static_cast<int>(material.size()), material.data()) != 1) {
    BOOST_LOG_TRIVIAL(error) << "Key derivation: PBKDF2 failed";
    throw KeyDerivationError("PBKDF2 failed");
  }

  DerivedKey derived;
  derived.key.assign(material.begin(), material.begin() + CryptoStream::KEY_SIZE);
  derived.key_check.assign(material.begin() + CryptoStream::KEY_SIZE, material.end());
  OPENSSL_cleanse(material.data(), material.size());

  BOOST_LOG_TRIVIAL(debug) << "Key derivation: Derived key with " << iterations << " iterations";
  return derived;
}

bool key_matches(const DerivedKey& derived, const std::vector<uint8_t>& key_check) {
  if (derived.key_check.size() != key_check.size()) {
    return false;
  }
  return CRYPTO_memcmp(derived.key_check.data(), key_check.data(), key_check.size()) == 0;
}

} // namespace dagsync::crypto
