#include "dag/digest.hpp"
#include "dag/dag_error.hpp"
#include <iomanip>
#include <sstream>
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>

namespace dagsync::dag {

namespace {

// Owns an EVP_MD_CTX for the duration of one digest computation
struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DagError("Digest: Failed to create hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  EVP_MD_CTX* get() { return ctx; }
};

const EVP_MD* evp_for(HashAlgorithm algorithm) {
  switch (algorithm) {
    case HashAlgorithm::Sha2_256: return EVP_sha256();
    case HashAlgorithm::Sha2_512: return EVP_sha512();
    case HashAlgorithm::Sha3_256: return EVP_sha3_256();
  }
  throw DagError("Digest: Unsupported hash algorithm");
}

} // namespace

std::size_t digest_size(HashAlgorithm algorithm) {
  switch (algorithm) {
    case HashAlgorithm::Sha2_256: return 32;
    case HashAlgorithm::Sha2_512: return 64;
    case HashAlgorithm::Sha3_256: return 32;
  }
  throw DagError("Digest: Unsupported hash algorithm");
}

const char* hash_algorithm_name(HashAlgorithm algorithm) {
  switch (algorithm) {
    case HashAlgorithm::Sha2_256: return "sha2-256";
    case HashAlgorithm::Sha2_512: return "sha2-512";
    case HashAlgorithm::Sha3_256: return "sha3-256";
    default: return "unknown";
  }
}

std::optional<HashAlgorithm> hash_algorithm_from_code(std::uint64_t code) {
  switch (code) {
    case static_cast<std::uint64_t>(HashAlgorithm::Sha2_256): return HashAlgorithm::Sha2_256;
    case static_cast<std::uint64_t>(HashAlgorithm::Sha2_512): return HashAlgorithm::Sha2_512;
    case static_cast<std::uint64_t>(HashAlgorithm::Sha3_256): return HashAlgorithm::Sha3_256;
    default: return std::nullopt;
  }
}

Bytes compute_digest(HashAlgorithm algorithm, const uint8_t* data, std::size_t size) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  DigestContext context;

  if (!EVP_DigestInit_ex(context.get(), evp_for(algorithm), nullptr)) {
    BOOST_LOG_TRIVIAL(error) << "Digest: Failed to initialize " << hash_algorithm_name(algorithm);
    throw DagError("Digest: Failed to initialize hash context");
  }

  if (size > 0 && !EVP_DigestUpdate(context.get(), data, size)) {
    throw DagError("Digest: Failed to update hash");
  }

  if (!EVP_DigestFinal_ex(context.get(), hash, &hash_len)) {
    throw DagError("Digest: Failed to finalize hash");
  }

  if (hash_len != digest_size(algorithm)) {
    throw DagError("Digest: Unexpected digest length " + std::to_string(hash_len));
  }

  return Bytes(hash, hash + hash_len);
}

Bytes compute_digest(HashAlgorithm algorithm, const Bytes& data) {
  return compute_digest(algorithm, data.data(), data.size());
}

std::string to_hex(const Bytes& data) {
  std::stringstream ss;
  for (uint8_t byte : data) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

} // namespace dagsync::dag
