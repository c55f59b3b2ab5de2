#ifndef DAGSYNC_DAG_DIGEST_HPP
#define DAGSYNC_DAG_DIGEST_HPP

#include <cstdint>
#include <optional>
#include <string>
#include "io/byte_stream.hpp"

namespace dagsync::dag {

// Multihash codes of the supported digest functions
enum class HashAlgorithm : std::uint64_t {
    Sha2_256 = 0x12,
    Sha2_512 = 0x13,
    Sha3_256 = 0x16
};

// Digest length in bytes for the given algorithm
std::size_t digest_size(HashAlgorithm algorithm);

const char* hash_algorithm_name(HashAlgorithm algorithm);

// Maps a multihash code to a supported algorithm, nullopt when unknown
std::optional<HashAlgorithm> hash_algorithm_from_code(std::uint64_t code);

// Hashes data with OpenSSL EVP. Throws DagError if the digest cannot be computed.
Bytes compute_digest(HashAlgorithm algorithm, const uint8_t* data, std::size_t size);
Bytes compute_digest(HashAlgorithm algorithm, const Bytes& data);

// Lowercase hex rendering used for store paths and log output
std::string to_hex(const Bytes& data);

} // namespace dagsync::dag

#endif // DAGSYNC_DAG_DIGEST_HPP
