#ifndef DAGSYNC_DAG_CID_HPP
#define DAGSYNC_DAG_CID_HPP

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include "dag/digest.hpp"
#include "dag/dag_error.hpp"

namespace dagsync::dag {

// Multicodec tags identifying which node variant a CID addresses.
// Values live in the multicodec private-use range.
enum class Codec : std::uint64_t {
    Chunk = 0x300001,
    File = 0x300002,
    Folder = 0x300003,
    Metadata = 0x300004
};

const char* codec_name(Codec codec);

struct Cid {
    static constexpr std::uint64_t VERSION = 1;

    Codec codec{Codec::Chunk};
    HashAlgorithm hash{HashAlgorithm::Sha2_256};
    Bytes digest;

    // Structural comparison of all three fields, never the string form
    bool operator==(const Cid& other) const {
        return codec == other.codec && hash == other.hash && digest == other.digest;
    }
    bool operator!=(const Cid& other) const { return !(*this == other); }
    bool operator<(const Cid& other) const;
};


// ---- BINARY FORM ----
// varint(version) varint(codec) varint(hash) varint(digest length) digest
Bytes to_bytes(const Cid& cid);
// Throws CidParseError on malformed input
Cid cid_from_bytes(const uint8_t* data, std::size_t size);
Cid cid_from_bytes(const Bytes& data);


// ---- TEXT FORM ----
// Multibase 'b' prefix followed by lowercase unpadded RFC 4648 base32
std::string to_string(const Cid& cid);
// Accepts 'b' (lowercase) and 'B' (uppercase) base32 multibase prefixes.
// Throws CidParseError on malformed input.
Cid cid_from_string(const std::string& text);


// ---- CONTENT ADDRESSING ----
// Hashes already-encoded node bytes into a CID
Cid cid_of_encoded(Codec codec, HashAlgorithm hash, const Bytes& encoded);

std::ostream& operator<<(std::ostream& os, const Cid& cid);

} // namespace dagsync::dag

namespace std {

template <>
struct hash<dagsync::dag::Cid> {
    std::size_t operator()(const dagsync::dag::Cid& cid) const noexcept {
        // Digest bytes are already uniformly distributed
        std::size_t seed = static_cast<std::size_t>(cid.codec) ^ (static_cast<std::size_t>(cid.hash) << 1);
        for (std::size_t i = 0; i < cid.digest.size() && i < sizeof(std::size_t); ++i) {
            seed = (seed << 8) ^ cid.digest[i];
        }
        return seed;
    }
};

} // namespace std

#endif // DAGSYNC_DAG_CID_HPP
