#include "dag/cid.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace dagsync::dag {

namespace {

constexpr char BASE32_LOWER[] = "abcdefghijklmnopqrstuvwxyz234567";
constexpr char BASE32_UPPER[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
// Multiformats caps unsigned varints at 9 bytes
constexpr std::size_t MAX_VARINT_BYTES = 9;

std::optional<Codec> codec_from_code(std::uint64_t code) {
  switch (code) {
    case static_cast<std::uint64_t>(Codec::Chunk): return Codec::Chunk;
    case static_cast<std::uint64_t>(Codec::File): return Codec::File;
    case static_cast<std::uint64_t>(Codec::Folder): return Codec::Folder;
    case static_cast<std::uint64_t>(Codec::Metadata): return Codec::Metadata;
    default: return std::nullopt;
  }
}

void write_varint(Bytes& out, std::uint64_t value) {
  while (value >= 0x80) {
    out.push_back(static_cast<uint8_t>((value & 0x7F) | 0x80));
    value >>= 7;
  }
  out.push_back(static_cast<uint8_t>(value));
}

std::uint64_t read_varint(const uint8_t* data, std::size_t size, std::size_t& offset) {
  std::uint64_t value = 0;
  unsigned shift = 0;

  for (std::size_t i = 0; i < MAX_VARINT_BYTES; ++i) {
    if (offset >= size) {
      throw CidParseError("truncated varint");
    }
    uint8_t byte = data[offset++];
    value |= static_cast<std::uint64_t>(byte & 0x7F) << shift;

    if ((byte & 0x80) == 0) {
      // Reject non-minimal encodings so one CID has exactly one binary form
      if (byte == 0 && i > 0) {
        throw CidParseError("non-minimal varint");
      }
      return value;
    }
    shift += 7;
  }
  throw CidParseError("varint too long");
}

std::string base32_encode(const Bytes& data) {
  std::string out;
  out.reserve((data.size() * 8 + 4) / 5);

  std::uint32_t buffer = 0;
  int bits = 0;
  for (uint8_t byte : data) {
    buffer = (buffer << 8) | byte;
    bits += 8;
    while (bits >= 5) {
      bits -= 5;
      out.push_back(BASE32_LOWER[(buffer >> bits) & 0x1F]);
    }
    buffer &= (1u << bits) - 1;
  }

  if (bits > 0) {
    out.push_back(BASE32_LOWER[(buffer << (5 - bits)) & 0x1F]);
  }
  return out;
}

Bytes base32_decode(const std::string& text, std::size_t begin, const char* alphabet) {
  Bytes out;
  out.reserve((text.size() - begin) * 5 / 8);

  std::uint32_t buffer = 0;
  int bits = 0;
  for (std::size_t i = begin; i < text.size(); ++i) {
    const char* pos = std::char_traits<char>::find(alphabet, 32, text[i]);
    if (pos == nullptr) {
      throw CidParseError("invalid base32 character at position " + std::to_string(i));
    }

    buffer = (buffer << 5) | static_cast<std::uint32_t>(pos - alphabet);
    bits += 5;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<uint8_t>((buffer >> bits) & 0xFF));
    }
    buffer &= (1u << bits) - 1;
  }

  if (bits >= 5) {
    throw CidParseError("invalid base32 length");
  }
  if (buffer != 0) {
    throw CidParseError("non-zero trailing base32 bits");
  }
  return out;
}

} // namespace

const char* codec_name(Codec codec) {
  switch (codec) {
    case Codec::Chunk: return "chunk";
    case Codec::File: return "file";
    case Codec::Folder: return "folder";
    case Codec::Metadata: return "metadata";
    default: return "unknown";
  }
}

bool Cid::operator<(const Cid& other) const {
  if (codec != other.codec) {
    return codec < other.codec;
  }
  if (hash != other.hash) {
    return hash < other.hash;
  }
  return digest < other.digest;
}


//==============================================
// BINARY FORM
//==============================================

Bytes to_bytes(const Cid& cid) {
  Bytes out;
  out.reserve(12 + cid.digest.size());
  write_varint(out, Cid::VERSION);
  write_varint(out, static_cast<std::uint64_t>(cid.codec));
  write_varint(out, static_cast<std::uint64_t>(cid.hash));
  write_varint(out, cid.digest.size());
  out.insert(out.end(), cid.digest.begin(), cid.digest.end());
  return out;
}

Cid cid_from_bytes(const uint8_t* data, std::size_t size) {
  std::size_t offset = 0;

  std::uint64_t version = read_varint(data, size, offset);
  if (version != Cid::VERSION) {
    throw CidParseError("unsupported CID version " + std::to_string(version));
  }

  std::uint64_t codec_code = read_varint(data, size, offset);
  auto codec = codec_from_code(codec_code);
  if (!codec) {
    throw CidParseError("unknown codec " + std::to_string(codec_code));
  }

  std::uint64_t hash_code = read_varint(data, size, offset);
  auto hash = hash_algorithm_from_code(hash_code);
  if (!hash) {
    throw CidParseError("unknown hash algorithm " + std::to_string(hash_code));
  }

  std::uint64_t digest_length = read_varint(data, size, offset);
  if (digest_length != digest_size(*hash)) {
    throw CidParseError("digest length " + std::to_string(digest_length) + " does not match "
                        + hash_algorithm_name(*hash));
  }

  if (size - offset < digest_length) {
    throw CidParseError("truncated digest");
  }
  if (size - offset > digest_length) {
    throw CidParseError("trailing bytes after digest");
  }

  Cid cid;
  cid.codec = *codec;
  cid.hash = *hash;
  cid.digest.assign(data + offset, data + offset + digest_length);
  return cid;
}

Cid cid_from_bytes(const Bytes& data) {
  return cid_from_bytes(data.data(), data.size());
}


//==============================================
// TEXT FORM
//==============================================

std::string to_string(const Cid& cid) {
  return "b" + base32_encode(to_bytes(cid));
}

Cid cid_from_string(const std::string& text) {
  if (text.empty()) {
    throw CidParseError("empty string");
  }

  const char* alphabet = nullptr;
  switch (text.front()) {
    case 'b': alphabet = BASE32_LOWER; break;
    case 'B': alphabet = BASE32_UPPER; break;
    default:
      BOOST_LOG_TRIVIAL(debug) << "CID: Rejecting multibase prefix '" << text.front() << "'";
      throw CidParseError(std::string("unsupported multibase prefix '") + text.front() + "'");
  }

  if (text.size() == 1) {
    throw CidParseError("missing payload after multibase prefix");
  }

  Bytes binary = base32_decode(text, 1, alphabet);
  return cid_from_bytes(binary);
}


//==============================================
// CONTENT ADDRESSING
//==============================================

Cid cid_of_encoded(Codec codec, HashAlgorithm hash, const Bytes& encoded) {
  Cid cid;
  cid.codec = codec;
  cid.hash = hash;
  cid.digest = compute_digest(hash, encoded);
  return cid;
}

std::ostream& operator<<(std::ostream& os, const Cid& cid) {
  return os << to_string(cid);
}

} // namespace dagsync::dag
