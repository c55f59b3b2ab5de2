#include "dag/node_codec.hpp"
#include <cstring>
#include <limits>
#include <set>
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>

namespace dagsync::dag {

namespace {

constexpr std::size_t MAX_SHORT_FIELD = std::numeric_limits<std::uint16_t>::max();

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

//==============================================
// OUTPUT BUFFER
//==============================================

class Writer {
public:
  explicit Writer(Bytes& out) : out_(out) {}

  void write_u8(uint8_t value) { out_.push_back(value); }

  void write_u16(std::uint16_t value) {
    std::uint16_t network_value = boost::endian::native_to_big(value);
    write_bytes(&network_value, sizeof(network_value));
  }

  void write_u32(std::uint32_t value) {
    std::uint32_t network_value = boost::endian::native_to_big(value);
    write_bytes(&network_value, sizeof(network_value));
  }

  void write_u64(std::uint64_t value) {
    std::uint64_t network_value = boost::endian::native_to_big(value);
    write_bytes(&network_value, sizeof(network_value));
  }

  // u16 length prefix followed by the bytes
  void write_short_field(const uint8_t* data, std::size_t size, const char* field) {
    if (size > MAX_SHORT_FIELD) {
      BOOST_LOG_TRIVIAL(error) << "Node codec: Field " << field << " too long: " << size << " bytes";
      throw EncodeError(std::string(field) + " exceeds " + std::to_string(MAX_SHORT_FIELD) + " bytes");
    }
    write_u16(static_cast<std::uint16_t>(size));
    write_bytes(data, size);
  }

  void write_short_field(const std::string& value, const char* field) {
    write_short_field(reinterpret_cast<const uint8_t*>(value.data()), value.size(), field);
  }

  void write_short_field(const Bytes& value, const char* field) {
    write_short_field(value.data(), value.size(), field);
  }

  // u64 length prefix followed by the bytes
  void write_long_field(const Bytes& value) {
    write_u64(value.size());
    write_bytes(value.data(), value.size());
  }

  void write_cid(const Cid& cid) {
    write_short_field(to_bytes(cid), "cid");
  }

private:
  Bytes& out_;

  void write_bytes(const void* data, std::size_t size) {
    const auto* bytes = static_cast<const uint8_t*>(data);
    out_.insert(out_.end(), bytes, bytes + size);
  }
};


//==============================================
// INPUT BUFFER
//==============================================

class Reader {
public:
  Reader(const uint8_t* data, std::size_t size) : data_(data), size_(size) {}

  uint8_t read_u8(const char* field) {
    uint8_t value;
    read_bytes(&value, sizeof(value), field);
    return value;
  }

  std::uint16_t read_u16(const char* field) {
    std::uint16_t network_value;
    read_bytes(&network_value, sizeof(network_value), field);
    return boost::endian::big_to_native(network_value);
  }

  std::uint32_t read_u32(const char* field) {
    std::uint32_t network_value;
    read_bytes(&network_value, sizeof(network_value), field);
    return boost::endian::big_to_native(network_value);
  }

  std::uint64_t read_u64(const char* field) {
    std::uint64_t network_value;
    read_bytes(&network_value, sizeof(network_value), field);
    return boost::endian::big_to_native(network_value);
  }

  Bytes read_short_bytes(const char* field) {
    std::uint16_t length = read_u16(field);
    return take(length, field);
  }

  std::string read_short_string(const char* field) {
    Bytes raw = read_short_bytes(field);
    return std::string(raw.begin(), raw.end());
  }

  Bytes read_long_bytes(const char* field) {
    std::uint64_t length = read_u64(field);
    return take(length, field);
  }

  Cid read_cid(const char* field) {
    Bytes raw = read_short_bytes(field);
    try {
      return cid_from_bytes(raw);
    } catch (const CidParseError& e) {
      throw DecodeError(DecodeError::Kind::SchemaInvalid, std::string(field) + ": " + e.what());
    }
  }

  std::size_t remaining() const { return size_ - offset_; }

private:
  const uint8_t* data_;
  std::size_t size_;
  std::size_t offset_{0};

  void read_bytes(void* out, std::size_t count, const char* field) {
    if (remaining() < count) {
      throw DecodeError(DecodeError::Kind::Truncated,
                        std::string("input ends inside field ") + field);
    }
    std::memcpy(out, data_ + offset_, count);
    offset_ += count;
  }

  Bytes take(std::uint64_t count, const char* field) {
    if (remaining() < count) {
      throw DecodeError(DecodeError::Kind::Truncated,
                        std::string("input ends inside field ") + field);
    }
    Bytes out(data_ + offset_, data_ + offset_ + count);
    offset_ += static_cast<std::size_t>(count);
    return out;
  }
};

bool add_checked(std::uint64_t& total, std::uint64_t value) {
  if (total > std::numeric_limits<std::uint64_t>::max() - value) {
    return false;
  }
  total += value;
  return true;
}


//==============================================
// SCHEMA CHECKS
//==============================================

std::optional<std::string> check_file(const FileNode& file) {
  if (file.inline_data && !file.links.empty()) {
    return std::string("file node carries both inline data and links");
  }
  if (!file.inline_data && file.links.empty()) {
    return std::string("file node has neither inline data nor links");
  }

  std::uint64_t total = file.inline_data ? file.inline_data->size() : 0;
  for (const auto& link : file.links) {
    if (link.cid.codec != Codec::Chunk && link.cid.codec != Codec::File) {
      return std::string("file link must address a chunk or file node, got ") + codec_name(link.cid.codec);
    }
    if (!add_checked(total, link.size)) {
      return std::string("file link sizes overflow");
    }
  }

  if (total != file.size) {
    return "file size " + std::to_string(file.size) + " does not match content size " + std::to_string(total);
  }
  return std::nullopt;
}

std::optional<std::string> check_folder(const FolderNode& folder) {
  std::set<std::string> names;
  std::uint64_t total = 0;

  for (const auto& entry : folder.entries) {
    if (!NodeCodec::is_valid_entry_name(entry.name)) {
      return "invalid entry name '" + entry.name + "'";
    }
    if (!names.insert(entry.name).second) {
      return "duplicate entry name '" + entry.name + "'";
    }

    Codec expected = entry.kind == EntryKind::File ? Codec::File : Codec::Folder;
    if (entry.cid.codec != expected) {
      return "entry '" + entry.name + "' kind does not match its CID codec " + codec_name(entry.cid.codec);
    }
    if (!add_checked(total, entry.size)) {
      return std::string("folder entry sizes overflow");
    }
  }

  if (total != folder.total_size) {
    return "folder total size " + std::to_string(folder.total_size)
      + " does not match sum of entries " + std::to_string(total);
  }
  return std::nullopt;
}

std::optional<std::string> check_metadata(const MetadataNode& metadata) {
  if (metadata.data_cid.codec != Codec::File && metadata.data_cid.codec != Codec::Folder) {
    return std::string("metadata must point to a file or folder node, got ") + codec_name(metadata.data_cid.codec);
  }
  if (metadata.encryption && metadata.encryption->algorithm.empty()) {
    return std::string("encryption descriptor without algorithm");
  }
  if (metadata.compression && metadata.compression->algorithm.empty()) {
    return std::string("compression descriptor without algorithm");
  }
  return std::nullopt;
}


//==============================================
// VARIANT BODIES
//==============================================

void encode_body(Writer& writer, const ChunkNode& chunk) {
  writer.write_u8(NodeCodec::TAG_CHUNK);
  writer.write_u8(NodeCodec::FORMAT_VERSION);
  writer.write_long_field(chunk.data);
}

void encode_body(Writer& writer, const FileNode& file) {
  if (file.links.size() > std::numeric_limits<std::uint32_t>::max()) {
    throw EncodeError("too many file links");
  }

  writer.write_u8(NodeCodec::TAG_FILE);
  writer.write_u8(NodeCodec::FORMAT_VERSION);
  writer.write_u64(file.size);
  writer.write_u8(file.inline_data ? 1 : 0);
  if (file.inline_data) {
    writer.write_long_field(*file.inline_data);
  }
  writer.write_u32(static_cast<std::uint32_t>(file.links.size()));
  for (const auto& link : file.links) {
    writer.write_cid(link.cid);
    writer.write_u64(link.size);
  }
}

void encode_body(Writer& writer, const FolderNode& folder) {
  if (folder.entries.size() > std::numeric_limits<std::uint32_t>::max()) {
    throw EncodeError("too many folder entries");
  }

  writer.write_u8(NodeCodec::TAG_FOLDER);
  writer.write_u8(NodeCodec::FORMAT_VERSION);
  writer.write_u64(folder.total_size);
  writer.write_u32(static_cast<std::uint32_t>(folder.entries.size()));
  for (const auto& entry : folder.entries) {
    writer.write_short_field(entry.name, "entry name");
    writer.write_u8(static_cast<uint8_t>(entry.kind));
    writer.write_cid(entry.cid);
    writer.write_u64(entry.size);
  }
}

void encode_body(Writer& writer, const MetadataNode& metadata) {
  writer.write_u8(NodeCodec::TAG_METADATA);
  writer.write_u8(NodeCodec::FORMAT_VERSION);
  writer.write_short_field(metadata.name, "name");
  writer.write_short_field(metadata.mime_type, "mime type");
  writer.write_u64(metadata.total_size);

  uint8_t flags = 0;
  if (metadata.encryption) flags |= NodeCodec::FLAG_ENCRYPTION;
  if (metadata.compression) flags |= NodeCodec::FLAG_COMPRESSION;
  writer.write_u8(flags);

  if (metadata.encryption) {
    const auto& encryption = *metadata.encryption;
    writer.write_short_field(encryption.algorithm, "encryption algorithm");
    writer.write_u32(encryption.flags);
    writer.write_short_field(encryption.salt, "encryption salt");
    writer.write_u32(encryption.iterations);
    writer.write_short_field(encryption.key_check, "encryption key check");
  }
  if (metadata.compression) {
    writer.write_short_field(metadata.compression->algorithm, "compression algorithm");
  }
  writer.write_cid(metadata.data_cid);
}

ChunkNode decode_chunk(Reader& reader) {
  ChunkNode chunk;
  chunk.data = reader.read_long_bytes("chunk data");
  return chunk;
}

FileNode decode_file(Reader& reader) {
  FileNode file;
  file.size = reader.read_u64("file size");

  uint8_t has_inline = reader.read_u8("inline flag");
  if (has_inline > 1) {
    throw DecodeError(DecodeError::Kind::SchemaInvalid, "inline flag must be 0 or 1");
  }
  if (has_inline) {
    file.inline_data = reader.read_long_bytes("inline data");
  }

  std::uint32_t count = reader.read_u32("link count");
  for (std::uint32_t i = 0; i < count; ++i) {
    FileLink link;
    link.cid = reader.read_cid("link cid");
    link.size = reader.read_u64("link size");
    file.links.push_back(std::move(link));
  }
  return file;
}

FolderNode decode_folder(Reader& reader) {
  FolderNode folder;
  folder.total_size = reader.read_u64("folder size");

  std::uint32_t count = reader.read_u32("entry count");
  for (std::uint32_t i = 0; i < count; ++i) {
    FolderEntry entry;
    entry.name = reader.read_short_string("entry name");

    uint8_t kind = reader.read_u8("entry kind");
    if (kind > static_cast<uint8_t>(EntryKind::Folder)) {
      throw DecodeError(DecodeError::Kind::SchemaInvalid, "unknown entry kind " + std::to_string(kind));
    }
    entry.kind = static_cast<EntryKind>(kind);
    entry.cid = reader.read_cid("entry cid");
    entry.size = reader.read_u64("entry size");
    folder.entries.push_back(std::move(entry));
  }
  return folder;
}

MetadataNode decode_metadata(Reader& reader) {
  MetadataNode metadata;
  metadata.name = reader.read_short_string("name");
  metadata.mime_type = reader.read_short_string("mime type");
  metadata.total_size = reader.read_u64("total size");

  uint8_t flags = reader.read_u8("metadata flags");
  if (flags & ~(NodeCodec::FLAG_ENCRYPTION | NodeCodec::FLAG_COMPRESSION)) {
    throw DecodeError(DecodeError::Kind::SchemaInvalid, "unknown metadata flag bits");
  }

  if (flags & NodeCodec::FLAG_ENCRYPTION) {
    EncryptionInfo encryption;
    encryption.algorithm = reader.read_short_string("encryption algorithm");
    encryption.flags = reader.read_u32("encryption flags");
    encryption.salt = reader.read_short_bytes("encryption salt");
    encryption.iterations = reader.read_u32("encryption iterations");
    encryption.key_check = reader.read_short_bytes("encryption key check");
    metadata.encryption = std::move(encryption);
  }
  if (flags & NodeCodec::FLAG_COMPRESSION) {
    CompressionInfo compression;
    compression.algorithm = reader.read_short_string("compression algorithm");
    metadata.compression = std::move(compression);
  }

  metadata.data_cid = reader.read_cid("data cid");
  return metadata;
}

} // namespace


//==============================================
// SERIALIZATION AND DESERIALIZATION
//==============================================

Bytes NodeCodec::encode(const Node& node) {
  if (auto violation = find_schema_violation(node)) {
    BOOST_LOG_TRIVIAL(error) << "Node codec: Refusing to encode " << node_kind_name(node)
                             << " node: " << *violation;
    throw EncodeError(*violation);
  }

  Bytes out;
  Writer writer(out);
  std::visit([&writer](const auto& value) { encode_body(writer, value); }, node);

  BOOST_LOG_TRIVIAL(trace) << "Node codec: Encoded " << node_kind_name(node) << " node into "
                           << out.size() << " bytes";
  return out;
}

Node NodeCodec::decode(const uint8_t* data, std::size_t size) {
  Reader reader(data, size);

  uint8_t tag = reader.read_u8("tag");
  if (tag < TAG_CHUNK || tag > TAG_METADATA) {
    BOOST_LOG_TRIVIAL(debug) << "Node codec: Unknown variant tag " << static_cast<int>(tag);
    throw DecodeError(DecodeError::Kind::UnknownVariant, "unknown variant tag " + std::to_string(tag));
  }

  uint8_t version = reader.read_u8("version");
  if (version != FORMAT_VERSION) {
    throw DecodeError(DecodeError::Kind::UnknownVariant, "unsupported format version " + std::to_string(version));
  }

  Node node;
  switch (tag) {
    case TAG_CHUNK: node = decode_chunk(reader); break;
    case TAG_FILE: node = decode_file(reader); break;
    case TAG_FOLDER: node = decode_folder(reader); break;
    default: node = decode_metadata(reader); break;
  }

  if (reader.remaining() != 0) {
    throw DecodeError(DecodeError::Kind::SchemaInvalid,
                      std::to_string(reader.remaining()) + " trailing bytes");
  }

  if (auto violation = find_schema_violation(node)) {
    throw DecodeError(DecodeError::Kind::SchemaInvalid, *violation);
  }
  return node;
}


//==============================================
// VALIDATION
//==============================================

std::optional<std::string> NodeCodec::find_schema_violation(const Node& node) {
  return std::visit(overloaded{
      [](const ChunkNode&) -> std::optional<std::string> { return std::nullopt; },
      [](const FileNode& file) { return check_file(file); },
      [](const FolderNode& folder) { return check_folder(folder); },
      [](const MetadataNode& metadata) { return check_metadata(metadata); }},
    node);
}

bool NodeCodec::is_valid_entry_name(const std::string& name) {
  if (name.empty() || name == "." || name == ".." || name.size() > MAX_SHORT_FIELD) {
    return false;
  }
  return name.find('/') == std::string::npos
      && name.find('\\') == std::string::npos
      && name.find('\0') == std::string::npos;
}

} // namespace dagsync::dag
