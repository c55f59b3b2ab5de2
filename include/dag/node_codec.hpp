#ifndef DAGSYNC_DAG_NODE_CODEC_HPP
#define DAGSYNC_DAG_NODE_CODEC_HPP

#include <cstdint>
#include <optional>
#include <string>
#include "dag/node.hpp"

namespace dagsync::dag {

class NodeCodec {
public:
  static constexpr uint8_t FORMAT_VERSION = 1;

  // Variant tags, first byte of every encoded node
  static constexpr uint8_t TAG_CHUNK = 1;
  static constexpr uint8_t TAG_FILE = 2;
  static constexpr uint8_t TAG_FOLDER = 3;
  static constexpr uint8_t TAG_METADATA = 4;

  // Metadata presence flags
  static constexpr uint8_t FLAG_ENCRYPTION = 0x01;
  static constexpr uint8_t FLAG_COMPRESSION = 0x02;


  // ---- SERIALIZATION AND DESERIALIZATION ----
  // Canonical bytes of the node; throws EncodeError for unrepresentable values
  static Bytes encode(const Node& node);
  // Exact inverse of encode; throws DecodeError
  static Node decode(const uint8_t* data, std::size_t size);


  // ---- VALIDATION ----
  // Describes the first invariant the node violates, nullopt if it is well formed
  static std::optional<std::string> find_schema_violation(const Node& node);
  // Folder entry names are single path components
  static bool is_valid_entry_name(const std::string& name);
};

inline Bytes encode(const Node& node) { return NodeCodec::encode(node); }
inline Node decode(const Bytes& data) { return NodeCodec::decode(data.data(), data.size()); }

} // namespace dagsync::dag

#endif // DAGSYNC_DAG_NODE_CODEC_HPP
