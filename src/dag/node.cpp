#include "dag/node.hpp"
#include "dag/node_codec.hpp"

namespace dagsync::dag {

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

Codec codec_of(const Node& node) {
  return std::visit(overloaded{
      [](const ChunkNode&) { return Codec::Chunk; },
      [](const FileNode&) { return Codec::File; },
      [](const FolderNode&) { return Codec::Folder; },
      [](const MetadataNode&) { return Codec::Metadata; }},
    node);
}

Cid cid_of(const Node& node, HashAlgorithm hash) {
  return cid_of_encoded(codec_of(node), hash, encode(node));
}

std::uint64_t node_size(const Node& node) {
  return std::visit(overloaded{
      [](const ChunkNode& chunk) { return static_cast<std::uint64_t>(chunk.data.size()); },
      [](const FileNode& file) { return file.size; },
      [](const FolderNode& folder) { return folder.total_size; },
      [](const MetadataNode& metadata) { return metadata.total_size; }},
    node);
}

const char* node_kind_name(const Node& node) {
  return codec_name(codec_of(node));
}

} // namespace dagsync::dag
