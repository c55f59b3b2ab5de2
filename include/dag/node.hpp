#ifndef DAGSYNC_DAG_NODE_HPP
#define DAGSYNC_DAG_NODE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "dag/cid.hpp"

namespace dagsync::dag {

// Raw leaf segment of a file
struct ChunkNode {
    Bytes data;

    bool operator==(const ChunkNode& other) const { return data == other.data; }
    bool operator!=(const ChunkNode& other) const { return !(*this == other); }
};

// Link from a file node to a chunk node or a nested file node
struct FileLink {
    Cid cid;
    std::uint64_t size{0};

    bool operator==(const FileLink& other) const { return cid == other.cid && size == other.size; }
    bool operator!=(const FileLink& other) const { return !(*this == other); }
};

// Either carries the whole payload inline or links to its children in byte order
struct FileNode {
    std::uint64_t size{0};
    std::optional<Bytes> inline_data;
    std::vector<FileLink> links;

    bool operator==(const FileNode& other) const {
        return size == other.size && inline_data == other.inline_data && links == other.links;
    }
    bool operator!=(const FileNode& other) const { return !(*this == other); }
};

enum class EntryKind : uint8_t {
    File = 0,
    Folder = 1
};

struct FolderEntry {
    std::string name;
    Cid cid;
    std::uint64_t size{0};
    EntryKind kind{EntryKind::File};

    bool operator==(const FolderEntry& other) const {
        return name == other.name && cid == other.cid && size == other.size && kind == other.kind;
    }
    bool operator!=(const FolderEntry& other) const { return !(*this == other); }
};

struct FolderNode {
    std::uint64_t total_size{0};
    std::vector<FolderEntry> entries;

    bool operator==(const FolderNode& other) const {
        return total_size == other.total_size && entries == other.entries;
    }
    bool operator!=(const FolderNode& other) const { return !(*this == other); }
};

// Describes the symmetric cipher applied to the payload and how to re-derive its key
struct EncryptionInfo {
    std::string algorithm;
    std::uint32_t flags{0};
    Bytes salt;
    std::uint32_t iterations{0};
    Bytes key_check;

    bool operator==(const EncryptionInfo& other) const {
        return algorithm == other.algorithm && flags == other.flags && salt == other.salt
            && iterations == other.iterations && key_check == other.key_check;
    }
    bool operator!=(const EncryptionInfo& other) const { return !(*this == other); }
};

struct CompressionInfo {
    std::string algorithm;

    bool operator==(const CompressionInfo& other) const { return algorithm == other.algorithm; }
    bool operator!=(const CompressionInfo& other) const { return !(*this == other); }
};

// Publishable root: presentation identity on top of the content identity in data_cid
struct MetadataNode {
    std::string name;
    std::string mime_type;
    std::uint64_t total_size{0};
    std::optional<EncryptionInfo> encryption;
    std::optional<CompressionInfo> compression;
    Cid data_cid;

    bool operator==(const MetadataNode& other) const {
        return name == other.name && mime_type == other.mime_type && total_size == other.total_size
            && encryption == other.encryption && compression == other.compression
            && data_cid == other.data_cid;
    }
    bool operator!=(const MetadataNode& other) const { return !(*this == other); }
};

using Node = std::variant<ChunkNode, FileNode, FolderNode, MetadataNode>;

// Codec tag of the node's variant
Codec codec_of(const Node& node);

// Encodes the node canonically and hashes it
Cid cid_of(const Node& node, HashAlgorithm hash = HashAlgorithm::Sha2_256);

// Payload bytes represented by a file-like node: chunk length or file size.
// Folder and metadata nodes report their declared total size.
std::uint64_t node_size(const Node& node);

const char* node_kind_name(const Node& node);

} // namespace dagsync::dag

#endif // DAGSYNC_DAG_NODE_HPP
