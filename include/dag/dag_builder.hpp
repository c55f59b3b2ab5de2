#ifndef DAGSYNC_DAG_DAG_BUILDER_HPP
#define DAGSYNC_DAG_DAG_BUILDER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "dag/block_sink.hpp"
#include "dag/node.hpp"
#include "io/byte_stream.hpp"

namespace dagsync::dag {

struct BuilderConfig {
    static constexpr std::size_t DEFAULT_CHUNK_SIZE = 256 * 1024;
    static constexpr std::size_t DEFAULT_MAX_LINKS = 1024;

    std::size_t chunk_size = DEFAULT_CHUNK_SIZE;
    // Fan-out limit of one file node before intermediate file nodes are introduced
    std::size_t max_links = DEFAULT_MAX_LINKS;
    HashAlgorithm hash = HashAlgorithm::Sha2_256;

    // Throws ConfigError
    void validate() const;
};

// Root of a freshly built (sub)DAG
struct DagHead {
    Cid cid;
    Node node;
    std::uint64_t size{0};
};

// Folder entry as supplied by a caller that may not have every field
struct FolderEntryInput {
    std::string name;
    std::optional<Cid> cid;
    std::optional<std::int64_t> size;
    EntryKind kind{EntryKind::File};
};

class DagBuilder {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Throws ConfigError for a zero chunk size or a fan-out below 2
  explicit DagBuilder(BuilderConfig config = {});


  // ---- DAG CONSTRUCTION ----
  // Chunks the stream and emits chunk nodes, intermediate file nodes and the root
  // file node to the sink, children always before parents. Input that fits in one
  // chunk (including empty input) becomes a single file node with inline payload.
  DagHead build_file(io::ByteStream& input, BlockSink& sink);

  // Builds a folder node over already-built children. Entries keep the caller's
  // order; the total is the sum of the supplied sizes. Throws ValidationError.
  DagHead build_folder(const std::vector<FolderEntry>& entries, BlockSink& sink);
  DagHead build_folder(const std::vector<FolderEntryInput>& entries, BlockSink& sink);

  // Builds the metadata root. Throws ValidationError.
  DagHead build_metadata(const MetadataNode& metadata, BlockSink& sink);


  // ---- GETTERS ----
  const BuilderConfig& config() const { return config_; }

private:
  // ---- PARAMETERS ----
  BuilderConfig config_;


  // ---- NODE FINALIZATION ----
  // Encodes, hashes and hands the node to the sink
  DagHead finalize(Node node, BlockSink& sink);
  FileLink emit_chunk(Bytes data, BlockSink& sink);


  // ---- LAYOUT ----
  // Per-level pending links of the file being built
  using Levels = std::vector<std::vector<FileLink>>;
  // Adds a link at the given level, packing the level first when it is full
  void add_link(Levels& levels, std::size_t level, FileLink link, BlockSink& sink,
                std::optional<DagHead>& last_packed);
  // Wraps links into one file node, after every child is acknowledged
  DagHead pack(std::vector<FileLink> links, BlockSink& sink);
  // Collapses the remaining levels into a single root
  DagHead finish_layout(Levels& levels, BlockSink& sink, std::optional<DagHead>& last_packed);
};

} // namespace dagsync::dag

#endif // DAGSYNC_DAG_DAG_BUILDER_HPP
