#include "dag/dag_builder.hpp"
#include "dag/chunker.hpp"
#include "dag/node_codec.hpp"
#include <limits>
#include <set>
#include <boost/log/trivial.hpp>

namespace dagsync::dag {

void BuilderConfig::validate() const {
  if (chunk_size == 0) {
    throw ConfigError("chunk size must be greater than zero");
  }
  if (max_links < 2) {
    throw ConfigError("max links must be at least 2, got " + std::to_string(max_links));
  }
  digest_size(hash);  // throws for unsupported algorithms
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

DagBuilder::DagBuilder(BuilderConfig config) : config_(config) {
  try {
    config_.validate();
  } catch (const DagError& e) {
    BOOST_LOG_TRIVIAL(error) << "DAG builder: Invalid configuration: " << e.what();
    throw;
  }
  BOOST_LOG_TRIVIAL(debug) << "DAG builder: Chunk size " << config_.chunk_size
                           << ", max links " << config_.max_links
                           << ", hash " << hash_algorithm_name(config_.hash);
}


//==============================================
// DAG CONSTRUCTION
//==============================================

DagHead DagBuilder::build_file(io::ByteStream& input, BlockSink& sink) {
  Chunker chunker(input, config_.chunk_size);

  Bytes first;
  chunker.next(first);

  Bytes second;
  if (!chunker.next(second)) {
    // Whole payload fits one chunk: no chunk layer at all
    FileNode file;
    file.size = first.size();
    file.inline_data = std::move(first);
    DagHead head = finalize(std::move(file), sink);
    BOOST_LOG_TRIVIAL(info) << "DAG builder: Built inline file node " << head.cid << " (" << head.size << " bytes)";
    return head;
  }

  Levels levels(1);
  std::optional<DagHead> last_packed;

  add_link(levels, 0, emit_chunk(std::move(first), sink), sink, last_packed);
  add_link(levels, 0, emit_chunk(std::move(second), sink), sink, last_packed);

  Bytes segment;
  while (chunker.next(segment)) {
    add_link(levels, 0, emit_chunk(std::move(segment), sink), sink, last_packed);
  }

  DagHead head = finish_layout(levels, sink, last_packed);
  BOOST_LOG_TRIVIAL(info) << "DAG builder: Built file DAG " << head.cid << " from "
                          << chunker.segments_emitted() << " chunks (" << head.size << " bytes)";
  return head;
}

DagHead DagBuilder::build_folder(const std::vector<FolderEntry>& entries, BlockSink& sink) {
  FolderNode folder;
  std::set<std::string> names;

  for (const auto& entry : entries) {
    if (!NodeCodec::is_valid_entry_name(entry.name)) {
      BOOST_LOG_TRIVIAL(error) << "DAG builder: Invalid folder entry name '" << entry.name << "'";
      throw ValidationError("invalid folder entry name '" + entry.name + "'");
    }
    if (!names.insert(entry.name).second) {
      throw ValidationError("duplicate folder entry name '" + entry.name + "'");
    }

    Codec expected = entry.kind == EntryKind::File ? Codec::File : Codec::Folder;
    if (entry.cid.codec != expected) {
      throw ValidationError("entry '" + entry.name + "' is declared as "
                            + (entry.kind == EntryKind::File ? "file" : "folder")
                            + " but its CID addresses a " + codec_name(entry.cid.codec) + " node");
    }

    if (folder.total_size > std::numeric_limits<std::uint64_t>::max() - entry.size) {
      throw ValidationError("folder size overflows");
    }
    folder.total_size += entry.size;
    folder.entries.push_back(entry);
  }

  // Every entry subtree must be acknowledged before the folder itself is sent
  sink.drain();
  DagHead head = finalize(std::move(folder), sink);
  BOOST_LOG_TRIVIAL(info) << "DAG builder: Built folder node " << head.cid << " with "
                          << entries.size() << " entries (" << head.size << " bytes)";
  return head;
}

DagHead DagBuilder::build_folder(const std::vector<FolderEntryInput>& entries, BlockSink& sink) {
  std::vector<FolderEntry> checked;
  checked.reserve(entries.size());

  for (const auto& input : entries) {
    if (!input.cid) {
      throw ValidationError("folder entry '" + input.name + "' has no CID");
    }
    if (!input.size) {
      throw ValidationError("folder entry '" + input.name + "' has no size");
    }
    if (*input.size < 0) {
      throw ValidationError("folder entry '" + input.name + "' has negative size " + std::to_string(*input.size));
    }

    FolderEntry entry;
    entry.name = input.name;
    entry.cid = *input.cid;
    entry.size = static_cast<std::uint64_t>(*input.size);
    entry.kind = input.kind;
    checked.push_back(std::move(entry));
  }

  return build_folder(checked, sink);
}

DagHead DagBuilder::build_metadata(const MetadataNode& metadata, BlockSink& sink) {
  Node node = metadata;
  if (auto violation = NodeCodec::find_schema_violation(node)) {
    BOOST_LOG_TRIVIAL(error) << "DAG builder: Invalid metadata: " << *violation;
    throw ValidationError(*violation);
  }

  sink.drain();
  DagHead head = finalize(std::move(node), sink);
  BOOST_LOG_TRIVIAL(info) << "DAG builder: Built metadata root " << head.cid << " for '"
                          << metadata.name << "' -> " << metadata.data_cid;
  return head;
}


//==============================================
// NODE FINALIZATION
//==============================================

DagHead DagBuilder::finalize(Node node, BlockSink& sink) {
  Bytes encoded = encode(node);
  Cid cid = cid_of_encoded(codec_of(node), config_.hash, encoded);
  std::uint64_t size = node_size(node);

  sink.put(Block{cid, std::move(encoded)});
  return DagHead{std::move(cid), std::move(node), size};
}

FileLink DagBuilder::emit_chunk(Bytes data, BlockSink& sink) {
  std::uint64_t size = data.size();
  Node node = ChunkNode{std::move(data)};

  Bytes encoded = encode(node);
  Cid cid = cid_of_encoded(Codec::Chunk, config_.hash, encoded);
  sink.put(Block{cid, std::move(encoded)});

  return FileLink{std::move(cid), size};
}


//==============================================
// LAYOUT
//==============================================

void DagBuilder::add_link(Levels& levels, std::size_t level, FileLink link, BlockSink& sink,
                          std::optional<DagHead>& last_packed) {
  if (levels.size() <= level) {
    levels.resize(level + 1);
  }

  if (levels[level].size() == config_.max_links) {
    std::vector<FileLink> full = std::move(levels[level]);
    levels[level].clear();

    DagHead packed = pack(std::move(full), sink);
    FileLink parent_link{packed.cid, packed.size};
    last_packed = std::move(packed);
    add_link(levels, level + 1, std::move(parent_link), sink, last_packed);
  }

  levels[level].push_back(std::move(link));
}

DagHead DagBuilder::pack(std::vector<FileLink> links, BlockSink& sink) {
  FileNode file;
  for (const auto& link : links) {
    file.size += link.size;
  }
  file.links = std::move(links);

  sink.drain();
  return finalize(std::move(file), sink);
}

DagHead DagBuilder::finish_layout(Levels& levels, BlockSink& sink, std::optional<DagHead>& last_packed) {
  for (std::size_t level = 0; level < levels.size(); ++level) {
    bool top = true;
    for (std::size_t above = level + 1; above < levels.size(); ++above) {
      if (!levels[above].empty()) {
        top = false;
        break;
      }
    }

    std::vector<FileLink> links = std::move(levels[level]);
    levels[level].clear();

    if (top) {
      if (links.size() == 1 && last_packed && links.front().cid == last_packed->cid) {
        return std::move(*last_packed);
      }
      return pack(std::move(links), sink);
    }

    if (links.size() == 1) {
      // A lone link moves up instead of getting a single-child wrapper
      add_link(levels, level + 1, std::move(links.front()), sink, last_packed);
    } else if (!links.empty()) {
      DagHead packed = pack(std::move(links), sink);
      FileLink parent_link{packed.cid, packed.size};
      last_packed = std::move(packed);
      add_link(levels, level + 1, std::move(parent_link), sink, last_packed);
    }
  }

  throw EncodeError("file layout produced no root");
}

} // namespace dagsync::dag
