#ifndef DAGSYNC_TRANSFER_DAG_READER_HPP
#define DAGSYNC_TRANSFER_DAG_READER_HPP

#include <deque>
#include <future>
#include <optional>
#include <boost/asio/thread_pool.hpp>
#include "dag/node.hpp"
#include "io/byte_stream.hpp"
#include "transfer/block_fetcher.hpp"

namespace dagsync::transfer {

// Emits the stored payload of one file DAG in byte order. Chunk fetches run
// ahead on the pool, at most `window` at a time; emission order never depends
// on which fetch finishes first.
class DagReader : public io::ByteStream {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // root must be a FileNode or a ChunkNode
  DagReader(BlockFetcher& fetcher, boost::asio::thread_pool& pool,
            std::size_t window, dag::Node root);
  // Waits for fetches still running on the pool
  ~DagReader() override;

  DagReader(const DagReader&) = delete;
  DagReader& operator=(const DagReader&) = delete;


  // ---- BYTE STREAM ----
  bool read(Bytes& out) override;


  // ---- GETTERS ----
  std::uint64_t size() const { return size_; }
  std::uint64_t bytes_emitted() const { return bytes_emitted_; }

private:
  struct Pending {
    dag::FileLink link;
    std::optional<std::future<dag::Node>> fetch;
  };

  // ---- PARAMETERS ----
  BlockFetcher& fetcher_;
  boost::asio::thread_pool& pool_;
  std::size_t window_;
  std::uint64_t size_{0};
  std::uint64_t bytes_emitted_{0};
  // Links not yet emitted, in byte order
  std::deque<Pending> pending_;
  std::size_t in_flight_{0};
  std::optional<Bytes> inline_payload_;

  // Starts fetches for the first unstarted links until the window is full
  void schedule();
  // Prepends the children of an intermediate file node
  void expand(const dag::FileNode& file);
};

} // namespace dagsync::transfer

#endif // DAGSYNC_TRANSFER_DAG_READER_HPP
