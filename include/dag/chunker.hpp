#ifndef DAGSYNC_DAG_CHUNKER_HPP
#define DAGSYNC_DAG_CHUNKER_HPP

#include <cstdint>
#include "io/byte_stream.hpp"

namespace dagsync::dag {

// Splits a byte stream into fixed-size segments. Boundaries never depend on content.
// Every segment is chunk_size bytes except the last, which may be shorter. An empty
// input yields exactly one empty segment.
class Chunker {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Throws ConfigError when chunk_size is zero
  Chunker(io::ByteStream& input, std::size_t chunk_size);

  Chunker(const Chunker&) = delete;
  Chunker& operator=(const Chunker&) = delete;


  // ---- SEGMENT PRODUCTION ----
  // Replaces segment with the next one; false once the input is exhausted.
  // Not restartable: keeps returning false afterwards.
  bool next(Bytes& segment);


  // ---- GETTERS ----
  std::size_t chunk_size() const { return chunk_size_; }
  std::uint64_t bytes_consumed() const { return bytes_consumed_; }
  std::uint64_t segments_emitted() const { return segments_emitted_; }

private:
  // ---- PARAMETERS ----
  io::ByteStream& input_;
  std::size_t chunk_size_;
  Bytes pending_;
  std::size_t pending_offset_{0};
  bool input_done_{false};
  bool finished_{false};
  std::uint64_t bytes_consumed_{0};
  std::uint64_t segments_emitted_{0};

  // Pulls pieces from the input until a full segment is buffered or input ends
  void fill(Bytes& segment);
};

} // namespace dagsync::dag

#endif // DAGSYNC_DAG_CHUNKER_HPP
