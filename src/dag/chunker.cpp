#include "dag/chunker.hpp"
#include "dag/dag_error.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace dagsync::dag {

Chunker::Chunker(io::ByteStream& input, std::size_t chunk_size)
  : input_(input)
  , chunk_size_(chunk_size) {
  if (chunk_size_ == 0) {
    BOOST_LOG_TRIVIAL(error) << "Chunker: Chunk size must be positive";
    throw ConfigError("chunk size must be greater than zero");
  }
  BOOST_LOG_TRIVIAL(debug) << "Chunker: Created with chunk size " << chunk_size_;
}

bool Chunker::next(Bytes& segment) {
  if (finished_) {
    return false;
  }

  segment.clear();
  fill(segment);

  if (segment.empty() && segments_emitted_ > 0) {
    finished_ = true;
    return false;
  }

  // First call on an empty input still yields one (empty) segment
  ++segments_emitted_;
  bytes_consumed_ += segment.size();
  if (input_done_ && pending_offset_ >= pending_.size()) {
    // Nothing left: the next call reports exhaustion without touching the input
    finished_ = segment.size() < chunk_size_;
  }

  BOOST_LOG_TRIVIAL(trace) << "Chunker: Segment " << segments_emitted_ << " of " << segment.size() << " bytes";
  return true;
}

void Chunker::fill(Bytes& segment) {
  segment.reserve(chunk_size_);

  while (segment.size() < chunk_size_) {
    if (pending_offset_ >= pending_.size()) {
      if (input_done_) {
        return;
      }
      pending_offset_ = 0;
      if (!input_.read(pending_)) {
        pending_.clear();
        input_done_ = true;
        return;
      }
      continue;
    }

    std::size_t take = std::min(chunk_size_ - segment.size(), pending_.size() - pending_offset_);
    segment.insert(segment.end(), pending_.begin() + pending_offset_, pending_.begin() + pending_offset_ + take);
    pending_offset_ += take;
  }
}

} // namespace dagsync::dag
