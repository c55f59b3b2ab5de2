#include "utils/pipeliner.hpp"
#include <boost/log/trivial.hpp>

namespace dagsync {
namespace utils {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Pipeliner::Pipeliner(ProducerFn producer)
  : producer_(std::move(producer))
  , buffer_size_(64 * 1024)
  , eof_(false) {}


//==============================================
// PIPELINE CONSTRUCTION METHODS
//==============================================

PipelinerPtr Pipeliner::create(ProducerFn producer) {
  return std::make_shared<Pipeliner>(std::move(producer));
}

PipelinerPtr Pipeliner::create(io::ByteStream& input) {
  return create([&input](Bytes& piece) { return input.read(piece); });
}

PipelinerPtr Pipeliner::transform(StagePtr stage) {
  stages_.push_back(std::move(stage));
  return shared_from_this();
}


//==============================================
// PIPELINE EXECUTION
//==============================================

bool Pipeliner::read(Bytes& out) {
  out.clear();

  try {
    // Process pieces until we have enough data
    while (buffer_.size() < buffer_size_ && !eof_) {
      if (!process_next_chunk()) {
        finish_stages();
        eof_ = true;
      }
    }
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Pipeliner: Processing failed after " << bytes_in_ << " input bytes: " << e.what();
    eof_ = true;
    buffer_.clear();
    throw;
  }

  if (buffer_.empty()) {
    return false;
  }

  bytes_out_ += buffer_.size();
  out.swap(buffer_);
  buffer_.clear();
  return true;
}

bool Pipeliner::process_next_chunk() {
  Bytes current;
  if (!producer_(current)) {
    return false;
  }
  bytes_in_ += current.size();

  // Process piece through stages
  for (const auto& stage : stages_) {
    Bytes next;
    stage->update(current, next);
    current = std::move(next);
  }

  buffer_.insert(buffer_.end(), current.begin(), current.end());
  return true;
}

void Pipeliner::finish_stages() {
  // Output flushed by one stage still has to pass through the stages after it
  Bytes carry;
  for (const auto& stage : stages_) {
    Bytes next;
    if (!carry.empty()) {
      stage->update(carry, next);
    }
    stage->finish(next);
    carry = std::move(next);
  }

  buffer_.insert(buffer_.end(), carry.begin(), carry.end());
  BOOST_LOG_TRIVIAL(debug) << "Pipeliner: Input exhausted after " << bytes_in_ << " bytes through "
                           << stages_.size() << " stages";
}


//==============================================
// GETTERS AND SETTERS
//==============================================

void Pipeliner::set_buffer_size(std::size_t size) {
  buffer_size_ = size == 0 ? 1 : size;
}

} // namespace utils
} // namespace dagsync
