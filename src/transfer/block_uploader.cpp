#include "transfer/block_uploader.hpp"
#include "transfer/retry.hpp"
#include <boost/asio/post.hpp>
#include <boost/log/trivial.hpp>

namespace dagsync::transfer {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

BlockUploader::BlockUploader(store::RemoteStore& store, boost::asio::thread_pool& pool,
                             std::size_t concurrency, RetryPolicy retry,
                             ProgressChannel* channel)
  : store_(store)
  , pool_(pool)
  , concurrency_(concurrency == 0 ? 1 : concurrency)
  , retry_(retry)
  , channel_(channel) {}

BlockUploader::~BlockUploader() {
  // Pool tasks reference this object
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return in_flight_ == 0; });
}


//==============================================
// BLOCK SINK
//==============================================

void BlockUploader::put(dag::Block block) {
  check_cancelled();

  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return in_flight_ < concurrency_ || error_; });
  if (error_) {
    std::rethrow_exception(error_);
  }

  if (!scheduled_.insert(block.cid).second) {
    BOOST_LOG_TRIVIAL(trace) << "Block uploader: Skipping repeated block " << block.cid;
    scheduled_mark_ = source_read_;
    publish_acknowledged();
    return;
  }
  std::uint64_t sequence = next_sequence_++;
  outstanding_.emplace(sequence, scheduled_mark_);
  scheduled_mark_ = source_read_;
  ++in_flight_;
  lock.unlock();

  boost::asio::post(pool_, [this, sequence, block = std::move(block)]() {
    std::exception_ptr failure;
    try {
      store_block(block);
    } catch (...) {
      // Handed to the pipeline thread by put() or drain()
      failure = std::current_exception();
    }

    std::lock_guard<std::mutex> guard(mutex_);
    if (failure && !error_) {
      error_ = failure;
    }
    if (!failure) {
      ++blocks_sent_;
      bytes_sent_ += block.data.size();
      outstanding_.erase(sequence);
      publish_acknowledged();
    }
    --in_flight_;
    cv_.notify_all();
  });
}

void BlockUploader::drain() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return in_flight_ == 0; });
  if (error_) {
    std::rethrow_exception(error_);
  }
  lock.unlock();

  check_cancelled();
}


//==============================================
// PROGRESS
//==============================================

void BlockUploader::record_source_bytes(std::uint64_t bytes) {
  std::lock_guard<std::mutex> lock(mutex_);
  source_read_ += bytes;
}

void BlockUploader::publish_acknowledged() {
  if (!channel_) {
    return;
  }
  std::uint64_t acknowledged = outstanding_.empty() ? scheduled_mark_ : outstanding_.begin()->second;
  if (acknowledged > reported_) {
    channel_->advance(acknowledged - reported_);
    reported_ = acknowledged;
  }
}

void BlockUploader::store_block(const dag::Block& block) {
  std::function<bool()> cancelled;
  if (channel_) {
    cancelled = [this] { return channel_->cancelled(); };
  }

  with_retry(retry_, "put " + dag::to_string(block.cid), [&] {
    store_.put(block.cid, block.data);
  }, cancelled);

  BOOST_LOG_TRIVIAL(trace) << "Block uploader: Stored " << block.data.size() << " bytes as " << block.cid;
}

void BlockUploader::check_cancelled() const {
  if (channel_ && channel_->cancelled()) {
    throw CancelledError("upload cancelled");
  }
}


//==============================================
// GETTERS
//==============================================

std::size_t BlockUploader::blocks_sent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return blocks_sent_;
}

std::uint64_t BlockUploader::bytes_sent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return bytes_sent_;
}

} // namespace dagsync::transfer
