#ifndef DAGSYNC_TRANSFER_BLOCK_UPLOADER_HPP
#define DAGSYNC_TRANSFER_BLOCK_UPLOADER_HPP

#include <condition_variable>
#include <exception>
#include <map>
#include <mutex>
#include <unordered_set>
#include <boost/asio/thread_pool.hpp>
#include "dag/block_sink.hpp"
#include "store/remote_store.hpp"
#include "transfer/progress_channel.hpp"
#include "transfer/transfer_config.hpp"

namespace dagsync::transfer {

// Block sink that stores blocks on a thread pool with at most `concurrency`
// puts in flight. put() blocks while the window is full; drain() waits for
// every outstanding put and rethrows the first failure.
class BlockUploader : public dag::BlockSink {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  BlockUploader(store::RemoteStore& store, boost::asio::thread_pool& pool,
                std::size_t concurrency, RetryPolicy retry,
                ProgressChannel* channel = nullptr);
  // Waits for in-flight puts, never throws
  ~BlockUploader() override;

  BlockUploader(const BlockUploader&) = delete;
  BlockUploader& operator=(const BlockUploader&) = delete;


  // ---- BLOCK SINK ----
  void put(dag::Block block) override;
  void drain() override;


  // ---- PROGRESS ----
  // Counts source bytes consumed by the builder. They reach the progress
  // channel only once every block emitted after them has been acknowledged.
  void record_source_bytes(std::uint64_t bytes);


  // ---- GETTERS ----
  std::size_t blocks_sent() const;
  std::uint64_t bytes_sent() const;

private:
  // ---- PARAMETERS ----
  store::RemoteStore& store_;
  boost::asio::thread_pool& pool_;
  std::size_t concurrency_;
  RetryPolicy retry_;
  ProgressChannel* channel_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::size_t in_flight_{0};
  std::exception_ptr error_;
  // Blocks already scheduled by this uploader
  std::unordered_set<dag::Cid> scheduled_;
  std::size_t blocks_sent_{0};
  std::uint64_t bytes_sent_{0};

  // Source bytes read so far, and read when the last block was scheduled
  std::uint64_t source_read_{0};
  std::uint64_t scheduled_mark_{0};
  std::uint64_t reported_{0};
  // Outstanding puts by sequence number, each mapped to the mark of the
  // block scheduled before it
  std::map<std::uint64_t, std::uint64_t> outstanding_;
  std::uint64_t next_sequence_{0};

  // Runs on the pool
  void store_block(const dag::Block& block);
  void check_cancelled() const;
  // Called with mutex_ held
  void publish_acknowledged();
};

} // namespace dagsync::transfer

#endif // DAGSYNC_TRANSFER_BLOCK_UPLOADER_HPP
