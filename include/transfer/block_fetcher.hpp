#ifndef DAGSYNC_TRANSFER_BLOCK_FETCHER_HPP
#define DAGSYNC_TRANSFER_BLOCK_FETCHER_HPP

#include <atomic>
#include <future>
#include <boost/asio/thread_pool.hpp>
#include "dag/node.hpp"
#include "store/remote_store.hpp"
#include "transfer/progress_channel.hpp"
#include "transfer/transfer_config.hpp"

namespace dagsync::transfer {

// Gets blocks from the store and only returns nodes that verifiably belong to
// the requested CID.
class BlockFetcher {
public:
  BlockFetcher(store::RemoteStore& store, RetryPolicy retry,
               ProgressChannel* channel = nullptr);

  // Fetch with retry, verify and decode. Throws NotFoundError, IntegrityError,
  // TransferError after the last attempt, CancelledError.
  dag::Node fetch(const dag::Cid& cid);

  // Same as fetch(), run on the pool
  std::future<dag::Node> fetch_async(const dag::Cid& cid, boost::asio::thread_pool& pool);

  // Checks that data hashes to cid and decodes to the variant cid names.
  // Throws IntegrityError, or DecodeError for bytes that hash correctly but
  // cannot be decoded.
  static dag::Node verify(const dag::Cid& cid, const Bytes& data);

  std::size_t blocks_fetched() const { return blocks_fetched_.load(); }

private:
  store::RemoteStore& store_;
  RetryPolicy retry_;
  ProgressChannel* channel_;
  std::atomic<std::size_t> blocks_fetched_{0};
};

} // namespace dagsync::transfer

#endif // DAGSYNC_TRANSFER_BLOCK_FETCHER_HPP
