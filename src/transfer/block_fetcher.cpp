#include "transfer/block_fetcher.hpp"
#include "dag/node_codec.hpp"
#include "transfer/retry.hpp"
#include <memory>
#include <boost/asio/post.hpp>
#include <boost/log/trivial.hpp>

namespace dagsync::transfer {

BlockFetcher::BlockFetcher(store::RemoteStore& store, RetryPolicy retry, ProgressChannel* channel)
  : store_(store)
  , retry_(retry)
  , channel_(channel) {}

dag::Node BlockFetcher::fetch(const dag::Cid& cid) {
  std::function<bool()> cancelled;
  if (channel_) {
    cancelled = [this] { return channel_->cancelled(); };
  }

  Bytes data = with_retry(retry_, "get " + dag::to_string(cid), [&] {
    return store_.get(cid);
  }, cancelled);

  dag::Node node = verify(cid, data);
  ++blocks_fetched_;
  BOOST_LOG_TRIVIAL(trace) << "Block fetcher: Fetched " << dag::node_kind_name(node) << " node " << cid;
  return node;
}

std::future<dag::Node> BlockFetcher::fetch_async(const dag::Cid& cid, boost::asio::thread_pool& pool) {
  auto promise = std::make_shared<std::promise<dag::Node>>();
  std::future<dag::Node> result = promise->get_future();

  boost::asio::post(pool, [this, cid, promise]() {
    try {
      promise->set_value(fetch(cid));
    } catch (...) {
      // Rethrown from future::get on the reading thread
      promise->set_exception(std::current_exception());
    }
  });
  return result;
}

dag::Node BlockFetcher::verify(const dag::Cid& cid, const Bytes& data) {
  Bytes digest = dag::compute_digest(cid.hash, data);
  if (digest != cid.digest) {
    BOOST_LOG_TRIVIAL(error) << "Block fetcher: Digest mismatch for " << cid << ", got "
                             << dag::to_hex(digest);
    throw IntegrityError("bytes returned for " + dag::to_string(cid) + " do not match its digest");
  }

  dag::Node node = dag::decode(data);
  if (dag::codec_of(node) != cid.codec) {
    BOOST_LOG_TRIVIAL(error) << "Block fetcher: " << cid << " decoded to a " << dag::node_kind_name(node) << " node";
    throw IntegrityError(dag::to_string(cid) + " names a " + dag::codec_name(cid.codec)
                         + " node but holds a " + dag::node_kind_name(node) + " node");
  }
  return node;
}

} // namespace dagsync::transfer
