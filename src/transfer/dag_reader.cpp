#include "transfer/dag_reader.hpp"
#include "transfer/transfer_error.hpp"
#include <boost/log/trivial.hpp>

namespace dagsync::transfer {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

DagReader::DagReader(BlockFetcher& fetcher, boost::asio::thread_pool& pool,
                     std::size_t window, dag::Node root)
  : fetcher_(fetcher)
  , pool_(pool)
  , window_(window == 0 ? 1 : window) {
  if (auto* chunk = std::get_if<dag::ChunkNode>(&root)) {
    size_ = chunk->data.size();
    inline_payload_ = std::move(chunk->data);
  } else if (auto* file = std::get_if<dag::FileNode>(&root)) {
    size_ = file->size;
    if (file->inline_data) {
      inline_payload_ = std::move(*file->inline_data);
    } else {
      expand(*file);
    }
  } else {
    throw dag::ValidationError(std::string("cannot read a ") + dag::node_kind_name(root) + " node as file content");
  }
}

DagReader::~DagReader() {
  for (auto& pending : pending_) {
    if (pending.fetch && pending.fetch->valid()) {
      pending.fetch->wait();
    }
  }
}


//==============================================
// BYTE STREAM
//==============================================

bool DagReader::read(Bytes& out) {
  out.clear();

  if (inline_payload_) {
    out = std::move(*inline_payload_);
    inline_payload_.reset();
    bytes_emitted_ += out.size();
    return true;
  }

  while (!pending_.empty()) {
    schedule();
    if (!pending_.front().fetch) {
      // Freshly expanded children sit ahead of fetches already in flight
      pending_.front().fetch = fetcher_.fetch_async(pending_.front().link.cid, pool_);
      ++in_flight_;
    }

    Pending front = std::move(pending_.front());
    pending_.pop_front();
    --in_flight_;

    // Rethrows whatever the fetch raised
    dag::Node node = front.fetch->get();
    if (dag::node_size(node) != front.link.size) {
      BOOST_LOG_TRIVIAL(error) << "DAG reader: " << front.link.cid << " holds " << dag::node_size(node)
                               << " bytes, link declares " << front.link.size;
      throw IntegrityError("size of " + dag::to_string(front.link.cid) + " does not match its link");
    }

    if (auto* chunk = std::get_if<dag::ChunkNode>(&node)) {
      out = std::move(chunk->data);
      bytes_emitted_ += out.size();
      return true;
    }

    auto& file = std::get<dag::FileNode>(node);
    if (file.inline_data) {
      out = std::move(*file.inline_data);
      bytes_emitted_ += out.size();
      return true;
    }
    expand(file);
  }

  if (bytes_emitted_ != size_) {
    throw IntegrityError("file DAG produced " + std::to_string(bytes_emitted_) + " bytes, expected "
                         + std::to_string(size_));
  }
  return false;
}


//==============================================
// PREFETCH
//==============================================

void DagReader::schedule() {
  for (auto it = pending_.begin(); it != pending_.end() && in_flight_ < window_; ++it) {
    if (!it->fetch) {
      it->fetch = fetcher_.fetch_async(it->link.cid, pool_);
      ++in_flight_;
    }
  }
}

void DagReader::expand(const dag::FileNode& file) {
  for (auto it = file.links.rbegin(); it != file.links.rend(); ++it) {
    pending_.push_front(Pending{*it, std::nullopt});
  }
}

} // namespace dagsync::transfer
