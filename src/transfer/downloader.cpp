#include "transfer/downloader.hpp"
#include "transfer/transfer_error.hpp"
#include <fstream>
#include <boost/log/trivial.hpp>

namespace dagsync::transfer {

namespace fs = std::filesystem;

//==============================================
// DOWNLOAD STREAM
//==============================================

DownloadStream::DownloadStream(std::shared_ptr<boost::asio::thread_pool> pool,
                               std::shared_ptr<BlockFetcher> fetcher,
                               std::size_t window, dag::Node data_root,
                               const TransformChain& transforms,
                               std::optional<std::uint64_t> expected_size,
                               std::size_t buffer_size,
                               std::shared_ptr<ProgressChannel> channel,
                               std::optional<dag::Cid> report_cid)
  : pool_(std::move(pool))
  , fetcher_(std::move(fetcher))
  , expected_size_(expected_size)
  , channel_(std::move(channel))
  , report_cid_(std::move(report_cid)) {
  reader_ = std::make_unique<DagReader>(*fetcher_, *pool_, window, std::move(data_root));

  DagReader* reader = reader_.get();
  pipeline_ = utils::Pipeliner::create([reader](Bytes& piece) { return reader->read(piece); });
  pipeline_->set_buffer_size(buffer_size);
  transforms.apply_download(*pipeline_);
}

DownloadStream::~DownloadStream() = default;

bool DownloadStream::read(Bytes& out) {
  out.clear();
  if (done_) {
    return false;
  }

  try {
    if (channel_ && channel_->cancelled()) {
      throw CancelledError("download cancelled");
    }

    if (pipeline_->read(out)) {
      bytes_read_ += out.size();
      if (channel_) {
        channel_->advance(out.size());
      }
      return true;
    }

    done_ = true;
    if (expected_size_ && *expected_size_ != bytes_read_) {
      throw IntegrityError("payload is " + std::to_string(bytes_read_) + " bytes, metadata declares "
                           + std::to_string(*expected_size_));
    }
    if (channel_ && report_cid_) {
      channel_->succeed(*report_cid_);
    }
    return false;
  }
  catch (const std::exception& e) {
    done_ = true;
    out.clear();
    BOOST_LOG_TRIVIAL(error) << "Download stream: Failed after " << bytes_read_ << " bytes: " << e.what();
    if (channel_) {
      channel_->fail(e.what());
    }
    throw;
  }
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Downloader::Downloader(TransferConfig config) : config_(std::move(config)) {
  config_.validate();
}


//==============================================
// DOWNLOAD OPERATIONS
//==============================================

std::unique_ptr<DownloadStream> Downloader::open(const dag::Cid& cid, const DownloadOptions& options,
                                                 const std::shared_ptr<ProgressChannel>& channel) {
  BOOST_LOG_TRIVIAL(info) << "Downloader: Opening " << cid;

  try {
    auto pool = std::make_shared<boost::asio::thread_pool>(config_.concurrency);
    auto fetcher = std::make_shared<BlockFetcher>(*config_.store, config_.retry, channel.get());

    Resolved root = resolve(*fetcher, cid, options);
    if (std::holds_alternative<dag::FolderNode>(root.data)) {
      throw dag::ValidationError(dag::to_string(cid) + " is a folder; download it to a directory");
    }
    if (channel) {
      channel->set_total(root.original_size);
    }

    return std::make_unique<DownloadStream>(pool, fetcher, config_.concurrency, std::move(root.data),
                                            root.transforms, root.original_size,
                                            config_.pipeline_buffer_size, channel, cid);
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Downloader: Cannot open " << cid << ": " << e.what();
    if (channel) {
      channel->fail(e.what());
    }
    throw;
  }
}

Bytes Downloader::read_all(const dag::Cid& cid, const DownloadOptions& options,
                           const std::shared_ptr<ProgressChannel>& channel) {
  std::unique_ptr<DownloadStream> stream = open(cid, options, channel);

  Bytes result;
  Bytes piece;
  while (stream->read(piece)) {
    result.insert(result.end(), piece.begin(), piece.end());
  }
  return result;
}

void Downloader::download_to(const dag::Cid& cid, const fs::path& target, const DownloadOptions& options,
                             const std::shared_ptr<ProgressChannel>& channel) {
  BOOST_LOG_TRIVIAL(info) << "Downloader: Downloading " << cid << " to " << target.string();

  try {
    auto pool = std::make_shared<boost::asio::thread_pool>(config_.concurrency);
    auto fetcher = std::make_shared<BlockFetcher>(*config_.store, config_.retry, channel.get());

    Resolved root = resolve(*fetcher, cid, options);
    if (channel) {
      channel->set_total(root.original_size);
    }

    if (std::holds_alternative<dag::FolderNode>(root.data)) {
      download_folder(pool, fetcher, root, target, channel);
    } else {
      DownloadStream stream(pool, fetcher, config_.concurrency, std::move(root.data), root.transforms,
                            root.original_size, config_.pipeline_buffer_size, channel, std::nullopt);
      write_file(stream, target);
    }

    if (channel) {
      channel->succeed(cid);
    }
    BOOST_LOG_TRIVIAL(info) << "Downloader: Finished " << cid;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Downloader: Download of " << cid << " failed: " << e.what();
    if (channel) {
      channel->fail(e.what());
    }
    throw;
  }
}

dag::Node Downloader::stat(const dag::Cid& cid) {
  BlockFetcher fetcher(*config_.store, config_.retry);
  return fetcher.fetch(cid);
}


//==============================================
// RESOLUTION
//==============================================

Downloader::Resolved Downloader::resolve(BlockFetcher& fetcher, const dag::Cid& cid,
                                         const DownloadOptions& options) {
  options.validate();

  Resolved resolved;
  dag::Node node = fetcher.fetch(cid);

  if (auto* metadata = std::get_if<dag::MetadataNode>(&node)) {
    BOOST_LOG_TRIVIAL(debug) << "Downloader: '" << metadata->name << "' (" << metadata->mime_type
                             << ") -> " << metadata->data_cid;
    // Wrong or missing keys fail here, before anything is fetched or written
    resolved.transforms = TransformChain::for_download(*metadata, options);
    resolved.data_cid = metadata->data_cid;
    resolved.original_size = metadata->total_size;
    resolved.data = fetcher.fetch(metadata->data_cid);
    resolved.metadata = std::move(*metadata);
  } else {
    resolved.data_cid = cid;
    resolved.original_size = dag::node_size(node);
    resolved.data = std::move(node);
  }
  return resolved;
}

void Downloader::download_folder(const std::shared_ptr<boost::asio::thread_pool>& pool,
                                 const std::shared_ptr<BlockFetcher>& fetcher,
                                 const Resolved& root, const fs::path& target,
                                 const std::shared_ptr<ProgressChannel>& channel) {
  struct Pending {
    dag::FolderNode folder;
    fs::path dir;
  };

  std::error_code ec;
  if (fs::exists(target, ec) && !(fs::is_directory(target, ec) && fs::is_empty(target, ec))) {
    throw TransferError("destination already exists: " + target.string());
  }

  // The tree is assembled beside the target and only moved into place complete
  fs::path staging = target;
  staging += ".partial";
  fs::remove_all(staging, ec);

  try {
    std::vector<Pending> stack;
    stack.push_back(Pending{std::get<dag::FolderNode>(root.data), staging});
    std::uint64_t written = 0;

    while (!stack.empty()) {
      Pending current = std::move(stack.back());
      stack.pop_back();
      fs::create_directories(current.dir);

      for (const auto& entry : current.folder.entries) {
        fs::path path = current.dir / entry.name;
        dag::Node node = fetcher->fetch(entry.cid);
        if (dag::node_size(node) != entry.size) {
          throw IntegrityError("entry '" + entry.name + "' holds " + std::to_string(dag::node_size(node))
                               + " bytes, folder declares " + std::to_string(entry.size));
        }

        if (entry.kind == dag::EntryKind::Folder) {
          stack.push_back(Pending{std::move(std::get<dag::FolderNode>(node)), path});
          continue;
        }

        DownloadStream stream(pool, fetcher, config_.concurrency, std::move(node), root.transforms,
                              std::nullopt, config_.pipeline_buffer_size, channel, std::nullopt);
        written += write_file(stream, path);
      }
    }

    if (written != root.original_size) {
      throw IntegrityError("folder payload is " + std::to_string(written) + " bytes, expected "
                           + std::to_string(root.original_size));
    }

    if (fs::exists(target)) {
      fs::remove(target);
    }
    if (target.has_parent_path()) {
      fs::create_directories(target.parent_path());
    }
    fs::rename(staging, target);
  }
  catch (const std::exception&) {
    std::error_code ignored;
    fs::remove_all(staging, ignored);
    throw;
  }
}

std::uint64_t Downloader::write_file(DownloadStream& stream, const fs::path& target) {
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path());
  }
  fs::path temp_path = target;
  temp_path += ".partial";

  try {
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw TransferError("cannot create " + temp_path.string());
    }

    Bytes piece;
    while (stream.read(piece)) {
      file.write(reinterpret_cast<const char*>(piece.data()), static_cast<std::streamsize>(piece.size()));
      if (!file) {
        throw TransferError("failed to write " + temp_path.string());
      }
    }
    file.close();
    if (!file) {
      throw TransferError("failed to write " + temp_path.string());
    }

    fs::rename(temp_path, target);
  }
  catch (const std::exception&) {
    // Partial output is never left behind as a valid file
    std::error_code ignored;
    fs::remove(temp_path, ignored);
    throw;
  }

  BOOST_LOG_TRIVIAL(debug) << "Downloader: Wrote " << stream.bytes_read() << " bytes to " << target.string();
  return stream.bytes_read();
}

} // namespace dagsync::transfer
