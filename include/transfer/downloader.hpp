#ifndef DAGSYNC_TRANSFER_DOWNLOADER_HPP
#define DAGSYNC_TRANSFER_DOWNLOADER_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <boost/asio/thread_pool.hpp>
#include "dag/node.hpp"
#include "io/byte_stream.hpp"
#include "transfer/block_fetcher.hpp"
#include "transfer/dag_reader.hpp"
#include "transfer/progress_channel.hpp"
#include "transfer/transfer_config.hpp"
#include "transfer/transform_chain.hpp"
#include "utils/pipeliner.hpp"

namespace dagsync::transfer {

// Lazy, forward-only, non-restartable plaintext of one file DAG. Decryption
// and decompression run as the caller reads. Any failure is thrown from read()
// and nothing already read should be trusted.
class DownloadStream : public io::ByteStream {
public:
  DownloadStream(std::shared_ptr<boost::asio::thread_pool> pool,
                 std::shared_ptr<BlockFetcher> fetcher,
                 std::size_t window, dag::Node data_root,
                 const TransformChain& transforms,
                 std::optional<std::uint64_t> expected_size,
                 std::size_t buffer_size,
                 std::shared_ptr<ProgressChannel> channel,
                 std::optional<dag::Cid> report_cid);
  ~DownloadStream() override;

  DownloadStream(const DownloadStream&) = delete;
  DownloadStream& operator=(const DownloadStream&) = delete;

  bool read(Bytes& out) override;

  std::uint64_t bytes_read() const { return bytes_read_; }

private:
  // ---- PARAMETERS ----
  // Destroyed in reverse order: pipeline, reader, fetcher, pool
  std::shared_ptr<boost::asio::thread_pool> pool_;
  std::shared_ptr<BlockFetcher> fetcher_;
  std::unique_ptr<DagReader> reader_;
  utils::PipelinerPtr pipeline_;

  std::optional<std::uint64_t> expected_size_;
  std::shared_ptr<ProgressChannel> channel_;
  // When set, success is published with this CID once the stream ends
  std::optional<dag::Cid> report_cid_;
  std::uint64_t bytes_read_{0};
  bool done_{false};
};

class Downloader {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Throws dag::ConfigError
  explicit Downloader(TransferConfig config);


  // ---- DOWNLOAD OPERATIONS ----
  // Resolves a metadata, file or chunk CID to its plaintext stream. Key
  // verification happens here, before any byte is produced.
  std::unique_ptr<DownloadStream> open(const dag::Cid& cid, const DownloadOptions& options = {},
                                       const std::shared_ptr<ProgressChannel>& channel = nullptr);

  Bytes read_all(const dag::Cid& cid, const DownloadOptions& options = {},
                 const std::shared_ptr<ProgressChannel>& channel = nullptr);

  // Writes a file at target, or a directory tree rooted at target for folder DAGs.
  // A folder target must be absent or an empty directory. Nothing is left at
  // target when the download fails.
  void download_to(const dag::Cid& cid, const std::filesystem::path& target,
                   const DownloadOptions& options = {},
                   const std::shared_ptr<ProgressChannel>& channel = nullptr);

  // Fetches and verifies a single node
  dag::Node stat(const dag::Cid& cid);


  // ---- GETTERS ----
  const TransferConfig& config() const { return config_; }

private:
  struct Resolved {
    std::optional<dag::MetadataNode> metadata;
    dag::Cid data_cid;
    dag::Node data;
    TransformChain transforms;
    std::uint64_t original_size{0};
  };

  // ---- PARAMETERS ----
  TransferConfig config_;

  Resolved resolve(BlockFetcher& fetcher, const dag::Cid& cid, const DownloadOptions& options);
  void download_folder(const std::shared_ptr<boost::asio::thread_pool>& pool,
                       const std::shared_ptr<BlockFetcher>& fetcher,
                       const Resolved& root, const std::filesystem::path& target,
                       const std::shared_ptr<ProgressChannel>& channel);
  // Writes through a temporary sibling that is renamed on success
  std::uint64_t write_file(DownloadStream& stream, const std::filesystem::path& target);
};

} // namespace dagsync::transfer

#endif // DAGSYNC_TRANSFER_DOWNLOADER_HPP
