#ifndef DAGSYNC_TRANSFER_UPLOADER_HPP
#define DAGSYNC_TRANSFER_UPLOADER_HPP

#include <filesystem>
#include <memory>
#include <string>
#include "dag/dag_builder.hpp"
#include "io/byte_stream.hpp"
#include "transfer/block_uploader.hpp"
#include "transfer/progress_channel.hpp"
#include "transfer/transfer_config.hpp"
#include "transfer/transform_chain.hpp"

namespace dagsync::transfer {

struct UploadResult {
    // Publishable root
    dag::Cid metadata_cid;
    // Root of the file or folder DAG
    dag::Cid data_cid;
    // Payload size before compression and encryption
    std::uint64_t original_size{0};
    // Payload size as stored
    std::uint64_t stored_size{0};
    std::size_t blocks_sent{0};
};

// Builds and transmits DAGs. Every call runs one self-contained pipeline and
// publishes exactly one terminal event on the channel, when one is given.
class Uploader {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Throws dag::ConfigError
  explicit Uploader(TransferConfig config);


  // ---- UPLOAD OPERATIONS ----
  UploadResult upload(io::ByteSource& source, const UploadOptions& options = {},
                      const std::shared_ptr<ProgressChannel>& channel = nullptr);
  UploadResult upload_buffer(const Bytes& data, const std::string& name,
                             const UploadOptions& options = {},
                             const std::shared_ptr<ProgressChannel>& channel = nullptr);
  // Regular file or directory
  UploadResult upload_path(const std::filesystem::path& path, const UploadOptions& options = {},
                           const std::shared_ptr<ProgressChannel>& channel = nullptr);
  // Depth-first, children before parents, metadata root last
  UploadResult upload_folder(const std::filesystem::path& root, const UploadOptions& options = {},
                             const std::shared_ptr<ProgressChannel>& channel = nullptr);


  // ---- GETTERS ----
  const TransferConfig& config() const { return config_; }

private:
  // ---- PARAMETERS ----
  TransferConfig config_;
  dag::DagBuilder builder_;

  struct FileUpload {
    dag::DagHead head;
    std::uint64_t original_size{0};
  };

  // Runs one file payload through the transforms into the builder
  FileUpload upload_stream(io::ByteStream& input, const TransformChain& transforms,
                             BlockUploader& sink, ProgressChannel* channel);
  // Iterative post-order walk; returns the root folder and the original byte total
  FileUpload upload_folder_tree(const std::filesystem::path& root, const TransformChain& transforms,
                                BlockUploader& sink, ProgressChannel* channel);
  // Builds the metadata root over a finished data DAG
  UploadResult finish_upload(const std::string& name, const std::string& mime_type,
                             const FileUpload& data, const TransformChain& transforms,
                             BlockUploader& sink);
};

} // namespace dagsync::transfer

#endif // DAGSYNC_TRANSFER_UPLOADER_HPP
