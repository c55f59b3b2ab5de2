#ifndef DAGSYNC_TRANSFER_TRANSFORM_CHAIN_HPP
#define DAGSYNC_TRANSFER_TRANSFORM_CHAIN_HPP

#include <optional>
#include <vector>
#include "dag/node.hpp"
#include "transfer/transfer_config.hpp"
#include "utils/pipeliner.hpp"

namespace dagsync::transfer {

// Compression and encryption applied to a payload, with the descriptors that
// let a reader undo them
struct TransformChain {
  std::optional<dag::EncryptionInfo> encryption;
  std::optional<dag::CompressionInfo> compression;
  std::vector<uint8_t> key;

  // New random salt and derived key when a password is given
  static TransformChain for_upload(const UploadOptions& options, std::uint32_t kdf_iterations);

  // Re-derives the key from the stored descriptor. Throws dag::ConfigError
  // when a password is missing and crypto::DecryptionError when it is wrong.
  static TransformChain for_download(const dag::MetadataNode& metadata, const DownloadOptions& options);

  // Compression first, then encryption
  void apply_upload(utils::Pipeliner& pipeline) const;
  // Decryption first, then decompression
  void apply_download(utils::Pipeliner& pipeline) const;

  bool empty() const { return !encryption && !compression; }
};

} // namespace dagsync::transfer

#endif // DAGSYNC_TRANSFER_TRANSFORM_CHAIN_HPP
