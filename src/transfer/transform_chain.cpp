#include "transfer/transform_chain.hpp"
#include "compress/compression_stream.hpp"
#include "crypto/crypto_stream.hpp"
#include "crypto/key_derivation.hpp"
#include <boost/log/trivial.hpp>

namespace dagsync::transfer {

TransformChain TransformChain::for_upload(const UploadOptions& options, std::uint32_t kdf_iterations) {
  options.validate();
  TransformChain chain;

  if (options.compression) {
    chain.compression = dag::CompressionInfo{compress::CompressionStream::ALGORITHM};
  }

  if (options.password) {
    dag::EncryptionInfo info;
    info.algorithm = crypto::CryptoStream::ALGORITHM;
    info.salt = crypto::random_bytes(crypto::SALT_SIZE);
    info.iterations = kdf_iterations;

    crypto::DerivedKey derived = crypto::derive_key(*options.password, info.salt, kdf_iterations);
    info.key_check = derived.key_check;
    chain.key = std::move(derived.key);
    chain.encryption = std::move(info);
  }
  return chain;
}

TransformChain TransformChain::for_download(const dag::MetadataNode& metadata, const DownloadOptions& options) {
  options.validate();
  TransformChain chain;

  if (metadata.compression) {
    if (metadata.compression->algorithm != compress::CompressionStream::ALGORITHM) {
      throw compress::CompressionError("unsupported algorithm '" + metadata.compression->algorithm + "'");
    }
    chain.compression = metadata.compression;
  }

  if (metadata.encryption) {
    const dag::EncryptionInfo& info = *metadata.encryption;
    if (info.algorithm != crypto::CryptoStream::ALGORITHM) {
      throw crypto::DecryptionError(crypto::DecryptionError::Reason::UnsupportedCipher,
                                    "unsupported algorithm '" + info.algorithm + "'");
    }
    if (!options.password) {
      throw dag::ConfigError("'" + metadata.name + "' is encrypted and no password was given");
    }

    crypto::DerivedKey derived = crypto::derive_key(*options.password, info.salt, info.iterations);
    if (!crypto::key_matches(derived, info.key_check)) {
      BOOST_LOG_TRIVIAL(error) << "Transform chain: Wrong password for '" << metadata.name << "'";
      throw crypto::DecryptionError(crypto::DecryptionError::Reason::WrongKey, "wrong password or key");
    }
    chain.key = std::move(derived.key);
    chain.encryption = info;
  }
  return chain;
}

void TransformChain::apply_upload(utils::Pipeliner& pipeline) const {
  if (compression) {
    pipeline.transform(std::make_shared<compress::CompressionStream>(compress::CompressionStream::Mode::Compress));
  }
  if (encryption) {
    pipeline.transform(std::make_shared<crypto::CryptoStream>(key, crypto::CryptoStream::Mode::Encrypt));
  }
}

void TransformChain::apply_download(utils::Pipeliner& pipeline) const {
  if (encryption) {
    pipeline.transform(std::make_shared<crypto::CryptoStream>(key, crypto::CryptoStream::Mode::Decrypt));
  }
  if (compression) {
    pipeline.transform(std::make_shared<compress::CompressionStream>(compress::CompressionStream::Mode::Decompress));
  }
}

} // namespace dagsync::transfer
