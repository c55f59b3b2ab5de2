#include "crypto/crypto_stream.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <algorithm>
#include <limits>
#include <boost/log/trivial.hpp>

namespace dagsync::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  // Initialize new cipher context
  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw InitializationError("Crypto stream: Failed to create cipher context");
    }
  }

  ~CipherContext() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }

  CipherContext(const CipherContext&) = delete;
  CipherContext& operator=(const CipherContext&) = delete;

  // Access the underlying context
  EVP_CIPHER_CTX* get() { return ctx; }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CryptoStream::CryptoStream(const std::vector<uint8_t>& key, Mode mode)
  : mode_(mode) {
  if (key.size() != KEY_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Crypto stream: Invalid key size: " << key.size() << " bytes (expected " << KEY_SIZE << " bytes)";
    throw InitializationError("Invalid key size");
  }

  key_ = key;
  context_ = std::make_unique<CipherContext>();

  if (mode_ == Mode::Encrypt) {
    iv_ = generate_IV();
  }
  BOOST_LOG_TRIVIAL(debug) << "Crypto stream: Created for " << (mode_ == Mode::Encrypt ? "encryption" : "decryption");
}

CryptoStream::~CryptoStream() = default;

void CryptoStream::set_IV(const std::array<uint8_t, IV_SIZE>& iv) {
  if (mode_ != Mode::Encrypt || cipher_ready_) {
    throw InitializationError("IV can only be set before encryption starts");
  }
  iv_ = iv;
}

//==============================================
// CRYPTO UNIT INITIALIZATION
//==============================================

void CryptoStream::initializeCipher() {
  bool encrypting = mode_ == Mode::Encrypt;
  BOOST_LOG_TRIVIAL(debug) << "Crypto stream: Initializing cipher for " << (encrypting ? "encryption" : "decryption");

  const EVP_CIPHER* cipher = EVP_aes_256_cbc();
  if (encrypting) {
    if (!EVP_EncryptInit_ex(context_->get(), cipher, nullptr, key_.data(), iv_.data())) {
      throw EncryptionError("Crypto stream: Failed to initialize encryption context");
    }
  } else {
    if (!EVP_DecryptInit_ex(context_->get(), cipher, nullptr, key_.data(), iv_.data())) {
      throw DecryptionError("Crypto stream: Failed to initialize decryption context");
    }
  }
  cipher_ready_ = true;
}

//==============================================
// STREAM PROCESSING - ENCRYPTION/DECRYPTION
//==============================================

void CryptoStream::update(const Bytes& input, Bytes& output) {
  if (finished_) {
    throw CryptoError("Crypto stream: update after finish");
  }

  const uint8_t* data = input.data();
  size_t length = input.size();

  if (mode_ == Mode::Encrypt) {
    if (!cipher_ready_) {
      // Stream starts with the IV
      initializeCipher();
      output.insert(output.end(), iv_.begin(), iv_.end());
    }
  } else if (!cipher_ready_) {
    size_t take = std::min(IV_SIZE - iv_received_, length);
    std::copy(data, data + take, iv_.begin() + iv_received_);
    iv_received_ += take;
    data += take;
    length -= take;
    if (iv_received_ < IV_SIZE) {
      return;
    }
    initializeCipher();
  }

  if (length > 0) {
    processDataBlock(data, length, output);
  }
}

void CryptoStream::finish(Bytes& output) {
  if (finished_) {
    return;
  }

  if (mode_ == Mode::Encrypt && !cipher_ready_) {
    // Empty plaintext still yields IV plus one padding block
    initializeCipher();
    output.insert(output.end(), iv_.begin(), iv_.end());
  }
  if (mode_ == Mode::Decrypt && !cipher_ready_) {
    BOOST_LOG_TRIVIAL(error) << "Crypto stream: Ciphertext ended after " << iv_received_ << " bytes, inside the IV";
    throw DecryptionError("ciphertext is shorter than the IV");
  }

  processFinalBlock(output);
  finished_ = true;
  BOOST_LOG_TRIVIAL(debug) << "Crypto stream: Completed " << (mode_ == Mode::Encrypt ? "encryption" : "decryption")
                           << ": Processed " << bytes_processed_ << " bytes";
}

void CryptoStream::processDataBlock(const uint8_t* inbuf, size_t length, Bytes& output) {
  constexpr size_t MAX_STEP = static_cast<size_t>(std::numeric_limits<int>::max()) - BLOCK_SIZE;

  while (length > 0) {
    size_t step = std::min(length, MAX_STEP);
    size_t offset = output.size();
    output.resize(offset + step + BLOCK_SIZE);

    int outlen = 0;
    if (mode_ == Mode::Encrypt) {
      if (!EVP_EncryptUpdate(context_->get(), output.data() + offset, &outlen,
                             inbuf, static_cast<int>(step))) {
        throw EncryptionError("Crypto stream: Failed to encrypt data block");
      }
    } else {
      if (!EVP_DecryptUpdate(context_->get(), output.data() + offset, &outlen,
                             inbuf, static_cast<int>(step))) {
        throw DecryptionError("Crypto stream: Failed to decrypt data block");
      }
    }

    output.resize(offset + static_cast<size_t>(outlen));
    bytes_processed_ += step;
    inbuf += step;
    length -= step;
  }
}

void CryptoStream::processFinalBlock(Bytes& output) {
  size_t offset = output.size();
  output.resize(offset + BLOCK_SIZE);

  int outlen = 0;
  if (mode_ == Mode::Encrypt) {
    if (!EVP_EncryptFinal_ex(context_->get(), output.data() + offset, &outlen)) {
      throw EncryptionError("Crypto stream: Failed to finalize encryption");
    }
  } else {
    if (!EVP_DecryptFinal_ex(context_->get(), output.data() + offset, &outlen)) {
      BOOST_LOG_TRIVIAL(error) << "Crypto stream: Bad padding in final block";
      throw DecryptionError("Crypto stream: Failed to finalize decryption");
    }
  }
  output.resize(offset + static_cast<size_t>(outlen));
}

//==============================================
// PUBLIC IV GENERATION METHOD
//==============================================

std::array<uint8_t, CryptoStream::IV_SIZE> CryptoStream::generate_IV() {
  std::array<uint8_t, IV_SIZE> iv;
  if (RAND_bytes(iv.data(), static_cast<int>(iv.size())) != 1) {
    throw InitializationError("Crypto stream: Failed to generate random IV");
  }
  return iv;
}

} // namespace dagsync::crypto
