#ifndef DAGSYNC_CRYPTO_STREAM_HPP
#define DAGSYNC_CRYPTO_STREAM_HPP

#include <array>
#include <memory>
#include <vector>
#include "crypto_error.hpp"
#include "utils/pipeliner.hpp"

namespace dagsync::crypto {

// Forward declaration for OpenSSL cipher context
struct CipherContext;

// Incremental AES-256-CBC stage. The encrypted stream is the IV followed by the
// PKCS#7 padded ciphertext; decryption reads the IV back from the stream head.
class CryptoStream : public utils::StreamStage {
public:

  enum class Mode {
    Encrypt,
    Decrypt
  };

  static constexpr const char* ALGORITHM = "aes-256-cbc";
  static constexpr size_t KEY_SIZE = 32;     // 256 bits for AES-256
  static constexpr size_t IV_SIZE = 16;      // 128 bits for CBC mode
  static constexpr size_t BLOCK_SIZE = 16;   // AES block size

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Throws InitializationError for a key that is not KEY_SIZE bytes
  CryptoStream(const std::vector<uint8_t>& key, Mode mode);
  ~CryptoStream() override;

  // Generate an initialization vector
  static std::array<uint8_t, IV_SIZE> generate_IV();

  // Encrypt mode only: replaces the random IV (deterministic output for tests)
  void set_IV(const std::array<uint8_t, IV_SIZE>& iv);


  // ---- STREAM STAGE ----
  void update(const Bytes& input, Bytes& output) override;
  void finish(Bytes& output) override;


  // ---- GETTERS ----
  Mode getMode() const { return mode_; }
  std::uint64_t bytes_processed() const { return bytes_processed_; }

private:
  // ---- PARAMETERS ----
  std::vector<uint8_t> key_;
  std::array<uint8_t, IV_SIZE> iv_{};
  std::unique_ptr<CipherContext> context_;
  Mode mode_;
  bool cipher_ready_ = false;
  bool finished_ = false;
  size_t iv_received_ = 0;
  std::uint64_t bytes_processed_ = 0;


  // ---- INITIALIZATION ----
  // Initializes cipher context once the IV is known
  void initializeCipher();


  // ---- STREAM PROCESSING - ENCRYPTION/DECRYPTION ----
  // Encrypts or decrypts bytes using the configured cipher, appending to output
  void processDataBlock(const uint8_t* inbuf, size_t length, Bytes& output);
  // Handles the final block with padding
  void processFinalBlock(Bytes& output);
};

} // namespace dagsync::crypto

#endif // DAGSYNC_CRYPTO_STREAM_HPP
