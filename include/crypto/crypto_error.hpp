#ifndef DAGSYNC_CRYPTO_ERROR_HPP
#define DAGSYNC_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace dagsync::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message)
        : std::runtime_error(message) {}
};

// Cipher context, key or IV could not be set up
class InitializationError : public CryptoError {
public:
    explicit InitializationError(const std::string& message)
        : CryptoError("Initialization error: " + message) {}
};

// PBKDF2 parameters rejected or randomness unavailable
class KeyDerivationError : public InitializationError {
public:
    explicit KeyDerivationError(const std::string& message)
        : InitializationError("key derivation: " + message) {}
};

class EncryptionError : public CryptoError {
public:
    explicit EncryptionError(const std::string& message)
        : CryptoError("Encryption error: " + message) {}
};

class DecryptionError : public CryptoError {
public:
    enum class Reason {
        WrongKey,           // key check value did not match
        CorruptCiphertext,  // truncated data or bad padding
        UnsupportedCipher   // metadata names a cipher this build cannot run
    };

    explicit DecryptionError(const std::string& message)
        : DecryptionError(Reason::CorruptCiphertext, message) {}

    DecryptionError(Reason reason, const std::string& message)
        : CryptoError("Decryption error (" + std::string(reason_name(reason)) + "): " + message)
        , reason_(reason) {}

    Reason reason() const { return reason_; }

    static const char* reason_name(Reason reason) {
        switch (reason) {
            case Reason::WrongKey: return "wrong key";
            case Reason::CorruptCiphertext: return "corrupt ciphertext";
            case Reason::UnsupportedCipher: return "unsupported cipher";
            default: return "unknown";
        }
    }

private:
    Reason reason_;
};

} // namespace dagsync::crypto

#endif // DAGSYNC_CRYPTO_ERROR_HPP
