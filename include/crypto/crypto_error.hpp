#ifndef GHOSTNET_CRYPTO_ERROR_HPP
#define GHOSTNET_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace ghostnet::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message)
        : std::runtime_error(message) {}
};

// Storage key could not be loaded or created; no cipher is available
class KeyUnavailableError : public CryptoError {
public:
    explicit KeyUnavailableError(const std::string& message)
        : CryptoError("Key unavailable: " + message) {}
};

// Wire key derivation failed; never replaced by a random key
class KeyDerivationError : public CryptoError {
public:
    explicit KeyDerivationError(const std::string& message)
        : CryptoError("Key derivation error: " + message) {}
};

class EncryptionError : public CryptoError {
public:
    explicit EncryptionError(const std::string& message)
        : CryptoError("Encryption error: " + message) {}
};

class DecryptionError : public CryptoError {
public:
    explicit DecryptionError(const std::string& message)
        : CryptoError("Decryption error: " + message) {}
};

} // namespace ghostnet::crypto

#endif // GHOSTNET_CRYPTO_ERROR_HPP
