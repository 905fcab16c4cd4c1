#ifndef GHOSTNET_TOKEN_CIPHER_HPP
#define GHOSTNET_TOKEN_CIPHER_HPP

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "crypto_error.hpp"

namespace ghostnet::crypto {

// Authenticated symmetric cipher producing base64url tokens:
//   0x80 | be64 timestamp | IV | AES-128-CBC(PKCS7) ciphertext | HMAC-SHA256
// The 32-byte key is split into a signing half and an encryption half.
class TokenCipher {
public:
  static constexpr size_t KEY_SIZE = 32;     // signing key + encryption key
  static constexpr size_t HALF_KEY_SIZE = 16;
  static constexpr size_t IV_SIZE = 16;      // 128 bits for CBC mode
  static constexpr size_t BLOCK_SIZE = 16;   // AES block size
  static constexpr size_t HMAC_SIZE = 32;    // SHA-256 output
  static constexpr uint8_t VERSION = 0x80;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit TokenCipher(const std::vector<uint8_t>& key);
  ~TokenCipher();

  TokenCipher(const TokenCipher&) = delete;
  TokenCipher& operator=(const TokenCipher&) = delete;


  // ---- ENCRYPTION/DECRYPTION OPERATIONS ----
  // Encrypts with a fresh IV and the current time
  std::string encrypt(const std::string& plaintext) const;
  // Encrypts with caller-supplied timestamp and IV
  std::string encrypt(const std::string& plaintext, uint64_t timestamp,
                      const std::array<uint8_t, IV_SIZE>& iv) const;
  // Verifies the HMAC and decrypts; throws DecryptionError on any mismatch
  std::string decrypt(const std::string& token) const;


  // ---- KEY MATERIAL ----
  static std::vector<uint8_t> generate_key();
  static std::array<uint8_t, IV_SIZE> generate_IV();


  // ---- ENCODING ----
  static std::string encode_base64url(const std::vector<uint8_t>& data);
  // Throws DecryptionError on characters outside the base64url alphabet
  static std::vector<uint8_t> decode_base64url(const std::string& text);

private:
  // ---- PARAMETERS ----
  std::vector<uint8_t> signing_key_;
  std::vector<uint8_t> encryption_key_;


  // ---- CIPHER OPERATIONS ----
  std::vector<uint8_t> run_cipher(const uint8_t* input, size_t length,
                                  const uint8_t* iv, bool encrypting) const;
  std::array<uint8_t, HMAC_SIZE> sign(const uint8_t* data, size_t length) const;
};

} // namespace ghostnet::crypto

#endif // GHOSTNET_TOKEN_CIPHER_HPP
