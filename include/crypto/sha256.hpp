#ifndef GHOSTNET_SHA256_HPP
#define GHOSTNET_SHA256_HPP

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>
#include "crypto_error.hpp"

namespace ghostnet::crypto {

// Incremental SHA-256 over OpenSSL EVP
class Sha256 {
public:
  static constexpr size_t DIGEST_SIZE = 32;

  Sha256();
  ~Sha256();

  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;

  void update(const void* data, size_t length);
  void update(const std::string& data) { update(data.data(), data.size()); }

  // Finalizes the digest; further updates are not allowed
  std::array<uint8_t, DIGEST_SIZE> digest();
  std::string hex_digest();

  // ---- ONE-SHOT HELPERS ----
  static std::array<uint8_t, DIGEST_SIZE> hash(const std::string& data);
  static std::string hex(const std::string& data);
  // Hashes a file in 8 KiB chunks
  static std::string file_hex(const std::filesystem::path& path);

private:
  struct Context;
  Context* context_;
  bool finalized_ = false;
};

std::string to_hex(const uint8_t* data, size_t length);

} // namespace ghostnet::crypto

#endif // GHOSTNET_SHA256_HPP
