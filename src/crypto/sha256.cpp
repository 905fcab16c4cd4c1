#include "crypto/sha256.hpp"
#include <openssl/evp.h>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace ghostnet::crypto {

struct Sha256::Context {
  EVP_MD_CTX* ctx = nullptr;
};

Sha256::Sha256()
  : context_(new Context) {
  // Create a new message digest context for the hashing operation
  context_->ctx = EVP_MD_CTX_new();
  if (!context_->ctx) {
    delete context_;
    throw CryptoError("Sha256: Failed to create hash context");
  }

  if (!EVP_DigestInit_ex(context_->ctx, EVP_sha256(), nullptr)) {
    EVP_MD_CTX_free(context_->ctx);
    delete context_;
    throw CryptoError("Sha256: Failed to initialize hash context");
  }
}

Sha256::~Sha256() {
  EVP_MD_CTX_free(context_->ctx);
  delete context_;
}

void Sha256::update(const void* data, size_t length) {
  if (finalized_) {
    throw CryptoError("Sha256: Update after finalize");
  }
  if (length > 0 && !EVP_DigestUpdate(context_->ctx, data, length)) {
    throw CryptoError("Sha256: Failed to update hash");
  }
}

std::array<uint8_t, Sha256::DIGEST_SIZE> Sha256::digest() {
  if (finalized_) {
    throw CryptoError("Sha256: Digest already finalized");
  }

  std::array<uint8_t, DIGEST_SIZE> result{};
  unsigned int length = 0;
  if (!EVP_DigestFinal_ex(context_->ctx, result.data(), &length) || length != DIGEST_SIZE) {
    throw CryptoError("Sha256: Failed to finalize hash");
  }
  finalized_ = true;
  return result;
}

std::string Sha256::hex_digest() {
  auto result = digest();
  return to_hex(result.data(), result.size());
}


//==============================================
// ONE-SHOT HELPERS
//==============================================

std::array<uint8_t, Sha256::DIGEST_SIZE> Sha256::hash(const std::string& data) {
  Sha256 sha;
  sha.update(data);
  return sha.digest();
}

std::string Sha256::hex(const std::string& data) {
  Sha256 sha;
  sha.update(data);
  return sha.hex_digest();
}

std::string Sha256::file_hex(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw CryptoError("Sha256: Failed to open file: " + path.string());
  }

  Sha256 sha;
  std::vector<char> buffer(8192);
  while (file.read(buffer.data(), buffer.size()) || file.gcount() > 0) {
    sha.update(buffer.data(), static_cast<size_t>(file.gcount()));
  }
  if (file.bad()) {
    throw CryptoError("Sha256: Failed to read file: " + path.string());
  }
  return sha.hex_digest();
}

std::string to_hex(const uint8_t* data, size_t length) {
  std::stringstream ss;
  for (size_t i = 0; i < length; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return ss.str();
}

} // namespace ghostnet::crypto
