#include "crypto/token_cipher.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstring>

namespace ghostnet::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

namespace {

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  // Initialize new cipher context
  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw CryptoError("Token cipher: Failed to create cipher context");
    }
  }

  ~CipherContext() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }

  EVP_CIPHER_CTX* get() { return ctx; }
};

constexpr size_t TIMESTAMP_SIZE = sizeof(uint64_t);
constexpr size_t PREFIX_SIZE = 1 + TIMESTAMP_SIZE + TokenCipher::IV_SIZE;

} // namespace


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TokenCipher::TokenCipher(const std::vector<uint8_t>& key) {
  if (key.size() != KEY_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Token cipher: Invalid key size: " << key.size()
                             << " bytes (expected " << KEY_SIZE << " bytes)";
    throw CryptoError("Token cipher: Invalid key size");
  }

  signing_key_.assign(key.begin(), key.begin() + HALF_KEY_SIZE);
  encryption_key_.assign(key.begin() + HALF_KEY_SIZE, key.end());
}

TokenCipher::~TokenCipher() {
  OPENSSL_cleanse(signing_key_.data(), signing_key_.size());
  OPENSSL_cleanse(encryption_key_.data(), encryption_key_.size());
}


//==============================================
// ENCRYPTION/DECRYPTION OPERATIONS
//==============================================

std::string TokenCipher::encrypt(const std::string& plaintext) const {
  auto now = std::chrono::duration_cast<std::chrono::seconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
  return encrypt(plaintext, static_cast<uint64_t>(now), generate_IV());
}

std::string TokenCipher::encrypt(const std::string& plaintext, uint64_t timestamp,
                                 const std::array<uint8_t, IV_SIZE>& iv) const {
  std::vector<uint8_t> token;
  token.reserve(PREFIX_SIZE + plaintext.size() + BLOCK_SIZE + HMAC_SIZE);

  // Version byte and big-endian timestamp
  token.push_back(VERSION);
  uint64_t network_timestamp = boost::endian::native_to_big(timestamp);
  const auto* ts_bytes = reinterpret_cast<const uint8_t*>(&network_timestamp);
  token.insert(token.end(), ts_bytes, ts_bytes + TIMESTAMP_SIZE);
  token.insert(token.end(), iv.begin(), iv.end());

  auto ciphertext = run_cipher(reinterpret_cast<const uint8_t*>(plaintext.data()),
                               plaintext.size(), iv.data(), true);
  token.insert(token.end(), ciphertext.begin(), ciphertext.end());

  auto mac = sign(token.data(), token.size());
  token.insert(token.end(), mac.begin(), mac.end());

  return encode_base64url(token);
}

std::string TokenCipher::decrypt(const std::string& token) const {
  std::vector<uint8_t> data = decode_base64url(token);

  if (data.size() < PREFIX_SIZE + BLOCK_SIZE + HMAC_SIZE) {
    throw DecryptionError("Token cipher: Token too short");
  }
  if (data[0] != VERSION) {
    throw DecryptionError("Token cipher: Unsupported token version");
  }

  const size_t signed_length = data.size() - HMAC_SIZE;
  auto expected = sign(data.data(), signed_length);
  if (CRYPTO_memcmp(expected.data(), data.data() + signed_length, HMAC_SIZE) != 0) {
    throw DecryptionError("Token cipher: Signature mismatch");
  }

  const size_t ciphertext_length = signed_length - PREFIX_SIZE;
  if (ciphertext_length % BLOCK_SIZE != 0) {
    throw DecryptionError("Token cipher: Ciphertext is not block aligned");
  }

  const uint8_t* iv = data.data() + 1 + TIMESTAMP_SIZE;
  auto plaintext = run_cipher(data.data() + PREFIX_SIZE, ciphertext_length, iv, false);
  return std::string(plaintext.begin(), plaintext.end());
}

std::vector<uint8_t> TokenCipher::run_cipher(const uint8_t* input, size_t length,
                                             const uint8_t* iv, bool encrypting) const {
  CipherContext context;
  const EVP_CIPHER* cipher = EVP_aes_128_cbc();

  if (EVP_CipherInit_ex(context.get(), cipher, nullptr, encryption_key_.data(), iv,
                        encrypting ? 1 : 0) != 1) {
    if (encrypting) {
      throw EncryptionError("Token cipher: Failed to initialize encryption context");
    }
    throw DecryptionError("Token cipher: Failed to initialize decryption context");
  }

  std::vector<uint8_t> output(length + BLOCK_SIZE);
  int outlen = 0;
  if (EVP_CipherUpdate(context.get(), output.data(), &outlen, input,
                       static_cast<int>(length)) != 1) {
    if (encrypting) {
      throw EncryptionError("Token cipher: Failed to encrypt data");
    }
    throw DecryptionError("Token cipher: Failed to decrypt data");
  }

  int final_outlen = 0;
  if (EVP_CipherFinal_ex(context.get(), output.data() + outlen, &final_outlen) != 1) {
    if (encrypting) {
      throw EncryptionError("Token cipher: Failed to finalize encryption");
    }
    throw DecryptionError("Token cipher: Invalid padding");
  }

  output.resize(static_cast<size_t>(outlen + final_outlen));
  return output;
}

std::array<uint8_t, TokenCipher::HMAC_SIZE> TokenCipher::sign(const uint8_t* data, size_t length) const {
  std::array<uint8_t, HMAC_SIZE> mac{};
  unsigned int mac_length = 0;
  if (!HMAC(EVP_sha256(), signing_key_.data(), static_cast<int>(signing_key_.size()),
            data, length, mac.data(), &mac_length) || mac_length != HMAC_SIZE) {
    throw CryptoError("Token cipher: Failed to compute HMAC");
  }
  return mac;
}


//==============================================
// KEY MATERIAL
//==============================================

std::vector<uint8_t> TokenCipher::generate_key() {
  std::vector<uint8_t> key(KEY_SIZE);
  if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1) {
    throw KeyUnavailableError("Token cipher: Failed to generate random key");
  }
  return key;
}

std::array<uint8_t, TokenCipher::IV_SIZE> TokenCipher::generate_IV() {
  std::array<uint8_t, IV_SIZE> iv;
  if (RAND_bytes(iv.data(), static_cast<int>(iv.size())) != 1) {
    throw EncryptionError("Token cipher: Failed to generate random IV");
  }
  return iv;
}


//==============================================
// ENCODING
//==============================================

std::string TokenCipher::encode_base64url(const std::vector<uint8_t>& data) {
  // EVP_EncodeBlock writes a trailing NUL
  std::string encoded(4 * ((data.size() + 2) / 3) + 1, '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&encoded[0]),
                                data.data(), static_cast<int>(data.size()));
  encoded.resize(static_cast<size_t>(written));

  std::replace(encoded.begin(), encoded.end(), '+', '-');
  std::replace(encoded.begin(), encoded.end(), '/', '_');
  return encoded;
}

std::vector<uint8_t> TokenCipher::decode_base64url(const std::string& text) {
  std::string standard;
  standard.reserve(text.size() + 3);

  for (char c : text) {
    if (c == '-') {
      standard.push_back('+');
    } else if (c == '_') {
      standard.push_back('/');
    } else if (std::isalnum(static_cast<unsigned char>(c)) || c == '=') {
      standard.push_back(c);
    } else {
      throw DecryptionError("Token cipher: Invalid base64url character");
    }
  }

  while (standard.size() % 4 != 0) {
    standard.push_back('=');
  }
  if (standard.empty()) {
    return {};
  }

  std::vector<uint8_t> decoded(3 * standard.size() / 4);
  int written = EVP_DecodeBlock(decoded.data(),
                                reinterpret_cast<const unsigned char*>(standard.data()),
                                static_cast<int>(standard.size()));
  if (written < 0) {
    throw DecryptionError("Token cipher: Malformed base64url input");
  }

  // EVP_DecodeBlock counts padding as zero bytes
  size_t padding = 0;
  for (auto it = standard.rbegin(); it != standard.rend() && *it == '='; ++it) {
    ++padding;
  }
  decoded.resize(static_cast<size_t>(written) - std::min<size_t>(padding, written));
  return decoded;
}

} // namespace ghostnet::crypto
