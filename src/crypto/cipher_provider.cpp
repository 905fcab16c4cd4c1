#include "crypto/cipher_provider.hpp"
#include "crypto/sha256.hpp"
#include <boost/log/trivial.hpp>
#include <openssl/crypto.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <thread>

namespace ghostnet::crypto {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CipherProvider::CipherProvider(const std::filesystem::path& key_path)
  : key_path_(key_path) {
  BOOST_LOG_TRIVIAL(info) << "Cipher provider: Using storage key file: " << key_path_.string();
}

CipherProvider::~CipherProvider() = default;


//==============================================
// STORAGE KEY
//==============================================

bool CipherProvider::storage_available() {
  std::call_once(storage_once_, [this]() { initialize_storage_key(); });
  return storage_cipher_ != nullptr;
}

std::string CipherProvider::storage_error() {
  std::call_once(storage_once_, [this]() { initialize_storage_key(); });
  return storage_error_;
}

TokenCipher& CipherProvider::storage_cipher() {
  if (!storage_available()) {
    throw KeyUnavailableError(storage_error_);
  }
  return *storage_cipher_;
}

std::string CipherProvider::encrypt_for_storage(const std::string& plaintext) {
  return storage_cipher().encrypt(plaintext);
}

std::string CipherProvider::decrypt_from_storage(const std::string& token) {
  return storage_cipher().decrypt(token);
}

void CipherProvider::initialize_storage_key() {
  try {
    if (key_path_.has_parent_path()) {
      std::filesystem::create_directories(key_path_.parent_path());
    }

    std::vector<uint8_t> key = TokenCipher::generate_key();
    if (create_key_file(key)) {
      BOOST_LOG_TRIVIAL(info) << "Cipher provider: Generated new storage key";
    } else {
      key = read_key_file();
      BOOST_LOG_TRIVIAL(info) << "Cipher provider: Loaded existing storage key";
    }

    storage_cipher_ = std::make_unique<TokenCipher>(key);
    OPENSSL_cleanse(key.data(), key.size());
  }
  catch (const std::exception& e) {
    storage_cipher_.reset();
    storage_error_ = e.what();
    BOOST_LOG_TRIVIAL(error) << "Cipher provider: Storage encryption unavailable: " << e.what();
  }
}

bool CipherProvider::create_key_file(const std::vector<uint8_t>& key) {
  // Written under a private name first; link() then publishes it only if no key file exists,
  // so a concurrent reader never sees a partially written key
  std::ostringstream temp_name;
  temp_name << key_path_.string() << ".tmp." << ::getpid() << "." << std::this_thread::get_id();
  const std::string temp_path = temp_name.str();

  int fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, S_IRUSR | S_IWUSR);
  if (fd < 0) {
    throw KeyUnavailableError("Cannot create key file " + temp_path + ": " + std::strerror(errno));
  }

  const std::string encoded = TokenCipher::encode_base64url(key);
  size_t written = 0;
  while (written < encoded.size()) {
    ssize_t n = ::write(fd, encoded.data() + written, encoded.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      int saved_errno = errno;
      ::close(fd);
      ::unlink(temp_path.c_str());
      throw KeyUnavailableError("Cannot write key file: " + std::string(std::strerror(saved_errno)));
    }
    written += static_cast<size_t>(n);
  }

  if (::fsync(fd) != 0) {
    BOOST_LOG_TRIVIAL(warning) << "Cipher provider: fsync on key file failed: " << std::strerror(errno);
  }
  ::close(fd);

  const int linked = ::link(temp_path.c_str(), key_path_.c_str());
  const int link_errno = errno;
  ::unlink(temp_path.c_str());

  if (linked != 0) {
    if (link_errno == EEXIST) {
      return false;
    }
    throw KeyUnavailableError("Cannot create key file " + key_path_.string() + ": " + std::strerror(link_errno));
  }
  return true;
}

std::vector<uint8_t> CipherProvider::read_key_file() {
  std::ifstream file(key_path_, std::ios::binary);
  if (!file) {
    throw KeyUnavailableError("Cannot read key file " + key_path_.string());
  }

  std::stringstream ss;
  ss << file.rdbuf();
  std::string encoded = ss.str();

  // Trim trailing whitespace left by editors
  while (!encoded.empty() && std::isspace(static_cast<unsigned char>(encoded.back()))) {
    encoded.pop_back();
  }

  std::vector<uint8_t> key;
  try {
    key = TokenCipher::decode_base64url(encoded);
  }
  catch (const CryptoError&) {
    throw KeyUnavailableError("Key file " + key_path_.string() + " is corrupt");
  }
  if (key.size() != TokenCipher::KEY_SIZE) {
    throw KeyUnavailableError("Key file " + key_path_.string() + " has wrong key size");
  }
  return key;
}


//==============================================
// WIRE KEY
//==============================================

boost::gregorian::date CipherProvider::utc_today() {
  return boost::gregorian::day_clock::universal_day();
}

std::vector<uint8_t> CipherProvider::derive_wire_key(const boost::gregorian::date& day) {
  if (day.is_special()) {
    throw KeyDerivationError("Invalid calendar date");
  }

  try {
    const std::string material = std::string(WIRE_KEY_PREFIX) + boost::gregorian::to_iso_extended_string(day);
    auto digest = Sha256::hash(material);
    return std::vector<uint8_t>(digest.begin(), digest.end());
  }
  catch (const std::exception& e) {
    throw KeyDerivationError(e.what());
  }
}

std::string CipherProvider::encrypt_for_wire(const std::string& plaintext) const {
  return encrypt_for_wire(plaintext, utc_today());
}

std::string CipherProvider::encrypt_for_wire(const std::string& plaintext,
                                             const boost::gregorian::date& day) const {
  TokenCipher cipher(derive_wire_key(day));
  return cipher.encrypt(plaintext);
}

std::string CipherProvider::decrypt_from_wire(const std::string& token) const {
  return decrypt_from_wire(token, utc_today());
}

std::string CipherProvider::decrypt_from_wire(const std::string& token,
                                              const boost::gregorian::date& today) const {
  try {
    TokenCipher current(derive_wire_key(today));
    return current.decrypt(token);
  }
  catch (const DecryptionError&) {
    BOOST_LOG_TRIVIAL(debug) << "Cipher provider: Current wire key rejected token, trying previous day";
  }

  TokenCipher previous(derive_wire_key(today - boost::gregorian::days(1)));
  return previous.decrypt(token);
}

} // namespace ghostnet::crypto
