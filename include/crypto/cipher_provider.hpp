#ifndef GHOSTNET_CIPHER_PROVIDER_HPP
#define GHOSTNET_CIPHER_PROVIDER_HPP

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "token_cipher.hpp"

namespace ghostnet::crypto {

// Owns the two key domains of the engine:
//  - storage key: random, persisted once to a 0600 key file, encrypts data at rest
//  - wire key: SHA-256 of "GhostNet-YYYY-MM-DD" (UTC), shared by every node on the same day
//
// The wire key is a shared secret by convention only. Anyone who knows the scheme and the
// date can read headers; it keeps casual observers out and nothing more.
class CipherProvider {
public:
  static constexpr const char* WIRE_KEY_PREFIX = "GhostNet-";

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit CipherProvider(const std::filesystem::path& key_path);
  ~CipherProvider();

  CipherProvider(const CipherProvider&) = delete;
  CipherProvider& operator=(const CipherProvider&) = delete;


  // ---- STORAGE KEY ----
  // Loads or creates the key file on first use; false when no key could be obtained
  bool storage_available();
  // Reason the storage key is unavailable (empty when available)
  std::string storage_error();
  // Both throw KeyUnavailableError when the storage key is unavailable
  std::string encrypt_for_storage(const std::string& plaintext);
  std::string decrypt_from_storage(const std::string& token);


  // ---- WIRE KEY ----
  std::string encrypt_for_wire(const std::string& plaintext) const;
  std::string encrypt_for_wire(const std::string& plaintext, const boost::gregorian::date& day) const;
  // Tries the key of `today`, then the key of the previous day
  std::string decrypt_from_wire(const std::string& token) const;
  std::string decrypt_from_wire(const std::string& token, const boost::gregorian::date& today) const;

  static std::vector<uint8_t> derive_wire_key(const boost::gregorian::date& day);
  static boost::gregorian::date utc_today();


  // ---- GETTERS ----
  const std::filesystem::path& key_path() const { return key_path_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path key_path_;
  std::once_flag storage_once_;
  std::unique_ptr<TokenCipher> storage_cipher_;
  std::string storage_error_;


  // ---- STORAGE KEY INITIALIZATION ----
  void initialize_storage_key();
  // Publishes a fully written key file atomically; returns false if one already exists
  bool create_key_file(const std::vector<uint8_t>& key);
  std::vector<uint8_t> read_key_file();
  TokenCipher& storage_cipher();
};

} // namespace ghostnet::crypto

#endif // GHOSTNET_CIPHER_PROVIDER_HPP
