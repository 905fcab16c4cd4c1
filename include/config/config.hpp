#ifndef GHOSTNET_CONFIG_HPP
#define GHOSTNET_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ghostnet {
namespace config {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

// JSON-backed settings. Every setter persists immediately; keys this version does
// not know about are carried through load and save untouched.
class Config {
public:
  using ChangeCallback = std::function<void(const std::string& key,
                                            const nlohmann::json& old_value,
                                            const nlohmann::json& new_value)>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Loads `path` if present, otherwise starts from defaults with a generated username
  explicit Config(const std::filesystem::path& path);
  ~Config() = default;

  Config(const Config&) = delete;
  Config& operator=(const Config&) = delete;


  // ---- GENERIC ACCESS ----
  nlohmann::json get(const std::string& key) const;
  // Validates known keys (std::invalid_argument), stores and persists (ConfigError)
  void set(const std::string& key, const nlohmann::json& value);
  void on_change(ChangeCallback callback);
  // Restores every default except the username, then persists
  void reset_to_defaults();
  // Writes to a temporary file and renames it over the config; throws ConfigError
  void save() const;


  // ---- TYPED GETTERS ----
  std::string username() const;
  int retention_hours() const;
  bool auto_cleanup() const;
  int max_file_size_mb() const;
  uint64_t max_file_size_bytes() const;
  std::filesystem::path data_dir() const;
  std::filesystem::path downloads_dir() const;
  uint16_t discovery_port() const;
  uint16_t transport_port() const;
  std::string bind_address() const;
  std::string broadcast_address() const;
  std::string advertise_address() const;
  std::chrono::milliseconds beacon_interval() const;
  std::chrono::milliseconds peer_timeout() const;
  std::chrono::milliseconds prune_interval() const;


  // ---- TYPED SETTERS ----
  void set_username(const std::string& username);
  void set_retention_hours(int hours);
  void set_auto_cleanup(bool enabled);
  void set_max_file_size_mb(int megabytes);
  void set_downloads_dir(const std::filesystem::path& dir);


  // ---- PATH HELPERS ----
  // Creates the downloads directory, falling back to ./.ghostnet_downloads
  std::filesystem::path ensure_downloads_dir() const;
  std::filesystem::path database_path() const { return data_dir() / "ghostnet.db"; }
  std::filesystem::path key_path() const { return data_dir() / "secret.key"; }
  const std::filesystem::path& path() const { return path_; }


  // ---- DEFAULTS ----
  static nlohmann::json defaults();
  static std::string generate_username();
  static std::filesystem::path home_dir();

private:
  // ---- PARAMETERS ----
  std::filesystem::path path_;
  nlohmann::json values_;
  std::vector<ChangeCallback> callbacks_;
  mutable std::mutex mutex_;


  // ---- INTERNAL ----
  void load();
  void save_locked() const;
  // Throws std::invalid_argument when a known key has an unacceptable value
  static void validate(const std::string& key, const nlohmann::json& value);
  void notify(const std::string& key, const nlohmann::json& old_value,
              const nlohmann::json& new_value);
};

} // namespace config
} // namespace ghostnet

#endif // GHOSTNET_CONFIG_HPP
