#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "crypto/cipher_provider.hpp"
#include "store/write_channel.hpp"

struct sqlite3;

namespace ghostnet {
namespace store {

enum class Sender { ME, PEER };
enum class ContentType { TEXT, FILE };
enum class SortOrder { ASCENDING, DESCENDING };

const char* to_string(Sender sender);
const char* to_string(ContentType type);
// Seconds since the epoch as local "YYYY-MM-DD HH:MM:SS"
std::string format_local_time(double timestamp);

struct StoredMessage {
  int64_t id = 0;
  std::string peer_ip;
  Sender sender = Sender::PEER;
  std::string content;        // decrypted, or the placeholder when decryption failed
  ContentType type = ContentType::TEXT;
  double timestamp = 0.0;     // seconds since the epoch
  std::string file_path;
  bool decrypted = true;
};

struct StoredPeer {
  std::string ip;
  std::string username;
  double last_seen = 0.0;
};

struct Statistics {
  std::size_t total_messages = 0;
  std::size_t total_peers = 0;
  std::optional<double> oldest_message;
  std::optional<double> newest_message;
};

// Encrypted message history and persisted peers in one SQLite database.
// Every database access is serialized by a single store-wide mutex.
class Store {
public:
  static constexpr const char* DECRYPTION_FAILED = "[Decryption Failed]";

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Opens (or creates) the database and starts the writer thread; throws StoreError
  Store(const std::filesystem::path& db_path, crypto::CipherProvider& cipher);
  ~Store();

  Store(const Store&) = delete;
  Store& operator=(const Store&) = delete;


  // ---- MESSAGES ----
  // Queues an encrypted insert and returns immediately; failures are logged and dropped
  void save_message(const std::string& peer_ip, Sender sender, const std::string& content,
                    ContentType type, const std::string& file_path = "",
                    std::optional<double> timestamp = std::nullopt);
  // Synchronous insert; throws StoreError or crypto::KeyUnavailableError
  int64_t insert_message(const std::string& peer_ip, Sender sender, const std::string& content,
                         ContentType type, const std::string& file_path, double timestamp);
  // Most recent `limit` messages, returned in the requested timestamp order
  std::vector<StoredMessage> get_history(const std::string& peer_ip, std::size_t limit = 100,
                                         SortOrder order = SortOrder::ASCENDING);
  // Deletes messages older than `hours`; returns the number deleted
  std::size_t cleanup_older_than(int hours);
  std::size_t delete_peer_history(const std::string& peer_ip);


  // ---- PEERS ----
  void save_peer(const std::string& ip, const std::string& username,
                 std::optional<double> last_seen = std::nullopt);
  // Queued variant used from the discovery listener
  void save_peer_async(const std::string& ip, const std::string& username);
  std::vector<StoredPeer> get_all_peers();
  std::optional<std::string> get_peer_username(const std::string& ip);


  // ---- EXPORT ----
  // Writes a readable transcript; returns the number of messages written
  std::size_t export_chat(const std::string& peer_ip, std::ostream& output);
  std::size_t export_chat(const std::string& peer_ip, const std::filesystem::path& output_path);


  // ---- MAINTENANCE ----
  Statistics get_statistics();
  void vacuum();
  // Blocks until every queued write has been applied
  void flush();


  // ---- GETTERS ----
  const std::filesystem::path& db_path() const { return db_path_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path db_path_;
  crypto::CipherProvider& cipher_;
  sqlite3* db_;
  mutable std::mutex mutex_;

  // Asynchronous writes
  WriteChannel channel_;
  std::atomic<bool> running_;
  std::unique_ptr<std::thread> writer_thread_;


  // ---- INITIALIZATION ----
  void open_database();
  void init_tables();
  void exec(const std::string& sql);


  // ---- WRITER THREAD ----
  void writer_loop();
};

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace store
} // namespace ghostnet
