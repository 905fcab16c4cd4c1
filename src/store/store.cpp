#include "store/store.hpp"
#include "network/codec.hpp"
#include <boost/log/trivial.hpp>
#include <sqlite3.h>
#include <algorithm>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace ghostnet {
namespace store {

//=================================================
// RAII WRAPPER TO MANAGE STATEMENT LIFECYCLE
//=================================================

namespace {

class Statement {
public:
  Statement(sqlite3* db, const std::string& sql)
    : db_(db) {
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
      throw StoreError("Store: Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }
  }

  ~Statement() {
    sqlite3_finalize(stmt_);
  }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  void bind(int index, const std::string& value) {
    check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
  }

  void bind_blob(int index, const std::string& value) {
    check(sqlite3_bind_blob(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
  }

  void bind(int index, double value) {
    check(sqlite3_bind_double(stmt_, index, value));
  }

  void bind(int index, int64_t value) {
    check(sqlite3_bind_int64(stmt_, index, value));
  }

  void bind_null(int index) {
    check(sqlite3_bind_null(stmt_, index));
  }

  // True while rows are available; throws on error
  bool step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
      return true;
    }
    if (rc == SQLITE_DONE) {
      return false;
    }
    throw StoreError("Store: Statement failed: " + std::string(sqlite3_errmsg(db_)));
  }

  std::string column_text(int index) {
    const unsigned char* text = sqlite3_column_text(stmt_, index);
    if (!text) {
      return "";
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, index)));
  }

  std::string column_blob(int index) {
    const void* blob = sqlite3_column_blob(stmt_, index);
    if (!blob) {
      return "";
    }
    return std::string(static_cast<const char*>(blob),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, index)));
  }

  double column_double(int index) { return sqlite3_column_double(stmt_, index); }
  int64_t column_int64(int index) { return sqlite3_column_int64(stmt_, index); }
  bool column_is_null(int index) { return sqlite3_column_type(stmt_, index) == SQLITE_NULL; }

private:
  sqlite3* db_;
  sqlite3_stmt* stmt_ = nullptr;

  void check(int rc) {
    if (rc != SQLITE_OK) {
      throw StoreError("Store: Failed to bind parameter: " + std::string(sqlite3_errmsg(db_)));
    }
  }
};

Sender sender_from_string(const std::string& value) {
  return value == "ME" ? Sender::ME : Sender::PEER;
}

ContentType type_from_string(const std::string& value) {
  return value == "FILE" ? ContentType::FILE : ContentType::TEXT;
}

} // namespace

std::string format_local_time(double timestamp) {
  std::time_t seconds = static_cast<std::time_t>(timestamp);
  std::tm local{};
  localtime_r(&seconds, &local);

  std::ostringstream ss;
  ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

const char* to_string(Sender sender) {
  return sender == Sender::ME ? "ME" : "PEER";
}

const char* to_string(ContentType type) {
  return type == ContentType::FILE ? "FILE" : "TEXT";
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Store::Store(const std::filesystem::path& db_path, crypto::CipherProvider& cipher)
  : db_path_(db_path)
  , cipher_(cipher)
  , db_(nullptr)
  , running_(false) {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing store at: " << db_path_.string();

  open_database();
  init_tables();

  running_ = true;
  writer_thread_ = std::make_unique<std::thread>(&Store::writer_loop, this);

  BOOST_LOG_TRIVIAL(info) << "Store: Store initialization complete";
}

Store::~Store() {
  running_ = false;
  channel_.close();
  if (writer_thread_ && writer_thread_->joinable()) {
    writer_thread_->join();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (db_) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
  BOOST_LOG_TRIVIAL(info) << "Store: Store closed";
}


//==============================================
// INITIALIZATION
//==============================================

void Store::open_database() {
  try {
    if (db_path_.has_parent_path()) {
      std::filesystem::create_directories(db_path_.parent_path());
    }
  }
  catch (const std::filesystem::filesystem_error& e) {
    throw StoreError("Store: Cannot create database directory: " + std::string(e.what()));
  }

  if (sqlite3_open(db_path_.c_str(), &db_) != SQLITE_OK) {
    std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to open database: " << message;
    throw StoreError("Store: Failed to open database: " + message);
  }
  sqlite3_busy_timeout(db_, 5000);
}

void Store::init_tables() {
  std::lock_guard<std::mutex> lock(mutex_);

  exec("CREATE TABLE IF NOT EXISTS peers ("
       "  ip TEXT PRIMARY KEY,"
       "  username TEXT NOT NULL,"
       "  last_seen REAL NOT NULL)");
  exec("CREATE TABLE IF NOT EXISTS messages ("
       "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
       "  peer_ip TEXT NOT NULL,"
       "  sender TEXT NOT NULL,"
       "  content BLOB NOT NULL,"
       "  message_type TEXT NOT NULL,"
       "  timestamp REAL NOT NULL,"
       "  file_path TEXT,"
       "  FOREIGN KEY (peer_ip) REFERENCES peers(ip))");
  exec("CREATE INDEX IF NOT EXISTS idx_messages_peer ON messages(peer_ip)");
  exec("CREATE INDEX IF NOT EXISTS idx_messages_timestamp ON messages(timestamp)");

  BOOST_LOG_TRIVIAL(debug) << "Store: Tables created/verified";
}

void Store::exec(const std::string& sql) {
  char* error = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error) != SQLITE_OK) {
    std::string message = error ? error : "unknown error";
    sqlite3_free(error);
    throw StoreError("Store: " + message);
  }
}


//==============================================
// WRITER THREAD
//==============================================

void Store::writer_loop() {
  BOOST_LOG_TRIVIAL(info) << "Store: Starting writer thread";

  while (true) {
    WriteChannel::Task task;
    if (!channel_.consume(task, std::chrono::milliseconds(200))) {
      if (!running_) {
        break;
      }
      continue;
    }

    try {
      task();
    }
    catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Store: Dropped queued write: " << e.what();
    }
    channel_.task_done();
  }

  BOOST_LOG_TRIVIAL(info) << "Store: Writer thread stopped";
}

void Store::flush() {
  channel_.wait_idle();
}


//==============================================
// MESSAGES
//==============================================

void Store::save_message(const std::string& peer_ip, Sender sender, const std::string& content,
                         ContentType type, const std::string& file_path,
                         std::optional<double> timestamp) {
  const double when = timestamp.value_or(network::Codec::unix_time_now());

  bool queued = channel_.produce([this, peer_ip, sender, content, type, file_path, when]() {
    insert_message(peer_ip, sender, content, type, file_path, when);
  });
  if (!queued) {
    BOOST_LOG_TRIVIAL(error) << "Store: Store is shutting down, message for " << peer_ip << " dropped";
  }
}

int64_t Store::insert_message(const std::string& peer_ip, Sender sender, const std::string& content,
                              ContentType type, const std::string& file_path, double timestamp) {
  // Encrypt outside the lock; throws KeyUnavailableError when there is no storage key
  const std::string encrypted = cipher_.encrypt_for_storage(content);

  std::lock_guard<std::mutex> lock(mutex_);

  Statement stmt(db_, "INSERT INTO messages (peer_ip, sender, content, message_type, timestamp, file_path) "
                      "VALUES (?, ?, ?, ?, ?, ?)");
  stmt.bind(1, peer_ip);
  stmt.bind(2, std::string(to_string(sender)));
  stmt.bind_blob(3, encrypted);
  stmt.bind(4, std::string(to_string(type)));
  stmt.bind(5, timestamp);
  if (file_path.empty()) {
    stmt.bind_null(6);
  } else {
    stmt.bind(6, file_path);
  }
  stmt.step();

  int64_t id = sqlite3_last_insert_rowid(db_);
  BOOST_LOG_TRIVIAL(debug) << "Store: Saved " << to_string(type) << " message " << id
                           << " for " << peer_ip << " (" << content.size() << " bytes)";
  return id;
}

std::vector<StoredMessage> Store::get_history(const std::string& peer_ip, std::size_t limit,
                                              SortOrder order) {
  std::vector<StoredMessage> messages;
  {
    std::lock_guard<std::mutex> lock(mutex_);

    // Newest `limit` rows, re-ordered afterwards
    Statement stmt(db_, "SELECT id, sender, content, message_type, timestamp, file_path "
                        "FROM messages WHERE peer_ip = ? "
                        "ORDER BY timestamp DESC, id DESC LIMIT ?");
    stmt.bind(1, peer_ip);
    stmt.bind(2, static_cast<int64_t>(limit));

    while (stmt.step()) {
      StoredMessage message;
      message.id = stmt.column_int64(0);
      message.peer_ip = peer_ip;
      message.sender = sender_from_string(stmt.column_text(1));
      message.content = stmt.column_blob(2);
      message.type = type_from_string(stmt.column_text(3));
      message.timestamp = stmt.column_double(4);
      if (!stmt.column_is_null(5)) {
        message.file_path = stmt.column_text(5);
      }
      messages.push_back(std::move(message));
    }
  }

  for (auto& message : messages) {
    try {
      message.content = cipher_.decrypt_from_storage(message.content);
    }
    catch (const crypto::CryptoError& e) {
      BOOST_LOG_TRIVIAL(warning) << "Store: Message " << message.id << " could not be decrypted: " << e.what();
      message.content = DECRYPTION_FAILED;
      message.decrypted = false;
    }
  }

  if (order == SortOrder::ASCENDING) {
    std::reverse(messages.begin(), messages.end());
  }
  return messages;
}

std::size_t Store::cleanup_older_than(int hours) {
  if (hours < 0) {
    throw std::invalid_argument("Store: Retention hours must not be negative");
  }

  const double cutoff = network::Codec::unix_time_now() - static_cast<double>(hours) * 3600.0;

  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(db_, "DELETE FROM messages WHERE timestamp < ?");
  stmt.bind(1, cutoff);
  stmt.step();

  std::size_t deleted = static_cast<std::size_t>(sqlite3_changes(db_));
  BOOST_LOG_TRIVIAL(info) << "Store: Retention cleanup removed " << deleted
                          << " messages older than " << hours << " hours";
  return deleted;
}

std::size_t Store::delete_peer_history(const std::string& peer_ip) {
  std::lock_guard<std::mutex> lock(mutex_);

  Statement stmt(db_, "DELETE FROM messages WHERE peer_ip = ?");
  stmt.bind(1, peer_ip);
  stmt.step();

  std::size_t deleted = static_cast<std::size_t>(sqlite3_changes(db_));
  BOOST_LOG_TRIVIAL(info) << "Store: Deleted " << deleted << " messages for " << peer_ip;
  return deleted;
}


//==============================================
// PEERS
//==============================================

void Store::save_peer(const std::string& ip, const std::string& username,
                      std::optional<double> last_seen) {
  std::lock_guard<std::mutex> lock(mutex_);

  Statement stmt(db_, "INSERT INTO peers (ip, username, last_seen) VALUES (?, ?, ?) "
                      "ON CONFLICT(ip) DO UPDATE SET username = excluded.username, "
                      "last_seen = excluded.last_seen");
  stmt.bind(1, ip);
  stmt.bind(2, username);
  stmt.bind(3, last_seen.value_or(network::Codec::unix_time_now()));
  stmt.step();
}

void Store::save_peer_async(const std::string& ip, const std::string& username) {
  const double now = network::Codec::unix_time_now();
  channel_.produce([this, ip, username, now]() {
    save_peer(ip, username, now);
  });
}

std::vector<StoredPeer> Store::get_all_peers() {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<StoredPeer> peers;
  Statement stmt(db_, "SELECT ip, username, last_seen FROM peers ORDER BY last_seen DESC");
  while (stmt.step()) {
    peers.push_back(StoredPeer{stmt.column_text(0), stmt.column_text(1), stmt.column_double(2)});
  }
  return peers;
}

std::optional<std::string> Store::get_peer_username(const std::string& ip) {
  std::lock_guard<std::mutex> lock(mutex_);

  Statement stmt(db_, "SELECT username FROM peers WHERE ip = ?");
  stmt.bind(1, ip);
  if (stmt.step()) {
    return stmt.column_text(0);
  }
  return std::nullopt;
}


//==============================================
// EXPORT
//==============================================

std::size_t Store::export_chat(const std::string& peer_ip, std::ostream& output) {
  auto messages = get_history(peer_ip, 10000);
  const std::string username = get_peer_username(peer_ip).value_or(peer_ip);

  output << "Ghost Net Chat History\n";
  output << "Peer: " << username << " (" << peer_ip << ")\n";
  output << "Exported: " << format_local_time(network::Codec::unix_time_now()) << "\n";
  output << std::string(60, '=') << "\n\n";

  for (const auto& message : messages) {
    const std::string sender = message.sender == Sender::ME ? "You" : username;
    output << "[" << format_local_time(message.timestamp) << "] " << sender << ": ";

    if (message.type == ContentType::TEXT) {
      output << message.content << "\n";
    } else {
      output << "[FILE] " << message.content << "\n";
      if (!message.file_path.empty()) {
        output << "    Path: " << message.file_path << "\n";
      }
    }
    output << "\n";
  }

  if (!output) {
    throw StoreError("Store: Failed to write transcript for " + peer_ip);
  }

  BOOST_LOG_TRIVIAL(info) << "Store: Exported " << messages.size() << " messages for " << peer_ip;
  return messages.size();
}

std::size_t Store::export_chat(const std::string& peer_ip, const std::filesystem::path& output_path) {
  std::ofstream file(output_path);
  if (!file) {
    throw StoreError("Store: Cannot open export file: " + output_path.string());
  }
  return export_chat(peer_ip, file);
}


//==============================================
// MAINTENANCE
//==============================================

Statistics Store::get_statistics() {
  std::lock_guard<std::mutex> lock(mutex_);

  Statistics stats;
  {
    Statement stmt(db_, "SELECT COUNT(*), MIN(timestamp), MAX(timestamp) FROM messages");
    if (stmt.step()) {
      stats.total_messages = static_cast<std::size_t>(stmt.column_int64(0));
      if (!stmt.column_is_null(1)) {
        stats.oldest_message = stmt.column_double(1);
        stats.newest_message = stmt.column_double(2);
      }
    }
  }
  {
    Statement stmt(db_, "SELECT COUNT(*) FROM peers");
    if (stmt.step()) {
      stats.total_peers = static_cast<std::size_t>(stmt.column_int64(0));
    }
  }
  return stats;
}

void Store::vacuum() {
  std::lock_guard<std::mutex> lock(mutex_);
  exec("VACUUM");
  BOOST_LOG_TRIVIAL(info) << "Store: Database vacuumed";
}

} // namespace store
} // namespace ghostnet
