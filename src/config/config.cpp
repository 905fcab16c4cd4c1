#include "config/config.hpp"
#include <boost/log/trivial.hpp>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <random>

namespace ghostnet {
namespace config {

using json = nlohmann::json;

namespace {

const char* const ADJECTIVES[] = {
  "Silent", "Shadow", "Phantom", "Ghost", "Dark", "Night",
  "Cyber", "Neon", "Electric", "Quantum", "Digital", "Crypto"
};

const char* const NOUNS[] = {
  "Wolf", "Hawk", "Fox", "Raven", "Tiger", "Dragon",
  "Ninja", "Samurai", "Knight", "Warrior", "Sentinel", "Guardian"
};

constexpr size_t MAX_USERNAME_LENGTH = 32;

std::string trim(const std::string& value) {
  const auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  const auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

void require_integer_in(const std::string& key, const json& value, int64_t min, int64_t max) {
  if (!value.is_number_integer()) {
    throw std::invalid_argument("Config: " + key + " must be an integer");
  }
  const int64_t number = value.get<int64_t>();
  if (number < min || number > max) {
    throw std::invalid_argument("Config: " + key + " must be between " + std::to_string(min)
                                + " and " + std::to_string(max));
  }
}

void require_string(const std::string& key, const json& value, bool allow_empty) {
  if (!value.is_string() || (!allow_empty && value.get<std::string>().empty())) {
    throw std::invalid_argument("Config: " + key + " must be a " +
                                (allow_empty ? "string" : "non-empty string"));
  }
}

} // namespace


//==============================================
// CONSTRUCTOR
//==============================================

Config::Config(const std::filesystem::path& path)
  : path_(path)
  , values_(defaults()) {
  BOOST_LOG_TRIVIAL(info) << "Config: Using configuration file: " << path_.string();
  load();
}


//==============================================
// DEFAULTS
//==============================================

std::filesystem::path Config::home_dir() {
  const char* home = std::getenv("HOME");
  if (home && *home) {
    return std::filesystem::path(home);
  }
  return std::filesystem::current_path();
}

json Config::defaults() {
  const auto home = home_dir();
  return json{
    {"username", ""},
    {"retention_hours", 24},
    {"auto_cleanup", true},
    {"max_file_size_mb", 100},
    {"downloads_dir", (home / "Downloads" / "GhostNet").string()},
    {"data_dir", (home / ".ghostnet").string()},
    {"discovery_port", 37020},
    {"transport_port", 37021},
    {"bind_address", "0.0.0.0"},
    {"broadcast_address", "255.255.255.255"},
    {"advertise_address", ""},
    {"beacon_interval_ms", 2000},
    {"peer_timeout_ms", 10000},
    {"prune_interval_ms", 3000}
  };
}

std::string Config::generate_username() {
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<size_t> adjective(0, std::size(ADJECTIVES) - 1);
  std::uniform_int_distribution<size_t> noun(0, std::size(NOUNS) - 1);
  std::uniform_int_distribution<int> number(10, 99);

  return std::string(ADJECTIVES[adjective(gen)]) + NOUNS[noun(gen)] + std::to_string(number(gen));
}


//==============================================
// LOAD AND SAVE
//==============================================

void Config::load() {
  std::lock_guard<std::mutex> lock(mutex_);

  bool dirty = false;
  std::ifstream file(path_);
  if (file) {
    json loaded = json::parse(file, nullptr, false);
    if (loaded.is_discarded() || !loaded.is_object()) {
      BOOST_LOG_TRIVIAL(warning) << "Config: Cannot parse " << path_.string() << ", using defaults";
      dirty = true;
    } else {
      for (auto it = loaded.begin(); it != loaded.end(); ++it) {
        try {
          validate(it.key(), it.value());
          values_[it.key()] = it.value();
        }
        catch (const std::invalid_argument& e) {
          BOOST_LOG_TRIVIAL(warning) << e.what() << ", keeping default";
          dirty = true;
        }
      }
      BOOST_LOG_TRIVIAL(info) << "Config: Loaded configuration";
    }
  } else {
    dirty = true;
  }

  if (values_["username"].get<std::string>().empty()) {
    values_["username"] = generate_username();
    BOOST_LOG_TRIVIAL(info) << "Config: Generated username " << values_["username"].get<std::string>();
    dirty = true;
  }

  if (dirty) {
    try {
      save_locked();
    }
    catch (const ConfigError& e) {
      BOOST_LOG_TRIVIAL(warning) << e.what() << ", settings will not persist";
    }
  }
}

void Config::save() const {
  std::lock_guard<std::mutex> lock(mutex_);
  save_locked();
}

void Config::save_locked() const {
  std::error_code ec;
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      throw ConfigError("Config: Cannot create directory " + path_.parent_path().string() + ": " + ec.message());
    }
  }

  std::filesystem::path temp_path = path_;
  temp_path += ".part";
  {
    std::ofstream file(temp_path, std::ios::trunc);
    if (!file) {
      throw ConfigError("Config: Cannot write " + temp_path.string());
    }
    file << values_.dump(2) << "\n";
    if (!file) {
      throw ConfigError("Config: Failed writing " + temp_path.string());
    }
  }

  std::filesystem::rename(temp_path, path_, ec);
  if (ec) {
    std::filesystem::remove(temp_path, ec);
    throw ConfigError("Config: Cannot replace " + path_.string());
  }
  BOOST_LOG_TRIVIAL(debug) << "Config: Saved configuration";
}


//==============================================
// GENERIC ACCESS
//==============================================

void Config::validate(const std::string& key, const json& value) {
  if (key == "username") {
    require_string(key, value, true);
    if (value.get<std::string>().size() > MAX_USERNAME_LENGTH) {
      throw std::invalid_argument("Config: username is longer than " + std::to_string(MAX_USERNAME_LENGTH));
    }
  } else if (key == "retention_hours") {
    require_integer_in(key, value, 1, 168);
  } else if (key == "auto_cleanup") {
    if (!value.is_boolean()) {
      throw std::invalid_argument("Config: auto_cleanup must be a boolean");
    }
  } else if (key == "max_file_size_mb") {
    require_integer_in(key, value, 1, 100);
  } else if (key == "downloads_dir" || key == "data_dir") {
    require_string(key, value, false);
  } else if (key == "discovery_port" || key == "transport_port") {
    require_integer_in(key, value, 1, 65535);
  } else if (key == "bind_address" || key == "broadcast_address") {
    require_string(key, value, false);
  } else if (key == "advertise_address") {
    require_string(key, value, true);
  } else if (key == "beacon_interval_ms" || key == "peer_timeout_ms" || key == "prune_interval_ms") {
    require_integer_in(key, value, 10, 3600 * 1000);
  }
}

json Config::get(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = values_.find(key);
  if (it == values_.end()) {
    return json();
  }
  return *it;
}

void Config::set(const std::string& key, const json& value) {
  validate(key, value);
  if (key == "username" && value.get<std::string>().empty()) {
    throw std::invalid_argument("Config: username must not be empty");
  }

  json old_value;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it != values_.end()) {
      old_value = *it;
    }
    if (old_value == value) {
      return;
    }
    values_[key] = value;
    save_locked();
  }

  BOOST_LOG_TRIVIAL(info) << "Config: Updated " << key;
  notify(key, old_value, value);
}

void Config::on_change(ChangeCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.push_back(std::move(callback));
}

void Config::notify(const std::string& key, const json& old_value, const json& new_value) {
  std::vector<ChangeCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks = callbacks_;
  }

  for (const auto& callback : callbacks) {
    try {
      callback(key, old_value, new_value);
    }
    catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Config: Change callback for " << key << " failed: " << e.what();
    }
  }
}

void Config::reset_to_defaults() {
  json previous;
  json current;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    previous = values_;
    const json username = values_["username"];
    json reset = defaults();
    reset["username"] = username;
    // Unknown keys survive a reset as well
    for (auto it = values_.begin(); it != values_.end(); ++it) {
      if (!reset.contains(it.key())) {
        reset[it.key()] = it.value();
      }
    }
    values_ = reset;
    current = values_;
    save_locked();
  }

  BOOST_LOG_TRIVIAL(info) << "Config: Reset to defaults";
  for (auto it = current.begin(); it != current.end(); ++it) {
    auto old_it = previous.find(it.key());
    if (old_it == previous.end() || *old_it != it.value()) {
      notify(it.key(), old_it == previous.end() ? json() : *old_it, it.value());
    }
  }
}


//==============================================
// TYPED GETTERS
//==============================================

std::string Config::username() const { return get("username").get<std::string>(); }
int Config::retention_hours() const { return get("retention_hours").get<int>(); }
bool Config::auto_cleanup() const { return get("auto_cleanup").get<bool>(); }
int Config::max_file_size_mb() const { return get("max_file_size_mb").get<int>(); }

uint64_t Config::max_file_size_bytes() const {
  return static_cast<uint64_t>(max_file_size_mb()) * 1024 * 1024;
}

std::filesystem::path Config::data_dir() const { return get("data_dir").get<std::string>(); }
std::filesystem::path Config::downloads_dir() const { return get("downloads_dir").get<std::string>(); }
uint16_t Config::discovery_port() const { return get("discovery_port").get<uint16_t>(); }
uint16_t Config::transport_port() const { return get("transport_port").get<uint16_t>(); }
std::string Config::bind_address() const { return get("bind_address").get<std::string>(); }
std::string Config::broadcast_address() const { return get("broadcast_address").get<std::string>(); }
std::string Config::advertise_address() const { return get("advertise_address").get<std::string>(); }

std::chrono::milliseconds Config::beacon_interval() const {
  return std::chrono::milliseconds(get("beacon_interval_ms").get<int64_t>());
}

std::chrono::milliseconds Config::peer_timeout() const {
  return std::chrono::milliseconds(get("peer_timeout_ms").get<int64_t>());
}

std::chrono::milliseconds Config::prune_interval() const {
  return std::chrono::milliseconds(get("prune_interval_ms").get<int64_t>());
}


//==============================================
// TYPED SETTERS
//==============================================

void Config::set_username(const std::string& username) {
  const std::string trimmed = trim(username);
  if (trimmed.empty()) {
    throw std::invalid_argument("Config: username must not be empty");
  }
  set("username", trimmed);
}

void Config::set_retention_hours(int hours) { set("retention_hours", hours); }
void Config::set_auto_cleanup(bool enabled) { set("auto_cleanup", enabled); }
void Config::set_max_file_size_mb(int megabytes) { set("max_file_size_mb", megabytes); }
void Config::set_downloads_dir(const std::filesystem::path& dir) { set("downloads_dir", dir.string()); }


//==============================================
// PATH HELPERS
//==============================================

std::filesystem::path Config::ensure_downloads_dir() const {
  const std::filesystem::path preferred = downloads_dir();
  std::error_code ec;
  std::filesystem::create_directories(preferred, ec);
  if (!ec && std::filesystem::is_directory(preferred, ec)) {
    return preferred;
  }

  BOOST_LOG_TRIVIAL(warning) << "Config: Cannot use downloads directory " << preferred.string()
                             << ", falling back to ./.ghostnet_downloads";
  const std::filesystem::path fallback = std::filesystem::current_path() / ".ghostnet_downloads";
  std::filesystem::create_directories(fallback, ec);
  if (ec) {
    throw ConfigError("Config: No writable downloads directory: " + ec.message());
  }
  return fallback;
}

} // namespace config
} // namespace ghostnet
