#include "network/engine.hpp"
#include "network/codec.hpp"
#include <boost/log/trivial.hpp>

namespace ghostnet {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Engine::Engine(config::Config& config)
  : config_(config)
  , state_(State::STOPPED)
  , status_(STATUS_STOPPED)
  , cipher_(std::make_unique<crypto::CipherProvider>(config.key_path())) {
  BOOST_LOG_TRIVIAL(info) << "Engine: Created with config " << config_.path().string();
}

Engine::~Engine() {
  try {
    stop();
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Engine: Error during destructor shutdown: " << e.what();
  }
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool Engine::start() {
  std::string started_status;
  {
    std::unique_lock<std::shared_mutex> lifecycle(lifecycle_mutex_);
    if (state_ != State::STOPPED) {
      BOOST_LOG_TRIVIAL(warning) << "Engine: Start requested while not stopped";
      return false;
    }
    state_ = State::STARTING;
    BOOST_LOG_TRIVIAL(info) << "Engine: Starting";
    start_components();
    state_ = State::RUNNING;
    started_status = compute_status();
  }

  set_status(started_status);
  BOOST_LOG_TRIVIAL(info) << "Engine: Started (" << status() << ")";
  return true;
}

void Engine::start_components() {
  local_ip_ = resolve_local_ip();
  BOOST_LOG_TRIVIAL(info) << "Engine: Local address " << local_ip_ << ", username " << config_.username();

  // Storage comes first so discovery and transport can persist from their first event
  open_storage();
  start_discovery();
  start_transport();

  client_ = std::make_unique<TransportClient>(TransportClient::Options{
    config_.transport_port(),
    config_.bind_address(),
    std::chrono::milliseconds(5000),
    std::chrono::milliseconds(15000),
    config_.max_file_size_bytes()
  }, *cipher_);
}

void Engine::stop() {
  {
    // Once STOPPING is set under the lock no new API call gets through
    std::unique_lock<std::shared_mutex> lifecycle(lifecycle_mutex_);
    if (state_ != State::RUNNING) {
      return;
    }
    state_ = State::STOPPING;
  }

  BOOST_LOG_TRIVIAL(info) << "Engine: Initiating shutdown sequence";

  if (discovery_) {
    BOOST_LOG_TRIVIAL(debug) << "Engine: Shutting down discovery";
    discovery_->stop();
  }
  if (server_) {
    BOOST_LOG_TRIVIAL(debug) << "Engine: Shutting down transport server";
    server_->shutdown();
  }

  // In-flight sends finish or fail on their own timeouts
  reap_sends(true);

  if (store_) {
    BOOST_LOG_TRIVIAL(debug) << "Engine: Flushing storage";
    store_->flush();
  }

  {
    std::unique_lock<std::shared_mutex> lifecycle(lifecycle_mutex_);
    discovery_.reset();
    server_.reset();
    client_.reset();
    store_.reset();
    peers_.clear();
    state_ = State::STOPPED;
  }

  set_status(STATUS_STOPPED);
  BOOST_LOG_TRIVIAL(info) << "Engine: Shutdown complete";
}


//==============================================
// STARTUP STEPS
//==============================================

std::string Engine::resolve_local_ip() const {
  const std::string advertised = config_.advertise_address();
  if (!advertised.empty()) {
    return advertised;
  }
  const std::string bound = config_.bind_address();
  if (!bound.empty() && bound != "0.0.0.0") {
    return bound;
  }
  return InterfaceDetector::detect_local_ip();
}

void Engine::open_storage() {
  if (!cipher_->storage_available()) {
    BOOST_LOG_TRIVIAL(error) << "Engine: Storage disabled, no storage key: " << cipher_->storage_error();
    return;
  }

  try {
    store_ = std::make_unique<store::Store>(config_.database_path(), *cipher_);
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Engine: Storage disabled: " << e.what();
    store_.reset();
    return;
  }

  if (config_.auto_cleanup()) {
    try {
      const std::size_t removed = store_->cleanup_older_than(config_.retention_hours());
      BOOST_LOG_TRIVIAL(info) << "Engine: Retention cleanup removed " << removed << " messages";
    }
    catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Engine: Retention cleanup failed: " << e.what();
    }
  }
}

void Engine::start_discovery() {
  DiscoveryWorker::Options options;
  options.bind_address = config_.bind_address();
  options.port = config_.discovery_port();
  options.broadcast_address = config_.broadcast_address();
  options.local_ip = local_ip_;
  options.beacon_interval = config_.beacon_interval();
  options.peer_timeout = config_.peer_timeout();
  options.prune_interval = config_.prune_interval();

  // Username is read through the config on every beacon
  discovery_ = std::make_unique<DiscoveryWorker>(options, peers_, [this]() { return config_.username(); });

  discovery_->set_peer_seen_callback([this](const Peer& peer) {
    if (store_) {
      store_->save_peer_async(peer.ip, peer.username);
    }
  });
  discovery_->set_peer_list_callback([this](const std::vector<Peer>& peers) {
    PeerListCallback callback;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      callback = peer_list_callback_;
    }
    if (callback) {
      try {
        callback(peers);
      }
      catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Engine: Peer list callback failed: " << e.what();
      }
    }
  });

  if (!discovery_->start()) {
    BOOST_LOG_TRIVIAL(error) << "Engine: Discovery disabled";
    discovery_.reset();
  }
}

void Engine::start_transport() {
  TransportServer::Options options;
  options.bind_address = config_.bind_address();
  options.port = config_.transport_port();
  options.max_file_size = config_.max_file_size_bytes();

  try {
    options.downloads_dir = config_.ensure_downloads_dir();
  }
  catch (const config::ConfigError& e) {
    BOOST_LOG_TRIVIAL(error) << "Engine: Transport disabled: " << e.what();
    return;
  }

  server_ = std::make_unique<TransportServer>(options, *cipher_, store_.get());

  TransportServer::Handlers handlers;
  handlers.on_text = [this](const std::string& peer_ip, const std::string& text, const std::string& timestamp) {
    MessageCallback callback;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      callback = message_callback_;
    }
    if (callback) {
      callback(peer_ip, text, timestamp);
    }
  };
  handlers.on_file = [this](const std::string& peer_ip, const std::string& filename,
                            const std::filesystem::path& path, const std::string& timestamp) {
    FileCallback callback;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      callback = file_callback_;
    }
    if (callback) {
      callback(peer_ip, filename, path, timestamp);
    }
  };
  server_->set_handlers(std::move(handlers));

  if (!server_->start_listener()) {
    BOOST_LOG_TRIVIAL(error) << "Engine: Transport server disabled";
    server_.reset();
  }
}


//==============================================
// CALLBACKS
//==============================================

void Engine::on_peer_list_changed(PeerListCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  peer_list_callback_ = std::move(callback);
}

void Engine::on_message_received(MessageCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  message_callback_ = std::move(callback);
}

void Engine::on_file_received(FileCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  file_callback_ = std::move(callback);
}

void Engine::on_status_changed(StatusCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  status_callback_ = std::move(callback);
}


//==============================================
// OUTGOING MESSAGES
//==============================================

std::future<SendResult> Engine::send_message(const std::string& peer_ip, const std::string& text) {
  return spawn_send([this, peer_ip, text]() {
    SendResult result = client_->send_text(peer_ip, text);
    if (result.ok() && store_) {
      store_->save_message(peer_ip, store::Sender::ME, text, store::ContentType::TEXT);
    }
    return result;
  });
}

std::future<SendResult> Engine::send_file(const std::string& peer_ip, const std::filesystem::path& path,
                                          ProgressCallback progress) {
  return spawn_send([this, peer_ip, path, progress]() {
    SendResult result = client_->send_file(peer_ip, path, progress);
    if (result.ok() && store_) {
      std::error_code ec;
      const auto absolute = std::filesystem::absolute(path, ec);
      store_->save_message(peer_ip, store::Sender::ME, Codec::sanitize_filename(path.filename().string()),
                           store::ContentType::FILE, ec ? path.string() : absolute.string());
    }
    return result;
  });
}

std::future<SendResult> Engine::spawn_send(std::function<SendResult()> work) {
  reap_sends(false);

  auto promise = std::make_shared<std::promise<SendResult>>();
  std::future<SendResult> future = promise->get_future();

  std::lock_guard<std::mutex> lock(send_mutex_);
  // Checked under the lock so stop() cannot miss a task spawned concurrently
  if (state_ != State::RUNNING) {
    promise->set_value(SendResult::failure(SendStatus::ENGINE_NOT_RUNNING, "Engine is not running"));
    return future;
  }

  auto finished = std::make_shared<std::atomic<bool>>(false);
  send_tasks_.push_back(SendTask{
    std::thread([promise, finished, work]() {
      try {
        promise->set_value(work());
      }
      catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Engine: Send worker failed: " << e.what();
        promise->set_value(SendResult::failure(SendStatus::TRANSFER_FAILED, e.what()));
      }
      *finished = true;
    }),
    finished
  });
  return future;
}

void Engine::reap_sends(bool wait_all) {
  std::list<SendTask> done;
  {
    std::lock_guard<std::mutex> lock(send_mutex_);
    for (auto it = send_tasks_.begin(); it != send_tasks_.end(); ) {
      if (wait_all || *it->finished) {
        done.push_back(std::move(*it));
        it = send_tasks_.erase(it);
      } else {
        ++it;
      }
    }
  }

  for (auto& task : done) {
    if (task.thread.joinable()) {
      task.thread.join();
    }
  }
}


//==============================================
// PEERS AND HISTORY
//==============================================

std::vector<Peer> Engine::get_peers() const {
  return peers_.snapshot();
}

std::vector<store::StoredPeer> Engine::known_peers() {
  auto lifecycle = lock_running();
  return require_store().get_all_peers();
}

std::optional<std::string> Engine::peer_username(const std::string& peer_ip) {
  std::shared_lock<std::shared_mutex> lifecycle(lifecycle_mutex_);
  if (state_ != State::RUNNING) {
    return std::nullopt;
  }
  if (auto live = peers_.username_for(peer_ip)) {
    return live;
  }
  if (store_) {
    return store_->get_peer_username(peer_ip);
  }
  return std::nullopt;
}

std::vector<store::StoredMessage> Engine::get_history(const std::string& peer_ip, std::size_t limit) {
  auto lifecycle = lock_running();
  return require_store().get_history(peer_ip, limit);
}

std::size_t Engine::export_chat(const std::string& peer_ip, const std::filesystem::path& output_path) {
  auto lifecycle = lock_running();
  return require_store().export_chat(peer_ip, output_path);
}

std::size_t Engine::delete_history(const std::string& peer_ip) {
  auto lifecycle = lock_running();
  return require_store().delete_peer_history(peer_ip);
}

std::size_t Engine::cleanup_now() {
  auto lifecycle = lock_running();
  return require_store().cleanup_older_than(config_.retention_hours());
}

store::Statistics Engine::statistics() {
  auto lifecycle = lock_running();
  return require_store().get_statistics();
}

std::shared_lock<std::shared_mutex> Engine::lock_running() const {
  std::shared_lock<std::shared_mutex> lifecycle(lifecycle_mutex_);
  if (state_ != State::RUNNING) {
    throw store::StoreError("Engine is not running");
  }
  return lifecycle;
}

// Caller holds lifecycle_mutex_
store::Store& Engine::require_store() {
  if (!store_) {
    throw store::StoreError("Storage is unavailable");
  }
  return *store_;
}


//==============================================
// STATUS
//==============================================

std::string Engine::status() const {
  std::lock_guard<std::mutex> lock(status_mutex_);
  return status_;
}

bool Engine::discovery_enabled() const {
  std::shared_lock<std::shared_mutex> lifecycle(lifecycle_mutex_);
  return discovery_ != nullptr;
}

bool Engine::transport_enabled() const {
  std::shared_lock<std::shared_mutex> lifecycle(lifecycle_mutex_);
  return server_ != nullptr;
}

bool Engine::storage_enabled() const {
  std::shared_lock<std::shared_mutex> lifecycle(lifecycle_mutex_);
  return store_ != nullptr;
}

NetworkStatus Engine::network_status() const {
  return InterfaceDetector::status(local_ip_.empty() ? resolve_local_ip() : local_ip_);
}

std::string Engine::compute_status() const {
  if (!discovery_) {
    return STATUS_DISCOVERY_OFF;
  }
  if (!server_) {
    return STATUS_TRANSPORT_OFF;
  }
  if (!store_) {
    return STATUS_STORAGE_OFF;
  }
  return STATUS_RUNNING;
}

void Engine::set_status(const std::string& status) {
  {
    std::lock_guard<std::mutex> lock(status_mutex_);
    if (status_ == status) {
      return;
    }
    status_ = status;
  }
  BOOST_LOG_TRIVIAL(info) << "Engine: Status " << status;

  StatusCallback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = status_callback_;
  }
  if (callback) {
    try {
      callback(status);
    }
    catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Engine: Status callback failed: " << e.what();
    }
  }
}

} // namespace network
} // namespace ghostnet
