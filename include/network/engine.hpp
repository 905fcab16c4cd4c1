#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>
#include "config/config.hpp"
#include "crypto/cipher_provider.hpp"
#include "network/discovery_worker.hpp"
#include "network/interface_detector.hpp"
#include "network/network_error.hpp"
#include "network/peer_manager.hpp"
#include "network/tcp_client.hpp"
#include "network/tcp_server.hpp"
#include "store/store.hpp"

namespace ghostnet {
namespace network {

// Composition root: owns every worker and exposes the API the host application calls.
// All callbacks run on worker threads and must not block.
class Engine {
public:
  enum class State { STOPPED, STARTING, RUNNING, STOPPING };

  static constexpr const char* STATUS_RUNNING = "running";
  static constexpr const char* STATUS_DISCOVERY_OFF = "degraded: discovery off";
  static constexpr const char* STATUS_TRANSPORT_OFF = "degraded: transport off";
  static constexpr const char* STATUS_STORAGE_OFF = "degraded: storage off";
  static constexpr const char* STATUS_STOPPED = "stopped";

  using PeerListCallback = std::function<void(const std::vector<Peer>& peers)>;
  using MessageCallback = std::function<void(const std::string& peer_ip, const std::string& text,
                                             const std::string& timestamp)>;
  using FileCallback = std::function<void(const std::string& peer_ip, const std::string& filename,
                                          const std::filesystem::path& path, const std::string& timestamp)>;
  using StatusCallback = std::function<void(const std::string& status)>;
  using ProgressCallback = TransportClient::ProgressCallback;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Engine(config::Config& config);
  ~Engine();

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Returns false only when the engine was not stopped; subsystem failures degrade instead
  bool start();
  // Stops discovery and transport and joins every worker, including outbound sends
  void stop();


  // ---- CALLBACKS ----
  void on_peer_list_changed(PeerListCallback callback);
  void on_message_received(MessageCallback callback);
  void on_file_received(FileCallback callback);
  void on_status_changed(StatusCallback callback);


  // ---- OUTGOING MESSAGES ----
  // Both run on a worker thread; successful sends are recorded as sent by ME
  std::future<SendResult> send_message(const std::string& peer_ip, const std::string& text);
  std::future<SendResult> send_file(const std::string& peer_ip, const std::filesystem::path& path,
                                    ProgressCallback progress = nullptr);


  // ---- PEERS ----
  std::vector<Peer> get_peers() const;
  std::vector<store::StoredPeer> known_peers();
  // Live username first, persisted username second
  std::optional<std::string> peer_username(const std::string& peer_ip);


  // ---- HISTORY ----
  // Throw store::StoreError unless the engine is running with storage
  std::vector<store::StoredMessage> get_history(const std::string& peer_ip, std::size_t limit = 100);
  std::size_t export_chat(const std::string& peer_ip, const std::filesystem::path& output_path);
  std::size_t delete_history(const std::string& peer_ip);
  std::size_t cleanup_now();
  store::Statistics statistics();


  // ---- GETTERS ----
  State state() const { return state_; }
  std::string status() const;
  NetworkStatus network_status() const;
  const std::string& local_ip() const { return local_ip_; }
  std::string username() const { return config_.username(); }
  bool discovery_enabled() const;
  bool transport_enabled() const;
  bool storage_enabled() const;

private:
  struct SendTask {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> finished;
  };

  // ---- PARAMETERS ----
  config::Config& config_;
  std::string local_ip_;
  std::atomic<State> state_;
  std::string status_;
  mutable std::mutex status_mutex_;
  // Shared by API calls, exclusive while components are created or destroyed
  mutable std::shared_mutex lifecycle_mutex_;

  // System components
  std::unique_ptr<crypto::CipherProvider> cipher_;
  std::unique_ptr<store::Store> store_;
  PeerTable peers_;
  std::unique_ptr<DiscoveryWorker> discovery_;
  std::unique_ptr<TransportServer> server_;
  std::unique_ptr<TransportClient> client_;

  // Host callbacks
  PeerListCallback peer_list_callback_;
  MessageCallback message_callback_;
  FileCallback file_callback_;
  StatusCallback status_callback_;
  std::mutex callback_mutex_;

  // Outbound send workers
  std::list<SendTask> send_tasks_;
  std::mutex send_mutex_;


  // ---- STARTUP STEPS ----
  void start_components();
  void open_storage();
  void start_discovery();
  void start_transport();
  std::string resolve_local_ip() const;


  // ---- HELPERS ----
  void set_status(const std::string& status);
  std::string compute_status() const;
  std::shared_lock<std::shared_mutex> lock_running() const;
  store::Store& require_store();
  std::future<SendResult> spawn_send(std::function<SendResult()> work);
  void reap_sends(bool wait_all);
};

} // namespace network
} // namespace ghostnet
