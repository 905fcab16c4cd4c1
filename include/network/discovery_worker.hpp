#ifndef GHOSTNET_NETWORK_DISCOVERY_WORKER_HPP
#define GHOSTNET_NETWORK_DISCOVERY_WORKER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include "network/peer_manager.hpp"

namespace ghostnet {
namespace network {

// Announces this node over UDP and keeps the PeerTable in sync with beacons from others.
// Runs three threads: beacon sender, beacon listener and stale-peer pruner.
class DiscoveryWorker {
public:
  struct Options {
    std::string bind_address = "0.0.0.0";
    uint16_t port = 37020;
    std::string broadcast_address = "255.255.255.255";
    // Address announced in beacons and ignored when heard back
    std::string local_ip;
    std::chrono::milliseconds beacon_interval{2000};
    std::chrono::milliseconds peer_timeout{10000};
    std::chrono::milliseconds prune_interval{3000};
    std::chrono::milliseconds receive_timeout{1000};
  };

  using UsernameProvider = std::function<std::string()>;
  using PeerListCallback = std::function<void(const std::vector<Peer>&)>;
  using PeerSeenCallback = std::function<void(const Peer&)>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  DiscoveryWorker(const Options& options, PeerTable& peers, UsernameProvider username);
  ~DiscoveryWorker();

  DiscoveryWorker(const DiscoveryWorker&) = delete;
  DiscoveryWorker& operator=(const DiscoveryWorker&) = delete;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Binds the sockets (one retry) and starts the threads; false leaves discovery disabled
  bool start();
  void stop();
  bool is_running() const { return running_; }


  // ---- CALLBACKS ----
  // Fired with a fresh snapshot when a peer appears, is renamed or is pruned
  void set_peer_list_callback(PeerListCallback callback);
  // Fired for every accepted beacon
  void set_peer_seen_callback(PeerSeenCallback callback);


  // ---- BEACON PROCESSING ----
  // Applies one received datagram; returns true when the peer list changed
  bool handle_datagram(const std::string& data, const std::string& sender_ip);
  // Removes peers that stopped beaconing; returns true when any were removed
  bool prune();
  // Builds the beacon for the current username
  std::string make_beacon() const;


  // ---- GETTERS ----
  const Options& options() const { return options_; }

private:
  // ---- PARAMETERS ----
  Options options_;
  PeerTable& peers_;
  UsernameProvider username_;

  PeerListCallback peer_list_callback_;
  PeerSeenCallback peer_seen_callback_;
  std::mutex callback_mutex_;

  // Sockets; each is only touched by its own thread once started
  boost::asio::io_context send_context_;
  boost::asio::io_context receive_context_;
  std::unique_ptr<boost::asio::ip::udp::socket> send_socket_;
  std::unique_ptr<boost::asio::ip::udp::socket> receive_socket_;

  // Thread state
  std::atomic<bool> running_;
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  std::thread beacon_thread_;
  std::thread listener_thread_;
  std::thread pruner_thread_;


  // ---- SOCKET SETUP ----
  void open_sockets();
  void close_sockets();


  // ---- WORKER LOOPS ----
  void beacon_loop();
  void listener_loop();
  void pruner_loop();
  // Waits for `duration` or until stop() is called; false when stopping
  bool wait_for(std::chrono::milliseconds duration);

  void send_beacon();
  void publish_snapshot();
};

} // namespace network
} // namespace ghostnet

#endif // GHOSTNET_NETWORK_DISCOVERY_WORKER_HPP
