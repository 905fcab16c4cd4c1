#pragma once

#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "crypto/cipher_provider.hpp"
#include "network/message_frame.hpp"
#include "network/timed_socket.hpp"
#include "store/store.hpp"

namespace ghostnet {
namespace network {

// Accepts one logical message per inbound TCP connection:
//   <encrypted header><HEADER_END>[raw file bytes]
// Every connection is served on its own thread.
class TransportServer {
public:
  struct Options {
    std::string bind_address = "0.0.0.0";
    uint16_t port = 37021;
    std::filesystem::path downloads_dir;
    uint64_t max_file_size = 100ULL * 1024 * 1024;
    // Longest pause tolerated between bytes of one connection
    std::chrono::milliseconds idle_timeout{15000};
  };

  struct Handlers {
    std::function<void(const std::string& peer_ip, const std::string& text,
                       const std::string& timestamp)> on_text;
    std::function<void(const std::string& peer_ip, const std::string& filename,
                       const std::filesystem::path& path, const std::string& timestamp)> on_file;
  };

  // -- CONSTRUCTOR AND DESTRUCTOR ----
  // store may be null, in which case nothing is persisted
  TransportServer(const Options& options, crypto::CipherProvider& cipher, store::Store* store);
  ~TransportServer();

  TransportServer(const TransportServer&) = delete;
  TransportServer& operator=(const TransportServer&) = delete;


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start_listener();
  // Stops accepting and joins every connection thread
  void shutdown();
  bool is_running() const { return is_running_; }


  // ---- GETTERS AND SETTERS ----
  void set_handlers(Handlers handlers);
  uint16_t port() const { return port_; }
  std::size_t received_count() const { return received_count_; }
  std::size_t rejected_count() const { return rejected_count_; }
  std::size_t active_connections();

private:
  struct Connection {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> finished;
  };

  // ---- PARAMETERS ----
  Options options_;
  uint16_t port_;
  crypto::CipherProvider& cipher_;
  store::Store* store_;

  Handlers handlers_;
  std::mutex handlers_mutex_;

  // Server state
  std::atomic<bool> is_running_;
  std::unique_ptr<std::thread> accept_thread_;
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;

  // Connection threads
  std::list<Connection> connections_;
  std::mutex connections_mutex_;

  // Serializes destination name selection and the final rename
  std::mutex destination_mutex_;
  std::atomic<uint64_t> temp_counter_;

  std::atomic<std::size_t> received_count_;
  std::atomic<std::size_t> rejected_count_;


  // ---- ACCEPT LOOP ----
  void accept_loop();
  void spawn_connection(std::unique_ptr<TimedSocket> socket);
  // Joins connection threads that have finished
  void reap_connections(bool wait_all);


  // ---- CONNECTION HANDLING ----
  void handle_connection(TimedSocket& socket);
  std::string read_header_token(TimedSocket& socket);
  void receive_text(TimedSocket& socket, const std::string& peer_ip, const MessageHeader& header);
  void receive_file(TimedSocket& socket, const std::string& peer_ip, const MessageHeader& header);
};

} // namespace network
} // namespace ghostnet
