#include "network/discovery_worker.hpp"
#include "network/codec.hpp"
#include <boost/log/trivial.hpp>
#include <array>

namespace ghostnet {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

DiscoveryWorker::DiscoveryWorker(const Options& options, PeerTable& peers, UsernameProvider username)
  : options_(options)
  , peers_(peers)
  , username_(std::move(username))
  , running_(false) {
  BOOST_LOG_TRIVIAL(info) << "Discovery: Initializing on " << options_.bind_address << ":" << options_.port
                          << " announcing " << options_.local_ip;
}

DiscoveryWorker::~DiscoveryWorker() {
  stop();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool DiscoveryWorker::start() {
  if (running_) {
    BOOST_LOG_TRIVIAL(warning) << "Discovery: Already running";
    return true;
  }

  // Bind is retried once; the port may still be held by a previous instance
  for (int attempt = 1; attempt <= 2; ++attempt) {
    try {
      open_sockets();
      break;
    }
    catch (const boost::system::system_error& e) {
      BOOST_LOG_TRIVIAL(error) << "Discovery: Failed to bind UDP port " << options_.port
                               << " (attempt " << attempt << "): " << e.what();
      close_sockets();
      if (attempt == 2) {
        return false;
      }
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
  }

  running_ = true;
  beacon_thread_ = std::thread(&DiscoveryWorker::beacon_loop, this);
  listener_thread_ = std::thread(&DiscoveryWorker::listener_loop, this);
  pruner_thread_ = std::thread(&DiscoveryWorker::pruner_loop, this);

  BOOST_LOG_TRIVIAL(info) << "Discovery: Started";
  return true;
}

void DiscoveryWorker::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "Discovery: Stopping";
  {
    // Pairs with the predicate check in wait_for
    std::lock_guard<std::mutex> lock(stop_mutex_);
  }
  stop_cv_.notify_all();

  // The listener notices within one receive timeout
  for (std::thread* thread : {&beacon_thread_, &listener_thread_, &pruner_thread_}) {
    if (thread->joinable()) {
      thread->join();
    }
  }

  close_sockets();
  BOOST_LOG_TRIVIAL(info) << "Discovery: Stopped";
}


//==============================================
// SOCKET SETUP
//==============================================

void DiscoveryWorker::open_sockets() {
  using boost::asio::ip::udp;

  const auto bind_address = boost::asio::ip::make_address(options_.bind_address);

  receive_socket_ = std::make_unique<udp::socket>(receive_context_);
  receive_socket_->open(udp::v4());
  receive_socket_->set_option(boost::asio::socket_base::reuse_address(true));
  receive_socket_->bind(udp::endpoint(bind_address, options_.port));

  send_socket_ = std::make_unique<udp::socket>(send_context_);
  send_socket_->open(udp::v4());
  send_socket_->set_option(boost::asio::socket_base::broadcast(true));
  if (!bind_address.is_unspecified()) {
    // Beacons must leave from the announced interface
    send_socket_->bind(udp::endpoint(bind_address, 0));
  }
}

void DiscoveryWorker::close_sockets() {
  boost::system::error_code ec;
  if (receive_socket_ && receive_socket_->is_open()) {
    receive_socket_->close(ec);
  }
  if (send_socket_ && send_socket_->is_open()) {
    send_socket_->close(ec);
  }
  receive_socket_.reset();
  send_socket_.reset();
}


//==============================================
// CALLBACKS
//==============================================

void DiscoveryWorker::set_peer_list_callback(PeerListCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  peer_list_callback_ = std::move(callback);
}

void DiscoveryWorker::set_peer_seen_callback(PeerSeenCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  peer_seen_callback_ = std::move(callback);
}

void DiscoveryWorker::publish_snapshot() {
  PeerListCallback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = peer_list_callback_;
  }
  if (!callback) {
    return;
  }

  try {
    callback(peers_.snapshot());
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Discovery: Peer list callback failed: " << e.what();
  }
}


//==============================================
// BEACON PROCESSING
//==============================================

std::string DiscoveryWorker::make_beacon() const {
  return Codec::encode_beacon(Beacon{username_(), options_.local_ip});
}

bool DiscoveryWorker::handle_datagram(const std::string& data, const std::string& sender_ip) {
  if (sender_ip == options_.local_ip) {
    return false;
  }

  auto beacon = Codec::decode_beacon(data);
  if (!beacon) {
    BOOST_LOG_TRIVIAL(trace) << "Discovery: Dropped malformed datagram from " << sender_ip;
    return false;
  }

  const auto now = std::chrono::steady_clock::now();
  const auto result = peers_.upsert(sender_ip, beacon->username, now);

  PeerSeenCallback seen;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    seen = peer_seen_callback_;
  }
  if (seen) {
    try {
      seen(Peer{sender_ip, beacon->username, now});
    }
    catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Discovery: Peer seen callback failed: " << e.what();
    }
  }

  if (result == PeerTable::UpsertResult::REFRESHED) {
    return false;
  }
  publish_snapshot();
  return true;
}

bool DiscoveryWorker::prune() {
  auto removed = peers_.remove_stale(std::chrono::steady_clock::now(), options_.peer_timeout);
  if (removed.empty()) {
    return false;
  }
  publish_snapshot();
  return true;
}


//==============================================
// WORKER LOOPS
//==============================================

bool DiscoveryWorker::wait_for(std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(stop_mutex_);
  stop_cv_.wait_for(lock, duration, [this]() { return !running_; });
  return running_;
}

void DiscoveryWorker::send_beacon() {
  const std::string payload = make_beacon();
  boost::asio::ip::udp::endpoint target(boost::asio::ip::make_address(options_.broadcast_address),
                                        options_.port);

  boost::system::error_code ec;
  send_socket_->send_to(boost::asio::buffer(payload), target, 0, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Discovery: Failed to send beacon to " << options_.broadcast_address
                               << ": " << ec.message();
  }
}

void DiscoveryWorker::beacon_loop() {
  BOOST_LOG_TRIVIAL(debug) << "Discovery: Beacon thread started";

  do {
    try {
      // Username is looked up on every tick so renames go out immediately
      send_beacon();
    }
    catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Discovery: Beacon error: " << e.what();
    }
  } while (wait_for(options_.beacon_interval));

  BOOST_LOG_TRIVIAL(debug) << "Discovery: Beacon thread stopped";
}

void DiscoveryWorker::listener_loop() {
  BOOST_LOG_TRIVIAL(debug) << "Discovery: Listener thread started";

  std::array<char, Codec::MAX_BEACON_SIZE + 1> buffer;
  boost::asio::ip::udp::endpoint sender;
  boost::asio::steady_timer timer(receive_context_);

  while (running_) {
    bool completed = false;
    boost::system::error_code result;
    size_t received = 0;

    timer.expires_after(options_.receive_timeout);
    timer.async_wait([this, &completed](const boost::system::error_code& ec) {
      if (!ec && !completed) {
        boost::system::error_code ignored;
        receive_socket_->cancel(ignored);
      }
    });
    receive_socket_->async_receive_from(boost::asio::buffer(buffer), sender,
      [&](const boost::system::error_code& ec, size_t bytes) {
        completed = true;
        result = ec;
        received = bytes;
        timer.cancel();
      });

    receive_context_.restart();
    receive_context_.run();

    if (result == boost::asio::error::operation_aborted) {
      continue;
    }
    if (result) {
      BOOST_LOG_TRIVIAL(warning) << "Discovery: Receive error: " << result.message();
      wait_for(std::chrono::milliseconds(100));
      continue;
    }

    try {
      handle_datagram(std::string(buffer.data(), received), sender.address().to_string());
    }
    catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Discovery: Error handling beacon: " << e.what();
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Discovery: Listener thread stopped";
}

void DiscoveryWorker::pruner_loop() {
  BOOST_LOG_TRIVIAL(debug) << "Discovery: Pruner thread started";

  while (wait_for(options_.prune_interval)) {
    try {
      prune();
    }
    catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Discovery: Prune error: " << e.what();
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Discovery: Pruner thread stopped";
}

} // namespace network
} // namespace ghostnet
