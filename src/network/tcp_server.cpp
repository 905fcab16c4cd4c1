#include "network/tcp_server.hpp"
#include "network/codec.hpp"
#include "network/network_error.hpp"
#include "crypto/sha256.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <vector>

namespace ghostnet {
namespace network {

namespace {

// Granularity at which blocked reads re-check the running flag
constexpr std::chrono::milliseconds POLL_SLICE{500};

// Removes a partially received file unless it was handed over
struct PartialFile {
  std::filesystem::path path;
  bool keep = false;

  ~PartialFile() {
    if (!keep) {
      std::error_code ec;
      std::filesystem::remove(path, ec);
    }
  }
};

std::string lowercase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TransportServer::TransportServer(const Options& options, crypto::CipherProvider& cipher, store::Store* store)
  : options_(options)
  , port_(options.port)
  , cipher_(cipher)
  , store_(store)
  , is_running_(false)
  , temp_counter_(0)
  , received_count_(0)
  , rejected_count_(0) {
  BOOST_LOG_TRIVIAL(info) << "Transport server: Initializing on " << options_.bind_address << ":" << options_.port;
}

TransportServer::~TransportServer() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool TransportServer::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "Transport server: Server already running";
    return false;
  }

  try {
    boost::asio::ip::tcp::endpoint endpoint(
      boost::asio::ip::make_address(options_.bind_address),
      options_.port
    );

    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(io_context_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen();
    port_ = acceptor_->local_endpoint().port();

    is_running_ = true;
    accept_thread_ = std::make_unique<std::thread>(&TransportServer::accept_loop, this);

    BOOST_LOG_TRIVIAL(info) << "Transport server: Listening on " << options_.bind_address << ":" << port_;
    return true;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Transport server: Failed to start server: " << e.what();
    acceptor_.reset();
    return false;
  }
}

void TransportServer::shutdown() {
  if (!is_running_.exchange(false)) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "Transport server: Initiating server shutdown";

  // Accept loop closes the acceptor on its way out
  if (accept_thread_ && accept_thread_->joinable()) {
    accept_thread_->join();
  }
  accept_thread_.reset();

  // Connection threads observe the flag within one poll slice
  reap_connections(true);

  BOOST_LOG_TRIVIAL(info) << "Transport server: Server shutdown complete";
}


//==============================================
// ACCEPT LOOP
//==============================================

void TransportServer::accept_loop() {
  BOOST_LOG_TRIVIAL(debug) << "Transport server: Accept loop started";

  std::unique_ptr<TimedSocket> pending;
  bool accepted = false;
  boost::system::error_code accept_error;

  while (is_running_) {
    try {
      if (!pending) {
        pending = std::make_unique<TimedSocket>(Codec::MAX_HEADER_SIZE + std::string(Codec::HEADER_DELIMITER).size());
        accepted = false;
        acceptor_->async_accept(pending->socket(),
          [&accepted, &accept_error](const boost::system::error_code& error) {
            accepted = true;
            accept_error = error;
          });
      }

      io_context_.restart();
      io_context_.run_for(POLL_SLICE);

      reap_connections(false);
      if (!accepted) {
        continue;
      }

      if (accept_error) {
        BOOST_LOG_TRIVIAL(error) << "Transport server: Accept error: " << accept_error.message();
        pending.reset();
        continue;
      }

      spawn_connection(std::move(pending));
    }
    catch (const std::exception& e) {
      // A failing connection never takes the accept loop down
      BOOST_LOG_TRIVIAL(error) << "Transport server: Error in accept loop: " << e.what();
      pending.reset();
    }
  }

  boost::system::error_code ec;
  acceptor_->close(ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Transport server: Error closing acceptor: " << ec.message();
  }
  // Let the aborted accept complete before its socket goes away
  io_context_.restart();
  io_context_.run();
  pending.reset();

  BOOST_LOG_TRIVIAL(debug) << "Transport server: Accept loop stopped";
}

void TransportServer::spawn_connection(std::unique_ptr<TimedSocket> socket) {
  auto finished = std::make_shared<std::atomic<bool>>(false);
  std::shared_ptr<TimedSocket> connection(std::move(socket));

  std::lock_guard<std::mutex> lock(connections_mutex_);
  connections_.push_back(Connection{
    std::thread([this, connection, finished]() {
      handle_connection(*connection);
      connection->close();
      *finished = true;
    }),
    finished
  });
}

void TransportServer::reap_connections(bool wait_all) {
  std::list<Connection> done;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto it = connections_.begin(); it != connections_.end(); ) {
      if (wait_all || *it->finished) {
        done.push_back(std::move(*it));
        it = connections_.erase(it);
      } else {
        ++it;
      }
    }
  }

  for (auto& connection : done) {
    if (connection.thread.joinable()) {
      connection.thread.join();
    }
  }
}

std::size_t TransportServer::active_connections() {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  return static_cast<std::size_t>(std::count_if(connections_.begin(), connections_.end(),
    [](const Connection& connection) { return !*connection.finished; }));
}


//==============================================
// CONNECTION HANDLING
//==============================================

void TransportServer::set_handlers(Handlers handlers) {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  handlers_ = std::move(handlers);
}

void TransportServer::handle_connection(TimedSocket& socket) {
  const std::string peer_ip = socket.remote_address();
  BOOST_LOG_TRIVIAL(debug) << "Transport server: Connection from " << peer_ip;

  try {
    const std::string token = read_header_token(socket);

    std::string plaintext;
    try {
      plaintext = cipher_.decrypt_from_wire(token);
    }
    catch (const crypto::CryptoError& e) {
      throw ProtocolError(std::string("Undecryptable header: ") + e.what());
    }

    const MessageHeader header = Codec::decode_header(plaintext);
    if (header.type == MessageType::TEXT) {
      receive_text(socket, peer_ip, header);
    } else {
      receive_file(socket, peer_ip, header);
    }
    ++received_count_;
  }
  catch (const IntegrityError& e) {
    ++rejected_count_;
    BOOST_LOG_TRIVIAL(error) << "Transport server: Rejected file from " << peer_ip << ": " << e.what();
  }
  catch (const ProtocolError& e) {
    ++rejected_count_;
    BOOST_LOG_TRIVIAL(warning) << "Transport server: Protocol violation from " << peer_ip << ": " << e.what();
  }
  catch (const TransportError& e) {
    ++rejected_count_;
    BOOST_LOG_TRIVIAL(warning) << "Transport server: Transfer from " << peer_ip << " failed: " << e.what();
  }
  catch (const std::exception& e) {
    ++rejected_count_;
    BOOST_LOG_TRIVIAL(error) << "Transport server: Error handling connection from " << peer_ip << ": " << e.what();
  }
}

std::string TransportServer::read_header_token(TimedSocket& socket) {
  auto deadline = std::chrono::steady_clock::now() + options_.idle_timeout;

  while (is_running_) {
    auto token = socket.read_until(Codec::HEADER_DELIMITER, POLL_SLICE);
    if (token) {
      return *token;
    }
    if (std::chrono::steady_clock::now() > deadline) {
      throw TimeoutError("No header received");
    }
  }
  throw TransportError("Server shutting down");
}

void TransportServer::receive_text(TimedSocket& socket, const std::string& peer_ip,
                                   const MessageHeader& header) {
  // Bytes that arrived behind the delimiter belong to the message
  const std::string text = header.content + socket.take_buffered();
  const std::string timestamp = header.timestamp.empty() ? Codec::current_timestamp() : header.timestamp;

  BOOST_LOG_TRIVIAL(info) << "Transport server: Received text from " << peer_ip
                          << " (" << text.size() << " bytes)";

  if (store_) {
    store_->save_message(peer_ip, store::Sender::PEER, text, store::ContentType::TEXT);
  }

  decltype(handlers_.on_text) callback;
  {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    callback = handlers_.on_text;
  }
  if (callback) {
    try {
      callback(peer_ip, text, timestamp);
    }
    catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Transport server: Text callback failed: " << e.what();
    }
  }
}

void TransportServer::receive_file(TimedSocket& socket, const std::string& peer_ip,
                                   const MessageHeader& header) {
  // Enforced before any payload byte is read
  if (header.filesize > options_.max_file_size) {
    throw ProtocolError("Announced size " + std::to_string(header.filesize) + " exceeds limit of "
                        + std::to_string(options_.max_file_size));
  }

  const std::string filename = Codec::sanitize_filename(header.filename);
  BOOST_LOG_TRIVIAL(info) << "Transport server: Receiving " << filename << " (" << header.filesize
                          << " bytes) from " << peer_ip;

  std::filesystem::create_directories(options_.downloads_dir);

  PartialFile partial;
  partial.path = options_.downloads_dir /
    (".incoming_" + std::to_string(++temp_counter_) + "_" +
     std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".part");

  crypto::Sha256 sha;
  {
    std::ofstream output(partial.path, std::ios::binary | std::ios::trunc);
    if (!output) {
      throw std::runtime_error("Cannot create " + partial.path.string());
    }

    std::vector<char> buffer(Codec::CHUNK_SIZE);
    uint64_t remaining = header.filesize;
    auto last_progress = std::chrono::steady_clock::now();

    while (remaining > 0) {
      if (!is_running_) {
        throw TransportError("Server shutting down");
      }

      const size_t wanted = static_cast<size_t>(std::min<uint64_t>(remaining, buffer.size()));
      const size_t received = socket.read_some(buffer.data(), wanted, POLL_SLICE);
      if (received == 0) {
        if (std::chrono::steady_clock::now() - last_progress > options_.idle_timeout) {
          throw TimeoutError("Transfer stalled with " + std::to_string(remaining) + " bytes outstanding");
        }
        continue;
      }

      output.write(buffer.data(), static_cast<std::streamsize>(received));
      if (!output) {
        throw std::runtime_error("Failed writing " + partial.path.string());
      }
      sha.update(buffer.data(), received);
      remaining -= received;
      last_progress = std::chrono::steady_clock::now();
    }
  }

  const std::string checksum = sha.hex_digest();
  if (checksum != lowercase(header.checksum)) {
    throw IntegrityError("Checksum mismatch for " + filename);
  }

  std::filesystem::path destination;
  {
    std::lock_guard<std::mutex> lock(destination_mutex_);
    destination = Codec::unique_destination(options_.downloads_dir, filename);
    std::filesystem::rename(partial.path, destination);
    partial.keep = true;
  }

  BOOST_LOG_TRIVIAL(info) << "Transport server: Stored " << filename << " from " << peer_ip
                          << " at " << destination.string();

  if (store_) {
    store_->save_message(peer_ip, store::Sender::PEER, filename, store::ContentType::FILE,
                         destination.string());
  }

  decltype(handlers_.on_file) callback;
  {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    callback = handlers_.on_file;
  }
  if (callback) {
    const std::string timestamp = header.timestamp.empty() ? Codec::current_timestamp() : header.timestamp;
    try {
      callback(peer_ip, filename, destination, timestamp);
    }
    catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Transport server: File callback failed: " << e.what();
    }
  }
}

} // namespace network
} // namespace ghostnet
