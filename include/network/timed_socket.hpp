#ifndef GHOSTNET_NETWORK_TIMED_SOCKET_HPP
#define GHOSTNET_NETWORK_TIMED_SOCKET_HPP

#include <boost/asio.hpp>
#include <chrono>
#include <optional>
#include <string>

namespace ghostnet {
namespace network {

// Blocking TCP socket whose every operation is bounded by a deadline.
// Each instance owns a private io_context; operations run on the calling thread.
class TimedSocket {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit TimedSocket(size_t max_buffered);
  ~TimedSocket();

  TimedSocket(const TimedSocket&) = delete;
  TimedSocket& operator=(const TimedSocket&) = delete;


  // ---- CONNECTION ----
  // Binds to local_address first when it names a specific interface.
  // Throws TimeoutError or TransportError.
  void connect(const std::string& host, uint16_t port, const std::string& local_address,
               std::chrono::milliseconds timeout);
  void close();


  // ---- I/O OPERATIONS ----
  // Throws TimeoutError or TransportError
  void write_all(const void* data, size_t size, std::chrono::milliseconds timeout);
  void write_all(const std::string& data, std::chrono::milliseconds timeout) {
    write_all(data.data(), data.size(), timeout);
  }
  // Returns the bytes preceding the delimiter and consumes the delimiter.
  // nullopt when the timeout elapsed first (already received bytes are kept).
  // Throws ProtocolError when the buffer fills or the peer closes without a delimiter.
  std::optional<std::string> read_until(const std::string& delimiter,
                                        std::chrono::milliseconds timeout);
  // Serves buffered bytes first; returns 0 when the timeout elapsed.
  // Throws TransportError when the peer closed the connection.
  size_t read_some(void* data, size_t size, std::chrono::milliseconds timeout);
  // Removes and returns whatever is already buffered without touching the socket
  std::string take_buffered();


  // ---- GETTERS ----
  boost::asio::ip::tcp::socket& socket() { return socket_; }
  std::string remote_address() const;

private:
  // ---- PARAMETERS ----
  boost::asio::io_context io_context_;
  boost::asio::ip::tcp::socket socket_;
  boost::asio::steady_timer timer_;
  boost::asio::streambuf buffer_;

  // State of the operation in flight
  bool completed_;
  bool timed_out_;
  boost::system::error_code result_;
  size_t transferred_;


  // ---- OPERATION DRIVER ----
  // Runs the pending operation until it completes or the deadline cancels it
  void run(std::chrono::milliseconds timeout);
  void prepare();
  void complete(const boost::system::error_code& ec, size_t bytes);
};

} // namespace network
} // namespace ghostnet

#endif // GHOSTNET_NETWORK_TIMED_SOCKET_HPP
