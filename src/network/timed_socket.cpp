#include "network/timed_socket.hpp"
#include "network/network_error.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>

namespace ghostnet {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TimedSocket::TimedSocket(size_t max_buffered)
  : socket_(io_context_)
  , timer_(io_context_)
  , buffer_(max_buffered)
  , completed_(false)
  , timed_out_(false)
  , transferred_(0) {
}

TimedSocket::~TimedSocket() {
  close();
}


//==============================================
// OPERATION DRIVER
//==============================================

void TimedSocket::prepare() {
  completed_ = false;
  timed_out_ = false;
  result_ = boost::system::error_code();
  transferred_ = 0;
}

void TimedSocket::complete(const boost::system::error_code& ec, size_t bytes) {
  completed_ = true;
  result_ = ec;
  transferred_ = bytes;
  timer_.cancel();
}

void TimedSocket::run(std::chrono::milliseconds timeout) {
  timer_.expires_after(timeout);
  timer_.async_wait([this](const boost::system::error_code& ec) {
    if (!ec && !completed_) {
      timed_out_ = true;
      boost::system::error_code ignored;
      socket_.cancel(ignored);
    }
  });

  io_context_.restart();
  io_context_.run();
}


//==============================================
// CONNECTION
//==============================================

void TimedSocket::connect(const std::string& host, uint16_t port, const std::string& local_address,
                          std::chrono::milliseconds timeout) {
  boost::system::error_code ec;
  auto address = boost::asio::ip::make_address(host, ec);
  if (ec) {
    throw TransportError("Invalid address: " + host);
  }
  boost::asio::ip::tcp::endpoint endpoint(address, port);

  socket_.open(endpoint.protocol(), ec);
  if (ec) {
    throw TransportError("Failed to open socket: " + ec.message());
  }

  if (!local_address.empty() && local_address != "0.0.0.0") {
    auto local = boost::asio::ip::make_address(local_address, ec);
    if (!ec) {
      socket_.bind(boost::asio::ip::tcp::endpoint(local, 0), ec);
    }
    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "Timed socket: Could not bind to " << local_address
                                 << ": " << ec.message();
    }
  }

  prepare();
  socket_.async_connect(endpoint, [this](const boost::system::error_code& error) {
    complete(error, 0);
  });
  run(timeout);

  if (timed_out_) {
    close();
    throw TimeoutError("Connection to " + host + ":" + std::to_string(port) + " timed out");
  }
  if (result_) {
    close();
    throw TransportError("Connection to " + host + ":" + std::to_string(port) + " failed: " + result_.message());
  }
}

void TimedSocket::close() {
  if (socket_.is_open()) {
    boost::system::error_code ec;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
  }
}


//==============================================
// I/O OPERATIONS
//==============================================

void TimedSocket::write_all(const void* data, size_t size, std::chrono::milliseconds timeout) {
  prepare();
  boost::asio::async_write(socket_, boost::asio::buffer(data, size),
    [this](const boost::system::error_code& error, size_t bytes) {
      complete(error, bytes);
    });
  run(timeout);

  if (timed_out_) {
    throw TimeoutError("Write timed out");
  }
  if (result_) {
    throw TransportError("Write failed: " + result_.message());
  }
}

std::optional<std::string> TimedSocket::read_until(const std::string& delimiter,
                                                   std::chrono::milliseconds timeout) {
  prepare();
  boost::asio::async_read_until(socket_, buffer_, delimiter,
    [this](const boost::system::error_code& error, size_t bytes) {
      complete(error, bytes);
    });
  run(timeout);

  if (timed_out_) {
    return std::nullopt;
  }
  if (result_ == boost::asio::error::not_found) {
    throw ProtocolError("Header exceeds " + std::to_string(buffer_.max_size()) + " bytes without delimiter");
  }
  if (result_ == boost::asio::error::eof) {
    throw ProtocolError("Connection closed before header delimiter");
  }
  if (result_) {
    throw TransportError("Read failed: " + result_.message());
  }

  // transferred_ counts everything up to and including the delimiter
  auto begin = boost::asio::buffers_begin(buffer_.data());
  std::string header(begin, begin + (transferred_ - delimiter.size()));
  buffer_.consume(transferred_);
  return header;
}

size_t TimedSocket::read_some(void* data, size_t size, std::chrono::milliseconds timeout) {
  if (buffer_.size() > 0) {
    size_t copied = boost::asio::buffer_copy(boost::asio::buffer(data, size), buffer_.data());
    buffer_.consume(copied);
    return copied;
  }

  prepare();
  socket_.async_read_some(boost::asio::buffer(data, size),
    [this](const boost::system::error_code& error, size_t bytes) {
      complete(error, bytes);
    });
  run(timeout);

  if (timed_out_ && transferred_ == 0) {
    return 0;
  }
  if (result_ == boost::asio::error::eof) {
    throw TransportError("Connection closed by peer");
  }
  if (result_ && result_ != boost::asio::error::operation_aborted) {
    throw TransportError("Read failed: " + result_.message());
  }
  return transferred_;
}

std::string TimedSocket::take_buffered() {
  std::string remaining(boost::asio::buffers_begin(buffer_.data()),
                        boost::asio::buffers_end(buffer_.data()));
  buffer_.consume(buffer_.size());
  return remaining;
}


//==============================================
// GETTERS
//==============================================

std::string TimedSocket::remote_address() const {
  boost::system::error_code ec;
  auto endpoint = socket_.remote_endpoint(ec);
  if (ec) {
    return "";
  }
  return endpoint.address().to_string();
}

} // namespace network
} // namespace ghostnet
