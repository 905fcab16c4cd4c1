#include "network/tcp_client.hpp"
#include "network/codec.hpp"
#include "network/timed_socket.hpp"
#include "crypto/crypto_error.hpp"
#include "crypto/sha256.hpp"
#include <boost/log/trivial.hpp>
#include <cstring>
#include <fstream>
#include <vector>

namespace ghostnet {
namespace network {

namespace {
// Receivers buffer at most this much while looking for the delimiter
const size_t MAX_FRAMED_HEADER = Codec::MAX_HEADER_SIZE + std::strlen(Codec::HEADER_DELIMITER);
}

//==============================================
// CONSTRUCTOR
//==============================================

TransportClient::TransportClient(const Options& options, crypto::CipherProvider& cipher)
  : options_(options)
  , cipher_(cipher) {
}


//==============================================
// HELPERS
//==============================================

std::string TransportClient::frame_header(const MessageHeader& header) const {
  return cipher_.encrypt_for_wire(Codec::encode_header(header)) + Codec::HEADER_DELIMITER;
}

void TransportClient::open(TimedSocket& socket, const std::string& peer_ip) {
  BOOST_LOG_TRIVIAL(debug) << "Transport client: Connecting to " << peer_ip << ":" << options_.port;
  socket.connect(peer_ip, options_.port, options_.local_address, options_.connect_timeout);
}

SendResult TransportClient::classify_failure(const std::string& peer_ip, std::exception_ptr error) const {
  try {
    std::rethrow_exception(error);
  }
  catch (const TimeoutError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Transport client: Timeout talking to " << peer_ip << ": " << e.what();
    return SendResult::failure(SendStatus::TIMEOUT, e.what());
  }
  catch (const TransportError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Transport client: Send to " << peer_ip << " failed: " << e.what();
    return SendResult::failure(SendStatus::CONNECTION_FAILED, e.what());
  }
  catch (const crypto::CryptoError& e) {
    BOOST_LOG_TRIVIAL(error) << "Transport client: Could not encrypt header for " << peer_ip << ": " << e.what();
    return SendResult::failure(SendStatus::CRYPTO_UNAVAILABLE, e.what());
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Transport client: Send to " << peer_ip << " failed: " << e.what();
    return SendResult::failure(SendStatus::TRANSFER_FAILED, e.what());
  }
}


//==============================================
// OUTGOING MESSAGES
//==============================================

SendResult TransportClient::send_text(const std::string& peer_ip, const std::string& text) {
  try {
    // Header is built before connecting so crypto failures never open a socket
    const std::string framed = frame_header(Codec::make_text_header(text));
    if (framed.size() > MAX_FRAMED_HEADER) {
      BOOST_LOG_TRIVIAL(warning) << "Transport client: Text for " << peer_ip << " frames to " << framed.size()
                                 << " bytes, receivers accept " << MAX_FRAMED_HEADER;
      return SendResult::failure(SendStatus::MESSAGE_TOO_LARGE,
                                 std::to_string(text.size()) + " byte message exceeds the header limit");
    }

    TimedSocket socket(Codec::CHUNK_SIZE);
    open(socket, peer_ip);
    socket.write_all(framed, options_.io_timeout);
    socket.close();

    BOOST_LOG_TRIVIAL(info) << "Transport client: Sent text to " << peer_ip << " (" << text.size() << " bytes)";
    return SendResult::success();
  }
  catch (const std::exception&) {
    return classify_failure(peer_ip, std::current_exception());
  }
}

SendResult TransportClient::send_file(const std::string& peer_ip, const std::filesystem::path& path,
                                      ProgressCallback progress) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    BOOST_LOG_TRIVIAL(warning) << "Transport client: File not found: " << path.string();
    return SendResult::failure(SendStatus::FILE_NOT_FOUND, path.string());
  }

  const uint64_t filesize = std::filesystem::file_size(path, ec);
  if (ec) {
    return SendResult::failure(SendStatus::FILE_NOT_FOUND, path.string() + ": " + ec.message());
  }
  if (filesize > options_.max_file_size) {
    BOOST_LOG_TRIVIAL(warning) << "Transport client: " << path.string() << " is " << filesize
                               << " bytes, limit is " << options_.max_file_size;
    return SendResult::failure(SendStatus::FILE_TOO_LARGE,
                               std::to_string(filesize) + " bytes exceeds " + std::to_string(options_.max_file_size));
  }

  try {
    const std::string checksum = crypto::Sha256::file_hex(path);
    const std::string filename = Codec::sanitize_filename(path.filename().string());
    const std::string framed = frame_header(Codec::make_file_header(filename, filesize, checksum));

    std::ifstream input(path, std::ios::binary);
    if (!input) {
      return SendResult::failure(SendStatus::FILE_NOT_FOUND, path.string());
    }

    TimedSocket socket(Codec::CHUNK_SIZE);
    open(socket, peer_ip);
    socket.write_all(framed, options_.io_timeout);

    std::vector<char> buffer(Codec::CHUNK_SIZE);
    uint64_t sent = 0;
    while (sent < filesize) {
      input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
      const std::streamsize count = input.gcount();
      if (count <= 0) {
        // File shrank while sending; the receiver will reject the short payload
        return SendResult::failure(SendStatus::TRANSFER_FAILED,
                                   "Read " + std::to_string(sent) + " of " + std::to_string(filesize) + " bytes");
      }
      socket.write_all(buffer.data(), static_cast<size_t>(count), options_.io_timeout);
      sent += static_cast<uint64_t>(count);
      if (progress) {
        progress(sent, filesize);
      }
    }
    socket.close();

    BOOST_LOG_TRIVIAL(info) << "Transport client: Sent " << filename << " (" << filesize << " bytes) to " << peer_ip;
    return SendResult::success();
  }
  catch (const std::exception&) {
    return classify_failure(peer_ip, std::current_exception());
  }
}

} // namespace network
} // namespace ghostnet
