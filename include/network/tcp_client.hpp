#ifndef GHOSTNET_NETWORK_TCP_CLIENT_HPP
#define GHOSTNET_NETWORK_TCP_CLIENT_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include "crypto/cipher_provider.hpp"
#include "network/message_frame.hpp"
#include "network/network_error.hpp"

namespace ghostnet {
namespace network {

class TimedSocket;

// Sends one message per outbound connection and reports the outcome as a SendResult.
// Safe to use from several threads at once; it keeps no connection state.
class TransportClient {
public:
  struct Options {
    uint16_t port = 37021;
    // Source address for outbound connections; empty or 0.0.0.0 lets the OS choose
    std::string local_address;
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds io_timeout{15000};
    uint64_t max_file_size = 100ULL * 1024 * 1024;
  };

  // Bytes sent so far and the total
  using ProgressCallback = std::function<void(uint64_t sent, uint64_t total)>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  TransportClient(const Options& options, crypto::CipherProvider& cipher);

  TransportClient(const TransportClient&) = delete;
  TransportClient& operator=(const TransportClient&) = delete;


  // ---- OUTGOING MESSAGES ----
  SendResult send_text(const std::string& peer_ip, const std::string& text);
  SendResult send_file(const std::string& peer_ip, const std::filesystem::path& path,
                       ProgressCallback progress = nullptr);


  // ---- GETTERS ----
  const Options& options() const { return options_; }

private:
  // ---- PARAMETERS ----
  Options options_;
  crypto::CipherProvider& cipher_;


  // ---- HELPERS ----
  // Encrypts the header and appends the delimiter; throws crypto::CryptoError
  std::string frame_header(const MessageHeader& header) const;
  void open(TimedSocket& socket, const std::string& peer_ip);
  // Maps an exception thrown while sending to the matching status
  SendResult classify_failure(const std::string& peer_ip, std::exception_ptr error) const;
};

} // namespace network
} // namespace ghostnet

#endif // GHOSTNET_NETWORK_TCP_CLIENT_HPP
