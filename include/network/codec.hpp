#ifndef GHOSTNET_NETWORK_CODEC_HPP
#define GHOSTNET_NETWORK_CODEC_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "network/message_frame.hpp"
#include "network/network_error.hpp"

namespace ghostnet {
namespace network {

// Stateless helpers for the wire formats used by discovery and transport
class Codec {
public:
  // ---- PROTOCOL CONSTANTS ----
  // base64url never produces '<' or '>', so the delimiter cannot occur in a header token
  static constexpr const char* HEADER_DELIMITER = "<HEADER_END>";
  static constexpr uint64_t MAX_FILE_SIZE = 100ULL * 1024 * 1024;
  static constexpr size_t CHUNK_SIZE = 4096;
  static constexpr size_t MAX_HEADER_SIZE = 64 * 1024;
  static constexpr size_t MAX_BEACON_SIZE = 4096;
  static constexpr size_t MAX_FILENAME_LENGTH = 255;
  static constexpr const char* PLACEHOLDER_FILENAME = "received_file";


  // ---- HEADER SERIALIZATION ----
  // Serializes a header to its JSON plaintext
  static std::string encode_header(const MessageHeader& header);
  // Parses JSON plaintext into a header; throws ProtocolError on any malformed field
  // or a file size above MAX_FILE_SIZE
  static MessageHeader decode_header(const std::string& plaintext);

  static MessageHeader make_text_header(const std::string& content);
  static MessageHeader make_file_header(const std::string& filename, uint64_t filesize,
                                        const std::string& checksum);


  // ---- BEACON SERIALIZATION ----
  static std::string encode_beacon(const Beacon& beacon);
  // Returns nullopt for anything that is not a well-formed beacon
  static std::optional<Beacon> decode_beacon(const std::string& datagram);


  // ---- FILENAME HANDLING ----
  // Reduces an untrusted filename to a safe basename. Idempotent.
  static std::string sanitize_filename(const std::string& filename);
  // Returns dir/name, or dir/name_N.ext for the first N that does not exist yet
  static std::filesystem::path unique_destination(const std::filesystem::path& dir,
                                                  const std::string& name);


  // ---- TIMESTAMPS ----
  // Current UTC time as ISO8601 with microseconds
  static std::string current_timestamp();
  // Seconds since the epoch as a floating point value
  static double unix_time_now();

private:
  static bool is_allowed_filename_char(char c);
  static bool is_hex_digest(const std::string& value);
};

} // namespace network
} // namespace ghostnet

#endif // GHOSTNET_NETWORK_CODEC_HPP
