#include "network/codec.hpp"
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>
#include <cctype>
#include <chrono>

namespace ghostnet {
namespace network {

using json = nlohmann::json;

//==============================================
// HEADER SERIALIZATION
//==============================================

std::string Codec::encode_header(const MessageHeader& header) {
  json j;
  j["type"] = to_string(header.type);

  if (header.type == MessageType::TEXT) {
    j["content"] = header.content;
  } else {
    j["filename"] = header.filename;
    j["filesize"] = header.filesize;
    j["checksum"] = header.checksum;
  }
  j["timestamp"] = header.timestamp;

  return j.dump();
}

MessageHeader Codec::decode_header(const std::string& plaintext) {
  json j = json::parse(plaintext, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    throw ProtocolError("Codec: Header is not a JSON object");
  }

  auto type_it = j.find("type");
  if (type_it == j.end() || !type_it->is_string()) {
    throw ProtocolError("Codec: Header has no type");
  }

  MessageHeader header;
  const std::string type = type_it->get<std::string>();

  auto timestamp_it = j.find("timestamp");
  if (timestamp_it != j.end() && timestamp_it->is_string()) {
    header.timestamp = timestamp_it->get<std::string>();
  }

  if (type == "TEXT") {
    auto content_it = j.find("content");
    if (content_it == j.end() || !content_it->is_string()) {
      throw ProtocolError("Codec: TEXT header has no content");
    }
    header.type = MessageType::TEXT;
    header.content = content_it->get<std::string>();
    return header;
  }

  if (type == "FILE") {
    auto filename_it = j.find("filename");
    auto filesize_it = j.find("filesize");
    auto checksum_it = j.find("checksum");

    if (filename_it == j.end() || !filename_it->is_string()) {
      throw ProtocolError("Codec: FILE header has no filename");
    }
    if (filesize_it == j.end() || !filesize_it->is_number_unsigned()) {
      throw ProtocolError("Codec: FILE header has no valid filesize");
    }
    if (checksum_it == j.end() || !checksum_it->is_string()
        || !is_hex_digest(checksum_it->get<std::string>())) {
      throw ProtocolError("Codec: FILE header has no valid checksum");
    }

    header.type = MessageType::FILE;
    header.filename = filename_it->get<std::string>();
    header.filesize = filesize_it->get<uint64_t>();
    header.checksum = checksum_it->get<std::string>();

    if (header.filesize > MAX_FILE_SIZE) {
      throw ProtocolError("Codec: File size " + std::to_string(header.filesize) + " exceeds limit");
    }
    return header;
  }

  throw ProtocolError("Codec: Unknown message type: " + type);
}

MessageHeader Codec::make_text_header(const std::string& content) {
  MessageHeader header;
  header.type = MessageType::TEXT;
  header.content = content;
  header.timestamp = current_timestamp();
  return header;
}

MessageHeader Codec::make_file_header(const std::string& filename, uint64_t filesize,
                                      const std::string& checksum) {
  MessageHeader header;
  header.type = MessageType::FILE;
  header.filename = filename;
  header.filesize = filesize;
  header.checksum = checksum;
  header.timestamp = current_timestamp();
  return header;
}

bool Codec::is_hex_digest(const std::string& value) {
  if (value.size() != 64) {
    return false;
  }
  for (char c : value) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}


//==============================================
// BEACON SERIALIZATION
//==============================================

std::string Codec::encode_beacon(const Beacon& beacon) {
  json j;
  j["type"] = "BEACON";
  j["username"] = beacon.username;
  j["ip"] = beacon.ip;
  return j.dump();
}

std::optional<Beacon> Codec::decode_beacon(const std::string& datagram) {
  if (datagram.empty() || datagram.size() > MAX_BEACON_SIZE) {
    return std::nullopt;
  }

  json j = json::parse(datagram, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return std::nullopt;
  }

  auto type_it = j.find("type");
  auto username_it = j.find("username");
  auto ip_it = j.find("ip");
  if (type_it == j.end() || !type_it->is_string() || type_it->get<std::string>() != "BEACON") {
    return std::nullopt;
  }
  if (username_it == j.end() || !username_it->is_string()
      || ip_it == j.end() || !ip_it->is_string()) {
    return std::nullopt;
  }

  Beacon beacon;
  beacon.username = username_it->get<std::string>();
  beacon.ip = ip_it->get<std::string>();
  if (beacon.username.empty() || beacon.ip.empty()) {
    return std::nullopt;
  }
  return beacon;
}


//==============================================
// FILENAME HANDLING
//==============================================

bool Codec::is_allowed_filename_char(char c) {
  const unsigned char uc = static_cast<unsigned char>(c);
  if (uc >= 0x80) {
    return false;
  }
  return std::isalnum(uc) || c == '.' || c == '_' || c == '-' || c == ' ' || c == '(' || c == ')';
}

std::string Codec::sanitize_filename(const std::string& filename) {
  // Keep only the last path component, whichever separator was used
  std::string name = filename;
  const size_t separator = name.find_last_of("/\\");
  if (separator != std::string::npos) {
    name = name.substr(separator + 1);
  }

  std::string filtered;
  filtered.reserve(name.size());
  for (char c : name) {
    if (is_allowed_filename_char(c)) {
      filtered.push_back(c);
    }
  }

  // Truncate, keeping a short extension intact
  if (filtered.size() > MAX_FILENAME_LENGTH) {
    std::string extension;
    const size_t dot = filtered.find_last_of('.');
    if (dot != std::string::npos && dot > 0 && filtered.size() - dot <= 16) {
      extension = filtered.substr(dot);
    }
    filtered = filtered.substr(0, MAX_FILENAME_LENGTH - extension.size()) + extension;
  }

  // No hidden files, no names that resolve to "." or ".."
  size_t begin = 0;
  while (begin < filtered.size() && (filtered[begin] == '.' || filtered[begin] == ' ')) {
    ++begin;
  }
  size_t end = filtered.size();
  while (end > begin && (filtered[end - 1] == '.' || filtered[end - 1] == ' ')) {
    --end;
  }
  filtered = filtered.substr(begin, end - begin);

  if (filtered.empty()) {
    return PLACEHOLDER_FILENAME;
  }
  return filtered;
}

std::filesystem::path Codec::unique_destination(const std::filesystem::path& dir,
                                                const std::string& name) {
  std::filesystem::path candidate = dir / name;
  if (!std::filesystem::exists(candidate)) {
    return candidate;
  }

  const std::filesystem::path original(name);
  const std::string stem = original.stem().string();
  const std::string extension = original.extension().string();

  for (unsigned counter = 1; ; ++counter) {
    candidate = dir / (stem + "_" + std::to_string(counter) + extension);
    if (!std::filesystem::exists(candidate)) {
      BOOST_LOG_TRIVIAL(debug) << "Codec: Name collision for " << name << ", using "
                               << candidate.filename().string();
      return candidate;
    }
  }
}


//==============================================
// TIMESTAMPS
//==============================================

std::string Codec::current_timestamp() {
  return boost::posix_time::to_iso_extended_string(
    boost::posix_time::microsec_clock::universal_time());
}

double Codec::unix_time_now() {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::duration<double>>(now).count();
}

} // namespace network
} // namespace ghostnet
