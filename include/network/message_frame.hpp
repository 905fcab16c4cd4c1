#ifndef GHOSTNET_NETWORK_MESSAGE_FRAME_HPP
#define GHOSTNET_NETWORK_MESSAGE_FRAME_HPP

#include <cstdint>
#include <string>

namespace ghostnet {
namespace network {

// Message type carried in the encrypted header
enum class MessageType : uint8_t {
    TEXT = 0,
    FILE = 1
};

inline const char* to_string(MessageType type) {
    return type == MessageType::TEXT ? "TEXT" : "FILE";
}

// Plaintext header preceding every transport payload
struct MessageHeader {
    MessageType type = MessageType::TEXT;
    std::string timestamp;    // ISO8601

    // TEXT
    std::string content;

    // FILE
    std::string filename;
    uint64_t filesize = 0;
    std::string checksum;     // hex SHA-256 of the payload
};

// Presence announcement sent over UDP
struct Beacon {
    std::string username;
    std::string ip;
};

} // namespace network
} // namespace ghostnet

#endif // GHOSTNET_NETWORK_MESSAGE_FRAME_HPP
