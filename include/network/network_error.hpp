#ifndef GHOSTNET_NETWORK_ERROR_HPP
#define GHOSTNET_NETWORK_ERROR_HPP

#include <stdexcept>
#include <string>

namespace ghostnet {
namespace network {

// Malformed header, missing delimiter, header too large or size over cap
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& message) : std::runtime_error(message) {}
};

// Received payload does not match the checksum announced in its header
class IntegrityError : public std::runtime_error {
public:
    explicit IntegrityError(const std::string& message) : std::runtime_error(message) {}
};

// Connect, accept, read, write or timeout failures
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message) : std::runtime_error(message) {}
};

class TimeoutError : public TransportError {
public:
    explicit TimeoutError(const std::string& message) : TransportError(message) {}
};

enum class SendStatus {
    SUCCESS = 0,
    ENGINE_NOT_RUNNING,
    FILE_NOT_FOUND,
    FILE_TOO_LARGE,
    MESSAGE_TOO_LARGE,
    CRYPTO_UNAVAILABLE,
    CONNECTION_FAILED,
    TIMEOUT,
    TRANSFER_FAILED
};

inline const char* to_string(SendStatus status) {
    switch (status) {
        case SendStatus::SUCCESS: return "Success";
        case SendStatus::ENGINE_NOT_RUNNING: return "Engine not running";
        case SendStatus::FILE_NOT_FOUND: return "File not found";
        case SendStatus::FILE_TOO_LARGE: return "File too large";
        case SendStatus::MESSAGE_TOO_LARGE: return "Message too large";
        case SendStatus::CRYPTO_UNAVAILABLE: return "Encryption unavailable";
        case SendStatus::CONNECTION_FAILED: return "Connection failed";
        case SendStatus::TIMEOUT: return "Timeout";
        case SendStatus::TRANSFER_FAILED: return "Transfer failed";
        default: return "Undefined error";
    }
}

// Outcome of a single outbound send
struct SendResult {
    SendStatus status = SendStatus::SUCCESS;
    std::string detail;

    bool ok() const { return status == SendStatus::SUCCESS; }

    static SendResult success() { return SendResult{}; }
    static SendResult failure(SendStatus status, const std::string& detail) {
        return SendResult{status, detail};
    }
};

} // namespace network
} // namespace ghostnet

#endif // GHOSTNET_NETWORK_ERROR_HPP
