#ifndef GHOSTNET_NETWORK_INTERFACE_DETECTOR_HPP
#define GHOSTNET_NETWORK_INTERFACE_DETECTOR_HPP

#include <optional>
#include <string>
#include <vector>

namespace ghostnet {
namespace network {

// Ordered by preference when choosing the local address
enum class NetworkType {
    WIFI = 0,
    ETHERNET,
    PRIVATE,
    HOTSPOT,
    CELLULAR,
    UNKNOWN
};

const char* to_string(NetworkType type);

struct InterfaceInfo {
    std::string name;
    std::string ip;
    std::string netmask;
    std::string broadcast;
    NetworkType type = NetworkType::UNKNOWN;
};

struct NetworkStatus {
    std::string local_ip;
    NetworkType type = NetworkType::UNKNOWN;
    bool connected = false;
};

class InterfaceDetector {
public:
    // Active IPv4 interfaces, excluding loopback and link-local addresses
    static std::vector<InterfaceInfo> list_interfaces();
    // Classifies by interface name first, then by address range
    static NetworkType classify(const std::string& name, const std::string& ip);
    static std::optional<InterfaceInfo> best_interface(const std::vector<InterfaceInfo>& interfaces);
    // Best interface address, else the route probe address, else 127.0.0.1
    static std::string detect_local_ip();
    // Local address the kernel would use to reach the internet; empty when unroutable
    static std::string probe_route();
    static NetworkStatus status(const std::string& local_ip);
};

} // namespace network
} // namespace ghostnet

#endif // GHOSTNET_NETWORK_INTERFACE_DETECTOR_HPP
