#ifndef GHOSTNET_NETWORK_PEER_HPP
#define GHOSTNET_NETWORK_PEER_HPP

#include <chrono>
#include <string>

namespace ghostnet {
namespace network {

// A node seen on the local network, keyed by its IP address
struct Peer {
    std::string ip;
    std::string username;
    std::chrono::steady_clock::time_point last_seen;
};

} // namespace network
} // namespace ghostnet

#endif // GHOSTNET_NETWORK_PEER_HPP
