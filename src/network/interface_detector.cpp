#include "network/interface_detector.hpp"
#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <algorithm>
#include <cctype>

namespace ghostnet {
namespace network {

namespace {

std::string lowercase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool starts_with(const std::string& value, const std::string& prefix) {
  return value.compare(0, prefix.size(), prefix) == 0;
}

bool contains_any(const std::string& value, std::initializer_list<const char*> needles) {
  for (const char* needle : needles) {
    if (value.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

std::string address_to_string(const sockaddr* address) {
  if (!address || address->sa_family != AF_INET) {
    return "";
  }
  char buffer[INET_ADDRSTRLEN] = {0};
  const auto* in = reinterpret_cast<const sockaddr_in*>(address);
  if (!inet_ntop(AF_INET, &in->sin_addr, buffer, sizeof(buffer))) {
    return "";
  }
  return buffer;
}

std::string compute_broadcast(const std::string& ip, const std::string& netmask) {
  boost::system::error_code ec;
  auto address = boost::asio::ip::make_address_v4(ip, ec);
  if (ec) {
    return "";
  }
  auto mask = boost::asio::ip::make_address_v4(netmask, ec);
  if (ec) {
    return "";
  }
  return boost::asio::ip::address_v4(address.to_uint() | ~mask.to_uint()).to_string();
}

} // namespace

const char* to_string(NetworkType type) {
  switch (type) {
    case NetworkType::WIFI: return "wifi";
    case NetworkType::ETHERNET: return "ethernet";
    case NetworkType::PRIVATE: return "private";
    case NetworkType::HOTSPOT: return "hotspot";
    case NetworkType::CELLULAR: return "cellular";
    default: return "unknown";
  }
}


//==============================================
// CLASSIFICATION
//==============================================

NetworkType InterfaceDetector::classify(const std::string& name, const std::string& ip) {
  const std::string lower = lowercase(name);

  if (starts_with(lower, "ap") || contains_any(lower, {"hotspot", "tether", "rndis", "ncm"})) {
    return NetworkType::HOTSPOT;
  }
  if (contains_any(lower, {"rmnet", "ccmni", "cellular", "mobile", "wwan"})) {
    return NetworkType::CELLULAR;
  }
  if (starts_with(lower, "eth") || starts_with(lower, "en") || starts_with(lower, "lan")) {
    return NetworkType::ETHERNET;
  }
  if (starts_with(lower, "wl") || starts_with(lower, "wifi") || starts_with(lower, "ath")) {
    return NetworkType::WIFI;
  }

  if (starts_with(ip, "192.168.43.") || starts_with(ip, "192.168.137.")) {
    return NetworkType::HOTSPOT;
  }
  if (starts_with(ip, "10.") || starts_with(ip, "172.") || starts_with(ip, "192.168.")) {
    return NetworkType::PRIVATE;
  }
  return NetworkType::UNKNOWN;
}


//==============================================
// ENUMERATION
//==============================================

std::vector<InterfaceInfo> InterfaceDetector::list_interfaces() {
  std::vector<InterfaceInfo> interfaces;

  ifaddrs* addresses = nullptr;
  if (getifaddrs(&addresses) != 0) {
    BOOST_LOG_TRIVIAL(warning) << "Interface detector: getifaddrs failed";
    return interfaces;
  }

  for (ifaddrs* entry = addresses; entry != nullptr; entry = entry->ifa_next) {
    if (!entry->ifa_addr || entry->ifa_addr->sa_family != AF_INET) {
      continue;
    }
    if (!(entry->ifa_flags & IFF_UP) || (entry->ifa_flags & IFF_LOOPBACK)) {
      continue;
    }

    InterfaceInfo info;
    info.name = entry->ifa_name ? entry->ifa_name : "";
    info.ip = address_to_string(entry->ifa_addr);
    if (info.ip.empty() || starts_with(info.ip, "127.") || starts_with(info.ip, "169.254.")) {
      continue;
    }

    info.netmask = address_to_string(entry->ifa_netmask);
    if (info.netmask.empty()) {
      info.netmask = "255.255.255.0";
    }
    if ((entry->ifa_flags & IFF_BROADCAST) && entry->ifa_broadaddr) {
      info.broadcast = address_to_string(entry->ifa_broadaddr);
    }
    if (info.broadcast.empty()) {
      info.broadcast = compute_broadcast(info.ip, info.netmask);
    }
    info.type = classify(info.name, info.ip);

    BOOST_LOG_TRIVIAL(debug) << "Interface detector: " << info.name << " " << info.ip
                             << " (" << to_string(info.type) << ")";
    interfaces.push_back(info);
  }

  freeifaddrs(addresses);
  return interfaces;
}

std::optional<InterfaceInfo> InterfaceDetector::best_interface(const std::vector<InterfaceInfo>& interfaces) {
  auto best = std::min_element(interfaces.begin(), interfaces.end(),
    [](const InterfaceInfo& a, const InterfaceInfo& b) {
      return static_cast<int>(a.type) < static_cast<int>(b.type);
    });
  if (best == interfaces.end()) {
    return std::nullopt;
  }
  return *best;
}

std::string InterfaceDetector::probe_route() {
  try {
    boost::asio::io_context io_context;
    boost::asio::ip::udp::socket socket(io_context);
    socket.open(boost::asio::ip::udp::v4());
    // Connecting a UDP socket sends nothing; it only selects a route
    socket.connect(boost::asio::ip::udp::endpoint(boost::asio::ip::make_address("8.8.8.8"), 80));
    return socket.local_endpoint().address().to_string();
  }
  catch (const boost::system::system_error& e) {
    BOOST_LOG_TRIVIAL(debug) << "Interface detector: Route probe failed: " << e.what();
    return "";
  }
}

std::string InterfaceDetector::detect_local_ip() {
  if (auto best = best_interface(list_interfaces())) {
    return best->ip;
  }

  std::string probed = probe_route();
  if (!probed.empty() && probed != "0.0.0.0") {
    return probed;
  }

  BOOST_LOG_TRIVIAL(warning) << "Interface detector: No network interface found, using 127.0.0.1";
  return "127.0.0.1";
}

NetworkStatus InterfaceDetector::status(const std::string& local_ip) {
  NetworkStatus status;
  status.local_ip = local_ip;

  const auto interfaces = list_interfaces();
  status.connected = !interfaces.empty();
  for (const auto& info : interfaces) {
    if (info.ip == local_ip) {
      status.type = info.type;
      return status;
    }
  }
  status.type = classify("", local_ip);
  return status;
}

} // namespace network
} // namespace ghostnet
