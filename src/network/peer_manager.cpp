#include "network/peer_manager.hpp"
#include <boost/log/trivial.hpp>

namespace ghostnet {
namespace network {

PeerTable::UpsertResult PeerTable::upsert(const std::string& ip, const std::string& username,
                                          std::chrono::steady_clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = peers_.find(ip);
  if (it == peers_.end()) {
    peers_[ip] = Peer{ip, username, now};
    BOOST_LOG_TRIVIAL(info) << "Peer table: Added peer " << username << " (" << ip << ")";
    return UpsertResult::ADDED;
  }

  it->second.last_seen = now;
  if (it->second.username != username) {
    BOOST_LOG_TRIVIAL(info) << "Peer table: Peer " << ip << " renamed from "
                            << it->second.username << " to " << username;
    it->second.username = username;
    return UpsertResult::RENAMED;
  }
  return UpsertResult::REFRESHED;
}

bool PeerTable::remove(const std::string& ip) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = peers_.find(ip);
  if (it == peers_.end()) {
    BOOST_LOG_TRIVIAL(warning) << "Peer table: Attempted to remove non-existent peer: " << ip;
    return false;
  }
  peers_.erase(it);
  BOOST_LOG_TRIVIAL(info) << "Peer table: Removed peer " << ip;
  return true;
}

std::vector<Peer> PeerTable::remove_stale(std::chrono::steady_clock::time_point now,
                                          std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<Peer> removed;
  for (auto it = peers_.begin(); it != peers_.end(); ) {
    if (now - it->second.last_seen > timeout) {
      BOOST_LOG_TRIVIAL(info) << "Peer table: Peer " << it->second.username << " ("
                              << it->first << ") timed out";
      removed.push_back(it->second);
      it = peers_.erase(it);
    } else {
      ++it;
    }
  }
  return removed;
}

void PeerTable::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  peers_.clear();
}

bool PeerTable::has_peer(const std::string& ip) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.find(ip) != peers_.end();
}

std::optional<Peer> PeerTable::get_peer(const std::string& ip) const {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = peers_.find(ip);
  if (it != peers_.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::optional<std::string> PeerTable::username_for(const std::string& ip) const {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = peers_.find(ip);
  if (it != peers_.end()) {
    return it->second.username;
  }
  return std::nullopt;
}

std::vector<Peer> PeerTable::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<Peer> peers;
  peers.reserve(peers_.size());
  for (const auto& entry : peers_) {
    peers.push_back(entry.second);
  }
  return peers;
}

std::size_t PeerTable::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.size();
}

} // namespace network
} // namespace ghostnet
