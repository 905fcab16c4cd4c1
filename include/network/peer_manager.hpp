#ifndef GHOSTNET_PEER_MANAGER_HPP
#define GHOSTNET_PEER_MANAGER_HPP

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "peer.hpp"

namespace ghostnet {
namespace network {

// Concurrent table of live peers. Readers get copies, never references into the table.
class PeerTable {
public:
  enum class UpsertResult {
    ADDED,      // first beacon from this address
    RENAMED,    // known peer announced a different username
    REFRESHED   // only last_seen moved
  };

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  PeerTable() = default;
  ~PeerTable() = default;

  // Delete copy constructor and assignment operator
  PeerTable(const PeerTable&) = delete;
  PeerTable& operator=(const PeerTable&) = delete;


  // ---- PEER MANAGEMENT ----
  UpsertResult upsert(const std::string& ip, const std::string& username,
                      std::chrono::steady_clock::time_point now);
  bool remove(const std::string& ip);
  // Removes every peer with now - last_seen > timeout and returns them
  std::vector<Peer> remove_stale(std::chrono::steady_clock::time_point now,
                                 std::chrono::milliseconds timeout);
  void clear();


  // ---- QUERY METHODS ----
  bool has_peer(const std::string& ip) const;
  std::optional<Peer> get_peer(const std::string& ip) const;
  std::optional<std::string> username_for(const std::string& ip) const;
  // Copy of all peers ordered by address
  std::vector<Peer> snapshot() const;
  std::size_t size() const;

private:
  // ---- PARAMETERS ----
  // Peers map and access mutex
  std::map<std::string, Peer> peers_;
  mutable std::mutex mutex_;
};

} // namespace network
} // namespace ghostnet

#endif // GHOSTNET_PEER_MANAGER_HPP
