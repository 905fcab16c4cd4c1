#include <gtest/gtest.h>
#include <thread>
#include <chrono>
#include <vector>
#include "network/peer_manager.hpp"
#include "test_utils.hpp"

using namespace ghostnet::network;
using namespace std::chrono_literals;

class PeerTableTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_logging(boost::log::trivial::error);
    }

    PeerTable table;
    const std::chrono::steady_clock::time_point t0 = std::chrono::steady_clock::now();
};

// Test adding a new peer
TEST_F(PeerTableTest, AddPeerTest) {
    EXPECT_EQ(table.upsert("192.168.1.10", "Alice", t0), PeerTable::UpsertResult::ADDED);

    auto peer = table.get_peer("192.168.1.10");
    ASSERT_TRUE(peer.has_value());
    EXPECT_EQ(peer->username, "Alice");
    EXPECT_EQ(peer->last_seen, t0);
    EXPECT_EQ(table.size(), 1u);
}

// Repeated beacons only refresh the timestamp
TEST_F(PeerTableTest, RefreshPeerTest) {
    table.upsert("192.168.1.10", "Alice", t0);
    EXPECT_EQ(table.upsert("192.168.1.10", "Alice", t0 + 2s), PeerTable::UpsertResult::REFRESHED);

    EXPECT_EQ(table.get_peer("192.168.1.10")->last_seen, t0 + 2s);
    EXPECT_EQ(table.size(), 1u);
}

// A new username for a known address replaces the old one
TEST_F(PeerTableTest, RenamePeerTest) {
    table.upsert("192.168.1.10", "Alice", t0);
    EXPECT_EQ(table.upsert("192.168.1.10", "Alicia", t0 + 1s), PeerTable::UpsertResult::RENAMED);
    EXPECT_EQ(table.username_for("192.168.1.10"), "Alicia");
}

// Test peer removal
TEST_F(PeerTableTest, RemovePeerTest) {
    table.upsert("192.168.1.10", "Alice", t0);
    EXPECT_TRUE(table.remove("192.168.1.10"));
    EXPECT_FALSE(table.remove("192.168.1.10"));
    EXPECT_FALSE(table.has_peer("192.168.1.10"));
    EXPECT_FALSE(table.get_peer("192.168.1.10").has_value());
    EXPECT_FALSE(table.username_for("192.168.1.10").has_value());
}

// Only peers silent for longer than the timeout are pruned
TEST_F(PeerTableTest, RemoveStalePeersTest) {
    table.upsert("10.0.0.1", "Old", t0);
    table.upsert("10.0.0.2", "Edge", t0 + 5s);
    table.upsert("10.0.0.3", "Fresh", t0 + 9s);

    auto removed = table.remove_stale(t0 + 15s, 10s);
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0].ip, "10.0.0.1");
    EXPECT_EQ(removed[0].username, "Old");

    // Exactly at the timeout is still alive
    EXPECT_TRUE(table.remove_stale(t0 + 15s, 10s).empty());
    EXPECT_TRUE(table.has_peer("10.0.0.2"));
    EXPECT_TRUE(table.has_peer("10.0.0.3"));
}

// Snapshots are copies ordered by address
TEST_F(PeerTableTest, SnapshotTest) {
    table.upsert("10.0.0.2", "Bob", t0);
    table.upsert("10.0.0.1", "Alice", t0);

    auto snapshot = table.snapshot();
    ASSERT_EQ(snapshot.size(), 2u);
    EXPECT_EQ(snapshot[0].ip, "10.0.0.1");
    EXPECT_EQ(snapshot[1].ip, "10.0.0.2");

    table.clear();
    EXPECT_EQ(snapshot.size(), 2u);
    EXPECT_EQ(table.size(), 0u);
}

// Concurrent writers and readers keep the table consistent
TEST_F(PeerTableTest, ConcurrentAccessTest) {
    std::vector<std::thread> threads;
    const int num_threads = 8;
    const int peers_per_thread = 50;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < peers_per_thread; ++i) {
                const std::string ip = "10." + std::to_string(t) + ".0." + std::to_string(i);
                table.upsert(ip, "user" + std::to_string(i), std::chrono::steady_clock::now());
                table.snapshot();
                table.remove_stale(std::chrono::steady_clock::now(), 10s);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(table.size(), static_cast<std::size_t>(num_threads * peers_per_thread));
}
