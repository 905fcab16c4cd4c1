#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>
#include "network/codec.hpp"
#include "network/discovery_worker.hpp"
#include "test_utils.hpp"

using namespace ghostnet::network;
using namespace std::chrono_literals;

namespace {

DiscoveryWorker::Options loopback_options(const std::string& self, const std::string& other, uint16_t port) {
    DiscoveryWorker::Options options;
    options.bind_address = self;
    options.local_ip = self;
    options.broadcast_address = other;
    options.port = port;
    options.beacon_interval = 100ms;
    options.peer_timeout = 1000ms;
    options.prune_interval = 100ms;
    options.receive_timeout = 100ms;
    return options;
}

} // namespace

class DiscoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_logging(boost::log::trivial::warning);
        options.local_ip = "192.168.1.5";
        options.peer_timeout = 200ms;
    }

    std::string beacon(const std::string& username, const std::string& ip) {
        return Codec::encode_beacon(Beacon{username, ip});
    }

    DiscoveryWorker::Options options;
    PeerTable peers;
    std::string username = "Alice";
};


// ---- BEACON PROCESSING ----

TEST_F(DiscoveryTest, BeaconCarriesCurrentUsername) {
    DiscoveryWorker worker(options, peers, [this]() { return username; });

    auto decoded = Codec::decode_beacon(worker.make_beacon());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->username, "Alice");
    EXPECT_EQ(decoded->ip, "192.168.1.5");

    username = "Alicia";
    EXPECT_EQ(Codec::decode_beacon(worker.make_beacon())->username, "Alicia");
}

TEST_F(DiscoveryTest, OwnBeaconsAreIgnored) {
    DiscoveryWorker worker(options, peers, [this]() { return username; });

    EXPECT_FALSE(worker.handle_datagram(worker.make_beacon(), "192.168.1.5"));
    EXPECT_EQ(peers.size(), 0u);
}

TEST_F(DiscoveryTest, MalformedDatagramsAreDropped) {
    DiscoveryWorker worker(options, peers, [this]() { return username; });

    EXPECT_FALSE(worker.handle_datagram("", "192.168.1.7"));
    EXPECT_FALSE(worker.handle_datagram("not json", "192.168.1.7"));
    EXPECT_FALSE(worker.handle_datagram(R"({"type":"PING","username":"Bob","ip":"x"})", "192.168.1.7"));
    EXPECT_FALSE(worker.handle_datagram(R"({"type":"BEACON","username":"","ip":"x"})", "192.168.1.7"));
    EXPECT_FALSE(worker.handle_datagram(std::string(Codec::MAX_BEACON_SIZE + 1, '{'), "192.168.1.7"));
    EXPECT_EQ(peers.size(), 0u);
}

TEST_F(DiscoveryTest, PeerListChangesAreReported) {
    DiscoveryWorker worker(options, peers, [this]() { return username; });

    std::vector<std::vector<Peer>> snapshots;
    int seen = 0;
    worker.set_peer_list_callback([&snapshots](const std::vector<Peer>& list) { snapshots.push_back(list); });
    worker.set_peer_seen_callback([&seen](const Peer&) { ++seen; });

    // Added
    EXPECT_TRUE(worker.handle_datagram(beacon("Bob", "192.168.1.7"), "192.168.1.7"));
    // Refreshed only
    EXPECT_FALSE(worker.handle_datagram(beacon("Bob", "192.168.1.7"), "192.168.1.7"));
    // Renamed
    EXPECT_TRUE(worker.handle_datagram(beacon("Robert", "192.168.1.7"), "192.168.1.7"));

    EXPECT_EQ(seen, 3);
    ASSERT_EQ(snapshots.size(), 2u);
    EXPECT_EQ(snapshots[0][0].username, "Bob");
    EXPECT_EQ(snapshots[1][0].username, "Robert");
}

TEST_F(DiscoveryTest, SenderAddressIsAuthoritative) {
    DiscoveryWorker worker(options, peers, [this]() { return username; });

    worker.handle_datagram(beacon("Mallory", "10.9.9.9"), "192.168.1.8");
    EXPECT_TRUE(peers.has_peer("192.168.1.8"));
    EXPECT_FALSE(peers.has_peer("10.9.9.9"));
}

TEST_F(DiscoveryTest, ThrowingCallbacksAreContained) {
    DiscoveryWorker worker(options, peers, [this]() { return username; });
    worker.set_peer_list_callback([](const std::vector<Peer>&) { throw std::runtime_error("list"); });
    worker.set_peer_seen_callback([](const Peer&) { throw std::runtime_error("seen"); });

    EXPECT_NO_THROW(worker.handle_datagram(beacon("Bob", "192.168.1.7"), "192.168.1.7"));
    EXPECT_TRUE(peers.has_peer("192.168.1.7"));
}

TEST_F(DiscoveryTest, SilentPeersArePruned) {
    DiscoveryWorker worker(options, peers, [this]() { return username; });
    std::vector<Peer> last;
    worker.set_peer_list_callback([&last](const std::vector<Peer>& list) { last = list; });

    worker.handle_datagram(beacon("Bob", "192.168.1.7"), "192.168.1.7");
    EXPECT_FALSE(worker.prune());

    std::this_thread::sleep_for(300ms);
    EXPECT_TRUE(worker.prune());
    EXPECT_TRUE(last.empty());
    EXPECT_EQ(peers.size(), 0u);
}


// ---- LIVE SOCKETS ----

TEST_F(DiscoveryTest, TwoWorkersDiscoverEachOther) {
    const uint16_t port = 47020;
    PeerTable table_a;
    PeerTable table_b;
    DiscoveryWorker a(loopback_options("127.0.0.1", "127.0.0.2", port), table_a, []() { return "NodeA"; });
    DiscoveryWorker b(loopback_options("127.0.0.2", "127.0.0.1", port), table_b, []() { return "NodeB"; });

    ASSERT_TRUE(a.start());
    ASSERT_TRUE(b.start());
    EXPECT_TRUE(a.is_running());

    ASSERT_TRUE(wait_until([&]() { return table_a.has_peer("127.0.0.2") && table_b.has_peer("127.0.0.1"); },
                           5s));
    EXPECT_EQ(table_a.username_for("127.0.0.2"), "NodeB");
    EXPECT_EQ(table_b.username_for("127.0.0.1"), "NodeA");

    // Once B goes quiet, A prunes it
    b.stop();
    EXPECT_FALSE(b.is_running());
    EXPECT_TRUE(wait_until([&]() { return !table_a.has_peer("127.0.0.2"); }, 5s));

    a.stop();
    a.stop();
}

TEST_F(DiscoveryTest, RestartAfterStop) {
    const uint16_t port = 47030;
    DiscoveryWorker worker(loopback_options("127.0.0.1", "127.0.0.2", port), peers, []() { return "Solo"; });

    ASSERT_TRUE(worker.start());
    worker.stop();
    ASSERT_TRUE(worker.start());
    worker.stop();
}
