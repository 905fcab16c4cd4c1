#include <gtest/gtest.h>
#include "network/interface_detector.hpp"
#include "test_utils.hpp"

using namespace ghostnet::network;

class InterfaceDetectorTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_logging(boost::log::trivial::warning);
  }

  InterfaceInfo make(const std::string& name, const std::string& ip) {
    InterfaceInfo info;
    info.name = name;
    info.ip = ip;
    info.type = InterfaceDetector::classify(name, ip);
    return info;
  }
};

TEST_F(InterfaceDetectorTest, ClassifiesByName) {
  EXPECT_EQ(InterfaceDetector::classify("wlan0", "10.0.0.5"), NetworkType::WIFI);
  EXPECT_EQ(InterfaceDetector::classify("wlp2s0", "10.0.0.5"), NetworkType::WIFI);
  EXPECT_EQ(InterfaceDetector::classify("eth0", "10.0.0.5"), NetworkType::ETHERNET);
  EXPECT_EQ(InterfaceDetector::classify("enp3s0", "10.0.0.5"), NetworkType::ETHERNET);
  EXPECT_EQ(InterfaceDetector::classify("ap0", "10.0.0.5"), NetworkType::HOTSPOT);
  EXPECT_EQ(InterfaceDetector::classify("rndis0", "10.0.0.5"), NetworkType::HOTSPOT);
  EXPECT_EQ(InterfaceDetector::classify("rmnet_data0", "10.0.0.5"), NetworkType::CELLULAR);
}

TEST_F(InterfaceDetectorTest, FallsBackToAddressRange) {
  EXPECT_EQ(InterfaceDetector::classify("br0", "192.168.43.1"), NetworkType::HOTSPOT);
  EXPECT_EQ(InterfaceDetector::classify("br0", "192.168.137.1"), NetworkType::HOTSPOT);
  EXPECT_EQ(InterfaceDetector::classify("br0", "192.168.1.20"), NetworkType::PRIVATE);
  EXPECT_EQ(InterfaceDetector::classify("br0", "10.1.2.3"), NetworkType::PRIVATE);
  EXPECT_EQ(InterfaceDetector::classify("br0", "8.8.4.4"), NetworkType::UNKNOWN);
}

TEST_F(InterfaceDetectorTest, PrefersWifiThenEthernet) {
  std::vector<InterfaceInfo> interfaces = {
    make("rmnet0", "100.64.0.2"),
    make("eth0", "192.168.1.10"),
    make("wlan0", "192.168.1.11"),
    make("docker0", "172.17.0.1")
  };

  auto best = InterfaceDetector::best_interface(interfaces);
  ASSERT_TRUE(best.has_value());
  EXPECT_EQ(best->name, "wlan0");

  interfaces.erase(interfaces.begin() + 2);
  EXPECT_EQ(InterfaceDetector::best_interface(interfaces)->name, "eth0");

  EXPECT_FALSE(InterfaceDetector::best_interface({}).has_value());
}

TEST_F(InterfaceDetectorTest, ListedInterfacesExcludeLoopback) {
  for (const auto& info : InterfaceDetector::list_interfaces()) {
    EXPECT_NE(info.ip.rfind("127.", 0), 0u) << info.name;
    EXPECT_NE(info.ip.rfind("169.254.", 0), 0u) << info.name;
    EXPECT_FALSE(info.broadcast.empty()) << info.name;
  }
}

TEST_F(InterfaceDetectorTest, DetectAlwaysReturnsAnAddress) {
  const std::string ip = InterfaceDetector::detect_local_ip();
  EXPECT_FALSE(ip.empty());

  auto status = InterfaceDetector::status(ip);
  EXPECT_EQ(status.local_ip, ip);
}

TEST_F(InterfaceDetectorTest, TypeNames) {
  EXPECT_STREQ(to_string(NetworkType::WIFI), "wifi");
  EXPECT_STREQ(to_string(NetworkType::HOTSPOT), "hotspot");
  EXPECT_STREQ(to_string(NetworkType::UNKNOWN), "unknown");
}
