// tests/test_host_set.cpp

#include "host_set.hpp"

#include <gtest/gtest.h>

using namespace std::chrono_literals;
namespace ip = boost::asio::ip;

namespace {

HostAdvertisement make_ad(std::optional<std::string> hostname,
                          std::optional<uint32_t> instance_id,
                          uint16_t control_port = 10100) {
  HostAdvertisement ad;
  ad.hostname = std::move(hostname);
  ad.instance_id = instance_id;
  ad.control_port = control_port;
  return ad;
}

udp::endpoint v6_endpoint(const std::string &address, uint32_t scope,
                          uint16_t port = 11000) {
  auto v6 = ip::make_address_v6(address);
  v6.scope_id(scope);
  return udp::endpoint(v6, port);
}

} // anonymous namespace

class HostSetTest : public ::testing::Test {
protected:
  std::chrono::steady_clock::time_point t0 = std::chrono::steady_clock::now();
  HostSet set;
};

TEST_F(HostSetTest, SameHostOnTwoInterfacesPicksLowestIndex) {
  auto ad = make_ad(std::string("field-a"), std::nullopt);

  for (bool reversed : {false, true}) {
    set.clear();
    uint32_t first = reversed ? 2 : 5;
    uint32_t second = reversed ? 5 : 2;
    set.observe(v6_endpoint("fe80::1", first), first, ad, t0);
    set.observe(v6_endpoint("fe80::1", second), second, ad, t0);

    HostList hosts = set.hosts();
    ASSERT_EQ(hosts.size(), 1u);
    EXPECT_EQ(hosts[0].interface_index, 2u);
    EXPECT_EQ(hosts[0].source.address().to_v6().scope_id(), 2u);
    EXPECT_EQ(hosts[0].interfaces, (std::set<uint32_t>{2, 5}));
  }
}

TEST_F(HostSetTest, HostnameAndPortMergeAcrossAddressFamilies) {
  auto ad = make_ad(std::string("field-a"), std::nullopt);
  set.observe(udp::endpoint(ip::make_address("192.168.1.20"), 11000), 3, ad,
              t0);
  set.observe(v6_endpoint("fe80::20", 3), 3, ad, t0);
  EXPECT_EQ(set.size(), 1u);

  // same name from another port is another publisher
  set.observe(udp::endpoint(ip::make_address("192.168.1.21"), 11005), 3, ad,
              t0);
  EXPECT_EQ(set.size(), 2u);
}

TEST_F(HostSetTest, DifferentInstanceIdsStaySeparate) {
  udp::endpoint source(ip::make_address("10.0.0.5"), 11000);
  set.observe(source, 1, make_ad(std::string("a"), 1), t0);
  set.observe(source, 1, make_ad(std::string("a"), 2), t0);
  EXPECT_EQ(set.size(), 2u);

  // equal ids merge even from another address
  set.observe(udp::endpoint(ip::make_address("10.0.0.6"), 12000), 4,
              make_ad(std::nullopt, 1), t0);
  EXPECT_EQ(set.size(), 2u);
}

TEST_F(HostSetTest, ScopeIsIgnoredWhenComparingAddresses) {
  EXPECT_TRUE(HostSet::same_address(v6_endpoint("fe80::1", 2),
                                    v6_endpoint("fe80::1", 7)));
  EXPECT_FALSE(HostSet::same_address(v6_endpoint("fe80::1", 2),
                                     v6_endpoint("fe80::1", 2, 11001)));
  EXPECT_FALSE(HostSet::same_address(v6_endpoint("fe80::1", 2),
                                     v6_endpoint("fe80::2", 2)));
}

TEST_F(HostSetTest, RepeatedBeaconIsNotAChange) {
  udp::endpoint source(ip::make_address("10.0.0.5"), 11000);
  auto ad = make_ad(std::string("field-a"), 9);
  EXPECT_TRUE(set.observe(source, 1, ad, t0));
  EXPECT_FALSE(set.observe(source, 1, ad, t0 + 1s));
  EXPECT_TRUE(set.observe(source, 3, ad, t0 + 1s));
  EXPECT_FALSE(set.observe(source, 3, ad, t0 + 2s));

  ad.control_port = 10200;
  EXPECT_TRUE(set.observe(source, 1, ad, t0 + 2s));
  EXPECT_EQ(set.hosts()[0].control_endpoint().port(), 10200);
}

TEST_F(HostSetTest, ExpireDropsSilentHosts) {
  set.observe(udp::endpoint(ip::make_address("10.0.0.5"), 11000), 1,
              make_ad(std::string("a"), std::nullopt), t0);
  set.observe(udp::endpoint(ip::make_address("10.0.0.6"), 11000), 1,
              make_ad(std::string("b"), std::nullopt), t0 + 2s);

  EXPECT_FALSE(set.expire(t0 + 3s, 3s));
  EXPECT_TRUE(set.expire(t0 + 4s, 3s));
  ASSERT_EQ(set.size(), 1u);
  EXPECT_EQ(set.hosts()[0].advertisement.hostname, "b");
}

TEST_F(HostSetTest, SnapshotIsOrderedByAddress) {
  set.observe(udp::endpoint(ip::make_address("10.0.0.9"), 11000), 1,
              make_ad(std::nullopt, std::nullopt), t0);
  set.observe(udp::endpoint(ip::make_address("10.0.0.2"), 11000), 1,
              make_ad(std::nullopt, std::nullopt), t0);

  HostList hosts = set.hosts();
  ASSERT_EQ(hosts.size(), 2u);
  EXPECT_EQ(hosts[0].source.address().to_string(), "10.0.0.2");
  EXPECT_EQ(hosts[1].source.address().to_string(), "10.0.0.9");
}
