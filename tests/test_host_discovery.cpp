// tests/test_host_discovery.cpp

#include "host_directory.hpp"
#include "host_discovery.hpp"
#include "network_runtime.hpp"
#include "packet_codec.hpp"

#include <boost/asio/error.hpp>
#include <chrono>
#include <gtest/gtest.h>
#include <map>
#include <set>
#include <thread>

using namespace std::chrono_literals;
namespace ip = boost::asio::ip;

namespace {

// unicast beacons reach the wildcard-bound discovery socket as well, which
// keeps these tests independent of multicast routing on the test machine
void send_beacon(uint16_t port, const HostAdvertisement &ad) {
  boost::asio::io_context io;
  udp::socket socket(io, udp::endpoint(udp::v4(), 0));
  socket.send_to(
      boost::asio::buffer(packet_codec::encode_host_advertisement(ad)),
      udp::endpoint(ip::make_address("127.0.0.1"), port));
}

HostDiscovery::Settings test_settings(uint16_t port) {
  HostDiscovery::Settings settings;
  settings.mode = HostDiscovery::Mode::DUAL_STACK;
  settings.port = port;
  settings.collection_window = 200ms;
  settings.host_expiry = 500ms;
  return settings;
}

NetworkInterface make_interface(uint32_t index, const std::string &name) {
  NetworkInterface iface;
  iface.index = index;
  iface.name = name;
  iface.addresses.push_back(ip::make_address("10.0.0." + std::to_string(index)));
  return iface;
}

HostAdvertisement field_ad() {
  HostAdvertisement ad;
  ad.hostname = "field-under-test";
  ad.instance_id = 77;
  ad.control_port = 10100;
  return ad;
}

} // anonymous namespace

// ============================================================================
// Group memberships
// ============================================================================

class GroupMembershipsTest : public ::testing::Test {
protected:
  // join function that fails for the indices in `failing`, counting attempts
  GroupMemberships::JoinFn join_fn() {
    return [this](const NetworkInterface &iface) -> boost::system::error_code {
      ++attempts[iface.index];
      if (failing.count(iface.index))
        return boost::asio::error::no_such_device;
      return {};
    };
  }

  GroupMemberships memberships;
  std::map<uint32_t, int> attempts;
  std::set<uint32_t> failing;
};

TEST_F(GroupMembershipsTest, FailedJoinIsAttemptedAgainOnNextRefresh) {
  std::vector<NetworkInterface> interfaces = {make_interface(2, "eth0"),
                                              make_interface(3, "wlan0")};
  failing = {3};

  auto joined = memberships.refresh(interfaces, join_fn());
  ASSERT_EQ(joined.size(), 1u);
  EXPECT_EQ(joined[0].index, 2u);
  EXPECT_TRUE(memberships.contains(2));
  EXPECT_FALSE(memberships.contains(3));

  failing.clear();
  joined = memberships.refresh(interfaces, join_fn());
  ASSERT_EQ(joined.size(), 1u);
  EXPECT_EQ(joined[0].index, 3u);
  EXPECT_TRUE(memberships.contains(3));

  // the successful join is not repeated
  EXPECT_EQ(attempts[2], 1);
  EXPECT_EQ(attempts[3], 2);

  EXPECT_TRUE(memberships.refresh(interfaces, join_fn()).empty());
  EXPECT_EQ(attempts[3], 2);
}

TEST_F(GroupMembershipsTest, InterfaceLeavingTheListIsJoinedAgain) {
  std::vector<NetworkInterface> interfaces = {make_interface(2, "eth0"),
                                              make_interface(3, "wlan0")};
  memberships.refresh(interfaces, join_fn());
  ASSERT_EQ(memberships.size(), 2u);

  memberships.refresh({interfaces[0]}, join_fn());
  EXPECT_EQ(memberships.size(), 1u);
  EXPECT_FALSE(memberships.contains(3));

  auto joined = memberships.refresh(interfaces, join_fn());
  ASSERT_EQ(joined.size(), 1u);
  EXPECT_EQ(joined[0].index, 3u);
  EXPECT_EQ(attempts[3], 2);
}

TEST_F(GroupMembershipsTest, MembershipStillHeldCountsAsJoined) {
  auto joined = memberships.refresh(
      {make_interface(2, "eth0")},
      [](const NetworkInterface &) -> boost::system::error_code {
        return boost::asio::error::address_in_use;
      });
  EXPECT_EQ(joined.size(), 1u);
  EXPECT_TRUE(memberships.contains(2));
}

// ============================================================================
// Discovery task
// ============================================================================

class HostDiscoveryTest : public ::testing::Test {
protected:
  static constexpr uint16_t PORT = 47311;
  NetworkRuntime runtime;
};

TEST_F(HostDiscoveryTest, PublishesAndExpiresBeaconSender) {
  auto handle = HostDiscoveryHandle::spawn(runtime.context(), test_settings(PORT));
  std::this_thread::sleep_for(100ms);
  if (handle.is_finished()) {
    GTEST_SKIP() << "discovery sockets cannot be bound here";
  }

  std::optional<HostList> list;
  auto deadline = std::chrono::steady_clock::now() + 3s;
  while (!list && std::chrono::steady_clock::now() < deadline) {
    send_beacon(PORT, field_ad());
    std::this_thread::sleep_for(50ms);
    while (auto next = handle.try_recv()) {
      if (!next->empty())
        list = std::move(next);
    }
  }
  ASSERT_TRUE(list.has_value());
  ASSERT_EQ(list->size(), 1u);
  EXPECT_EQ((*list)[0].advertisement, field_ad());
  EXPECT_TRUE((*list)[0].source.address().is_loopback());
  EXPECT_EQ((*list)[0].control_endpoint().port(), 10100);

  // silence beyond the expiry publishes an empty list
  bool expired = false;
  deadline = std::chrono::steady_clock::now() + 3s;
  while (!expired && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(50ms);
    while (auto next = handle.try_recv()) {
      expired = next->empty();
    }
  }
  EXPECT_TRUE(expired);
  EXPECT_FALSE(handle.is_finished());
}

TEST_F(HostDiscoveryTest, DirectoryReportsHostChangesOnce) {
  HostDirectory directory(runtime.context(), test_settings(PORT + 1));

  bool changed = false;
  auto deadline = std::chrono::steady_clock::now() + 3s;
  while (!changed && std::chrono::steady_clock::now() < deadline) {
    send_beacon(PORT + 1, field_ad());
    std::this_thread::sleep_for(50ms);
    changed = directory.poll() && !directory.hosts().empty();
  }
  if (!changed && directory.hosts().empty()) {
    GTEST_SKIP() << "no beacon received, discovery sockets unavailable";
  }
  ASSERT_EQ(directory.hosts().size(), 1u);
  EXPECT_EQ(directory.hosts()[0].display_name(), "field-under-test");

  // the same beacon again does not count as a change
  send_beacon(PORT + 1, field_ad());
  std::this_thread::sleep_for(100ms);
  EXPECT_FALSE(directory.poll());
}

TEST_F(HostDiscoveryTest, PublishesWindowedHostList) {
  auto settings = test_settings(PORT + 2);
  settings.mode = HostDiscovery::Mode::PER_INTERFACE;
  settings.collection_window = 300ms;

  auto handle = HostDiscoveryHandle::spawn(runtime.context(), settings);
  std::this_thread::sleep_for(100ms);
  if (handle.is_finished()) {
    GTEST_SKIP() << "discovery sockets cannot be bound here";
  }

  std::optional<HostList> list;
  auto deadline = std::chrono::steady_clock::now() + 3s;
  while (!list && std::chrono::steady_clock::now() < deadline) {
    send_beacon(PORT + 2, field_ad());
    std::this_thread::sleep_for(50ms);
    while (auto next = handle.try_recv()) {
      if (!next->empty())
        list = std::move(next);
    }
  }
  if (!list) {
    GTEST_SKIP() << "no multicast capable interface to listen on";
  }
  ASSERT_EQ(list->size(), 1u);
  EXPECT_EQ((*list)[0].advertisement, field_ad());
  EXPECT_NE((*list)[0].interface_index, 0u);

  // every window starts empty, so a silent window publishes an empty list
  bool emptied = false;
  deadline = std::chrono::steady_clock::now() + 2s;
  while (!emptied && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(50ms);
    while (auto next = handle.try_recv()) {
      emptied = next->empty();
    }
  }
  EXPECT_TRUE(emptied);
  EXPECT_FALSE(handle.is_finished());
}

TEST_F(HostDiscoveryTest, BindFailureInFirstWindowEndsTask) {
  if (net_iface::viable_multicast_interfaces().empty()) {
    GTEST_SKIP() << "no multicast capable interface to bind on";
  }

  // a socket without address reuse keeps the port to itself
  boost::asio::io_context io;
  udp::socket holder(io, udp::endpoint(udp::v4(), PORT + 3));

  auto settings = test_settings(PORT + 3);
  settings.mode = HostDiscovery::Mode::PER_INTERFACE;
  auto handle = HostDiscoveryHandle::spawn(runtime.context(), settings);

  auto deadline = std::chrono::steady_clock::now() + 2s;
  while (!handle.is_finished() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(20ms);
  }
  EXPECT_TRUE(handle.is_finished());
}
