// include/discovery/host_set.hpp

#pragma once

#include "wire_types.hpp"

#include <boost/asio/ip/udp.hpp>
#include <chrono>
#include <cstdint>
#include <set>
#include <vector>

using boost::asio::ip::udp;

// one remote publisher, possibly seen on several local interfaces
struct DiscoveredHost {
  udp::endpoint source;         ///< Sender of the chosen beacon.
  uint32_t interface_index = 0; ///< Interface the chosen beacon came in on.
  std::set<uint32_t> interfaces; ///< Every interface the host was seen on.
  HostAdvertisement advertisement;
  std::chrono::steady_clock::time_point last_seen;

  // address of the control channel (source address, advertised port)
  udp::endpoint control_endpoint() const {
    return udp::endpoint(source.address(), advertisement.control_port);
  }

  // equality ignores last_seen so that a refreshed host is not a change
  bool operator==(const DiscoveredHost &other) const {
    return source == other.source &&
           interface_index == other.interface_index &&
           interfaces == other.interfaces &&
           advertisement == other.advertisement;
  }
};

using HostList = std::vector<DiscoveredHost>;

/**
 * @class HostSet
 * @brief Deduplicating collection of discovered hosts.
 *
 * Two observations belong to the same host when
 *  - both beacons carry an instance id and the ids are equal, or
 *  - they come from the same address and port (the IPv6 scope is ignored), or
 *  - they carry the same non-empty hostname and come from the same port.
 * Beacons carrying different instance ids are never merged.
 *
 * When one host is heard on several interfaces the lowest interface index
 * wins. Indices are handed out in ascending order and the more local
 * interfaces (loopback first) tend to be registered first, so this picks the
 * same interface every time and the host list does not flicker.
 */
class HostSet {
public:
  // records one beacon, returns true if the visible host list changed
  bool observe(const udp::endpoint &source, uint32_t interface_index,
               const HostAdvertisement &advertisement,
               std::chrono::steady_clock::time_point now);

  // drops hosts not heard from within max_age, returns true if any was dropped
  bool expire(std::chrono::steady_clock::time_point now,
              std::chrono::steady_clock::duration max_age);

  // deterministic snapshot ordered by source address and port
  HostList hosts() const;

  size_t size() const { return hosts_.size(); }
  bool empty() const { return hosts_.empty(); }
  void clear() { hosts_.clear(); }

  static bool same_address(const udp::endpoint &a, const udp::endpoint &b);

private:
  static bool is_same_host(const DiscoveredHost &known,
                           const udp::endpoint &source,
                           const HostAdvertisement &advertisement);

  std::vector<DiscoveredHost> hosts_;
};
