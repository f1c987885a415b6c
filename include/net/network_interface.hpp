// include/net/network_interface.hpp

#pragma once

#include <boost/asio/ip/address.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// snapshot of one local network interface, taken by list_interfaces()
struct NetworkInterface {
  uint32_t index = 0; ///< OS interface index, lower means higher priority.
  std::string name;
  std::vector<boost::asio::ip::address> addresses;

  bool has_ipv4() const;
  bool has_ipv6() const;

  // first ipv4 address bound to the interface, used for ipv4 group joins
  std::optional<boost::asio::ip::address_v4> ipv4_address() const;
};

/**
 * @namespace net_iface
 * @brief Best-effort queries about the local network interfaces.
 *
 * Nothing in here throws: a failed platform query yields an empty list or
 * `false`, so one broken interface never blocks discovery on the others.
 */
namespace net_iface {

// all interfaces with at least one ipv4 or ipv6 address, ordered by index
std::vector<NetworkInterface> list_interfaces();

// IFF_MULTICAST as reported right now by the kernel
bool is_multicast_capable(const NetworkInterface &iface);

// IFF_UP as reported right now by the kernel
bool is_up(const NetworkInterface &iface);

// interfaces a discovery socket should be opened on
std::vector<NetworkInterface> viable_multicast_interfaces();

} // namespace net_iface
