// src/net/network_interface.cpp

#include "network_interface.hpp"

#include <algorithm>
#include <iterator>
#include <cerrno>
#include <cstring>
#include <iostream>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>

bool NetworkInterface::has_ipv4() const {
  return std::any_of(addresses.begin(), addresses.end(),
                     [](const auto &a) { return a.is_v4(); });
}

bool NetworkInterface::has_ipv6() const {
  return std::any_of(addresses.begin(), addresses.end(),
                     [](const auto &a) { return a.is_v6(); });
}

std::optional<boost::asio::ip::address_v4>
NetworkInterface::ipv4_address() const {
  for (const auto &a : addresses) {
    if (a.is_v4())
      return a.to_v4();
  }
  return std::nullopt;
}

namespace net_iface {

namespace {

std::optional<boost::asio::ip::address> to_address(const sockaddr *sa) {
  if (sa->sa_family == AF_INET) {
    const auto *sin = reinterpret_cast<const sockaddr_in *>(sa);
    boost::asio::ip::address_v4::bytes_type bytes;
    std::memcpy(bytes.data(), &sin->sin_addr, bytes.size());
    return boost::asio::ip::address_v4(bytes);
  }
  if (sa->sa_family == AF_INET6) {
    const auto *sin6 = reinterpret_cast<const sockaddr_in6 *>(sa);
    boost::asio::ip::address_v6::bytes_type bytes;
    std::memcpy(bytes.data(), &sin6->sin6_addr, bytes.size());
    return boost::asio::ip::address_v6(bytes, sin6->sin6_scope_id);
  }
  return std::nullopt;
}

// reads the interface flags via SIOCGIFFLAGS, nullopt on any failure
std::optional<short> query_flags(const std::string &name) {
  if (name.empty() || name.size() >= IFNAMSIZ)
    return std::nullopt;

  int fd = ::socket(AF_INET6, SOCK_DGRAM, 0);
  if (fd < 0) {
    // ipv6 disabled in the kernel, any datagram socket can issue the ioctl
    fd = ::socket(AF_INET, SOCK_DGRAM, 0);
  }
  if (fd < 0)
    return std::nullopt;

  ifreq req{};
  std::strncpy(req.ifr_name, name.c_str(), IFNAMSIZ - 1);
  int rc = ::ioctl(fd, SIOCGIFFLAGS, &req);
  int saved_errno = errno;
  ::close(fd);

  if (rc < 0) {
    std::cerr << "[IFACE] Warning: SIOCGIFFLAGS failed for " << name << ": "
              << std::strerror(saved_errno) << std::endl;
    return std::nullopt;
  }
  return req.ifr_flags;
}

} // anonymous namespace

std::vector<NetworkInterface> list_interfaces() {
  std::vector<NetworkInterface> result;

  ifaddrs *list = nullptr;
  if (::getifaddrs(&list) != 0) {
    std::cerr << "[IFACE] Warning: getifaddrs failed: " << std::strerror(errno)
              << std::endl;
    return result;
  }

  for (auto *entry = list; entry != nullptr; entry = entry->ifa_next) {
    if (entry->ifa_addr == nullptr || entry->ifa_name == nullptr)
      continue;
    auto address = to_address(entry->ifa_addr);
    if (!address)
      continue;

    uint32_t index = ::if_nametoindex(entry->ifa_name);
    if (index == 0)
      continue; // vanished while we were looking

    auto it = std::find_if(result.begin(), result.end(),
                           [index](const NetworkInterface &i) {
                             return i.index == index;
                           });
    if (it == result.end()) {
      NetworkInterface iface;
      iface.index = index;
      iface.name = entry->ifa_name;
      result.push_back(std::move(iface));
      it = std::prev(result.end());
    }
    it->addresses.push_back(*address);
  }
  ::freeifaddrs(list);

  std::sort(result.begin(), result.end(),
            [](const NetworkInterface &a, const NetworkInterface &b) {
              return a.index < b.index;
            });
  return result;
}

bool is_multicast_capable(const NetworkInterface &iface) {
  auto flags = query_flags(iface.name);
  return flags && (*flags & IFF_MULTICAST) != 0;
}

bool is_up(const NetworkInterface &iface) {
  auto flags = query_flags(iface.name);
  return flags && (*flags & IFF_UP) != 0;
}

std::vector<NetworkInterface> viable_multicast_interfaces() {
  std::vector<NetworkInterface> viable;
  for (auto &iface : list_interfaces()) {
    if (is_multicast_capable(iface) && is_up(iface)) {
      viable.push_back(std::move(iface));
    }
  }
  return viable;
}

} // namespace net_iface
