// src/discovery/host_set.cpp

#include "host_set.hpp"

#include <algorithm>
#include <tuple>

bool HostSet::same_address(const udp::endpoint &a, const udp::endpoint &b) {
  if (a.port() != b.port())
    return false;
  const auto &aa = a.address();
  const auto &ba = b.address();
  if (aa.is_v6() && ba.is_v6()) {
    return aa.to_v6().to_bytes() == ba.to_v6().to_bytes();
  }
  return aa == ba;
}

bool HostSet::is_same_host(const DiscoveredHost &known,
                           const udp::endpoint &source,
                           const HostAdvertisement &advertisement) {
  const auto &known_id = known.advertisement.instance_id;
  if (known_id && advertisement.instance_id) {
    return *known_id == *advertisement.instance_id;
  }
  if (same_address(known.source, source)) {
    return true;
  }
  return advertisement.hostname && !advertisement.hostname->empty() &&
         known.advertisement.hostname == advertisement.hostname &&
         known.source.port() == source.port();
}

bool HostSet::observe(const udp::endpoint &source, uint32_t interface_index,
                      const HostAdvertisement &advertisement,
                      std::chrono::steady_clock::time_point now) {
  auto it = std::find_if(hosts_.begin(), hosts_.end(),
                         [&](const DiscoveredHost &known) {
                           return is_same_host(known, source, advertisement);
                         });

  if (it == hosts_.end()) {
    DiscoveredHost host;
    host.source = source;
    host.interface_index = interface_index;
    host.interfaces.insert(interface_index);
    host.advertisement = advertisement;
    host.last_seen = now;
    hosts_.push_back(std::move(host));
    return true;
  }

  DiscoveredHost before = *it;
  it->last_seen = now;
  it->interfaces.insert(interface_index);
  if (interface_index < it->interface_index) {
    it->interface_index = interface_index;
    it->source = source;
    it->advertisement = advertisement;
  } else if (interface_index == it->interface_index) {
    it->source = source;
    it->advertisement = advertisement;
  }
  return !(before == *it);
}

bool HostSet::expire(std::chrono::steady_clock::time_point now,
                     std::chrono::steady_clock::duration max_age) {
  auto old_size = hosts_.size();
  hosts_.erase(std::remove_if(hosts_.begin(), hosts_.end(),
                              [&](const DiscoveredHost &host) {
                                return host.last_seen + max_age < now;
                              }),
               hosts_.end());
  return hosts_.size() != old_size;
}

HostList HostSet::hosts() const {
  HostList list = hosts_;
  std::sort(list.begin(), list.end(),
            [](const DiscoveredHost &a, const DiscoveredHost &b) {
              return std::make_tuple(a.source.address(), a.source.port(),
                                     a.interface_index) <
                     std::make_tuple(b.source.address(), b.source.port(),
                                     b.interface_index);
            });
  return list;
}
