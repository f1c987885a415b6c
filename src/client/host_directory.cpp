// src/client/host_directory.cpp

#include "host_directory.hpp"

#include <iostream>

HostDirectory::HostDirectory(boost::asio::io_context &io_context,
                             HostDiscovery::Settings settings)
    : io_context_(io_context), settings_(std::move(settings)) {}

bool HostDirectory::poll() {
  if (!discovery_ || discovery_->is_finished()) {
    if (discovery_) {
      std::cerr << "[CLIENT] Host discovery stopped, restarting it."
                << std::endl;
    }
    discovery_.reset();
    discovery_.emplace(HostDiscoveryHandle::spawn(io_context_, settings_));
  }

  auto list = discovery_->try_recv();
  if (!list)
    return false;

  std::vector<FieldHost> hosts;
  hosts.reserve(list->size());
  for (const auto &host : *list) {
    hosts.push_back(FieldHost::from_discovered(host));
  }
  if (hosts == hosts_)
    return false;

  hosts_ = std::move(hosts);
  std::cout << "[CLIENT] " << hosts_.size() << " host(s) available:";
  for (const auto &host : hosts_) {
    std::cout << " " << host.display_name();
  }
  std::cout << std::endl;
  return true;
}
