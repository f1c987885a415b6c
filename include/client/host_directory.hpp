// include/client/host_directory.hpp

#pragma once

#include "field_session.hpp"
#include "host_discovery.hpp"

#include <boost/asio/io_context.hpp>
#include <optional>
#include <vector>

/**
 * @class HostDirectory
 * @brief Per-tick view of the hosts reported by host discovery.
 *
 * poll() restarts the discovery task if it finished, takes at most one host
 * list from it and reports whether the list differs from the previous one.
 */
class HostDirectory {
public:
  explicit HostDirectory(boost::asio::io_context &io_context,
                         HostDiscovery::Settings settings = {});

  // returns true if hosts() changed
  bool poll();

  const std::vector<FieldHost> &hosts() const { return hosts_; }

private:
  boost::asio::io_context &io_context_;
  HostDiscovery::Settings settings_;
  std::optional<HostDiscoveryHandle> discovery_;
  std::vector<FieldHost> hosts_;
};
