// include/discovery/host_discovery.hpp

#pragma once

#include "channel.hpp"
#include "configs.hpp"
#include "host_set.hpp"
#include "multicast_socket.hpp"
#include "network_interface.hpp"

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

/**
 * @class GroupMemberships
 * @brief Interfaces a shared socket currently holds a group membership on.
 *
 * An interface is recorded only after its join succeeded, so a failed join is
 * attempted again on the next refresh. Interfaces missing from the refreshed
 * list are forgotten and joined afresh when they come back.
 */
class GroupMemberships {
public:
  using JoinFn =
      std::function<boost::system::error_code(const NetworkInterface &)>;

  // joins every listed interface not joined yet, returns the newly joined ones
  std::vector<NetworkInterface>
  refresh(const std::vector<NetworkInterface> &interfaces, const JoinFn &join);

  bool contains(uint32_t index) const { return joined_.count(index) > 0; }
  std::size_t size() const { return joined_.size(); }

private:
  std::set<uint32_t> joined_;
};

/**
 * @class HostDiscovery
 * @brief Long-lived task listening for host beacons.
 *
 * Two protocol variants are supported:
 *
 * PER_INTERFACE: every collection window the interface list is refreshed and
 * one discovery socket per family and multicast capable, up interface is
 * kept open. A family whose join failed is opened again on the next refresh.
 * A bind failure ends the task during the first window only; later it is
 * logged and the interface is skipped until it leaves the list. Beacons from all sockets are merged into one HostSet that is published when
 * the window closes, then a new window starts with an empty set.
 *
 * DUAL_STACK: one IPv4 and one IPv6 socket are bound at start (a bind failure
 * ends the task). The beacon groups are joined on every viable interface
 * that does not hold a membership yet, checked each collection window.
 * Hosts are kept until they stay silent for `host_expiry`, and the list is
 * published after every accepted beacon.
 *
 * The task ends when the consumer closes the host list channel, when stop()
 * is called, or on a fatal socket error. All work happens on the io_context.
 */
class HostDiscovery : public std::enable_shared_from_this<HostDiscovery> {
public:
  enum class Mode { PER_INTERFACE, DUAL_STACK };

  struct Settings {
    Mode mode = Mode::DUAL_STACK;
    std::chrono::milliseconds collection_window = DISCOVERY_COLLECTION_WINDOW;
    std::chrono::milliseconds host_expiry = HOST_EXPIRY;
    uint16_t port = DISCOVERY_PORT;
    std::string group_v4 = DISCOVERY_GROUP_V4;
    std::string group_v6 = DISCOVERY_GROUP_V6;
  };

  using HostChannel = BoundedChannel<HostList>;

  static std::shared_ptr<HostDiscovery>
  create(boost::asio::io_context &io_context, Settings settings,
         std::shared_ptr<HostChannel> hosts_out,
         std::shared_ptr<std::atomic<bool>> finished);

  HostDiscovery(const HostDiscovery &) = delete;
  HostDiscovery &operator=(const HostDiscovery &) = delete;

  // must be called on the io_context
  void start();
  void stop();

private:
  HostDiscovery(boost::asio::io_context &io_context, Settings settings,
                std::shared_ptr<HostChannel> hosts_out,
                std::shared_ptr<std::atomic<bool>> finished);

  struct InterfaceSockets {
    NetworkInterface iface;
    std::shared_ptr<MulticastSocket> v4;
    std::shared_ptr<MulticastSocket> v6;
  };

  // --- per-interface variant ---
  void start_window();
  void on_window_end(const boost::system::error_code &ec);
  void refresh_interface_sockets();
  std::shared_ptr<MulticastSocket>
  open_interface_socket(const NetworkInterface &iface, bool v6);

  // --- dual-stack variant ---
  bool open_shared_sockets();
  void join_new_interfaces();
  void schedule_refresh();

  void handle_beacon(const std::vector<uint8_t> &data,
                     const udp::endpoint &sender, uint32_t interface_index);
  void publish();
  void finish();

  boost::asio::io_context &io_context_;
  Settings settings_;
  std::shared_ptr<HostChannel> hosts_out_;
  std::shared_ptr<std::atomic<bool>> finished_;

  boost::asio::steady_timer timer_;
  std::chrono::steady_clock::time_point window_deadline_;
  std::chrono::steady_clock::time_point next_full_warning_;

  HostSet hosts_;

  std::map<uint32_t, InterfaceSockets> interface_sockets_;
  std::shared_ptr<MulticastSocket> shared_v4_;
  std::shared_ptr<MulticastSocket> shared_v6_;
  std::set<uint32_t> unbindable_interfaces_;
  GroupMemberships joined_v4_;
  GroupMemberships joined_v6_;

  bool first_window_ = true;
  bool stopped_ = false;
};

/**
 * @class HostDiscoveryHandle
 * @brief Consumer side of a running HostDiscovery task.
 *
 * Owns the receiving end of the host list channel and the finished flag.
 * Destroying the handle closes the channel and stops the task.
 */
class HostDiscoveryHandle {
public:
  static HostDiscoveryHandle spawn(boost::asio::io_context &io_context,
                                   HostDiscovery::Settings settings = {});

  HostDiscoveryHandle(HostDiscoveryHandle &&) noexcept = default;
  HostDiscoveryHandle &operator=(HostDiscoveryHandle &&other) noexcept;
  HostDiscoveryHandle(const HostDiscoveryHandle &) = delete;
  HostDiscoveryHandle &operator=(const HostDiscoveryHandle &) = delete;

  ~HostDiscoveryHandle();

  // next published host list, if one is waiting
  std::optional<HostList> try_recv();

  bool is_finished() const;

private:
  HostDiscoveryHandle(boost::asio::io_context &io_context,
                      std::shared_ptr<HostDiscovery> task,
                      std::shared_ptr<HostDiscovery::HostChannel> channel,
                      std::shared_ptr<std::atomic<bool>> finished);

  void release();

  boost::asio::io_context *io_context_;
  std::shared_ptr<HostDiscovery> task_;
  std::shared_ptr<HostDiscovery::HostChannel> channel_;
  std::shared_ptr<std::atomic<bool>> finished_;
};
