// src/discovery/host_discovery.cpp

#include "host_discovery.hpp"
#include "packet_codec.hpp"

#include <algorithm>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <iostream>
#include <stdexcept>

// ======== GroupMemberships ========

std::vector<NetworkInterface>
GroupMemberships::refresh(const std::vector<NetworkInterface> &interfaces,
                          const JoinFn &join) {
  std::set<uint32_t> listed;
  for (const auto &iface : interfaces)
    listed.insert(iface.index);
  for (auto it = joined_.begin(); it != joined_.end();) {
    if (listed.count(*it))
      ++it;
    else
      it = joined_.erase(it);
  }

  std::vector<NetworkInterface> newly_joined;
  for (const auto &iface : interfaces) {
    if (joined_.count(iface.index))
      continue;
    auto ec = join(iface);
    // the kernel may still hold the membership from before the interface
    // dropped out of the list
    if (ec && ec != boost::asio::error::address_in_use)
      continue;
    joined_.insert(iface.index);
    newly_joined.push_back(iface);
  }
  return newly_joined;
}

// ======== HostDiscovery ========

std::shared_ptr<HostDiscovery>
HostDiscovery::create(boost::asio::io_context &io_context, Settings settings,
                      std::shared_ptr<HostChannel> hosts_out,
                      std::shared_ptr<std::atomic<bool>> finished) {
  return std::shared_ptr<HostDiscovery>(
      new HostDiscovery(io_context, std::move(settings), std::move(hosts_out),
                        std::move(finished)));
}

HostDiscovery::HostDiscovery(boost::asio::io_context &io_context,
                             Settings settings,
                             std::shared_ptr<HostChannel> hosts_out,
                             std::shared_ptr<std::atomic<bool>> finished)
    : io_context_(io_context), settings_(std::move(settings)),
      hosts_out_(std::move(hosts_out)), finished_(std::move(finished)),
      timer_(io_context) {}

void HostDiscovery::start() {
  std::cout << "[DISCOVERY] Starting host discovery ("
            << (settings_.mode == Mode::PER_INTERFACE ? "per-interface"
                                                      : "dual-stack")
            << ", port " << settings_.port << ")" << std::endl;

  if (settings_.mode == Mode::PER_INTERFACE) {
    window_deadline_ = std::chrono::steady_clock::now();
    start_window();
    return;
  }

  if (!open_shared_sockets()) {
    finish();
    return;
  }
  join_new_interfaces();
  schedule_refresh();
}

void HostDiscovery::stop() {
  if (stopped_)
    return;
  std::cout << "[DISCOVERY] Stopping host discovery." << std::endl;
  finish();
}

void HostDiscovery::finish() {
  stopped_ = true;
  timer_.cancel();
  for (auto &[index, sockets] : interface_sockets_) {
    if (sockets.v4)
      sockets.v4->stop_receive();
    if (sockets.v6)
      sockets.v6->stop_receive();
  }
  interface_sockets_.clear();
  if (shared_v4_)
    shared_v4_->stop_receive();
  if (shared_v6_)
    shared_v6_->stop_receive();
  shared_v4_.reset();
  shared_v6_.reset();
  finished_->store(true);
}

// ======== per-interface variant ========

void HostDiscovery::start_window() {
  if (stopped_)
    return;

  window_deadline_ += settings_.collection_window;
  hosts_.clear();
  refresh_interface_sockets();
  if (stopped_)
    return; // a bind failed in the first window
  first_window_ = false;

  timer_.expires_at(window_deadline_);
  timer_.async_wait(
      [self = shared_from_this()](const boost::system::error_code &ec) {
        self->on_window_end(ec);
      });
}

void HostDiscovery::on_window_end(const boost::system::error_code &ec) {
  if (ec == boost::asio::error::operation_aborted || stopped_)
    return;
  if (ec) {
    std::cerr << "[DISCOVERY] Collection timer error: " << ec.message()
              << std::endl;
  }

  publish();
  start_window();
}

void HostDiscovery::refresh_interface_sockets() {
  auto interfaces = net_iface::viable_multicast_interfaces();
  auto same_interface = [](const NetworkInterface &a,
                           const NetworkInterface &b) {
    return a.index == b.index && a.name == b.name && a.addresses == b.addresses;
  };

  // drop sockets of interfaces that went away or changed
  for (auto it = interface_sockets_.begin(); it != interface_sockets_.end();) {
    auto current = std::find_if(interfaces.begin(), interfaces.end(),
                                [&](const NetworkInterface &i) {
                                  return same_interface(i, it->second.iface);
                                });
    if (current == interfaces.end()) {
      std::cout << "[DISCOVERY] Interface " << it->second.iface.name
                << " gone, closing its sockets." << std::endl;
      if (it->second.v4)
        it->second.v4->stop_receive();
      if (it->second.v6)
        it->second.v6->stop_receive();
      it = interface_sockets_.erase(it);
    } else {
      ++it;
    }
  }

  // an interface that could not be bound is tried again once it left the list
  for (auto it = unbindable_interfaces_.begin();
       it != unbindable_interfaces_.end();) {
    auto current = std::find_if(
        interfaces.begin(), interfaces.end(),
        [&](const NetworkInterface &i) { return i.index == *it; });
    if (current == interfaces.end())
      it = unbindable_interfaces_.erase(it);
    else
      ++it;
  }

  for (const auto &iface : interfaces) {
    if (unbindable_interfaces_.count(iface.index))
      continue;

    auto &sockets = interface_sockets_[iface.index];
    sockets.iface = iface;
    bool opened = false;
    try {
      // families whose join failed earlier are opened again here
      if (iface.has_ipv6() && !sockets.v6) {
        sockets.v6 = open_interface_socket(iface, true);
        opened = opened || sockets.v6 != nullptr;
      }
      if (iface.has_ipv4() && !sockets.v4) {
        sockets.v4 = open_interface_socket(iface, false);
        opened = opened || sockets.v4 != nullptr;
      }
    } catch (const std::exception &e) {
      std::cerr << (first_window_ ? "[ERROR]" : "[WARN]")
                << " Host discovery cannot bind on " << iface.name << ": "
                << e.what() << std::endl;
      if (sockets.v4)
        sockets.v4->stop_receive();
      if (sockets.v6)
        sockets.v6->stop_receive();
      interface_sockets_.erase(iface.index);
      if (first_window_) {
        finish();
        return;
      }
      unbindable_interfaces_.insert(iface.index);
      continue;
    }
    if (opened) {
      std::cout << "[DISCOVERY] Listening on interface " << iface.name << " ("
                << iface.index << ")" << std::endl;
    }
  }
}

std::shared_ptr<MulticastSocket>
HostDiscovery::open_interface_socket(const NetworkInterface &iface, bool v6) {
  auto socket = MulticastSocket::create(
      io_context_,
      MulticastSocket::bind_multicast(io_context_, v6 ? "::" : "0.0.0.0",
                                      settings_.port),
      DISCOVERY_SOCK_BUF_SIZE);

  boost::system::error_code ec;
  auto group = boost::asio::ip::make_address(
      v6 ? settings_.group_v6 : settings_.group_v4, ec);
  if (ec) {
    throw std::runtime_error("Invalid discovery group: " + ec.message());
  }

  auto if_address =
      iface.ipv4_address().value_or(boost::asio::ip::address_v4::any());
  if (socket->join_group(group, iface.index, if_address)) {
    // interface cannot join right now, retried at the next refresh
    return nullptr;
  }

  std::weak_ptr<HostDiscovery> weak_self = weak_from_this();
  uint32_t index = iface.index;
  socket->set_receive_callback(
      [weak_self, index](const std::vector<uint8_t> &data,
                         const udp::endpoint &sender) {
        if (auto self = weak_self.lock()) {
          self->handle_beacon(data, sender, index);
        }
      });
  socket->start_receive();
  return socket;
}

// ======== dual-stack variant ========

bool HostDiscovery::open_shared_sockets() {
  std::weak_ptr<HostDiscovery> weak_self = weak_from_this();
  auto callback = [weak_self](const std::vector<uint8_t> &data,
                              const udp::endpoint &sender) {
    auto self = weak_self.lock();
    if (!self)
      return;
    // the receiving interface is only known for scoped (link-local) senders
    uint32_t index = 0;
    if (sender.address().is_v6()) {
      index = static_cast<uint32_t>(sender.address().to_v6().scope_id());
    }
    self->handle_beacon(data, sender, index);
  };

  try {
    shared_v4_ = MulticastSocket::create(
        io_context_,
        MulticastSocket::bind_multicast(io_context_, "0.0.0.0", settings_.port),
        DISCOVERY_SOCK_BUF_SIZE);
    shared_v6_ = MulticastSocket::create(
        io_context_,
        MulticastSocket::bind_multicast(io_context_, "::", settings_.port),
        DISCOVERY_SOCK_BUF_SIZE);
  } catch (const std::exception &e) {
    std::cerr << "[ERROR] Host discovery cannot bind its sockets: " << e.what()
              << std::endl;
    return false;
  }

  shared_v4_->set_receive_callback(callback);
  shared_v6_->set_receive_callback(callback);
  shared_v4_->start_receive();
  shared_v6_->start_receive();
  return true;
}

void HostDiscovery::join_new_interfaces() {
  boost::system::error_code ec_v4, ec_v6;
  auto group_v4 = boost::asio::ip::make_address(settings_.group_v4, ec_v4);
  auto group_v6 = boost::asio::ip::make_address(settings_.group_v6, ec_v6);
  if (ec_v4 || ec_v6) {
    std::cerr << "[ERROR] Invalid discovery group address." << std::endl;
    finish();
    return;
  }

  // an interface may only carry one family, each is joined on its own
  std::vector<NetworkInterface> v4_interfaces, v6_interfaces;
  for (const auto &iface : net_iface::viable_multicast_interfaces()) {
    if (iface.has_ipv4())
      v4_interfaces.push_back(iface);
    if (iface.has_ipv6())
      v6_interfaces.push_back(iface);
  }

  auto joined = joined_v4_.refresh(
      v4_interfaces, [&](const NetworkInterface &iface) {
        return shared_v4_->join_group(group_v4, iface.index,
                                      *iface.ipv4_address());
      });
  for (const auto &iface : joined) {
    std::cout << "[DISCOVERY] Joined " << group_v4 << " on " << iface.name
              << " (" << iface.index << ")" << std::endl;
  }

  joined = joined_v6_.refresh(v6_interfaces, [&](const NetworkInterface &iface) {
    return shared_v6_->join_group(group_v6, iface.index);
  });
  for (const auto &iface : joined) {
    std::cout << "[DISCOVERY] Joined " << group_v6 << " on " << iface.name
              << " (" << iface.index << ")" << std::endl;
  }
}

void HostDiscovery::schedule_refresh() {
  if (stopped_)
    return;
  timer_.expires_after(settings_.collection_window);
  timer_.async_wait(
      [self = shared_from_this()](const boost::system::error_code &ec) {
        if (ec == boost::asio::error::operation_aborted || self->stopped_)
          return;
        self->join_new_interfaces();
        if (self->hosts_.expire(std::chrono::steady_clock::now(),
                                self->settings_.host_expiry)) {
          self->publish();
        }
        self->schedule_refresh();
      });
}

// ======== shared ========

void HostDiscovery::handle_beacon(const std::vector<uint8_t> &data,
                                  const udp::endpoint &sender,
                                  uint32_t interface_index) {
  if (stopped_)
    return;

  HostAdvertisement advertisement;
  try {
    advertisement = packet_codec::decode_host_advertisement(data);
  } catch (const std::exception &e) {
    std::cerr << "[DISCOVERY] Warning: Invalid host advertisement from "
              << sender << ": " << e.what() << std::endl;
    return;
  }

  auto now = std::chrono::steady_clock::now();
  if (settings_.mode == Mode::PER_INTERFACE) {
    hosts_.observe(sender, interface_index, advertisement, now);
    return; // published when the window closes
  }

  hosts_.expire(now, settings_.host_expiry);
  hosts_.observe(sender, interface_index, advertisement, now);
  publish();
}

void HostDiscovery::publish() {
  switch (hosts_out_->try_send(hosts_.hosts())) {
  case HostChannel::SendResult::OK:
    break;
  case HostChannel::SendResult::FULL: {
    auto now = std::chrono::steady_clock::now();
    if (now >= next_full_warning_) {
      std::cerr << "[WARN] Host list channel full, dropping newest list."
                << std::endl;
      next_full_warning_ = now + CHANNEL_FULL_WARN_COOLDOWN;
    }
    break;
  }
  case HostChannel::SendResult::CLOSED:
    std::cout << "[DISCOVERY] Host list receiver gone, ending discovery."
              << std::endl;
    finish();
    break;
  }
}

// ======== HostDiscoveryHandle ========

HostDiscoveryHandle
HostDiscoveryHandle::spawn(boost::asio::io_context &io_context,
                           HostDiscovery::Settings settings) {
  auto channel =
      make_channel<HostList>(HOST_LIST_CHANNEL_CAPACITY);
  auto finished = std::make_shared<std::atomic<bool>>(false);
  auto task =
      HostDiscovery::create(io_context, std::move(settings), channel, finished);
  boost::asio::post(io_context, [task] { task->start(); });
  return HostDiscoveryHandle(io_context, std::move(task), std::move(channel),
                             std::move(finished));
}

HostDiscoveryHandle::HostDiscoveryHandle(
    boost::asio::io_context &io_context, std::shared_ptr<HostDiscovery> task,
    std::shared_ptr<HostDiscovery::HostChannel> channel,
    std::shared_ptr<std::atomic<bool>> finished)
    : io_context_(&io_context), task_(std::move(task)),
      channel_(std::move(channel)), finished_(std::move(finished)) {}

HostDiscoveryHandle &
HostDiscoveryHandle::operator=(HostDiscoveryHandle &&other) noexcept {
  if (this != &other) {
    release();
    io_context_ = other.io_context_;
    task_ = std::move(other.task_);
    channel_ = std::move(other.channel_);
    finished_ = std::move(other.finished_);
  }
  return *this;
}

HostDiscoveryHandle::~HostDiscoveryHandle() { release(); }

void HostDiscoveryHandle::release() {
  if (channel_)
    channel_->close();
  if (task_) {
    boost::asio::post(*io_context_, [task = task_] { task->stop(); });
  }
  task_.reset();
  channel_.reset();
}

std::optional<HostList> HostDiscoveryHandle::try_recv() {
  if (!channel_)
    return std::nullopt;
  return channel_->try_recv();
}

bool HostDiscoveryHandle::is_finished() const {
  return !finished_ || finished_->load();
}
