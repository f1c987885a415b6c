// src/net/multicast_socket.cpp

#include "multicast_socket.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/multicast.hpp>
#include <boost/asio/ip/v6_only.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/system_error.hpp>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <iostream>
#include <stdexcept>

#include <netinet/in.h>
#include <sys/socket.h>

namespace {

// fills a sockaddr_storage as the kernel expects it inside group_source_req
sockaddr_storage to_storage(const boost::asio::ip::address &address,
                            uint32_t if_index) {
  sockaddr_storage storage;
  std::memset(&storage, 0, sizeof(storage));
  if (address.is_v6()) {
    auto *sin6 = reinterpret_cast<sockaddr_in6 *>(&storage);
    sin6->sin6_family = AF_INET6;
    auto bytes = address.to_v6().to_bytes();
    std::memcpy(&sin6->sin6_addr, bytes.data(), bytes.size());
    sin6->sin6_scope_id = if_index;
  } else {
    auto *sin = reinterpret_cast<sockaddr_in *>(&storage);
    sin->sin_family = AF_INET;
    auto bytes = address.to_v4().to_bytes();
    std::memcpy(&sin->sin_addr, bytes.data(), bytes.size());
  }
  return storage;
}

} // anonymous namespace

udp::socket MulticastSocket::bind_multicast(boost::asio::io_context &io_context,
                                            const std::string &host,
                                            uint16_t port) {
  boost::system::error_code ec;
  udp::resolver resolver(io_context);
  auto endpoints = resolver.resolve(host, std::to_string(port),
                                    udp::resolver::passive |
                                        udp::resolver::numeric_host,
                                    ec);
  if (ec) {
    throw std::runtime_error("Could not resolve multicast bind address " +
                             host + ": " + ec.message());
  }

  std::string last_error = "no candidate address";
  for (const auto &entry : endpoints) {
    udp::endpoint endpoint = entry.endpoint();
    udp::socket socket(io_context);

    socket.open(endpoint.protocol(), ec);
    if (ec) {
      last_error = ec.message();
      continue;
    }
    // every socket bound to the port gets its own copy of each datagram
    socket.set_option(udp::socket::reuse_address(true), ec);
    if (!ec && endpoint.address().is_v6()) {
      socket.set_option(boost::asio::ip::v6_only(true), ec);
    }
    if (!ec) {
      socket.bind(endpoint, ec);
    }
    if (!ec) {
      std::cout << "[MCAST] Bound multicast socket to " << endpoint
                << std::endl;
      return socket;
    }
    last_error = ec.message();
    boost::system::error_code close_ec;
    socket.close(close_ec);
  }

  throw std::runtime_error("No viable address to bind " + host + ":" +
                           std::to_string(port) + " (" + last_error + ")");
}

std::shared_ptr<MulticastSocket>
MulticastSocket::create(boost::asio::io_context &io_context, udp::socket socket,
                        size_t buffer_size) {
  return std::shared_ptr<MulticastSocket>(
      new MulticastSocket(io_context, std::move(socket), buffer_size));
}

MulticastSocket::MulticastSocket(boost::asio::io_context &io_context,
                                 udp::socket socket, size_t buffer_size)
    : io_context_(io_context), socket_(std::move(socket)),
      receive_buffer_(buffer_size), running_(false) {}

MulticastSocket::~MulticastSocket() {
  boost::system::error_code ec;
  socket_.close(ec);
}

boost::system::error_code
MulticastSocket::join_group(const boost::asio::ip::address &group,
                            uint32_t if_index,
                            const boost::asio::ip::address_v4 &if_address) {
  boost::system::error_code ec;
  if (group.is_v6()) {
    socket_.set_option(
        boost::asio::ip::multicast::join_group(group.to_v6(), if_index), ec);
  } else {
    socket_.set_option(
        boost::asio::ip::multicast::join_group(group.to_v4(), if_address), ec);
  }
  if (ec) {
    std::cerr << "[MCAST] Warning: Failed to join " << group
              << " on interface " << if_index << ": " << ec.message()
              << std::endl;
  }
  return ec;
}

boost::system::error_code
MulticastSocket::join_source_specific(const boost::asio::ip::address &group,
                                      const boost::asio::ip::address &source,
                                      uint32_t if_index) {
  if (group.is_v6() != source.is_v6()) {
    return boost::asio::error::make_error_code(
        boost::asio::error::address_family_not_supported);
  }

  group_source_req req;
  std::memset(&req, 0, sizeof(req));
  req.gsr_interface = if_index;
  req.gsr_group = to_storage(group, if_index);
  req.gsr_source = to_storage(source, if_index);

  int level = group.is_v6() ? IPPROTO_IPV6 : IPPROTO_IP;
  int rc = ::setsockopt(socket_.native_handle(), level,
                        MCAST_JOIN_SOURCE_GROUP, &req, sizeof(req));
  if (rc != 0) {
    boost::system::error_code ec(errno, boost::system::system_category());
    std::cerr << "[MCAST] Warning: Source-specific join of (" << source << ", "
              << group << ") on interface " << if_index
              << " failed: " << ec.message() << std::endl;
    return ec;
  }

  std::cout << "[MCAST] Joined (" << source << ", " << group
            << ") on interface " << if_index << std::endl;
  return {};
}

void MulticastSocket::set_receive_callback(ReceiveCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  receive_callback_ = std::move(callback);
}

void MulticastSocket::set_error_callback(ErrorCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  error_callback_ = std::move(callback);
}

void MulticastSocket::start_receive() {
  if (running_.exchange(true))
    return;
  do_receive();
}

void MulticastSocket::stop_receive() {
  bool expected = true;
  if (!running_.compare_exchange_strong(expected, false)) {
    return; // already stopped
  }

  if (socket_.is_open()) {
    boost::system::error_code ec;
    socket_.close(ec);
    if (ec) {
      std::cerr << "[MCAST] Error closing socket: " << ec.message()
                << std::endl;
    }
  }
}

void MulticastSocket::send_to(const std::vector<uint8_t> &data,
                              const udp::endpoint &recipient) {
  if (recipient.address().is_unspecified() || recipient.port() == 0) {
    std::cerr << "[MCAST] send_to: Invalid recipient endpoint " << recipient
              << std::endl;
    return;
  }

  // the buffer must outlive the async operation
  auto payload = std::make_shared<std::vector<uint8_t>>(data);
  socket_.async_send_to(
      boost::asio::buffer(*payload), recipient,
      [self = shared_from_this(), payload,
       recipient](const boost::system::error_code &error, std::size_t) {
        if (error && error != boost::asio::error::operation_aborted) {
          std::cerr << "[MCAST] send_to " << recipient
                    << " failed: " << error.message() << std::endl;
        }
      });
}

udp::endpoint MulticastSocket::local_endpoint() const {
  boost::system::error_code ec;
  auto endpoint = socket_.local_endpoint(ec);
  if (ec) {
    throw boost::system::system_error(ec, "MulticastSocket::local_endpoint");
  }
  return endpoint;
}

void MulticastSocket::do_receive() {
  if (!running_.load())
    return;

  socket_.async_receive_from(
      boost::asio::buffer(receive_buffer_), receive_endpoint_,
      [self = shared_from_this()](const boost::system::error_code &error,
                                  std::size_t bytes_transferred) {
        self->handle_receive(error, bytes_transferred);
      });
}

void MulticastSocket::handle_receive(const boost::system::error_code &error,
                                     std::size_t bytes_transferred) {
  udp::endpoint sender_endpoint = receive_endpoint_;

  if (!error && running_.load()) {
    std::vector<uint8_t> received_data(
        receive_buffer_.begin(),
        receive_buffer_.begin() + static_cast<std::ptrdiff_t>(bytes_transferred));

    ReceiveCallback callback_copy;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      callback_copy = receive_callback_;
    }

    if (callback_copy) {
      try {
        callback_copy(received_data, sender_endpoint);
      } catch (const std::exception &e) {
        std::cerr << "[MCAST] Exception in receive callback: " << e.what()
                  << std::endl;
      }
    }

    do_receive();

  } else if (error == boost::asio::error::operation_aborted) {
    // stopped
  } else if (running_.load()) {
    std::cerr << "[MCAST] Receive error: " << error.message() << std::endl;

    if (fail_on_error_) {
      running_.store(false);
      ErrorCallback callback_copy;
      {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_copy = error_callback_;
      }
      if (callback_copy) {
        callback_copy(error);
      }
      return;
    }
    schedule_retry();
  }
}

void MulticastSocket::schedule_retry() {
  auto timer = std::make_shared<boost::asio::steady_timer>(io_context_,
                                                           RECEIVE_RETRY_DELAY);
  timer->async_wait([self = shared_from_this(),
                     timer](const boost::system::error_code &ec) {
    if (!ec && self->running_.load()) {
      self->do_receive();
    } else if (ec && ec != boost::asio::error::operation_aborted) {
      std::cerr << "[MCAST] Error waiting for receive retry: " << ec.message()
                << std::endl;
    }
  });
}
