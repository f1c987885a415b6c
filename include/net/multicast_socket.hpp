// include/net/multicast_socket.hpp

#pragma once

#include "configs.hpp"

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using boost::asio::ip::udp;

/**
 * @class MulticastSocket
 * @brief Asynchronous UDP receiver for (source-specific) multicast traffic.
 *
 * Wraps a socket created by bind_multicast(). Several MulticastSockets may be
 * bound to the same port at once; every one that joined a group receives its
 * own copy of each datagram.
 *
 * Instances are always held by std::shared_ptr (see create()), pending
 * handlers keep the socket alive until they have run.
 */
class MulticastSocket : public std::enable_shared_from_this<MulticastSocket> {
public:
  using ReceiveCallback =
      std::function<void(const std::vector<uint8_t> &, const udp::endpoint &)>;
  using ErrorCallback = std::function<void(const boost::system::error_code &)>;

  /**
   * @brief Binds a reuse-address UDP socket to host:port.
   *
   * Every address the host resolves to is tried in turn, the first one that
   * binds wins. IPv6 sockets are bound v6-only so an IPv4 socket can share
   * the port.
   *
   * @throws std::runtime_error if no resolved address can be bound.
   */
  static udp::socket bind_multicast(boost::asio::io_context &io_context,
                                    const std::string &host, uint16_t port);

  static std::shared_ptr<MulticastSocket>
  create(boost::asio::io_context &io_context, udp::socket socket,
         size_t buffer_size = DATA_SOCK_BUF_SIZE);

  ~MulticastSocket();

  MulticastSocket(const MulticastSocket &) = delete;
  MulticastSocket &operator=(const MulticastSocket &) = delete;

  // any-source join, ipv4 groups are joined via the interface's ipv4 address
  boost::system::error_code
  join_group(const boost::asio::ip::address &group, uint32_t if_index,
             const boost::asio::ip::address_v4 &if_address =
                 boost::asio::ip::address_v4::any());

  /**
   * @brief Subscribes to traffic for `group` sent by `source` only.
   *
   * Scoped to one interface. A failure (e.g. the interface vanished since it
   * was enumerated) is returned rather than thrown; callers retry later.
   */
  boost::system::error_code
  join_source_specific(const boost::asio::ip::address &group,
                       const boost::asio::ip::address &source,
                       uint32_t if_index);

  void set_receive_callback(ReceiveCallback callback);

  // invoked once when a receive fails in a way that is not retried
  void set_error_callback(ErrorCallback callback);

  // when false (the default) receive errors are logged and retried after
  // RECEIVE_RETRY_DELAY, when true they are reported and end the loop
  void set_fail_on_error(bool fail) { fail_on_error_ = fail; }

  void start_receive();

  void stop_receive();

  void send_to(const std::vector<uint8_t> &data,
               const udp::endpoint &recipient);

  udp::endpoint local_endpoint() const;

  bool is_running() const { return running_.load(); }

private:
  MulticastSocket(boost::asio::io_context &io_context, udp::socket socket,
                  size_t buffer_size);

  void do_receive();

  void handle_receive(const boost::system::error_code &error,
                      std::size_t bytes_transferred);

  void schedule_retry();

  boost::asio::io_context &io_context_;
  udp::socket socket_;

  udp::endpoint receive_endpoint_;
  std::vector<uint8_t> receive_buffer_;

  ReceiveCallback receive_callback_;
  ErrorCallback error_callback_;

  std::atomic<bool> running_;
  bool fail_on_error_ = false;
  std::mutex callback_mutex_;
};
