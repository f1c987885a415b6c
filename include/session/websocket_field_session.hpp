// include/session/websocket_field_session.hpp

#pragma once

#include "field_session.hpp"
#include "multicast_socket.hpp"

#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket/stream.hpp>
#include <chrono>
#include <deque>
#include <memory>
#include <vector>

/**
 * @class WebSocketFieldSession
 * @brief Talks to one host over a WebSocket control channel plus UDP.
 *
 * Control packets (field geometry, game state, visualization mappings)
 * arrive as binary WebSocket frames; world states and visualization updates
 * arrive on a local UDP socket bound to an ephemeral port. Outgoing
 * UdpStreamRequests are rewritten to carry that port.
 *
 * The session ends on a close frame, on any read/write/UDP error, or when
 * nothing was received for WS_INACTIVITY_TIMEOUT. Text frames are ignored.
 */
class WebSocketFieldSession : public FieldSession {
public:
  static std::shared_ptr<WebSocketFieldSession>
  create(boost::asio::io_context &io_context, FieldHost host,
         std::shared_ptr<PacketChannel> packets_out,
         std::shared_ptr<RequestChannel> requests_in,
         std::shared_ptr<std::atomic<bool>> finished);

  void start() override;

protected:
  void handle_request(FieldRequest request) override;
  void close_sockets() override;

private:
  WebSocketFieldSession(boost::asio::io_context &io_context, FieldHost host,
                        std::shared_ptr<PacketChannel> packets_out,
                        std::shared_ptr<RequestChannel> requests_in,
                        std::shared_ptr<std::atomic<bool>> finished);

  std::shared_ptr<WebSocketFieldSession> self();

  void on_connect(const boost::system::error_code &ec);
  void on_handshake(const boost::system::error_code &ec);

  void do_read();
  void on_read(const boost::system::error_code &ec, std::size_t bytes);

  void do_write();
  void on_write(const boost::system::error_code &ec);

  void handle_udp(const std::vector<uint8_t> &data,
                  const udp::endpoint &sender);

  void touch() { last_activity_ = std::chrono::steady_clock::now(); }
  void arm_inactivity_timer();

  void fail(const char *what, const boost::system::error_code &ec);

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer read_buffer_;
  bool connected_ = false;

  std::shared_ptr<MulticastSocket> udp_socket_;
  uint16_t udp_port_ = 0;

  std::deque<std::shared_ptr<std::vector<uint8_t>>> write_queue_;
  bool writing_ = false;

  boost::asio::steady_timer inactivity_timer_;
  std::chrono::steady_clock::time_point last_activity_;
};
