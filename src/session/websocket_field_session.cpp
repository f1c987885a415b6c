// src/session/websocket_field_session.cpp

#include "websocket_field_session.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/websocket/error.hpp>
#include <boost/beast/websocket/rfc6455.hpp>
#include <iostream>
#include <sstream>

namespace websocket = boost::beast::websocket;
using boost::asio::ip::tcp;

std::shared_ptr<WebSocketFieldSession> WebSocketFieldSession::create(
    boost::asio::io_context &io_context, FieldHost host,
    std::shared_ptr<PacketChannel> packets_out,
    std::shared_ptr<RequestChannel> requests_in,
    std::shared_ptr<std::atomic<bool>> finished) {
  return std::shared_ptr<WebSocketFieldSession>(new WebSocketFieldSession(
      io_context, std::move(host), std::move(packets_out),
      std::move(requests_in), std::move(finished)));
}

WebSocketFieldSession::WebSocketFieldSession(
    boost::asio::io_context &io_context, FieldHost host,
    std::shared_ptr<PacketChannel> packets_out,
    std::shared_ptr<RequestChannel> requests_in,
    std::shared_ptr<std::atomic<bool>> finished)
    : FieldSession(io_context, std::move(host), std::move(packets_out),
                   std::move(requests_in), std::move(finished)),
      ws_(io_context), inactivity_timer_(io_context) {}

std::shared_ptr<WebSocketFieldSession> WebSocketFieldSession::self() {
  return std::static_pointer_cast<WebSocketFieldSession>(shared_from_this());
}

void WebSocketFieldSession::start() {
  if (stopped_)
    return;

  const auto &address = host_.control_endpoint.address();
  try {
    udp::socket socket(io_context_);
    socket.open(address.is_v6() ? udp::v6() : udp::v4());
    socket.bind(udp::endpoint(address.is_v6() ? udp::v6() : udp::v4(), 0));
    udp_port_ = socket.local_endpoint().port();
    udp_socket_ = MulticastSocket::create(io_context_, std::move(socket));
  } catch (const boost::system::system_error &e) {
    std::cerr << "[ERROR] Cannot open the udp stream socket for "
              << host_.display_name() << ": " << e.what() << std::endl;
    stop();
    return;
  }

  std::weak_ptr<WebSocketFieldSession> weak_self = self();
  udp_socket_->set_fail_on_error(true);
  udp_socket_->set_receive_callback(
      [weak_self](const std::vector<uint8_t> &data,
                  const udp::endpoint &sender) {
        if (auto s = weak_self.lock())
          s->handle_udp(data, sender);
      });
  udp_socket_->set_error_callback(
      [weak_self](const boost::system::error_code &ec) {
        if (auto s = weak_self.lock())
          s->fail("udp receive", ec);
      });
  udp_socket_->start_receive();

  touch();
  arm_inactivity_timer();

  tcp::endpoint endpoint(address, host_.control_endpoint.port());
  std::cout << "[WS] Connecting to " << host_.display_name() << " at "
            << endpoint << std::endl;
  boost::beast::get_lowest_layer(ws_).async_connect(
      endpoint, [s = self()](const boost::system::error_code &ec) {
        s->on_connect(ec);
      });

  process_requests();
}

void WebSocketFieldSession::on_connect(const boost::system::error_code &ec) {
  if (stopped_)
    return;
  if (ec) {
    fail("connect", ec);
    return;
  }

  // hosts ping at least once a second, pongs and pings both count as traffic
  std::weak_ptr<WebSocketFieldSession> weak_self = self();
  ws_.control_callback(
      [weak_self](websocket::frame_type, boost::beast::string_view) {
        if (auto s = weak_self.lock())
          s->touch();
      });
  ws_.binary(true);

  std::ostringstream host;
  host << host_.control_endpoint.address().to_string() << ":"
       << host_.control_endpoint.port();
  if (host_.control_endpoint.address().is_v6()) {
    host.str("");
    host << "[" << host_.control_endpoint.address().to_string()
         << "]:" << host_.control_endpoint.port();
  }

  ws_.async_handshake(host.str(), "/",
                      [s = self()](const boost::system::error_code &ec) {
                        s->on_handshake(ec);
                      });
}

void WebSocketFieldSession::on_handshake(const boost::system::error_code &ec) {
  if (stopped_)
    return;
  if (ec) {
    fail("handshake", ec);
    return;
  }

  std::cout << "[WS] Connected to " << host_.display_name()
            << ", udp streams on port " << udp_port_ << std::endl;
  connected_ = true;
  touch();
  do_read();
  do_write();
}

void WebSocketFieldSession::do_read() {
  ws_.async_read(read_buffer_, [s = self()](const boost::system::error_code &ec,
                                            std::size_t bytes) {
    s->on_read(ec, bytes);
  });
}

void WebSocketFieldSession::on_read(const boost::system::error_code &ec,
                                    std::size_t /*bytes*/) {
  if (stopped_)
    return;
  if (ec == websocket::error::closed) {
    std::cout << "[WS] " << host_.display_name() << " closed the connection."
              << std::endl;
    stop();
    return;
  }
  if (ec) {
    fail("read", ec);
    return;
  }

  touch();
  if (ws_.got_binary()) {
    auto data = read_buffer_.data();
    const auto *begin = static_cast<const uint8_t *>(data.data());
    std::vector<uint8_t> bytes(begin, begin + data.size());
    UpdatePacket packet =
        decode_datagram(bytes, udp::endpoint(host_.control_endpoint));
    if (std::holds_alternative<FieldGeometry>(packet) ||
        std::holds_alternative<GameState>(packet) ||
        std::holds_alternative<VisMappings>(packet)) {
      forward_packet(std::move(packet));
    } else if (!std::holds_alternative<std::monostate>(packet)) {
      std::cerr << "[WS] Warning: Unexpected "
                << packet_codec::packet_name(packet)
                << " on the control channel" << std::endl;
    }
  }
  read_buffer_.consume(read_buffer_.size());

  if (!stopped_)
    do_read();
}

void WebSocketFieldSession::handle_request(FieldRequest request) {
  if (auto *udp_request = std::get_if<UdpStreamRequest>(&request)) {
    udp_request->port = udp_port_;
  }
  write_queue_.push_back(std::make_shared<std::vector<uint8_t>>(
      packet_codec::encode_field_request(request)));
  do_write();
}

void WebSocketFieldSession::do_write() {
  if (!connected_ || writing_ || write_queue_.empty() || stopped_)
    return;
  writing_ = true;
  auto message = write_queue_.front();
  ws_.async_write(boost::asio::buffer(*message),
                  [s = self(), message](const boost::system::error_code &ec,
                                        std::size_t) { s->on_write(ec); });
}

void WebSocketFieldSession::on_write(const boost::system::error_code &ec) {
  writing_ = false;
  if (stopped_)
    return;
  if (ec) {
    fail("write", ec);
    return;
  }
  write_queue_.pop_front();
  do_write();
}

void WebSocketFieldSession::handle_udp(const std::vector<uint8_t> &data,
                                       const udp::endpoint &sender) {
  if (stopped_)
    return;
  touch();
  UpdatePacket packet = decode_datagram(data, sender);
  if (std::holds_alternative<WorldState>(packet) ||
      std::holds_alternative<VisualizationUpdate>(packet)) {
    forward_packet(std::move(packet));
  } else if (!std::holds_alternative<std::monostate>(packet)) {
    std::cerr << "[WS] Warning: Unexpected "
              << packet_codec::packet_name(packet) << " on the udp stream"
              << std::endl;
  }
}

void WebSocketFieldSession::arm_inactivity_timer() {
  inactivity_timer_.expires_at(last_activity_ + WS_INACTIVITY_TIMEOUT);
  inactivity_timer_.async_wait(
      [s = self()](const boost::system::error_code &ec) {
        if (ec == boost::asio::error::operation_aborted || s->stopped_)
          return;
        if (std::chrono::steady_clock::now() - s->last_activity_ >=
            WS_INACTIVITY_TIMEOUT) {
          std::cerr << "[WS] " << s->host_.display_name() << " silent for "
                    << WS_INACTIVITY_TIMEOUT.count() << "ms, closing."
                    << std::endl;
          s->stop();
          return;
        }
        s->arm_inactivity_timer();
      });
}

void WebSocketFieldSession::fail(const char *what,
                                 const boost::system::error_code &ec) {
  if (stopped_)
    return;
  std::cerr << "[ERROR] WebSocket session with " << host_.display_name()
            << " failed (" << what << "): " << ec.message() << std::endl;
  stop();
}

void WebSocketFieldSession::close_sockets() {
  inactivity_timer_.cancel();
  if (udp_socket_)
    udp_socket_->stop_receive();

  boost::system::error_code ec;
  auto &socket = boost::beast::get_lowest_layer(ws_).socket();
  if (socket.is_open()) {
    socket.shutdown(tcp::socket::shutdown_both, ec);
    socket.close(ec);
  }
}
