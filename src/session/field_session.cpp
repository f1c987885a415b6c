// src/session/field_session.cpp

#include "field_session.hpp"
#include "multicast_field_session.hpp"
#include "websocket_field_session.hpp"

#include <boost/asio/post.hpp>
#include <iostream>
#include <sstream>

FieldHost FieldHost::from_discovered(const DiscoveredHost &host) {
  FieldHost field_host;
  field_host.control_endpoint = host.control_endpoint();
  field_host.hostname = host.advertisement.hostname;
  field_host.interface_index = host.interface_index;
  if (host.advertisement.stream_group) {
    field_host.stream_group = *host.advertisement.stream_group;
  }
  return field_host;
}

std::string FieldHost::display_name() const {
  if (hostname && !hostname->empty())
    return *hostname;
  std::ostringstream oss;
  oss << control_endpoint;
  return oss.str();
}

// ======== FieldSession ========

FieldSession::FieldSession(boost::asio::io_context &io_context, FieldHost host,
                           std::shared_ptr<PacketChannel> packets_out,
                           std::shared_ptr<RequestChannel> requests_in,
                           std::shared_ptr<std::atomic<bool>> finished)
    : io_context_(io_context), host_(std::move(host)),
      packets_out_(std::move(packets_out)),
      requests_in_(std::move(requests_in)), finished_(std::move(finished)) {}

void FieldSession::stop() {
  if (stopped_)
    return;
  stopped_ = true;
  std::cout << "[SESSION] Closing session with " << host_.display_name()
            << std::endl;
  close_sockets();
  packets_out_->close();
  finished_->store(true);
}

void FieldSession::process_requests() {
  while (!stopped_) {
    auto request = requests_in_->try_recv();
    if (!request)
      break;
    handle_request(std::move(*request));
  }
}

void FieldSession::forward_packet(UpdatePacket packet) {
  if (std::holds_alternative<std::monostate>(packet))
    return;

  switch (packets_out_->try_send(std::move(packet))) {
  case PacketChannel::SendResult::OK:
    break;
  case PacketChannel::SendResult::FULL: {
    auto now = std::chrono::steady_clock::now();
    if (now >= next_full_warning_) {
      std::cerr << "[WARN] Packet channel of " << host_.display_name()
                << " full (consumer can't keep up)" << std::endl;
      next_full_warning_ = now + CHANNEL_FULL_WARN_COOLDOWN;
    }
    break;
  }
  case PacketChannel::SendResult::CLOSED:
    stop();
    break;
  }
}

UpdatePacket FieldSession::decode_datagram(const std::vector<uint8_t> &data,
                                           const udp::endpoint &sender) const {
  try {
    return packet_codec::decode_update_packet(data);
  } catch (const std::exception &e) {
    std::cerr << "[SESSION] Warning: Dropping malformed packet from " << sender
              << ": " << e.what() << std::endl;
    return std::monostate{};
  }
}

// ======== FieldConnection ========

FieldConnection FieldConnection::open(boost::asio::io_context &io_context,
                                      const FieldHost &host,
                                      Transport transport) {
  auto packets = make_channel<UpdatePacket>(PACKET_CHANNEL_CAPACITY);
  auto requests = make_channel<FieldRequest>(REQUEST_CHANNEL_CAPACITY);
  auto finished = std::make_shared<std::atomic<bool>>(false);

  std::shared_ptr<FieldSession> session;
  if (transport == Transport::MULTICAST) {
    session = MulticastFieldSession::create(io_context, host, packets,
                                            requests, finished);
  } else {
    session = WebSocketFieldSession::create(io_context, host, packets,
                                            requests, finished);
  }

  boost::asio::post(io_context, [session] { session->start(); });
  return FieldConnection(io_context, std::move(session), std::move(packets),
                         std::move(requests), std::move(finished));
}

FieldConnection::FieldConnection(
    boost::asio::io_context &io_context, std::shared_ptr<FieldSession> session,
    std::shared_ptr<FieldSession::PacketChannel> packets,
    std::shared_ptr<FieldSession::RequestChannel> requests,
    std::shared_ptr<std::atomic<bool>> finished)
    : io_context_(&io_context), session_(std::move(session)),
      packets_(std::move(packets)), requests_(std::move(requests)),
      finished_(std::move(finished)) {}

FieldConnection &FieldConnection::operator=(FieldConnection &&other) noexcept {
  if (this != &other) {
    release();
    io_context_ = other.io_context_;
    session_ = std::move(other.session_);
    packets_ = std::move(other.packets_);
    requests_ = std::move(other.requests_);
    finished_ = std::move(other.finished_);
  }
  return *this;
}

FieldConnection::~FieldConnection() { release(); }

void FieldConnection::release() {
  if (packets_)
    packets_->close();
  if (requests_)
    requests_->close();
  if (session_) {
    boost::asio::post(*io_context_, [session = session_] { session->stop(); });
  }
  session_.reset();
  packets_.reset();
  requests_.reset();
}

std::optional<UpdatePacket> FieldConnection::try_recv() {
  if (!packets_)
    return std::nullopt;
  return packets_->try_recv();
}

FieldSession::RequestChannel::SendResult
FieldConnection::send_request(FieldRequest request) {
  if (!requests_)
    return FieldSession::RequestChannel::SendResult::CLOSED;
  auto result = requests_->try_send(std::move(request));
  if (result == FieldSession::RequestChannel::SendResult::OK) {
    boost::asio::post(*io_context_,
                      [session = session_] { session->process_requests(); });
  }
  return result;
}

bool FieldConnection::is_finished() const {
  return !finished_ || finished_->load();
}
