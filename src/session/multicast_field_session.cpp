// src/session/multicast_field_session.cpp

#include "multicast_field_session.hpp"

#include <boost/asio/error.hpp>
#include <iostream>
#include <stdexcept>

std::shared_ptr<MulticastFieldSession> MulticastFieldSession::create(
    boost::asio::io_context &io_context, FieldHost host,
    std::shared_ptr<PacketChannel> packets_out,
    std::shared_ptr<RequestChannel> requests_in,
    std::shared_ptr<std::atomic<bool>> finished) {
  return std::shared_ptr<MulticastFieldSession>(new MulticastFieldSession(
      io_context, std::move(host), std::move(packets_out),
      std::move(requests_in), std::move(finished)));
}

MulticastFieldSession::MulticastFieldSession(
    boost::asio::io_context &io_context, FieldHost host,
    std::shared_ptr<PacketChannel> packets_out,
    std::shared_ptr<RequestChannel> requests_in,
    std::shared_ptr<std::atomic<bool>> finished)
    : FieldSession(io_context, std::move(host), std::move(packets_out),
                   std::move(requests_in), std::move(finished)),
      join_timer_(io_context) {}

std::shared_ptr<MulticastFieldSession> MulticastFieldSession::self() {
  return std::static_pointer_cast<MulticastFieldSession>(shared_from_this());
}

void MulticastFieldSession::start() {
  if (stopped_)
    return;

  source_ = host_.control_endpoint.address();
  bool v6 = source_.is_v6();
  const char *any = v6 ? "::" : "0.0.0.0";

  try {
    boost::system::error_code ec;
    group_ = boost::asio::ip::make_address(host_.stream_group, ec);
    if (ec || group_.is_v6() != v6) {
      throw std::runtime_error("Stream group " + host_.stream_group +
                               " unusable for source " + source_.to_string());
    }

    data_socket_ = MulticastSocket::create(
        io_context_,
        MulticastSocket::bind_multicast(io_context_, any, host_.data_port));
    advert_socket_ = MulticastSocket::create(
        io_context_,
        MulticastSocket::bind_multicast(io_context_, any, host_.vis_ad_port));

    udp::socket request_socket(io_context_);
    request_socket.open(v6 ? udp::v6() : udp::v4());
    request_socket.bind(udp::endpoint(v6 ? udp::v6() : udp::v4(), 0));
    request_socket_ =
        MulticastSocket::create(io_context_, std::move(request_socket));
  } catch (const std::exception &e) {
    std::cerr << "[ERROR] Multicast session with " << host_.display_name()
              << " cannot start: " << e.what() << std::endl;
    stop();
    return;
  }

  std::weak_ptr<MulticastFieldSession> weak_self = self();
  data_socket_->set_receive_callback(
      [weak_self](const std::vector<uint8_t> &data,
                  const udp::endpoint &sender) {
        if (auto s = weak_self.lock())
          s->handle_data(data, sender);
      });
  advert_socket_->set_receive_callback(
      [weak_self](const std::vector<uint8_t> &data,
                  const udp::endpoint &sender) {
        if (auto s = weak_self.lock())
          s->handle_advertisement(data, sender);
      });

  std::cout << "[SESSION] Multicast session with " << host_.display_name()
            << " (group " << group_ << ", interface " << host_.interface_index
            << ")" << std::endl;

  join_streams();
  data_socket_->start_receive();
  advert_socket_->start_receive();
  process_requests();
}

void MulticastFieldSession::join_streams() {
  if (stopped_)
    return;
  if (!data_joined_) {
    data_joined_ = !data_socket_->join_source_specific(group_, source_,
                                                       host_.interface_index);
  }
  if (!advert_joined_) {
    advert_joined_ = !advert_socket_->join_source_specific(
        group_, source_, host_.interface_index);
  }
  if (!data_joined_ || !advert_joined_) {
    schedule_join_retry();
  }
}

void MulticastFieldSession::schedule_join_retry() {
  join_timer_.expires_after(SSM_JOIN_RETRY_INTERVAL);
  join_timer_.async_wait(
      [s = self()](const boost::system::error_code &ec) {
        if (ec == boost::asio::error::operation_aborted)
          return;
        s->join_streams();
      });
}

void MulticastFieldSession::handle_data(const std::vector<uint8_t> &data,
                                        const udp::endpoint &sender) {
  if (stopped_)
    return;
  UpdatePacket packet = decode_datagram(data, sender);
  if (std::holds_alternative<Status>(packet) ||
      std::holds_alternative<WorldState>(packet) ||
      std::holds_alternative<VisualizationUpdate>(packet)) {
    forward_packet(std::move(packet));
  } else if (!std::holds_alternative<std::monostate>(packet)) {
    std::cerr << "[SESSION] Warning: Unexpected "
              << packet_codec::packet_name(packet) << " on the data stream"
              << std::endl;
  }
}

void MulticastFieldSession::handle_advertisement(
    const std::vector<uint8_t> &data, const udp::endpoint &sender) {
  if (stopped_)
    return;
  UpdatePacket packet = decode_datagram(data, sender);
  if (!std::holds_alternative<VisAdvertisement>(packet)) {
    return;
  }
  forward_packet(std::move(packet));
  if (stopped_)
    return;

  // pick up a selection change queued by the consumer before answering
  process_requests();
  request_socket_->send_to(packet_codec::encode_data_request(selection_),
                           sender);
}

void MulticastFieldSession::handle_request(FieldRequest request) {
  if (auto *filter = std::get_if<VisualizationFilter>(&request)) {
    selection_.visualization_id = filter->visualization_id;
    return;
  }
  // multicast streams are always on, stream subscriptions have no meaning
}

void MulticastFieldSession::close_sockets() {
  join_timer_.cancel();
  if (data_socket_)
    data_socket_->stop_receive();
  if (advert_socket_)
    advert_socket_->stop_receive();
  if (request_socket_)
    request_socket_->stop_receive();
}
