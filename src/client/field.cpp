// src/client/field.cpp

#include "field.hpp"

#include <iostream>
#include <type_traits>

Field Field::bind(boost::asio::io_context &io_context, const FieldHost &host,
                  FieldConnection::Transport transport) {
  std::cout << "[FIELD] Binding " << host.display_name() << std::endl;
  Field field(host, FieldConnection::open(io_context, host, transport));

  if (transport == FieldConnection::Transport::WEBSOCKET) {
    WsStreamRequest ws_request;
    ws_request.stream = {WsStream::FIELD_GEOMETRY, WsStream::GAME_STATE,
                         WsStream::VIS_MAPPINGS};
    UdpStreamRequest udp_request;
    udp_request.stream = {UdpStream::WORLD_STATE, UdpStream::VISUALIZATIONS};
    // the session fills in its udp port
    udp_request.port = 0;

    for (FieldRequest request : {FieldRequest(ws_request),
                                 FieldRequest(udp_request)}) {
      if (field.connection_.send_request(std::move(request)) !=
          FieldSession::RequestChannel::SendResult::OK) {
        std::cerr << "[FIELD] Warning: Could not queue stream request for "
                  << host.display_name() << std::endl;
      }
    }
  }
  return field;
}

Field::Field(FieldHost host, FieldConnection connection)
    : host_(std::move(host)), connection_(std::move(connection)) {}

bool Field::tick() {
  while (auto packet = connection_.try_recv()) {
    handle_packet(std::move(*packet));
  }
  if (connection_.is_finished()) {
    std::cout << "[FIELD] Session with " << host_.display_name()
              << " finished." << std::endl;
    return false;
  }
  return true;
}

void Field::handle_packet(UpdatePacket packet) {
  std::visit(
      [this](auto &&payload) {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, Status> ||
                      std::is_same_v<T, WorldState>) {
          filter_.push_packet(std::move(payload));
        } else if constexpr (std::is_same_v<T, FieldGeometry>) {
          filter_.set_field_geometry(payload);
        } else if constexpr (std::is_same_v<T, GameState>) {
          filter_.set_game_state(payload);
        } else if constexpr (std::is_same_v<T, VisualizationUpdate>) {
          tracker_.push_update(std::move(payload));
        } else if constexpr (std::is_same_v<T, VisMappings>) {
          vis_mappings_ = std::move(payload);
        } else if constexpr (std::is_same_v<T, VisAdvertisement>) {
          available_visualizations_ = std::move(payload);
        }
      },
      packet);
}

void Field::select_visualizations(const VisualizationFilter &filter) {
  if (selection_ && *selection_ == filter)
    return;

  switch (connection_.send_request(filter)) {
  case FieldSession::RequestChannel::SendResult::OK:
    selection_ = filter;
    break;
  case FieldSession::RequestChannel::SendResult::FULL:
    std::cerr << "[WARN] Request channel of " << host_.display_name()
              << " full, selection deferred." << std::endl;
    break;
  case FieldSession::RequestChannel::SendResult::CLOSED:
    break;
  }
}
