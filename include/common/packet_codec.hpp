// include/common/packet_codec.hpp

#pragma once

#include "wire_types.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

/**
 * @brief Every packet a field host can push to a client.
 *
 * std::monostate is the "empty" variant: an envelope without content or with
 * a type this client does not know. Receivers ignore it.
 */
using UpdatePacket =
    std::variant<std::monostate, FieldGeometry, GameState, VisMappings, Status,
                 WorldState, VisualizationUpdate, VisAdvertisement>;

// requests a client sends to a host over the control channel
using FieldRequest =
    std::variant<WsStreamRequest, UdpStreamRequest, VisualizationFilter>;

// central registries of the enveloped payload types, used by the codec to
// dispatch on the envelope's "type" field
#define UPDATE_PACKET_TYPES_LIST                                               \
  X(FieldGeometry)                                                             \
  X(GameState)                                                                 \
  X(VisMappings)                                                               \
  X(Status)                                                                    \
  X(WorldState)                                                                \
  X(VisualizationUpdate)                                                       \
  X(VisAdvertisement)

#define FIELD_REQUEST_TYPES_LIST                                               \
  X(WsStreamRequest)                                                           \
  X(UdpStreamRequest)                                                          \
  X(VisualizationFilter)

/**
 * @namespace packet_codec
 * @brief MessagePack framing for all payloads.
 *
 * Data and control packets travel in an envelope
 * `{"type": <payload name>, "content": <payload>}`. Beacons and data requests
 * are sent bare. Decoders throw std::runtime_error on malformed input.
 */
namespace packet_codec {

HostAdvertisement decode_host_advertisement(const std::vector<uint8_t> &bytes);
std::vector<uint8_t> encode_host_advertisement(const HostAdvertisement &ad);

UpdatePacket decode_update_packet(const std::vector<uint8_t> &bytes);
std::vector<uint8_t> encode_update_packet(const UpdatePacket &packet);

FieldRequest decode_field_request(const std::vector<uint8_t> &bytes);
std::vector<uint8_t> encode_field_request(const FieldRequest &request);

DataRequest decode_data_request(const std::vector<uint8_t> &bytes);
std::vector<uint8_t> encode_data_request(const DataRequest &request);

// type name carried in the envelope, "Empty" for the empty variant
std::string packet_name(const UpdatePacket &packet);

} // namespace packet_codec
