// src/common/packet_codec.cpp

#include "packet_codec.hpp"

#include <iostream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace packet_codec {

namespace { // internal linkage helpers

// parses a msgpack buffer, translating parser errors into runtime errors
nm::json parse_msgpack(const std::vector<uint8_t> &bytes,
                       const char *what) {
  if (bytes.empty()) {
    throw std::runtime_error(std::string("Empty ") + what + " datagram");
  }
  try {
    return nm::json::from_msgpack(bytes);
  } catch (const nm::json::parse_error &error) {
    throw std::runtime_error(std::string("Failed to parse ") + what +
                             " msgpack: " + error.what());
  }
}

// validates the envelope and returns its type name
std::string envelope_type(const nm::json &j, const char *what) {
  if (!j.is_object()) {
    throw std::runtime_error(std::string("Invalid ") + what +
                             " envelope: expected an object");
  }
  if (!j.contains("type") || !j["type"].is_string()) {
    throw std::runtime_error(std::string("Invalid ") + what +
                             " envelope: missing or invalid 'type' field "
                             "(must be a string)");
  }
  return j["type"].get<std::string>();
}

std::vector<uint8_t> make_envelope(const std::string &type,
                                   nm::json content) {
  nm::json j = {{"type", type}, {"content", std::move(content)}};
  return nm::json::to_msgpack(j);
}

} // anonymous namespace

HostAdvertisement
decode_host_advertisement(const std::vector<uint8_t> &bytes) {
  return HostAdvertisement::from_json(
      parse_msgpack(bytes, "host advertisement"));
}

std::vector<uint8_t> encode_host_advertisement(const HostAdvertisement &ad) {
  return nm::json::to_msgpack(ad.to_json());
}

UpdatePacket decode_update_packet(const std::vector<uint8_t> &bytes) {
  nm::json j = parse_msgpack(bytes, "update packet");
  std::string type = envelope_type(j, "update packet");

  if (!j.contains("content") || j["content"].is_null()) {
    return std::monostate{};
  }
  const nm::json &content = j["content"];

// --- dispatch using x-macro ---
#define X(PacketType)                                                          \
  if (type == PacketType::message_type()) {                                    \
    return PacketType::from_json(content);                                     \
  }

  UPDATE_PACKET_TYPES_LIST

#undef X

  // newer hosts may stream payloads this client does not understand yet
  std::cerr << "[CODEC] Warning: ignoring unknown packet type '" << type
            << "'" << std::endl;
  return std::monostate{};
}

std::vector<uint8_t> encode_update_packet(const UpdatePacket &packet) {
  return std::visit(
      [](const auto &payload) -> std::vector<uint8_t> {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return nm::json::to_msgpack(nm::json{{"type", "Empty"}});
        } else {
          return make_envelope(T::message_type(), payload.to_json());
        }
      },
      packet);
}

FieldRequest decode_field_request(const std::vector<uint8_t> &bytes) {
  nm::json j = parse_msgpack(bytes, "request");
  std::string type = envelope_type(j, "request");

  if (!j.contains("content") || j["content"].is_null()) {
    throw std::runtime_error("Invalid request envelope: missing 'content'");
  }
  const nm::json &content = j["content"];

#define X(RequestType)                                                         \
  if (type == RequestType::message_type()) {                                   \
    return RequestType::from_json(content);                                    \
  }

  FIELD_REQUEST_TYPES_LIST

#undef X

  throw std::runtime_error("Unknown request type encountered during decoding: " +
                           type);
}

std::vector<uint8_t> encode_field_request(const FieldRequest &request) {
  return std::visit(
      [](const auto &payload) {
        using T = std::decay_t<decltype(payload)>;
        return make_envelope(T::message_type(), payload.to_json());
      },
      request);
}

DataRequest decode_data_request(const std::vector<uint8_t> &bytes) {
  return DataRequest::from_json(parse_msgpack(bytes, "data request"));
}

std::vector<uint8_t> encode_data_request(const DataRequest &request) {
  return nm::json::to_msgpack(request.to_json());
}

std::string packet_name(const UpdatePacket &packet) {
  return std::visit(
      [](const auto &payload) -> std::string {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return "Empty";
        } else {
          return T::message_type();
        }
      },
      packet);
}

} // namespace packet_codec
