// include/common/wire_types.hpp

#pragma once

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace nm = nlohmann;

/**
 * @file wire_types.hpp
 * @brief Payload structs exchanged with a field host.
 *
 * Every struct knows how to build itself from a decoded json value
 * (`from_json`, throws std::runtime_error on a schema violation) and how to
 * turn itself back into one (`to_json`). The binary framing (MessagePack) is
 * handled by packet_codec.
 *
 * Positions are in metres, angles in radians, timestamps in microseconds of
 * the sender's clock.
 */

// ======== Telemetry ========

struct Ball {
  float p_x = 0.0f;
  float p_y = 0.0f;
  std::optional<float> p_z;

  bool operator==(const Ball &) const = default;

  static Ball from_json(const nm::json &j);
  nm::json to_json() const;
};

struct Robot {
  uint32_t id = 0;
  float p_x = 0.0f;
  float p_y = 0.0f;
  float phi = 0.0f; ///< Heading in radians.

  bool operator==(const Robot &) const = default;

  static Robot from_json(const nm::json &j);
  nm::json to_json() const;
};

// positions of everything on the field at one sender timestamp
struct WorldState {
  uint64_t timestamp = 0;
  std::vector<Ball> ball;
  std::vector<Robot> yellow_robot;
  std::vector<Robot> blue_robot;

  bool operator==(const WorldState &) const = default;

  static std::string message_type() { return "WorldState"; }
  static WorldState from_json(const nm::json &j);
  nm::json to_json() const;
};

struct FieldGeometry {
  float field_size_x = 0.0f;
  float field_size_y = 0.0f;
  std::optional<float> boundary_width;
  std::optional<float> defense_size_x;
  std::optional<float> defense_size_y;
  std::optional<float> goal_width;

  bool operator==(const FieldGeometry &) const = default;

  static std::string message_type() { return "FieldGeometry"; }
  static FieldGeometry from_json(const nm::json &j);
  nm::json to_json() const;
};

struct GameState {
  std::optional<std::string> yellow_team_name;
  std::optional<std::string> blue_team_name;

  bool operator==(const GameState &) const = default;

  static std::string message_type() { return "GameState"; }
  static GameState from_json(const nm::json &j);
  nm::json to_json() const;
};

// the combined telemetry snapshot sent on the multicast data channel
struct Status {
  uint64_t timestamp = 0;
  std::optional<WorldState> world_state;
  std::optional<FieldGeometry> field_geometry;
  std::optional<GameState> game_state;

  static std::string message_type() { return "Status"; }
  static Status from_json(const nm::json &j);
  nm::json to_json() const;
};

// ======== Visualizations ========

struct Point2 {
  float x = 0.0f;
  float y = 0.0f;

  bool operator==(const Point2 &) const = default;
};

struct Circle {
  float p_x = 0.0f;
  float p_y = 0.0f;
  float radius = 0.0f;

  bool operator==(const Circle &) const = default;
};

struct Polygon {
  std::vector<Point2> point;

  bool operator==(const Polygon &) const = default;
};

struct Path {
  std::vector<Point2> point;

  bool operator==(const Path &) const = default;
};

struct VisPart {
  std::variant<std::monostate, Circle, Polygon, Path> geom;
  std::optional<uint32_t> fill_color;   ///< RGBA
  std::optional<uint32_t> border_color; ///< RGBA
  std::optional<float> border_width;

  bool operator==(const VisPart &) const = default;

  static VisPart from_json(const nm::json &j);
  nm::json to_json() const;
};

struct Visualization {
  uint32_t id = 0;
  std::vector<VisPart> part;

  bool operator==(const Visualization &) const = default;

  static Visualization from_json(const nm::json &j);
  nm::json to_json() const;
};

// identifies one shard out of `group_count` shards of the overlay state
struct VisualizationGroup {
  uint32_t group = 0;
  uint32_t group_count = 1;
};

struct VisualizationSet {
  std::optional<uint32_t> source;
  std::vector<Visualization> visualization;
};

struct VisualizationUpdate {
  std::optional<VisualizationGroup> visualization_group;
  std::vector<VisualizationSet> visualization_set;

  static std::string message_type() { return "VisualizationUpdate"; }
  static VisualizationUpdate from_json(const nm::json &j);
  nm::json to_json() const;
};

// id -> display name tables for visualization sources and visualizations
struct VisMappings {
  std::map<uint32_t, std::string> source;
  std::map<uint32_t, std::string> name;

  static std::string message_type() { return "VisMappings"; }
  static VisMappings from_json(const nm::json &j);
  nm::json to_json() const;
};

// visualizations offered by a host on the multicast variant
struct VisAdvertisement {
  std::map<uint32_t, std::string> visualization;

  static std::string message_type() { return "VisAdvertisement"; }
  static VisAdvertisement from_json(const nm::json &j);
  nm::json to_json() const;
};

// ======== Discovery ========

struct HostAdvertisement {
  std::optional<std::string> hostname;
  std::optional<uint32_t> instance_id;
  uint16_t control_port = 0;
  std::optional<std::string> stream_group;

  bool operator==(const HostAdvertisement &) const = default;

  static HostAdvertisement from_json(const nm::json &j);
  nm::json to_json() const;
};

// ======== Requests (client -> host) ========

enum class WsStream : uint32_t { FIELD_GEOMETRY = 0, GAME_STATE = 1, VIS_MAPPINGS = 2 };

enum class UdpStream : uint32_t { WORLD_STATE = 0, VISUALIZATIONS = 1 };

struct WsStreamRequest {
  std::vector<WsStream> stream;

  static std::string message_type() { return "WsStreamRequest"; }
  static WsStreamRequest from_json(const nm::json &j);
  nm::json to_json() const;
};

struct UdpStreamRequest {
  std::vector<UdpStream> stream;
  uint16_t port = 0; ///< Filled in by the session with its local udp port.

  static std::string message_type() { return "UdpStreamRequest"; }
  static UdpStreamRequest from_json(const nm::json &j);
  nm::json to_json() const;
};

struct VisualizationFilter {
  std::vector<uint32_t> visualization_id;

  bool operator==(const VisualizationFilter &) const = default;

  static std::string message_type() { return "VisualizationFilter"; }
  static VisualizationFilter from_json(const nm::json &j);
  nm::json to_json() const;
};

// selection reply to a VisAdvertisement on the multicast variant
struct DataRequest {
  std::vector<uint32_t> visualization_id;

  static DataRequest from_json(const nm::json &j);
  nm::json to_json() const;
};
