// src/common/wire_types.cpp

#include "wire_types.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace { // internal linkage helpers

void require_object(const nm::json &j, const char *type_name) {
  if (!j.is_object()) {
    throw std::runtime_error(std::string("Invalid ") + type_name +
                             " payload: expected an object");
  }
}

// reads a mandatory field, rejecting missing keys and mismatched types
template <typename T>
T required_field(const nm::json &j, const char *key, const char *type_name) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    throw std::runtime_error(std::string("Invalid ") + type_name +
                             " payload: missing '" + key + "' field");
  }
  try {
    return it->get<T>();
  } catch (const nm::json::exception &e) {
    throw std::runtime_error(std::string("Invalid ") + type_name +
                             " payload: bad '" + key + "' field (" + e.what() +
                             ")");
  }
}

// ports are read wide so that out of range values are rejected instead of
// wrapping around
uint16_t required_port(const nm::json &j, const char *key,
                       const char *type_name) {
  auto value = required_field<int64_t>(j, key, type_name);
  if (value < 0 || value > 65535) {
    throw std::runtime_error(std::string("Invalid ") + type_name +
                             " payload: '" + key + "' out of range (" +
                             std::to_string(value) + ")");
  }
  return static_cast<uint16_t>(value);
}

template <typename T>
std::optional<T> optional_field(const nm::json &j, const char *key,
                                const char *type_name) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  try {
    return it->get<T>();
  } catch (const nm::json::exception &e) {
    throw std::runtime_error(std::string("Invalid ") + type_name +
                             " payload: bad '" + key + "' field (" + e.what() +
                             ")");
  }
}

// decodes an optional array of nested structs, missing means empty
template <typename T>
std::vector<T> struct_list(const nm::json &j, const char *key,
                           const char *type_name) {
  std::vector<T> result;
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return result;
  }
  if (!it->is_array()) {
    throw std::runtime_error(std::string("Invalid ") + type_name +
                             " payload: '" + key + "' must be an array");
  }
  result.reserve(it->size());
  for (const auto &entry : *it) {
    result.push_back(T::from_json(entry));
  }
  return result;
}

template <typename T> nm::json struct_list_to_json(const std::vector<T> &list) {
  nm::json arr = nm::json::array();
  for (const auto &entry : list) {
    arr.push_back(entry.to_json());
  }
  return arr;
}

template <typename T>
void set_optional(nm::json &j, const char *key, const std::optional<T> &value) {
  if (value) {
    j[key] = *value;
  }
}

// id/name tables travel as [{"id": .., "name": ..}] since map keys must be
// strings in the json model
std::map<uint32_t, std::string>
name_table(const nm::json &j, const char *key, const char *type_name) {
  std::map<uint32_t, std::string> table;
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return table;
  }
  if (!it->is_array()) {
    throw std::runtime_error(std::string("Invalid ") + type_name +
                             " payload: '" + key + "' must be an array");
  }
  for (const auto &entry : *it) {
    require_object(entry, type_name);
    table[required_field<uint32_t>(entry, "id", type_name)] =
        required_field<std::string>(entry, "name", type_name);
  }
  return table;
}

nm::json name_table_to_json(const std::map<uint32_t, std::string> &table) {
  nm::json arr = nm::json::array();
  for (const auto &[id, name] : table) {
    arr.push_back(nm::json{{"id", id}, {"name", name}});
  }
  return arr;
}

std::vector<Point2> point_list(const nm::json &j, const char *type_name) {
  std::vector<Point2> points;
  auto it = j.find("point");
  if (it == j.end() || it->is_null()) {
    return points;
  }
  if (!it->is_array()) {
    throw std::runtime_error(std::string("Invalid ") + type_name +
                             " payload: 'point' must be an array");
  }
  for (const auto &entry : *it) {
    require_object(entry, type_name);
    points.push_back({required_field<float>(entry, "x", type_name),
                      required_field<float>(entry, "y", type_name)});
  }
  return points;
}

nm::json point_list_to_json(const std::vector<Point2> &points) {
  nm::json arr = nm::json::array();
  for (const auto &p : points) {
    arr.push_back(nm::json{{"x", p.x}, {"y", p.y}});
  }
  return arr;
}

} // anonymous namespace

// --- telemetry ---

Ball Ball::from_json(const nm::json &j) {
  require_object(j, "Ball");
  Ball ball;
  ball.p_x = required_field<float>(j, "p_x", "Ball");
  ball.p_y = required_field<float>(j, "p_y", "Ball");
  ball.p_z = optional_field<float>(j, "p_z", "Ball");
  return ball;
}

nm::json Ball::to_json() const {
  nm::json j = {{"p_x", p_x}, {"p_y", p_y}};
  set_optional(j, "p_z", p_z);
  return j;
}

Robot Robot::from_json(const nm::json &j) {
  require_object(j, "Robot");
  Robot robot;
  robot.id = required_field<uint32_t>(j, "id", "Robot");
  robot.p_x = required_field<float>(j, "p_x", "Robot");
  robot.p_y = required_field<float>(j, "p_y", "Robot");
  robot.phi = required_field<float>(j, "phi", "Robot");
  return robot;
}

nm::json Robot::to_json() const {
  return {{"id", id}, {"p_x", p_x}, {"p_y", p_y}, {"phi", phi}};
}

WorldState WorldState::from_json(const nm::json &j) {
  require_object(j, "WorldState");
  WorldState state;
  state.timestamp = required_field<uint64_t>(j, "timestamp", "WorldState");
  state.ball = struct_list<Ball>(j, "ball", "WorldState");
  state.yellow_robot = struct_list<Robot>(j, "yellow_robot", "WorldState");
  state.blue_robot = struct_list<Robot>(j, "blue_robot", "WorldState");
  return state;
}

nm::json WorldState::to_json() const {
  return {{"timestamp", timestamp},
          {"ball", struct_list_to_json(ball)},
          {"yellow_robot", struct_list_to_json(yellow_robot)},
          {"blue_robot", struct_list_to_json(blue_robot)}};
}

FieldGeometry FieldGeometry::from_json(const nm::json &j) {
  require_object(j, "FieldGeometry");
  FieldGeometry geom;
  geom.field_size_x = required_field<float>(j, "field_size_x", "FieldGeometry");
  geom.field_size_y = required_field<float>(j, "field_size_y", "FieldGeometry");
  geom.boundary_width =
      optional_field<float>(j, "boundary_width", "FieldGeometry");
  geom.defense_size_x =
      optional_field<float>(j, "defense_size_x", "FieldGeometry");
  geom.defense_size_y =
      optional_field<float>(j, "defense_size_y", "FieldGeometry");
  geom.goal_width = optional_field<float>(j, "goal_width", "FieldGeometry");
  return geom;
}

nm::json FieldGeometry::to_json() const {
  nm::json j = {{"field_size_x", field_size_x}, {"field_size_y", field_size_y}};
  set_optional(j, "boundary_width", boundary_width);
  set_optional(j, "defense_size_x", defense_size_x);
  set_optional(j, "defense_size_y", defense_size_y);
  set_optional(j, "goal_width", goal_width);
  return j;
}

GameState GameState::from_json(const nm::json &j) {
  require_object(j, "GameState");
  GameState state;
  state.yellow_team_name =
      optional_field<std::string>(j, "yellow_team_name", "GameState");
  state.blue_team_name =
      optional_field<std::string>(j, "blue_team_name", "GameState");
  return state;
}

nm::json GameState::to_json() const {
  nm::json j = nm::json::object();
  set_optional(j, "yellow_team_name", yellow_team_name);
  set_optional(j, "blue_team_name", blue_team_name);
  return j;
}

Status Status::from_json(const nm::json &j) {
  require_object(j, "Status");
  Status status;
  status.timestamp = required_field<uint64_t>(j, "timestamp", "Status");
  if (j.contains("world_state") && !j["world_state"].is_null()) {
    status.world_state = WorldState::from_json(j["world_state"]);
  }
  if (j.contains("field_geometry") && !j["field_geometry"].is_null()) {
    status.field_geometry = FieldGeometry::from_json(j["field_geometry"]);
  }
  if (j.contains("game_state") && !j["game_state"].is_null()) {
    status.game_state = GameState::from_json(j["game_state"]);
  }
  return status;
}

nm::json Status::to_json() const {
  nm::json j = {{"timestamp", timestamp}};
  if (world_state)
    j["world_state"] = world_state->to_json();
  if (field_geometry)
    j["field_geometry"] = field_geometry->to_json();
  if (game_state)
    j["game_state"] = game_state->to_json();
  return j;
}

// --- visualizations ---

VisPart VisPart::from_json(const nm::json &j) {
  require_object(j, "VisPart");
  VisPart part;

  // exactly one geometry key may be present
  int geom_count = 0;
  if (j.contains("circle")) {
    const auto &c = j["circle"];
    require_object(c, "Circle");
    part.geom = Circle{required_field<float>(c, "p_x", "Circle"),
                       required_field<float>(c, "p_y", "Circle"),
                       required_field<float>(c, "radius", "Circle")};
    ++geom_count;
  }
  if (j.contains("polygon")) {
    require_object(j["polygon"], "Polygon");
    part.geom = Polygon{point_list(j["polygon"], "Polygon")};
    ++geom_count;
  }
  if (j.contains("path")) {
    require_object(j["path"], "Path");
    part.geom = Path{point_list(j["path"], "Path")};
    ++geom_count;
  }
  if (geom_count > 1) {
    throw std::runtime_error(
        "Invalid VisPart payload: more than one geometry present");
  }

  part.fill_color = optional_field<uint32_t>(j, "fill_color", "VisPart");
  part.border_color = optional_field<uint32_t>(j, "border_color", "VisPart");
  part.border_width = optional_field<float>(j, "border_width", "VisPart");
  return part;
}

nm::json VisPart::to_json() const {
  nm::json j = nm::json::object();
  if (const auto *c = std::get_if<Circle>(&geom)) {
    j["circle"] = {{"p_x", c->p_x}, {"p_y", c->p_y}, {"radius", c->radius}};
  } else if (const auto *poly = std::get_if<Polygon>(&geom)) {
    j["polygon"] = {{"point", point_list_to_json(poly->point)}};
  } else if (const auto *path = std::get_if<Path>(&geom)) {
    j["path"] = {{"point", point_list_to_json(path->point)}};
  }
  set_optional(j, "fill_color", fill_color);
  set_optional(j, "border_color", border_color);
  set_optional(j, "border_width", border_width);
  return j;
}

Visualization Visualization::from_json(const nm::json &j) {
  require_object(j, "Visualization");
  Visualization vis;
  vis.id = required_field<uint32_t>(j, "id", "Visualization");
  vis.part = struct_list<VisPart>(j, "part", "Visualization");
  return vis;
}

nm::json Visualization::to_json() const {
  return {{"id", id}, {"part", struct_list_to_json(part)}};
}

VisualizationUpdate VisualizationUpdate::from_json(const nm::json &j) {
  require_object(j, "VisualizationUpdate");
  VisualizationUpdate update;

  if (j.contains("visualization_group") &&
      !j["visualization_group"].is_null()) {
    const auto &g = j["visualization_group"];
    require_object(g, "VisualizationGroup");
    VisualizationGroup group;
    group.group = required_field<uint32_t>(g, "group", "VisualizationGroup");
    group.group_count =
        required_field<uint32_t>(g, "group_count", "VisualizationGroup");
    if (group.group_count == 0 || group.group >= group.group_count) {
      throw std::runtime_error("Invalid VisualizationGroup payload: group " +
                               std::to_string(group.group) +
                               " outside of group count " +
                               std::to_string(group.group_count));
    }
    update.visualization_group = group;
  }

  auto it = j.find("visualization_set");
  if (it != j.end() && !it->is_null()) {
    if (!it->is_array()) {
      throw std::runtime_error("Invalid VisualizationUpdate payload: "
                               "'visualization_set' must be an array");
    }
    for (const auto &s : *it) {
      require_object(s, "VisualizationSet");
      VisualizationSet set;
      set.source = optional_field<uint32_t>(s, "source", "VisualizationSet");
      set.visualization =
          struct_list<Visualization>(s, "visualization", "VisualizationSet");
      update.visualization_set.push_back(std::move(set));
    }
  }
  return update;
}

nm::json VisualizationUpdate::to_json() const {
  nm::json j = nm::json::object();
  if (visualization_group) {
    j["visualization_group"] = {
        {"group", visualization_group->group},
        {"group_count", visualization_group->group_count}};
  }
  nm::json sets = nm::json::array();
  for (const auto &set : visualization_set) {
    nm::json s = {{"visualization", struct_list_to_json(set.visualization)}};
    set_optional(s, "source", set.source);
    sets.push_back(std::move(s));
  }
  j["visualization_set"] = std::move(sets);
  return j;
}

VisMappings VisMappings::from_json(const nm::json &j) {
  require_object(j, "VisMappings");
  VisMappings mappings;
  mappings.source = name_table(j, "source", "VisMappings");
  mappings.name = name_table(j, "name", "VisMappings");
  return mappings;
}

nm::json VisMappings::to_json() const {
  return {{"source", name_table_to_json(source)},
          {"name", name_table_to_json(name)}};
}

VisAdvertisement VisAdvertisement::from_json(const nm::json &j) {
  require_object(j, "VisAdvertisement");
  VisAdvertisement ad;
  ad.visualization = name_table(j, "visualization", "VisAdvertisement");
  return ad;
}

nm::json VisAdvertisement::to_json() const {
  return {{"visualization", name_table_to_json(visualization)}};
}

// --- discovery ---

HostAdvertisement HostAdvertisement::from_json(const nm::json &j) {
  require_object(j, "HostAdvertisement");
  HostAdvertisement ad;
  ad.hostname = optional_field<std::string>(j, "hostname", "HostAdvertisement");
  ad.instance_id =
      optional_field<uint32_t>(j, "instance_id", "HostAdvertisement");
  ad.control_port =
      required_port(j, "control_port", "HostAdvertisement");
  ad.stream_group =
      optional_field<std::string>(j, "stream_group", "HostAdvertisement");
  return ad;
}

nm::json HostAdvertisement::to_json() const {
  nm::json j = {{"control_port", control_port}};
  set_optional(j, "hostname", hostname);
  set_optional(j, "instance_id", instance_id);
  set_optional(j, "stream_group", stream_group);
  return j;
}

// --- requests ---

WsStreamRequest WsStreamRequest::from_json(const nm::json &j) {
  require_object(j, "WsStreamRequest");
  WsStreamRequest req;
  for (uint32_t s : required_field<std::vector<uint32_t>>(j, "stream",
                                                          "WsStreamRequest")) {
    if (s > static_cast<uint32_t>(WsStream::VIS_MAPPINGS)) {
      throw std::runtime_error("Invalid WsStreamRequest payload: unknown "
                               "stream " +
                               std::to_string(s));
    }
    req.stream.push_back(static_cast<WsStream>(s));
  }
  return req;
}

nm::json WsStreamRequest::to_json() const {
  nm::json arr = nm::json::array();
  for (WsStream s : stream) {
    arr.push_back(static_cast<uint32_t>(s));
  }
  return {{"stream", arr}};
}

UdpStreamRequest UdpStreamRequest::from_json(const nm::json &j) {
  require_object(j, "UdpStreamRequest");
  UdpStreamRequest req;
  for (uint32_t s : required_field<std::vector<uint32_t>>(
           j, "stream", "UdpStreamRequest")) {
    if (s > static_cast<uint32_t>(UdpStream::VISUALIZATIONS)) {
      throw std::runtime_error("Invalid UdpStreamRequest payload: unknown "
                               "stream " +
                               std::to_string(s));
    }
    req.stream.push_back(static_cast<UdpStream>(s));
  }
  req.port = required_port(j, "port", "UdpStreamRequest");
  return req;
}

nm::json UdpStreamRequest::to_json() const {
  nm::json arr = nm::json::array();
  for (UdpStream s : stream) {
    arr.push_back(static_cast<uint32_t>(s));
  }
  return {{"stream", arr}, {"port", port}};
}

VisualizationFilter VisualizationFilter::from_json(const nm::json &j) {
  require_object(j, "VisualizationFilter");
  VisualizationFilter filter;
  filter.visualization_id = optional_field<std::vector<uint32_t>>(
                                j, "visualization_id", "VisualizationFilter")
                                .value_or(std::vector<uint32_t>{});
  return filter;
}

nm::json VisualizationFilter::to_json() const {
  return {{"visualization_id", visualization_id}};
}

DataRequest DataRequest::from_json(const nm::json &j) {
  require_object(j, "DataRequest");
  DataRequest req;
  req.visualization_id = optional_field<std::vector<uint32_t>>(
                             j, "visualization_id", "DataRequest")
                             .value_or(std::vector<uint32_t>{});
  return req;
}

nm::json DataRequest::to_json() const {
  return {{"visualization_id", visualization_id}};
}
