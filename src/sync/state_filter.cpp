// src/sync/state_filter.cpp

#include "state_filter.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <numbers>
#include <stdexcept>

namespace {

constexpr float PI = std::numbers::pi_v<float>;

std::vector<Robot> interpolate_robots(const std::vector<Robot> &prev,
                                      const std::vector<Robot> &next,
                                      float ratio) {
  std::vector<Robot> result;
  result.reserve(prev.size());
  for (const auto &pr : prev) {
    auto nr = std::find_if(next.begin(), next.end(),
                           [&](const Robot &r) { return r.id == pr.id; });
    if (nr == next.end())
      continue; // left the field, never extrapolated

    // shortest angular difference, wrapped into [-pi, pi)
    float diff = std::fmod(nr->phi - pr.phi + PI, 2.0f * PI);
    if (diff < 0.0f)
      diff += 2.0f * PI;
    diff -= PI;

    Robot robot;
    robot.id = pr.id;
    robot.p_x = pr.p_x + ratio * (nr->p_x - pr.p_x);
    robot.p_y = pr.p_y + ratio * (nr->p_y - pr.p_y);
    robot.phi = pr.phi + ratio * diff;
    result.push_back(robot);
  }
  return result;
}

} // anonymous namespace

WorldState interpolate_world_state(int64_t now, int64_t prev_time,
                                   const WorldState &prev, int64_t next_time,
                                   const WorldState &next) {
  if (next_time == prev_time) {
    return next; // duplicate timestamps, nothing to interpolate
  }

  double ratio_d = static_cast<double>(now - prev_time) /
                   static_cast<double>(next_time - prev_time);
  float ratio = static_cast<float>(ratio_d);

  WorldState result;
  int64_t timestamp_delta = static_cast<int64_t>(next.timestamp) -
                            static_cast<int64_t>(prev.timestamp);
  result.timestamp = static_cast<uint64_t>(
      static_cast<int64_t>(prev.timestamp) +
      static_cast<int64_t>(ratio_d * static_cast<double>(timestamp_delta)));

  // single ball only, multiple balls are not tracked across frames
  if (prev.ball.size() == 1 && next.ball.size() == 1) {
    const Ball &pb = prev.ball.front();
    const Ball &nb = next.ball.front();
    Ball ball;
    ball.p_x = pb.p_x + ratio * (nb.p_x - pb.p_x);
    ball.p_y = pb.p_y + ratio * (nb.p_y - pb.p_y);
    if (pb.p_z && nb.p_z) {
      ball.p_z = *pb.p_z + ratio * (*nb.p_z - *pb.p_z);
    }
    result.ball.push_back(ball);
  } else {
    result.ball = next.ball;
  }

  result.yellow_robot =
      interpolate_robots(prev.yellow_robot, next.yellow_robot, ratio);
  result.blue_robot =
      interpolate_robots(prev.blue_robot, next.blue_robot, ratio);
  return result;
}

void remap_world_state(WorldState &world_state) {
  for (auto &ball : world_state.ball) {
    ball.p_y = -ball.p_y;
  }
  for (auto *team : {&world_state.yellow_robot, &world_state.blue_robot}) {
    for (auto &robot : *team) {
      robot.p_y = -robot.p_y;
      robot.phi -= PI / 2.0f;
    }
  }
}

void remap_status(Status &status) {
  if (status.world_state) {
    remap_world_state(*status.world_state);
  }
}

std::optional<FieldGeometry> normalize_field_geometry(FieldGeometry geometry) {
  if (geometry.field_size_x <= 0.0f || geometry.field_size_y <= 0.0f) {
    return std::nullopt;
  }
  if (!geometry.boundary_width) {
    geometry.boundary_width = 0.0f;
  }
  if (!geometry.defense_size_x) {
    geometry.defense_size_x = geometry.field_size_x / 6.0f;
  }
  if (!geometry.defense_size_y) {
    geometry.defense_size_y = geometry.field_size_y / 3.0f;
  }
  if (!geometry.goal_width) {
    geometry.goal_width = geometry.field_size_y / 5.0f;
  }
  if (*geometry.defense_size_x <= 0.0f || *geometry.defense_size_y <= 0.0f ||
      *geometry.goal_width <= 0.0f) {
    return std::nullopt;
  }
  return geometry;
}

// ======== StateFilter ========

StateFilter::StateFilter() : StateFilter(Settings{}) {}

StateFilter::StateFilter(Settings settings, Clock::time_point time_reference)
    : settings_(settings), time_reference_(time_reference) {}

FieldGeometry StateFilter::default_field_geometry() {
  FieldGeometry geometry;
  geometry.field_size_x = 12.0f;
  geometry.field_size_y = 9.0f;
  geometry.boundary_width = 0.3f;
  geometry.defense_size_x = 1.8f;
  geometry.defense_size_y = 3.6f;
  geometry.goal_width = 1.8f;
  return geometry;
}

int64_t StateFilter::local_time(Clock::time_point now) const {
  return std::chrono::duration_cast<std::chrono::microseconds>(now -
                                                               time_reference_)
      .count();
}

void StateFilter::push_packet(Status status) {
  push_packet(std::move(status), Clock::now());
}

void StateFilter::push_packet(const WorldState &world_state) {
  push_packet(world_state, Clock::now());
}

void StateFilter::push_packet(const WorldState &world_state,
                              Clock::time_point now) {
  Status status;
  status.timestamp = world_state.timestamp;
  status.world_state = world_state;
  push_packet(std::move(status), now);
}

void StateFilter::push_packet(Status status, Clock::time_point now) {
  int64_t current = local_time(now);
  int64_t sender_timestamp = static_cast<int64_t>(status.timestamp);

  if (!time_offset_) {
    time_offset_ = current - sender_timestamp;
    BufferHealth health;
    health.scheduled_time = now + settings_.health_warmup_period;
    buffer_health_ = health;
    std::cout << "[FILTER] Initial clock offset " << *time_offset_ << " us"
              << std::endl;
  }

  adapt_offset(now);

  remap_status(status);

  int64_t local_timestamp = sender_timestamp + *time_offset_;
  auto insert_at = std::find_if(history_.begin(), history_.end(),
                                [&](const HistoryEntry &entry) {
                                  return entry.local_timestamp <=
                                         local_timestamp;
                                });
  history_.insert(insert_at, HistoryEntry{local_timestamp, std::move(status)});

  // history is sorted newest first, so everything from the first stale entry
  // on is stale as well
  int64_t retention = settings_.retention_window.count();
  auto first_stale = std::find_if(history_.begin(), history_.end(),
                                  [&](const HistoryEntry &entry) {
                                    return current >=
                                           entry.local_timestamp + retention;
                                  });
  history_.erase(first_stale, history_.end());
}

void StateFilter::adapt_offset(Clock::time_point now) {
  if (!buffer_health_ || !time_offset_)
    return;
  BufferHealth &health = *buffer_health_;
  if (now <= health.scheduled_time || !health.has_sample())
    return;

  int64_t target = settings_.target_buffer_time.count();
  auto allowed_stutters = static_cast<uint32_t>(
      std::chrono::duration_cast<std::chrono::seconds>(
          settings_.health_tracking_period)
          .count() /
      5);

  if (health.min_margin > 2 * target ||
      health.stutter_count > allowed_stutters) {
    int64_t correction = target - health.min_margin;
    *time_offset_ += correction;
    std::cout << "[FILTER] Adjusted clock offset by " << correction
              << " us (min margin " << health.min_margin << " us, "
              << health.stutter_count << " stutters)" << std::endl;
  }

  BufferHealth next_cycle;
  next_cycle.scheduled_time = now + settings_.health_tracking_period;
  health = next_cycle;
}

void StateFilter::record_margin(int64_t margin) {
  if (buffer_health_) {
    buffer_health_->min_margin = std::min(buffer_health_->min_margin, margin);
  }
}

WorldState StateFilter::current_world_state() {
  return current_world_state(Clock::now());
}

WorldState StateFilter::current_world_state(Clock::time_point now) {
  int64_t current = local_time(now);

  // walk the world-state carrying entries newest to oldest: prev is the first
  // one already in the past, next the one visited just before it
  const HistoryEntry *prev = nullptr;
  const HistoryEntry *next = nullptr;
  const HistoryEntry *latest = nullptr;
  const HistoryEntry *second_latest = nullptr;
  for (const auto &entry : history_) {
    if (!entry.status.world_state)
      continue;
    if (!latest) {
      latest = &entry;
    } else if (!second_latest) {
      second_latest = &entry;
    }
    if (!prev) {
      if (entry.local_timestamp <= current) {
        prev = &entry;
      } else {
        next = &entry;
      }
    }
    if (prev && second_latest)
      break;
  }

  if (prev && next) {
    record_margin(latest->local_timestamp - current);
    return interpolate_world_state(current, prev->local_timestamp,
                                   *prev->status.world_state,
                                   next->local_timestamp,
                                   *next->status.world_state);
  }

  if (prev) {
    // underrun: playback is past the newest sample
    if (prev != latest) {
      throw std::logic_error("StateFilter: underrun on a non-newest sample");
    }
    if (buffer_health_) {
      buffer_health_->stutter_count++;
    }
    record_margin(prev->local_timestamp - current);

    if (second_latest) {
      return interpolate_world_state(current, second_latest->local_timestamp,
                                     *second_latest->status.world_state,
                                     prev->local_timestamp,
                                     *prev->status.world_state);
    }
    return *prev->status.world_state;
  }

  // nothing received yet, or every sample still lies in the future
  return WorldState{};
}

WorldState StateFilter::latest_world_state() const {
  for (const auto &entry : history_) {
    if (entry.status.world_state)
      return *entry.status.world_state;
  }
  return WorldState{};
}

FieldGeometry StateFilter::current_field_geometry() const {
  std::optional<FieldGeometry> latest;
  for (const auto &entry : history_) {
    if (entry.status.field_geometry) {
      latest = entry.status.field_geometry;
      break;
    }
  }
  if (!latest) {
    latest = control_geometry_;
  }
  if (latest) {
    if (auto usable = normalize_field_geometry(*latest))
      return *usable;
  }
  return default_field_geometry();
}

GameState StateFilter::current_game_state() const {
  auto has_team = [](const GameState &state) {
    return state.yellow_team_name || state.blue_team_name;
  };
  for (const auto &entry : history_) {
    if (entry.status.game_state && has_team(*entry.status.game_state))
      return *entry.status.game_state;
  }
  if (control_game_state_ && has_team(*control_game_state_)) {
    return *control_game_state_;
  }
  return GameState{};
}

void StateFilter::set_field_geometry(const FieldGeometry &geometry) {
  control_geometry_ = geometry;
}

void StateFilter::set_game_state(const GameState &game_state) {
  control_game_state_ = game_state;
}
