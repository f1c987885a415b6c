// include/sync/state_filter.hpp

#pragma once

#include "configs.hpp"
#include "wire_types.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>

/**
 * @class StateFilter
 * @brief Jitter buffer turning an unordered, lossy status stream into a
 * smoothly advancing world state.
 *
 * Incoming snapshots are placed on the local timeline by adding a clock
 * offset to their sender timestamp and are kept newest first for
 * `retention_window`. Reads interpolate between the two stored world states
 * around "now", or extrapolate from the two newest ones when playback has
 * run past the newest sample (an underrun, counted as a stutter).
 *
 * The offset is first set so that the first packet plays back immediately.
 * After that, every `health_tracking_period` (the first time after
 * `health_warmup_period`), the smallest buffer margin and the stutter count
 * seen by reads decide whether the offset moves by
 * `target_buffer_time - min_margin`:
 *  - margin above twice the target: too much latency, shrink the buffer
 *  - more than one stutter per five seconds: too little, grow it
 * The evaluation only happens once at least one read recorded a margin, and
 * resets the sample whether or not the offset moved.
 *
 * Local timestamps are microseconds since `time_reference`. Every operation
 * that depends on the current time has an overload taking it explicitly.
 *
 * Not thread safe; owned by the consuming tick.
 */
class StateFilter {
public:
  using Clock = std::chrono::steady_clock;

  struct Settings {
    std::chrono::microseconds retention_window = RETENTION_WINDOW;
    std::chrono::microseconds health_tracking_period = HEALTH_TRACKING_PERIOD;
    std::chrono::microseconds health_warmup_period = HEALTH_WARMUP_PERIOD;
    std::chrono::microseconds target_buffer_time = TARGET_BUFFER_TIME;
  };

  struct HistoryEntry {
    int64_t local_timestamp = 0;
    Status status;
  };

  // minimum margin and stutters seen by reads within one tracking cycle
  struct BufferHealth {
    int64_t min_margin = INT64_MAX; ///< Microseconds, INT64_MAX if unsampled.
    uint32_t stutter_count = 0;
    Clock::time_point scheduled_time;

    bool has_sample() const { return min_margin != INT64_MAX; }
  };

  StateFilter();
  explicit StateFilter(Settings settings,
                       Clock::time_point time_reference = Clock::now());

  void push_packet(Status status);
  void push_packet(Status status, Clock::time_point now);
  void push_packet(const WorldState &world_state);
  void push_packet(const WorldState &world_state, Clock::time_point now);

  // interpolated world state for now, default if nothing was received
  WorldState current_world_state();
  WorldState current_world_state(Clock::time_point now);

  // newest stored world state as received (remapped, not interpolated)
  WorldState latest_world_state() const;

  // latest geometry from the stream or the control channel, with fallbacks
  FieldGeometry current_field_geometry() const;

  // latest game state carrying a team name, default if there is none
  GameState current_game_state() const;

  // records delivered outside the timestamped stream (control channel)
  void set_field_geometry(const FieldGeometry &geometry);
  void set_game_state(const GameState &game_state);

  int64_t local_time(Clock::time_point now) const;

  const std::deque<HistoryEntry> &history() const { return history_; }
  std::optional<int64_t> time_offset() const { return time_offset_; }
  const std::optional<BufferHealth> &buffer_health() const {
    return buffer_health_;
  }
  const Settings &settings() const { return settings_; }

  // Division A field, used when no usable geometry was received
  static FieldGeometry default_field_geometry();

private:
  void adapt_offset(Clock::time_point now);
  void record_margin(int64_t margin);

  Settings settings_;
  Clock::time_point time_reference_;

  std::deque<HistoryEntry> history_;
  std::optional<int64_t> time_offset_;
  std::optional<BufferHealth> buffer_health_;

  std::optional<FieldGeometry> control_geometry_;
  std::optional<GameState> control_game_state_;
};

// linear interpolation between two world states at `now`, ratio > 1
// extrapolates past next_time
WorldState interpolate_world_state(int64_t now, int64_t prev_time,
                                   const WorldState &prev, int64_t next_time,
                                   const WorldState &next);

// converts from the vision frame (z up) to the y up, -z forward render frame
void remap_status(Status &status);
void remap_world_state(WorldState &world_state);

// fills missing dimensions, nullopt if the geometry is unusable
std::optional<FieldGeometry> normalize_field_geometry(FieldGeometry geometry);
