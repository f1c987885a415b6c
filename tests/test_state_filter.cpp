// tests/test_state_filter.cpp

#include "state_filter.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <iterator>
#include <numbers>

using namespace std::chrono_literals;

namespace {

constexpr float PI = std::numbers::pi_v<float>;

WorldState make_state(uint64_t timestamp, float ball_x, float ball_y = 0.0f) {
  WorldState state;
  state.timestamp = timestamp;
  state.ball.push_back(Ball{ball_x, ball_y, std::nullopt});
  return state;
}

Robot make_robot(uint32_t id, float x, float y, float phi) {
  Robot robot;
  robot.id = id;
  robot.p_x = x;
  robot.p_y = y;
  robot.phi = phi;
  return robot;
}

} // anonymous namespace

// ============================================================================
// Fixture: the filter's local clock starts at t0, every call gets t0 + offset
// ============================================================================

class StateFilterTest : public ::testing::Test {
protected:
  StateFilter::Clock::time_point t0 = StateFilter::Clock::now();
  StateFilter filter{StateFilter::Settings{}, t0};
};

TEST_F(StateFilterTest, EmptyFilterReturnsDefaultState) {
  WorldState state = filter.current_world_state(t0 + 1s);
  EXPECT_EQ(state, WorldState{});
  EXPECT_FALSE(filter.time_offset().has_value());
}

TEST_F(StateFilterTest, FirstPacketSetsOffsetAndSchedulesWarmup) {
  filter.push_packet(make_state(5'000'000, 1.0f), t0 + 1s);

  ASSERT_TRUE(filter.time_offset().has_value());
  EXPECT_EQ(*filter.time_offset(), 1'000'000 - 5'000'000);
  ASSERT_TRUE(filter.buffer_health().has_value());
  EXPECT_FALSE(filter.buffer_health()->has_sample());
  EXPECT_EQ(filter.buffer_health()->scheduled_time, t0 + 1s + 1s);
}

TEST_F(StateFilterTest, SinglePacketIsReturnedUnchanged) {
  WorldState packet = make_state(42'000'000, 1.5f, 2.5f);
  packet.yellow_robot.push_back(make_robot(3, 1.0f, -1.0f, 0.25f));
  filter.push_packet(packet, t0 + 2s);

  WorldState expected = packet;
  remap_world_state(expected);

  EXPECT_EQ(filter.current_world_state(t0 + 2s), expected);
}

TEST_F(StateFilterTest, HistoryStaysSortedForOutOfOrderArrivals) {
  const uint64_t timestamps[] = {1000, 5000, 2000, 9000, 3000, 3000, 7000, 0};
  for (uint64_t ts : timestamps) {
    filter.push_packet(make_state(ts, 0.0f), t0);

    const auto &history = filter.history();
    for (size_t i = 1; i < history.size(); ++i) {
      EXPECT_GE(history[i - 1].local_timestamp, history[i].local_timestamp);
    }
  }
  EXPECT_EQ(filter.history().size(), std::size(timestamps));
}

TEST_F(StateFilterTest, InterpolatesBallHalfway) {
  filter.push_packet(make_state(0, 0.0f), t0);
  filter.push_packet(make_state(100, 10.0f), t0);

  WorldState state = filter.current_world_state(t0 + 50us);
  ASSERT_EQ(state.ball.size(), 1u);
  EXPECT_FLOAT_EQ(state.ball[0].p_x, 5.0f);
  EXPECT_FLOAT_EQ(state.ball[0].p_y, 0.0f);
  EXPECT_EQ(state.timestamp, 50u);
}

TEST_F(StateFilterTest, NormalReadRecordsMarginToNewestSample) {
  filter.push_packet(make_state(0, 0.0f), t0);
  filter.push_packet(make_state(100, 10.0f), t0);

  filter.current_world_state(t0 + 30us);
  ASSERT_TRUE(filter.buffer_health()->has_sample());
  EXPECT_EQ(filter.buffer_health()->min_margin, 70);
  EXPECT_EQ(filter.buffer_health()->stutter_count, 0u);
}

TEST_F(StateFilterTest, UnderrunExtrapolatesAndCountsStutter) {
  filter.push_packet(make_state(0, 0.0f), t0);
  filter.push_packet(make_state(100'000, 10.0f), t0);

  WorldState state = filter.current_world_state(t0 + 200ms);
  ASSERT_EQ(state.ball.size(), 1u);
  EXPECT_NEAR(state.ball[0].p_x, 20.0f, 1e-3f);
  EXPECT_EQ(filter.buffer_health()->stutter_count, 1u);
  EXPECT_EQ(filter.buffer_health()->min_margin, -100'000);
}

TEST_F(StateFilterTest, UnderrunWithSingleSampleHoldsLastState) {
  filter.push_packet(make_state(0, 3.0f), t0);

  WorldState state = filter.current_world_state(t0 + 500ms);
  ASSERT_EQ(state.ball.size(), 1u);
  EXPECT_FLOAT_EQ(state.ball[0].p_x, 3.0f);
  EXPECT_EQ(filter.buffer_health()->stutter_count, 1u);
}

TEST_F(StateFilterTest, SamplesOnlyInTheFutureGiveDefaultState) {
  filter.push_packet(make_state(0, 0.0f), t0 + 100ms);
  filter.push_packet(make_state(50'000, 1.0f), t0 + 100ms);

  EXPECT_EQ(filter.current_world_state(t0 + 50ms), WorldState{});
}

TEST_F(StateFilterTest, RobotMissingFromNextIsDropped) {
  WorldState prev = make_state(0, 0.0f);
  prev.blue_robot = {make_robot(1, 0.0f, 0.0f, 0.0f),
                     make_robot(2, 1.0f, 1.0f, 0.0f)};
  WorldState next = make_state(100, 0.0f);
  next.blue_robot = {make_robot(1, 2.0f, 0.0f, 0.0f)};

  filter.push_packet(prev, t0);
  filter.push_packet(next, t0);

  WorldState state = filter.current_world_state(t0 + 50us);
  ASSERT_EQ(state.blue_robot.size(), 1u);
  EXPECT_EQ(state.blue_robot[0].id, 1u);
  EXPECT_FLOAT_EQ(state.blue_robot[0].p_x, 1.0f);
}

TEST_F(StateFilterTest, PurgesEntriesOutsideRetentionWindow) {
  filter.push_packet(make_state(0, 0.0f), t0);
  filter.push_packet(make_state(100'000, 0.0f), t0);
  ASSERT_EQ(filter.history().size(), 2u);

  // two seconds later only the new packet is within the window
  filter.push_packet(make_state(2'000'000, 0.0f), t0 + 2s);
  ASSERT_EQ(filter.history().size(), 1u);
  EXPECT_EQ(filter.history().front().status.timestamp, 2'000'000u);
}

TEST_F(StateFilterTest, LatestWorldStateSkipsInterpolation) {
  filter.push_packet(make_state(0, 0.0f), t0);
  filter.push_packet(make_state(100, 10.0f), t0);

  WorldState latest = filter.latest_world_state();
  ASSERT_EQ(latest.ball.size(), 1u);
  EXPECT_FLOAT_EQ(latest.ball[0].p_x, 10.0f);
  EXPECT_FALSE(filter.buffer_health()->has_sample());
}

// ============================================================================
// Offset adaptation
// ============================================================================

TEST_F(StateFilterTest, NoAdaptationWithoutHealthSample) {
  filter.push_packet(make_state(0, 0.0f), t0);
  auto scheduled = filter.buffer_health()->scheduled_time;

  // well past the warm-up, but nothing was read yet
  filter.push_packet(make_state(2'000'000, 0.0f), t0 + 2s);
  filter.push_packet(make_state(3'000'000, 0.0f), t0 + 3s);

  EXPECT_EQ(*filter.time_offset(), 0);
  EXPECT_EQ(filter.buffer_health()->scheduled_time, scheduled);
}

TEST_F(StateFilterTest, ExcessLatencyShrinksBuffer) {
  filter.push_packet(make_state(0, 0.0f), t0);
  filter.push_packet(make_state(500'000, 0.0f), t0);

  // newest sample is 490ms ahead of playback
  filter.current_world_state(t0 + 10ms);
  ASSERT_EQ(filter.buffer_health()->min_margin, 490'000);

  filter.push_packet(make_state(1'100'000, 0.0f), t0 + 1100ms);
  EXPECT_EQ(*filter.time_offset(), 10'000 - 490'000);
  EXPECT_FALSE(filter.buffer_health()->has_sample());
  EXPECT_EQ(filter.buffer_health()->scheduled_time, t0 + 1100ms + 10s);
}

TEST_F(StateFilterTest, FrequentStuttersGrowBuffer) {
  filter.push_packet(make_state(0, 0.0f), t0);
  for (int i = 1; i <= 3; ++i) {
    filter.current_world_state(t0 + 5ms * i);
  }
  ASSERT_EQ(filter.buffer_health()->stutter_count, 3u);
  ASSERT_EQ(filter.buffer_health()->min_margin, -15'000);

  filter.push_packet(make_state(1'500'000, 0.0f), t0 + 1500ms);
  EXPECT_EQ(*filter.time_offset(), 10'000 + 15'000);
}

TEST_F(StateFilterTest, HealthyCycleResetsSampleWithoutMovingOffset) {
  filter.push_packet(make_state(0, 0.0f), t0);
  filter.push_packet(make_state(15'000, 0.0f), t0);

  // 15ms margin, below twice the target, and no stutters
  filter.current_world_state(t0);
  ASSERT_EQ(filter.buffer_health()->min_margin, 15'000);

  filter.push_packet(make_state(1'200'000, 0.0f), t0 + 1200ms);
  EXPECT_EQ(*filter.time_offset(), 0);
  EXPECT_FALSE(filter.buffer_health()->has_sample());

  // a second cycle without reads changes nothing
  auto scheduled = filter.buffer_health()->scheduled_time;
  filter.push_packet(make_state(12'000'000, 0.0f), t0 + 12s);
  EXPECT_EQ(*filter.time_offset(), 0);
  EXPECT_EQ(filter.buffer_health()->scheduled_time, scheduled);
}

// ============================================================================
// Interpolation helpers
// ============================================================================

TEST(InterpolateWorldStateTest, HeadingTakesShortestPath) {
  WorldState prev;
  prev.yellow_robot = {make_robot(4, 0.0f, 0.0f, 170.0f * PI / 180.0f)};
  WorldState next;
  next.timestamp = 100;
  next.yellow_robot = {make_robot(4, 0.0f, 0.0f, -170.0f * PI / 180.0f)};

  WorldState state = interpolate_world_state(50, 0, prev, 100, next);
  ASSERT_EQ(state.yellow_robot.size(), 1u);
  EXPECT_NEAR(state.yellow_robot[0].phi, PI, 1e-4f);
}

TEST(InterpolateWorldStateTest, BallsAreOnlyInterpolatedOneToOne) {
  WorldState prev;
  prev.ball = {Ball{0.0f, 0.0f, std::nullopt}};
  WorldState next;
  next.timestamp = 100;
  next.ball = {Ball{4.0f, 0.0f, std::nullopt}, Ball{8.0f, 0.0f, std::nullopt}};

  WorldState state = interpolate_world_state(50, 0, prev, 100, next);
  EXPECT_EQ(state.ball, next.ball);
}

TEST(InterpolateWorldStateTest, BallHeightNeedsBothSides) {
  WorldState prev;
  prev.ball = {Ball{0.0f, 0.0f, 1.0f}};
  WorldState next;
  next.timestamp = 100;
  next.ball = {Ball{0.0f, 0.0f, std::nullopt}};

  WorldState state = interpolate_world_state(50, 0, prev, 100, next);
  ASSERT_EQ(state.ball.size(), 1u);
  EXPECT_FALSE(state.ball[0].p_z.has_value());
}

TEST(RemapTest, MirrorsYAndRotatesRobots) {
  WorldState state = make_state(0, 1.0f, 2.0f);
  state.blue_robot = {make_robot(1, 3.0f, 4.0f, PI)};
  remap_world_state(state);

  EXPECT_FLOAT_EQ(state.ball[0].p_x, 1.0f);
  EXPECT_FLOAT_EQ(state.ball[0].p_y, -2.0f);
  EXPECT_FLOAT_EQ(state.blue_robot[0].p_y, -4.0f);
  EXPECT_FLOAT_EQ(state.blue_robot[0].phi, PI / 2.0f);
}

// ============================================================================
// Field geometry and game state
// ============================================================================

TEST_F(StateFilterTest, GeometryFallsBackToDivisionA) {
  FieldGeometry geometry = filter.current_field_geometry();
  EXPECT_FLOAT_EQ(geometry.field_size_x, 12.0f);
  EXPECT_FLOAT_EQ(geometry.field_size_y, 9.0f);
  EXPECT_FLOAT_EQ(*geometry.boundary_width, 0.3f);
  EXPECT_FLOAT_EQ(*geometry.defense_size_x, 1.8f);
  EXPECT_FLOAT_EQ(*geometry.defense_size_y, 3.6f);
  EXPECT_FLOAT_EQ(*geometry.goal_width, 1.8f);
}

TEST_F(StateFilterTest, DegenerateGeometryIsIgnored) {
  Status status;
  status.timestamp = 0;
  status.field_geometry = FieldGeometry{9.0f, 6.0f, 0.3f, 1.0f, 2.0f, 0.0f};
  filter.push_packet(status, t0);

  EXPECT_EQ(filter.current_field_geometry(),
            StateFilter::default_field_geometry());
}

TEST_F(StateFilterTest, MissingDefenseAreaIsDerivedFromFieldSize) {
  FieldGeometry geometry;
  geometry.field_size_x = 9.0f;
  geometry.field_size_y = 6.0f;
  filter.set_field_geometry(geometry);

  FieldGeometry result = filter.current_field_geometry();
  EXPECT_FLOAT_EQ(result.field_size_x, 9.0f);
  EXPECT_FLOAT_EQ(*result.defense_size_x, 1.5f);
  EXPECT_FLOAT_EQ(*result.defense_size_y, 2.0f);
  EXPECT_FLOAT_EQ(*result.goal_width, 1.2f);
}

TEST_F(StateFilterTest, StreamGeometryTakesPrecedence) {
  filter.set_field_geometry(FieldGeometry{9.0f, 6.0f, 0.3f, 1.0f, 2.0f, 1.0f});
  Status status;
  status.timestamp = 0;
  status.field_geometry = FieldGeometry{12.0f, 9.0f, 0.3f, 1.8f, 3.6f, 1.8f};
  filter.push_packet(status, t0);

  EXPECT_FLOAT_EQ(filter.current_field_geometry().field_size_x, 12.0f);
}

TEST_F(StateFilterTest, GameStateComesFromNewestNamedRecord) {
  EXPECT_EQ(filter.current_game_state(), GameState{});

  filter.set_game_state(GameState{std::string("Control"), std::nullopt});
  EXPECT_EQ(filter.current_game_state().yellow_team_name, "Control");

  Status status;
  status.timestamp = 10;
  status.game_state = GameState{std::string("Yellow"), std::string("Blue")};
  filter.push_packet(status, t0);
  Status unnamed;
  unnamed.timestamp = 20;
  unnamed.game_state = GameState{};
  filter.push_packet(unnamed, t0);

  GameState game = filter.current_game_state();
  EXPECT_EQ(game.yellow_team_name, "Yellow");
  EXPECT_EQ(game.blue_team_name, "Blue");
}
