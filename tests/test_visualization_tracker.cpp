// tests/test_visualization_tracker.cpp

#include "visualization_tracker.hpp"

#include <algorithm>
#include <gtest/gtest.h>

namespace {

VisualizationUpdate make_update(std::optional<uint32_t> group,
                                uint32_t group_count,
                                std::optional<uint32_t> source,
                                uint32_t vis_id) {
  VisualizationUpdate update;
  if (group) {
    update.visualization_group = VisualizationGroup{*group, group_count};
  }
  Visualization vis;
  vis.id = vis_id;
  VisualizationSet set;
  set.source = source;
  set.visualization.push_back(vis);
  update.visualization_set.push_back(set);
  return update;
}

std::vector<uint32_t> ids(const VisualizationBatch &batch) {
  std::vector<uint32_t> result;
  for (const auto &vis : batch.visualizations) {
    result.push_back(vis.id);
  }
  std::sort(result.begin(), result.end());
  return result;
}

} // anonymous namespace

TEST(VisualizationTrackerTest, EmptyTrackerReturnsSingleGroupBatch) {
  VisualizationTracker tracker;
  VisualizationBatch batch = tracker.visualization_updates();
  EXPECT_EQ(batch.group_count, 1u);
  EXPECT_TRUE(batch.groups.empty());
  EXPECT_TRUE(batch.visualizations.empty());
}

TEST(VisualizationTrackerTest, CollectsAllShardsInAnyOrder) {
  VisualizationTracker tracker;
  for (uint32_t group : {2u, 0u, 3u, 1u}) {
    tracker.push_update(make_update(group, 4, 1, 100 + group));
  }

  VisualizationBatch batch = tracker.visualization_updates();
  EXPECT_EQ(batch.group_count, 4u);
  EXPECT_EQ(batch.groups, (std::set<uint32_t>{0, 1, 2, 3}));
  EXPECT_EQ(ids(batch), (std::vector<uint32_t>{100, 101, 102, 103}));
  EXPECT_TRUE(tracker.history().empty());
}

TEST(VisualizationTrackerTest, HistoryStopsOnceEveryGroupIsCovered) {
  VisualizationTracker tracker;
  tracker.push_update(make_update(0, 2, 1, 1));
  tracker.push_update(make_update(1, 2, 1, 2));
  tracker.push_update(make_update(0, 2, 1, 3));

  // the oldest group 0 update is superseded
  EXPECT_EQ(tracker.history().size(), 2u);
  EXPECT_EQ(ids(tracker.visualization_updates()),
            (std::vector<uint32_t>{2, 3}));
}

TEST(VisualizationTrackerTest, NewestSetPerSourceWins) {
  VisualizationTracker tracker;
  tracker.push_update(make_update(0, 2, 7, 1));
  tracker.push_update(make_update(0, 2, 7, 2));

  VisualizationBatch batch = tracker.visualization_updates();
  EXPECT_EQ(ids(batch), (std::vector<uint32_t>{2}));
  EXPECT_EQ(batch.groups, (std::set<uint32_t>{0}));
}

TEST(VisualizationTrackerTest, SetsWithoutSourceAreAlwaysKept) {
  VisualizationTracker tracker;
  tracker.push_update(make_update(0, 2, std::nullopt, 1));
  tracker.push_update(make_update(0, 2, std::nullopt, 2));

  EXPECT_EQ(ids(tracker.visualization_updates()),
            (std::vector<uint32_t>{1, 2}));
}

TEST(VisualizationTrackerTest, GroupCountChangeDropsOlderUpdates) {
  VisualizationTracker tracker;
  tracker.push_update(make_update(0, 3, 1, 1));
  tracker.push_update(make_update(1, 3, 1, 2));
  tracker.push_update(make_update(0, 2, 1, 3));

  ASSERT_EQ(tracker.history().size(), 1u);
  VisualizationBatch batch = tracker.visualization_updates();
  EXPECT_EQ(batch.group_count, 2u);
  EXPECT_EQ(ids(batch), (std::vector<uint32_t>{3}));
}

TEST(VisualizationTrackerTest, UngroupedUpdateReplacesEverything) {
  VisualizationTracker tracker;
  tracker.push_update(make_update(std::nullopt, 1, 1, 1));
  tracker.push_update(make_update(std::nullopt, 1, 1, 2));

  ASSERT_EQ(tracker.history().size(), 1u);
  VisualizationBatch batch = tracker.visualization_updates();
  EXPECT_EQ(batch.group_count, 1u);
  EXPECT_EQ(batch.groups, (std::set<uint32_t>{0}));
  EXPECT_EQ(ids(batch), (std::vector<uint32_t>{2}));
}

TEST(VisualizationTrackerTest, RemapMirrorsGeometry) {
  VisualizationUpdate update = make_update(std::nullopt, 1, std::nullopt, 1);
  auto &vis = update.visualization_set[0].visualization[0];
  VisPart circle;
  circle.geom = Circle{1.0f, 2.0f, 0.5f};
  VisPart path;
  path.geom = Path{{Point2{0.0f, 1.0f}, Point2{3.0f, -4.0f}}};
  vis.part = {circle, path};

  VisualizationTracker tracker;
  tracker.push_update(update);
  VisualizationBatch batch = tracker.visualization_updates();
  ASSERT_EQ(batch.visualizations.size(), 1u);

  const auto &parts = batch.visualizations[0].part;
  const auto &c = std::get<Circle>(parts[0].geom);
  EXPECT_FLOAT_EQ(c.p_x, 1.0f);
  EXPECT_FLOAT_EQ(c.p_y, -2.0f);
  EXPECT_FLOAT_EQ(c.radius, 0.5f);
  const auto &p = std::get<Path>(parts[1].geom);
  EXPECT_FLOAT_EQ(p.point[0].y, -1.0f);
  EXPECT_FLOAT_EQ(p.point[1].y, 4.0f);
}
