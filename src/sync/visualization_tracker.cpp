// src/sync/visualization_tracker.cpp

#include "visualization_tracker.hpp"

#include <map>
#include <type_traits>
#include <variant>

void remap_visualization_update(VisualizationUpdate &update) {
  for (auto &set : update.visualization_set) {
    for (auto &vis : set.visualization) {
      for (auto &part : vis.part) {
        std::visit(
            [](auto &geom) {
              using T = std::decay_t<decltype(geom)>;
              if constexpr (std::is_same_v<T, Circle>) {
                geom.p_y = -geom.p_y;
              } else if constexpr (std::is_same_v<T, Polygon> ||
                                   std::is_same_v<T, Path>) {
                for (auto &point : geom.point)
                  point.y = -point.y;
              }
            },
            part.geom);
      }
    }
  }
}

void VisualizationTracker::push_update(VisualizationUpdate update) {
  remap_visualization_update(update);

  uint32_t new_group_count =
      update.visualization_group ? update.visualization_group->group_count : 1;

  history_.push_front(std::move(update));

  // keep just enough history to contain every group of the current count, an
  // update without group information counts as the only group of one
  std::set<uint32_t> seen_groups;
  for (size_t i = 0; i < history_.size(); ++i) {
    VisualizationGroup group =
        history_[i].visualization_group.value_or(VisualizationGroup{});
    if (group.group_count != new_group_count) {
      history_.resize(i);
      break;
    }
    seen_groups.insert(group.group);

    if (seen_groups.size() >= new_group_count) {
      history_.resize(i + 1);
      break;
    }
  }
}

VisualizationBatch VisualizationTracker::visualization_updates() {
  VisualizationBatch batch;
  if (history_.empty())
    return batch;

  const auto &newest_group = history_.front().visualization_group;
  batch.group_count = newest_group ? newest_group->group_count : 1;

  // sources already collected, per group
  std::map<uint32_t, std::set<uint32_t>> group_sources;

  for (const auto &update : history_) {
    uint32_t group =
        update.visualization_group ? update.visualization_group->group : 0;
    auto &seen_sources = group_sources[group];

    for (const auto &set : update.visualization_set) {
      if (set.source) {
        if (!seen_sources.insert(*set.source).second)
          continue; // a newer set from this source was already taken
      }
      batch.visualizations.insert(batch.visualizations.end(),
                                  set.visualization.begin(),
                                  set.visualization.end());
    }
  }

  for (const auto &[group, sources] : group_sources) {
    batch.groups.insert(group);
  }

  history_.clear();
  return batch;
}
