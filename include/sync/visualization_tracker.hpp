// include/sync/visualization_tracker.hpp

#pragma once

#include "wire_types.hpp"

#include <cstdint>
#include <deque>
#include <set>
#include <vector>

// everything collected since the previous visualization_updates() call
struct VisualizationBatch {
  uint32_t group_count = 1;
  std::set<uint32_t> groups; ///< Groups the visualizations replace.
  std::vector<Visualization> visualizations;
};

/**
 * @class VisualizationTracker
 * @brief Collects sharded overlay updates until one full picture is known.
 *
 * The host splits its overlay state into `group_count` groups and sends each
 * group in its own update. The tracker keeps the newest updates only until
 * every group of the current `group_count` has appeared at least once; older
 * updates, or updates from an earlier `group_count`, are dropped.
 */
class VisualizationTracker {
public:
  // remaps the update into the render frame and stores it
  void push_update(VisualizationUpdate update);

  /**
   * @brief Returns and forgets the retained updates.
   *
   * For every (group, source) pair only the newest visualization set is
   * returned. Sets without a source are always returned. `group_count` is
   * taken from the newest update.
   */
  VisualizationBatch visualization_updates();

  const std::deque<VisualizationUpdate> &history() const { return history_; }

private:
  std::deque<VisualizationUpdate> history_; ///< Newest first.
};

void remap_visualization_update(VisualizationUpdate &update);
