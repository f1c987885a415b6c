// include/client/field.hpp

#pragma once

#include "field_session.hpp"
#include "state_filter.hpp"
#include "visualization_tracker.hpp"

#include <boost/asio/io_context.hpp>
#include <optional>

/**
 * @class Field
 * @brief Consumer side state of one bound field host.
 *
 * Owns the session connection, the jitter buffer and the visualization
 * tracker. tick() is called once per render/update tick and moves every
 * packet the session delivered into the right structure; the accessors are
 * then read by the renderer.
 */
class Field {
public:
  static Field bind(boost::asio::io_context &io_context, const FieldHost &host,
                    FieldConnection::Transport transport);

  Field(Field &&) noexcept = default;
  Field &operator=(Field &&) noexcept = default;

  // drains queued packets, false once the session finished
  bool tick();

  // sends a new visualization selection if it differs from the last one
  void select_visualizations(const VisualizationFilter &filter);

  WorldState current_world_state() { return filter_.current_world_state(); }
  WorldState latest_world_state() const { return filter_.latest_world_state(); }
  FieldGeometry current_field_geometry() const {
    return filter_.current_field_geometry();
  }
  GameState current_game_state() const { return filter_.current_game_state(); }
  VisualizationBatch visualization_updates() {
    return tracker_.visualization_updates();
  }

  const VisMappings &vis_mappings() const { return vis_mappings_; }
  const std::optional<VisAdvertisement> &available_visualizations() const {
    return available_visualizations_;
  }
  const FieldHost &host() const { return host_; }
  StateFilter &state_filter() { return filter_; }

private:
  Field(FieldHost host, FieldConnection connection);

  void handle_packet(UpdatePacket packet);

  FieldHost host_;
  FieldConnection connection_;
  StateFilter filter_;
  VisualizationTracker tracker_;
  VisMappings vis_mappings_;
  std::optional<VisAdvertisement> available_visualizations_;
  std::optional<VisualizationFilter> selection_;
};
