// src/app/fieldsync_client.cpp

#include "field.hpp"
#include "host_directory.hpp"
#include "network_runtime.hpp"

#include <atomic>
#include <boost/asio/signal_set.hpp>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

namespace {

constexpr std::chrono::milliseconds TICK_INTERVAL{16};
constexpr std::chrono::seconds SUMMARY_INTERVAL{1};

void print_usage() {
  std::cout << "fieldsync client v0.1" << std::endl;
  std::cout << "Usage: ./fieldsync_client [options]" << std::endl;
  std::cout << "  --multicast       receive data via source-specific multicast"
            << std::endl;
  std::cout << "                    (default: websocket control channel + udp)"
            << std::endl;
  std::cout << "  --per-interface   one discovery socket per interface"
            << std::endl;
  std::cout << "  --raw             print received states without filtering"
            << std::endl;
  std::cout << "  --help            show this message" << std::endl;
}

void print_summary(Field &field, bool raw) {
  WorldState state =
      raw ? field.latest_world_state() : field.current_world_state();
  GameState game = field.current_game_state();
  FieldGeometry geometry = field.current_field_geometry();
  VisualizationBatch visualizations = field.visualization_updates();

  std::cout << "[CLIENT] " << field.host().display_name() << " | "
            << game.yellow_team_name.value_or("yellow") << " vs "
            << game.blue_team_name.value_or("blue") << " | field "
            << geometry.field_size_x << "x" << geometry.field_size_y << "m | "
            << state.yellow_robot.size() << "+" << state.blue_robot.size()
            << " robots";
  if (!state.ball.empty()) {
    std::cout << " | ball (" << state.ball.front().p_x << ", "
              << state.ball.front().p_y << ")";
  }
  std::cout << " | " << visualizations.visualizations.size()
            << " visualization(s) in " << visualizations.groups.size() << "/"
            << visualizations.group_count << " group(s)";
  if (auto offset = field.state_filter().time_offset()) {
    std::cout << " | offset " << *offset << "us";
  }
  std::cout << std::endl;
}

} // anonymous namespace

int main(int argc, char *argv[]) {
  auto transport = FieldConnection::Transport::WEBSOCKET;
  HostDiscovery::Settings discovery_settings;
  bool raw = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--multicast") {
      transport = FieldConnection::Transport::MULTICAST;
    } else if (arg == "--per-interface") {
      discovery_settings.mode = HostDiscovery::Mode::PER_INTERFACE;
      discovery_settings.group_v6 = PER_INTERFACE_DISCOVERY_GROUP_V6;
    } else if (arg == "--raw") {
      raw = true;
    } else if (arg == "--help") {
      print_usage();
      return 0;
    } else {
      std::cerr << "[ERROR] Unknown option: " << arg << std::endl;
      print_usage();
      return 1;
    }
  }

  try {
    NetworkRuntime runtime;

    std::atomic<bool> running{true};
    boost::asio::signal_set signals(runtime.context(), SIGINT, SIGTERM);
    signals.async_wait([&running](const boost::system::error_code &ec, int) {
      if (!ec) {
        std::cout << "[CLIENT] Shutting down..." << std::endl;
        running.store(false);
      }
    });

    HostDirectory directory(runtime.context(), discovery_settings);
    std::optional<Field> field;
    auto next_summary = std::chrono::steady_clock::now() + SUMMARY_INTERVAL;

    while (running.load()) {
      bool hosts_changed = directory.poll();

      // a field is dropped when its session ends or its host vanishes, and
      // only bound again once discovery reports a changed host list
      if (field) {
        bool listed = false;
        for (const auto &host : directory.hosts()) {
          listed = listed || host == field->host();
        }
        if (!field->tick() || (hosts_changed && !listed)) {
          field.reset();
        }
      }
      if (!field && hosts_changed && !directory.hosts().empty()) {
        field.emplace(Field::bind(runtime.context(),
                                  directory.hosts().front(), transport));
      }

      auto now = std::chrono::steady_clock::now();
      if (field && now >= next_summary) {
        print_summary(*field, raw);
        next_summary = now + SUMMARY_INTERVAL;
      }

      std::this_thread::sleep_for(TICK_INTERVAL);
    }

    field.reset();
    boost::system::error_code ec;
    signals.cancel(ec);
    runtime.stop();
    std::cout << "[CLIENT] Client stopped." << std::endl;
  } catch (const std::exception &error) {
    std::cerr << "[FATAL ERROR] " << error.what() << std::endl;
    return 1;
  }

  return 0;
}
