#ifndef PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_CONFIG_RIDEGRID_CONFIG_HPP_
#define PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_CONFIG_RIDEGRID_CONFIG_HPP_

#include <optional>
#include <string>
#include <vector>

#include "core/topology.hpp"
#include "core/types.hpp"

// A named rule that spawns passengers travelling from one area to another while it is active.
struct PassengerEventConfig {
  std::string name;
  Area start_area;
  Area destination_area;
  float spawn_rate = 0.0f;
  // Inclusive tick window; a missing bound leaves that side open.
  std::optional<TickCount> start_tick;
  std::optional<TickCount> end_tick;

  bool is_active(TickCount tick) const {
    return (!start_tick.has_value() || tick >= *start_tick) && (!end_tick.has_value() || tick <= *end_tick);
  }
};

struct GridConfig {
  TopologyConfig topology;
  unsigned int traffic_light_toggle_ticks = 60;

  unsigned int initial_passenger_count = 0;
  float passenger_spawn_rate = 0.0f;
  unsigned int max_passengers = 10;

  unsigned int agent_car_count = 1;
  unsigned int npc_car_count = 0;
  unsigned int passengers_per_car = 1;

  float discharge_rate = 0.0f;
  // Defaults to 0.2, or a full battery when cars never discharge.
  std::optional<float> initial_battery;
  float charge_rate = 0.01f;

  std::vector<GridPosition> charging_stations;
  unsigned int charging_station_capacity = 0;

  // Observation windowing only; the simulation itself is not limited by these.
  unsigned int car_radius = 3;
  unsigned int passenger_radius = 3;

  std::vector<PassengerEventConfig> passenger_events;

  bool deterministic_mode = false;
  bool verbose = false;

  float effective_initial_battery() const {
    if (initial_battery.has_value()) return *initial_battery;
    return discharge_rate == 0.0f ? 1.0f : 0.2f;
  }
};

// Throws std::invalid_argument describing the first problem found.
void validate_config(const GridConfig& config);

#endif  // PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_CONFIG_RIDEGRID_CONFIG_HPP_
