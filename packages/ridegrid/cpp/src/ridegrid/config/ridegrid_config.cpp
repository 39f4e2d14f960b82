#include "config/ridegrid_config.hpp"

#include <cmath>
#include <set>
#include <stdexcept>
#include <string>

namespace {

void check_probability(float value, const std::string& name) {
  if (!std::isfinite(value) || value < 0.0f || value > 1.0f) {
    throw std::invalid_argument(name + " must be within [0, 1], got " + std::to_string(value));
  }
}

void check_area(const Topology& topology, const Area& area, const std::string& name) {
  Area wrapped = topology.wrap_area(area);
  if (wrapped.x1 > wrapped.x2 || wrapped.y1 > wrapped.y2) {
    throw std::invalid_argument(name + " has inverted bounds");
  }
  if (topology.sections_in_area(area).empty()) {
    throw std::invalid_argument(name + " does not cover any road section");
  }
}

}  // namespace

void validate_config(const GridConfig& config) {
  // Throws std::invalid_argument for a degenerate road network.
  Topology topology(config.topology);

  check_probability(config.passenger_spawn_rate, "passenger_spawn_rate");
  if (config.initial_passenger_count > config.max_passengers) {
    throw std::invalid_argument("initial_passenger_count (" + std::to_string(config.initial_passenger_count) +
                                ") exceeds max_passengers (" + std::to_string(config.max_passengers) + ")");
  }

  if (config.passengers_per_car == 0) {
    throw std::invalid_argument("passengers_per_car must be at least 1");
  }
  size_t car_count = static_cast<size_t>(config.agent_car_count) + config.npc_car_count;
  if (car_count > topology.slot_count()) {
    throw std::invalid_argument("Cannot place " + std::to_string(car_count) + " cars on " +
                                std::to_string(topology.slot_count()) + " lane slots");
  }

  if (!std::isfinite(config.discharge_rate) || config.discharge_rate < 0.0f) {
    throw std::invalid_argument("discharge_rate must be non-negative");
  }
  if (!std::isfinite(config.charge_rate) || config.charge_rate < 0.0f) {
    throw std::invalid_argument("charge_rate must be non-negative");
  }
  if (config.initial_battery.has_value()) {
    check_probability(*config.initial_battery, "initial_battery");
  }

  if (!config.charging_stations.empty() && config.charging_station_capacity == 0) {
    throw std::invalid_argument("charging_station_capacity must be positive when charging stations are configured");
  }
  std::set<GridPosition> entrances;
  for (const GridPosition& entrance : config.charging_stations) {
    if (!topology.is_valid(entrance)) {
      throw std::invalid_argument("Charging station at invalid position: " + entrance.to_string());
    }
    // Either lane of the entrance leads into the same station.
    if (entrances.contains(entrance) || entrances.contains(topology.other_side_of_road(entrance))) {
      throw std::invalid_argument("Duplicate charging station at " + entrance.to_string());
    }
    entrances.insert(entrance);
  }

  for (const PassengerEventConfig& event : config.passenger_events) {
    const std::string label = "Passenger event '" + event.name + "'";
    check_probability(event.spawn_rate, label + " spawn_rate");
    check_area(topology, event.start_area, label + " start_area");
    check_area(topology, event.destination_area, label + " destination_area");
    if (event.start_tick.has_value() && event.end_tick.has_value() && *event.start_tick > *event.end_tick) {
      throw std::invalid_argument(label + " ends before it starts");
    }
  }
}
