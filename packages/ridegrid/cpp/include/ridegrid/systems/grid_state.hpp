#ifndef PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_SYSTEMS_GRID_STATE_HPP_
#define PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_SYSTEMS_GRID_STATE_HPP_

#include <optional>
#include <string>
#include <vector>

#include "actions/action.hpp"
#include "core/topology.hpp"
#include "core/types.hpp"
#include "objects/car.hpp"

struct PassengerSpawnedEvent {
  PassengerId passenger;
  GridPosition origin;
  GridPosition destination;
};

struct PassengerPickedUpEvent {
  CarId car;
  PassengerId passenger;
};

struct PassengerDroppedOffEvent {
  CarId car;
  PassengerId passenger;
  TickCount ticks_since_request;
};

struct CarOutOfBatteryEvent {
  CarId car;
};

// Everything that happened during one tick, in the order it happened.
struct TickEvents {
  std::vector<PassengerSpawnedEvent> passenger_spawned;
  std::vector<PassengerPickedUpEvent> car_picked_up_passenger;
  std::vector<PassengerDroppedOffEvent> car_dropped_off_passenger;
  std::vector<CarOutOfBatteryEvent> car_out_of_battery;

  void clear() {
    passenger_spawned.clear();
    car_picked_up_passenger.clear();
    car_dropped_off_passenger.clear();
    car_out_of_battery.clear();
  }
};

// Distances in views are measured from the car the snapshot was built for.
struct PassengerView {
  PassengerId id = 0;
  GridPosition origin;
  GridPosition destination;
  TickCount ticks_since_request = 0;
  std::optional<CarId> car;
  // Moves for the observing car to reach the origin (idle) or the destination (riding).
  Distance travel_ticks = 0;
  // Moves from origin to destination.
  Distance trip_ticks = 0;
};

struct CarView {
  CarId id = 0;
  CarType type = CarType::Agent;
  GridPosition position;
  std::optional<StationId> station;
  float battery = 0.0f;
  std::vector<PassengerView> passengers;
  std::vector<Action> recent_actions;
  std::optional<Action> active_action;
  bool out_of_battery = false;
  unsigned int ticks_since_out_of_battery = 0;
  Distance distance = 0;
};

struct StationView {
  StationId id = 0;
  GridPosition entrance;
  unsigned int capacity = 0;
  unsigned int occupant_count = 0;
  Distance distance = 0;
  Distance travel_ticks = 0;
};

// Point-in-time copy of the world as seen by one agent car.
struct GridState {
  GridCoord width = 0;
  GridCoord height = 0;
  CarView pov_car;
  // Nearest first, truncated to the configured radius.
  std::vector<CarView> other_cars;
  std::vector<PassengerView> idle_passengers;
  std::vector<StationView> charging_stations;
  TickEvents events;
  TickCount ticks_passed = 0;
  // True when the car stands at an intersection with more than one way to go.
  bool can_turn = false;
  // Whether the last action the car sent was accepted.
  bool action_valid = true;
  size_t total_passenger_count = 0;

  // Canonical text rendering. Identical states render to identical strings.
  std::string dump() const;
};

#endif  // PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_SYSTEMS_GRID_STATE_HPP_
