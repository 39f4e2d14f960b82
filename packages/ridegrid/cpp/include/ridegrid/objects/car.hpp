#ifndef PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_OBJECTS_CAR_HPP_
#define PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_OBJECTS_CAR_HPP_

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <vector>

#include "actions/action.hpp"
#include "core/topology.hpp"
#include "core/types.hpp"

enum class CarType : uint8_t {
  Agent = 0,
  Npc = 1
};

inline std::string car_type_name(CarType type) {
  return type == CarType::Agent ? "agent" : "npc";
}

class Car {
public:
  static constexpr size_t RecentActionCapacity = 5;

  CarId id;
  CarType type;
  // While parked this is the spot the car left the road from.
  GridPosition position;
  std::optional<StationId> station;
  float battery;
  unsigned int passenger_capacity;
  std::vector<PassengerId> passengers;
  // Newest first.
  std::deque<Action> recent_actions;
  std::optional<Action> active_action;
  bool last_action_valid;
  bool out_of_battery;
  unsigned int ticks_since_out_of_battery;
  // Set during movement, cleared at the start of every tick.
  bool moved_this_tick;

  Car(CarId id, CarType type, const GridPosition& position, float battery, unsigned int passenger_capacity);

  bool is_agent() const {
    return type == CarType::Agent;
  }

  bool is_parked() const {
    return station.has_value();
  }

  bool has_free_seat() const {
    return passengers.size() < passenger_capacity;
  }

  bool carries(PassengerId passenger) const;

  void record_action(const Action& action);

  // Both clamp the battery to [0, 1].
  void discharge(float amount);
  void charge(float amount);

  void remove_passenger(PassengerId passenger);
};

#endif  // PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_OBJECTS_CAR_HPP_
