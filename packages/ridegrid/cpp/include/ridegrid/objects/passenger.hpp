#ifndef PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_OBJECTS_PASSENGER_HPP_
#define PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_OBJECTS_PASSENGER_HPP_

#include <optional>

#include "core/topology.hpp"
#include "core/types.hpp"

class Passenger {
public:
  PassengerId id;
  GridPosition origin;
  GridPosition destination;
  TickCount spawn_tick;
  // Set while riding.
  std::optional<CarId> car;

  Passenger(PassengerId id, const GridPosition& origin, const GridPosition& destination, TickCount spawn_tick)
      : id(id), origin(origin), destination(destination), spawn_tick(spawn_tick), car(std::nullopt) {}

  bool is_idle() const {
    return !car.has_value();
  }

  TickCount ticks_since_request(TickCount now) const {
    return now - spawn_tick;
  }
};

#endif  // PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_OBJECTS_PASSENGER_HPP_
