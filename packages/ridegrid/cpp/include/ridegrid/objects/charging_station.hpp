#ifndef PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_OBJECTS_CHARGING_STATION_HPP_
#define PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_OBJECTS_CHARGING_STATION_HPP_

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/topology.hpp"
#include "core/types.hpp"

// Parked cars leave the road while they charge, so occupants do not hold a lane slot.
class ChargingStation {
public:
  StationId id;
  GridPosition entrance;
  unsigned int capacity;
  float charge_rate;
  std::vector<CarId> occupants;

  ChargingStation(StationId id, const GridPosition& entrance, unsigned int capacity, float charge_rate)
      : id(id), entrance(entrance), capacity(capacity), charge_rate(charge_rate), occupants() {}

  bool has_space() const {
    return occupants.size() < capacity;
  }

  bool contains(CarId car) const {
    return std::find(occupants.begin(), occupants.end(), car) != occupants.end();
  }

  // The station can be entered from either lane at the entrance spot.
  bool is_entrance(const GridPosition& position, const Topology& topology) const {
    return position == entrance || position == topology.other_side_of_road(entrance);
  }

  void enter(CarId car) {
    if (!has_space()) {
      throw std::logic_error("Charging station " + std::to_string(id) + " is full");
    }
    if (!contains(car)) {
      occupants.push_back(car);
    }
  }

  void leave(CarId car) {
    occupants.erase(std::remove(occupants.begin(), occupants.end(), car), occupants.end());
  }
};

#endif  // PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_OBJECTS_CHARGING_STATION_HPP_
