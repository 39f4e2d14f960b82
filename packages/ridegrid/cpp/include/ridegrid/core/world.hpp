#ifndef PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_CORE_WORLD_HPP_
#define PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_CORE_WORLD_HPP_

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <vector>

#include "core/topology.hpp"
#include "core/types.hpp"
#include "objects/car.hpp"
#include "objects/charging_station.hpp"
#include "objects/passenger.hpp"

// Owns every entity of an episode and keeps the lane occupancy index in sync with car positions.
// Cars are indexed by id; passengers are keyed by id in spawn order.
class World {
public:
  explicit World(const Topology& topology);

  World(const World&) = delete;
  World& operator=(const World&) = delete;

  const Topology& topology() const {
    return _topology;
  }

  // Cars
  Car& add_car(CarType type, const GridPosition& position, float battery, unsigned int passenger_capacity);
  Car& car(CarId id);
  const Car& car(CarId id) const;
  const std::vector<std::unique_ptr<Car>>& cars() const {
    return _cars;
  }

  std::optional<CarId> car_at(const GridPosition& position) const;
  bool is_occupied(const GridPosition& position) const {
    return car_at(position).has_value();
  }
  // Occupancy per slot id, for blocking checks against the start of a tick.
  const std::vector<std::optional<CarId>>& occupancy() const {
    return _occupancy;
  }

  void move_car(Car& car, const GridPosition& to);
  // Takes the car off the road and into the station.
  void park_car(Car& car, ChargingStation& station);
  // Puts a parked car back on the road at `position`.
  void unpark_car(Car& car, const GridPosition& position);

  // Passengers
  Passenger& add_passenger(const GridPosition& origin, const GridPosition& destination, TickCount tick);
  Passenger* find_passenger(PassengerId id);
  const Passenger* find_passenger(PassengerId id) const;
  const std::map<PassengerId, Passenger>& passengers() const {
    return _passengers;
  }
  std::vector<PassengerId> idle_passengers() const;
  size_t idle_passenger_count() const;
  bool has_idle_passenger_at(const GridPosition& origin) const;

  void board(Car& car, Passenger& passenger);
  // Removes a riding passenger from the simulation.
  void drop_off(Car& car, PassengerId passenger);

  // Passenger ids claimed by pick-up actions during the current tick.
  std::set<PassengerId>& claimed_passengers() {
    return _claimed_passengers;
  }
  void begin_tick() {
    _claimed_passengers.clear();
  }

  // Charging stations
  ChargingStation& add_station(const GridPosition& entrance, unsigned int capacity, float charge_rate);
  ChargingStation* find_station(StationId id);
  const ChargingStation* find_station(StationId id) const;
  std::vector<ChargingStation>& stations() {
    return _stations;
  }
  const std::vector<ChargingStation>& stations() const {
    return _stations;
  }
  ChargingStation* station_at_entrance(const GridPosition& position);
  bool is_station_entrance(const GridPosition& position) const;

private:
  const Topology& _topology;
  std::vector<std::unique_ptr<Car>> _cars;
  std::vector<std::optional<CarId>> _occupancy;
  std::map<PassengerId, Passenger> _passengers;
  PassengerId _next_passenger_id = 0;
  std::set<PassengerId> _claimed_passengers;
  std::vector<ChargingStation> _stations;
};

#endif  // PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_CORE_WORLD_HPP_
