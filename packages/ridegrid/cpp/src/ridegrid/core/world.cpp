#include "core/world.hpp"

#include <stdexcept>
#include <string>

World::World(const Topology& topology)
    : _topology(topology), _cars(), _occupancy(topology.slot_count()), _passengers(), _stations() {}

Car& World::add_car(CarType type, const GridPosition& position, float battery, unsigned int passenger_capacity) {
  size_t slot = _topology.slot_id(position);
  if (_occupancy[slot].has_value()) {
    throw std::logic_error("Slot already occupied: " + position.to_string());
  }
  CarId id = static_cast<CarId>(_cars.size());
  _cars.push_back(std::make_unique<Car>(id, type, position, battery, passenger_capacity));
  _occupancy[slot] = id;
  return *_cars.back();
}

Car& World::car(CarId id) {
  if (id >= _cars.size()) {
    throw std::out_of_range("Unknown car id " + std::to_string(id));
  }
  return *_cars[id];
}

const Car& World::car(CarId id) const {
  if (id >= _cars.size()) {
    throw std::out_of_range("Unknown car id " + std::to_string(id));
  }
  return *_cars[id];
}

std::optional<CarId> World::car_at(const GridPosition& position) const {
  return _occupancy[_topology.slot_id(position)];
}

void World::move_car(Car& car, const GridPosition& to) {
  if (car.is_parked()) {
    throw std::logic_error("Car " + std::to_string(car.id) + " is parked");
  }
  size_t target = _topology.slot_id(to);
  if (_occupancy[target].has_value() && *_occupancy[target] != car.id) {
    throw std::logic_error("Slot already occupied: " + to.to_string());
  }
  _occupancy[_topology.slot_id(car.position)].reset();
  _occupancy[target] = car.id;
  car.position = to;
}

void World::park_car(Car& car, ChargingStation& station) {
  if (car.is_parked()) {
    throw std::logic_error("Car " + std::to_string(car.id) + " is already parked");
  }
  station.enter(car.id);
  _occupancy[_topology.slot_id(car.position)].reset();
  car.station = station.id;
}

void World::unpark_car(Car& car, const GridPosition& position) {
  if (!car.is_parked()) {
    throw std::logic_error("Car " + std::to_string(car.id) + " is not parked");
  }
  size_t slot = _topology.slot_id(position);
  if (_occupancy[slot].has_value()) {
    throw std::logic_error("Slot already occupied: " + position.to_string());
  }
  ChargingStation* station = find_station(*car.station);
  if (station != nullptr) {
    station->leave(car.id);
  }
  car.station.reset();
  car.position = position;
  _occupancy[slot] = car.id;
}

Passenger& World::add_passenger(const GridPosition& origin, const GridPosition& destination, TickCount tick) {
  _topology.check(origin);
  _topology.check(destination);
  PassengerId id = _next_passenger_id++;
  auto it = _passengers.emplace(id, Passenger(id, origin, destination, tick)).first;
  return it->second;
}

Passenger* World::find_passenger(PassengerId id) {
  auto it = _passengers.find(id);
  return it == _passengers.end() ? nullptr : &it->second;
}

const Passenger* World::find_passenger(PassengerId id) const {
  auto it = _passengers.find(id);
  return it == _passengers.end() ? nullptr : &it->second;
}

std::vector<PassengerId> World::idle_passengers() const {
  std::vector<PassengerId> idle;
  for (const auto& [id, passenger] : _passengers) {
    if (passenger.is_idle()) idle.push_back(id);
  }
  return idle;
}

size_t World::idle_passenger_count() const {
  size_t count = 0;
  for (const auto& [id, passenger] : _passengers) {
    if (passenger.is_idle()) count++;
  }
  return count;
}

bool World::has_idle_passenger_at(const GridPosition& origin) const {
  for (const auto& [id, passenger] : _passengers) {
    if (passenger.is_idle() && passenger.origin == origin) return true;
  }
  return false;
}

void World::board(Car& car, Passenger& passenger) {
  if (!passenger.is_idle()) {
    throw std::logic_error("Passenger " + std::to_string(passenger.id) + " is already riding");
  }
  if (!car.has_free_seat()) {
    throw std::logic_error("Car " + std::to_string(car.id) + " has no free seat");
  }
  passenger.car = car.id;
  car.passengers.push_back(passenger.id);
}

void World::drop_off(Car& car, PassengerId passenger) {
  if (!car.carries(passenger)) {
    throw std::logic_error("Car " + std::to_string(car.id) + " does not carry passenger " + std::to_string(passenger));
  }
  car.remove_passenger(passenger);
  _passengers.erase(passenger);
}

ChargingStation& World::add_station(const GridPosition& entrance, unsigned int capacity, float charge_rate) {
  _topology.check(entrance);
  StationId id = static_cast<StationId>(_stations.size());
  _stations.emplace_back(id, entrance, capacity, charge_rate);
  return _stations.back();
}

ChargingStation* World::find_station(StationId id) {
  return id < _stations.size() ? &_stations[id] : nullptr;
}

const ChargingStation* World::find_station(StationId id) const {
  return id < _stations.size() ? &_stations[id] : nullptr;
}

ChargingStation* World::station_at_entrance(const GridPosition& position) {
  for (auto& station : _stations) {
    if (station.is_entrance(position, _topology)) return &station;
  }
  return nullptr;
}

bool World::is_station_entrance(const GridPosition& position) const {
  for (const auto& station : _stations) {
    if (station.is_entrance(position, _topology)) return true;
  }
  return false;
}
