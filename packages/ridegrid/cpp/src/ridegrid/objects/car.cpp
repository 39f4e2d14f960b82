#include "objects/car.hpp"

#include <algorithm>

Car::Car(CarId id, CarType type, const GridPosition& position, float battery, unsigned int passenger_capacity)
    : id(id),
      type(type),
      position(position),
      station(std::nullopt),
      battery(std::clamp(battery, 0.0f, 1.0f)),
      passenger_capacity(passenger_capacity),
      passengers(),
      recent_actions(),
      active_action(std::nullopt),
      last_action_valid(true),
      out_of_battery(false),
      ticks_since_out_of_battery(0),
      moved_this_tick(false) {}

bool Car::carries(PassengerId passenger) const {
  return std::find(passengers.begin(), passengers.end(), passenger) != passengers.end();
}

void Car::record_action(const Action& action) {
  recent_actions.push_front(action);
  while (recent_actions.size() > RecentActionCapacity) {
    recent_actions.pop_back();
  }
}

void Car::discharge(float amount) {
  battery = std::max(0.0f, battery - amount);
}

void Car::charge(float amount) {
  battery = std::min(1.0f, battery + amount);
}

void Car::remove_passenger(PassengerId passenger) {
  passengers.erase(std::remove(passengers.begin(), passengers.end(), passenger), passengers.end());
}
