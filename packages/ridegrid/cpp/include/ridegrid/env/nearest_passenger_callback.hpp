#ifndef PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_ENV_NEAREST_PASSENGER_CALLBACK_HPP_
#define PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_ENV_NEAREST_PASSENGER_CALLBACK_HPP_

#include <cstddef>

#include "env/car_callback.hpp"

namespace ridegrid::env {

// Baseline driver: tops up at the nearest station when the battery runs low, otherwise delivers the passenger it
// carries or goes for the nearest idle one.
class NearestPassengerCallback : public CarCallback {
public:
  explicit NearestPassengerCallback(float low_battery = 0.25f) : _low_battery(low_battery), _transitions(0) {}

  Action get_action(const GridState& state) override {
    const CarView& car = state.pov_car;
    if (car.station.has_value() && car.battery < 1.0f) {
      return Action::charge(*car.station);
    }
    if (car.battery < _low_battery && !state.charging_stations.empty()) {
      return Action::charge(state.charging_stations.front().id);
    }
    if (!car.passengers.empty()) {
      return Action::drop_off(car.passengers.front().id);
    }
    if (!state.idle_passengers.empty()) {
      return Action::pick_up(state.idle_passengers.front().id);
    }
    return Action::head_towards(car.position.direction);
  }

  void transition_happened(const GridState& /*old_state*/, const GridState& /*new_state*/) override {
    _transitions += 1;
  }

  size_t transitions() const {
    return _transitions;
  }

private:
  float _low_battery;
  size_t _transitions;
};

}  // namespace ridegrid::env

#endif  // PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_ENV_NEAREST_PASSENGER_CALLBACK_HPP_
