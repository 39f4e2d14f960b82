#ifndef PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_ACTIONS_CHARGE_BATTERY_HPP_
#define PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_ACTIONS_CHARGE_BATTERY_HPP_

#include "actions/action_handler.hpp"

// Rejected while the station is full, unless the car is already parked inside.
class ChargeBattery : public ActionHandler {
public:
  ChargeBattery() : ActionHandler("charge_battery") {}

protected:
  bool _handle_action(Car& actor, const Action& action) override {
    const ChargingStation* station = _world->find_station(action.target);
    if (station == nullptr) {
      return false;
    }
    return station->contains(actor.id) || station->has_space();
  }
};

#endif  // PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_ACTIONS_CHARGE_BATTERY_HPP_
