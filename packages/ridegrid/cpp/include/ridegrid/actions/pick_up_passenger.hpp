#ifndef PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_ACTIONS_PICK_UP_PASSENGER_HPP_
#define PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_ACTIONS_PICK_UP_PASSENGER_HPP_

#include "actions/action_handler.hpp"

// The first car to ask for an idle passenger during a tick claims it; later requests that tick are rejected.
class PickUpPassenger : public ActionHandler {
public:
  PickUpPassenger() : ActionHandler("pick_up_passenger") {}

protected:
  bool _handle_action(Car& actor, const Action& action) override {
    const Passenger* passenger = _world->find_passenger(action.target);
    if (passenger == nullptr || !passenger->is_idle()) {
      return false;
    }
    if (!actor.has_free_seat()) {
      return false;
    }
    auto& claimed = _world->claimed_passengers();
    if (claimed.contains(passenger->id)) {
      _stats->incr("action.pick_up_passenger.conflict");
      return false;
    }
    claimed.insert(passenger->id);
    return true;
  }
};

#endif  // PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_ACTIONS_PICK_UP_PASSENGER_HPP_
