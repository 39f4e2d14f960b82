#ifndef PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_ACTIONS_DROP_OFF_PASSENGER_HPP_
#define PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_ACTIONS_DROP_OFF_PASSENGER_HPP_

#include "actions/action_handler.hpp"

class DropOffPassenger : public ActionHandler {
public:
  DropOffPassenger() : ActionHandler("drop_off_passenger") {}

protected:
  bool _handle_action(Car& actor, const Action& action) override {
    return actor.carries(action.target);
  }
};

#endif  // PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_ACTIONS_DROP_OFF_PASSENGER_HPP_
