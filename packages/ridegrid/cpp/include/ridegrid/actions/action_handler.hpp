// action_handler.hpp
#ifndef PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_ACTIONS_ACTION_HANDLER_HPP_
#define PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_ACTIONS_ACTION_HANDLER_HPP_

#include <string>

#include "actions/action.hpp"
#include "core/world.hpp"
#include "objects/car.hpp"
#include "systems/stats_tracker.hpp"

// Validates one kind of action against the world. Handlers only accept or reject; the engine carries accepted
// actions out during movement, charging, pick-up and drop-off.
class ActionHandler {
public:
  explicit ActionHandler(const std::string& action_name) : _action_name(action_name) {}

  virtual ~ActionHandler() {}

  void init(World* world, StatsTracker* stats) {
    _world = world;
    _stats = stats;
  }

  // Returns true if the action was accepted. A rejected action must leave the world untouched.
  bool handle_action(Car& actor, const Action& action) {
    _stats->incr("action." + _action_name + ".requested");

    // Cars without charge wait to be towed and ignore what they are told.
    if (actor.out_of_battery) {
      _stats->incr("status.out_of_battery.ticks");
      return false;
    }

    bool success = _handle_action(actor, action);
    if (success) {
      _stats->incr("action." + _action_name + ".success");
    } else {
      _stats->incr("action." + _action_name + ".failed");
    }
    return success;
  }

  std::string action_name() const {
    return _action_name;
  }

protected:
  virtual bool _handle_action(Car& actor, const Action& action) = 0;

  std::string _action_name;
  World* _world{};
  StatsTracker* _stats{};
};

#endif  // PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_ACTIONS_ACTION_HANDLER_HPP_
