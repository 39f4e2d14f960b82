#ifndef PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_ENV_CAR_CALLBACK_HPP_
#define PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_ENV_CAR_CALLBACK_HPP_

#include "actions/action.hpp"
#include "systems/grid_state.hpp"

namespace ridegrid::env {

// Supplies actions for one agent car. Both calls happen synchronously inside RideGridEngine::tick(), once per
// tick, in ascending car id order. Exceptions thrown here abort the tick and propagate to the caller.
class CarCallback {
public:
  virtual ~CarCallback() = default;

  virtual Action get_action(const GridState& state) = 0;

  virtual void transition_happened(const GridState& old_state, const GridState& new_state) = 0;
};

}  // namespace ridegrid::env

#endif  // PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_ENV_CAR_CALLBACK_HPP_
