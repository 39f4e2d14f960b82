#ifndef PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_ACTIONS_ACTION_SPACE_HPP_
#define PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_ACTIONS_ACTION_SPACE_HPP_

#include <cstddef>
#include <string>
#include <vector>

#include "actions/action.hpp"
#include "systems/grid_state.hpp"

// Flat action encoding relative to a snapshot:
//   [0, passengers_per_car)                 drop off the i-th riding passenger
//   [.., + passenger_radius)                pick up the i-th nearest idle passenger
//   [.., + 1)                               charge at the nearest station
//   [.., + 4)                               head up, right, down, left
class ActionSpace {
public:
  static constexpr Direction HeadingOrder[4] = {Direction::Up, Direction::Right, Direction::Down, Direction::Left};

  ActionSpace(unsigned int passengers_per_car, unsigned int passenger_radius);

  size_t size() const {
    return static_cast<size_t>(_passengers_per_car) + _passenger_radius + 1 + 4;
  }

  // Indices that do not resolve against the snapshot decode to an Invalid action.
  Action decode(const GridState& state, ActionIndex index) const;
  std::vector<bool> mask(const GridState& state) const;

  ActionIndex head_towards_index(Direction direction) const;
  std::vector<std::string> action_names() const;

private:
  ActionIndex pick_up_offset() const {
    return static_cast<ActionIndex>(_passengers_per_car);
  }
  ActionIndex charge_offset() const {
    return pick_up_offset() + static_cast<ActionIndex>(_passenger_radius);
  }
  ActionIndex head_towards_offset() const {
    return charge_offset() + 1;
  }

  unsigned int _passengers_per_car;
  unsigned int _passenger_radius;
};

#endif  // PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_ACTIONS_ACTION_SPACE_HPP_
