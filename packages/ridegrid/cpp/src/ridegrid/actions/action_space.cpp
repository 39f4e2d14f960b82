#include "actions/action_space.hpp"

#include <stdexcept>

ActionSpace::ActionSpace(unsigned int passengers_per_car, unsigned int passenger_radius)
    : _passengers_per_car(passengers_per_car), _passenger_radius(passenger_radius) {}

Action ActionSpace::decode(const GridState& state, ActionIndex index) const {
  if (index < 0 || static_cast<size_t>(index) >= size()) {
    return Action::invalid(index);
  }

  if (index < pick_up_offset()) {
    const auto& riding = state.pov_car.passengers;
    size_t slot = static_cast<size_t>(index);
    if (slot >= riding.size()) return Action::invalid(index);
    return Action::drop_off(riding[slot].id, index);
  }

  if (index < charge_offset()) {
    size_t slot = static_cast<size_t>(index - pick_up_offset());
    if (slot >= state.idle_passengers.size()) return Action::invalid(index);
    return Action::pick_up(state.idle_passengers[slot].id, index);
  }

  if (index == charge_offset()) {
    if (state.charging_stations.empty()) return Action::invalid(index);
    return Action::charge(state.charging_stations.front().id, index);
  }

  return Action::head_towards(HeadingOrder[index - head_towards_offset()], index);
}

std::vector<bool> ActionSpace::mask(const GridState& state) const {
  std::vector<bool> valid(size(), false);
  for (size_t i = 0; i < valid.size(); ++i) {
    Action action = decode(state, static_cast<ActionIndex>(i));
    if (action.kind == ActionKind::ChargeBattery) {
      const StationView& station = state.charging_stations.front();
      valid[i] = station.occupant_count < station.capacity || state.pov_car.station == station.id;
    } else {
      valid[i] = action.kind != ActionKind::Invalid;
    }
  }
  return valid;
}

ActionIndex ActionSpace::head_towards_index(Direction direction) const {
  for (ActionIndex i = 0; i < 4; ++i) {
    if (HeadingOrder[i] == direction) return head_towards_offset() + i;
  }
  throw std::invalid_argument("Unknown direction");
}

std::vector<std::string> ActionSpace::action_names() const {
  std::vector<std::string> names;
  names.reserve(size());
  for (unsigned int i = 0; i < _passengers_per_car; ++i) {
    names.push_back("drop_off_" + std::to_string(i));
  }
  for (unsigned int i = 0; i < _passenger_radius; ++i) {
    names.push_back("pick_up_" + std::to_string(i));
  }
  names.push_back("charge_nearest");
  for (Direction direction : HeadingOrder) {
    names.push_back("head_" + direction_name(direction));
  }
  return names;
}
