#ifndef PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_ACTIONS_ACTION_HPP_
#define PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_ACTIONS_ACTION_HPP_

#include <cstdint>
#include <string>

#include "core/types.hpp"

enum class ActionKind : uint8_t {
  HeadTowards = 0,
  PickUpPassenger = 1,
  DropOffPassenger = 2,
  ChargeBattery = 3,
  // Produced when a flat action index cannot be decoded.
  Invalid = 4
};

constexpr uint8_t ActionKindCount = 5;

inline std::string action_kind_name(ActionKind kind) {
  switch (kind) {
    case ActionKind::HeadTowards:
      return "head_towards";
    case ActionKind::PickUpPassenger:
      return "pick_up_passenger";
    case ActionKind::DropOffPassenger:
      return "drop_off_passenger";
    case ActionKind::ChargeBattery:
      return "charge_battery";
    case ActionKind::Invalid:
      return "invalid";
  }
  return "unknown";
}

// Tagged action. `target` is a passenger id for pick-up/drop-off and a station id for charging.
// `raw` is the flat index the action was decoded from, kept only for round-tripping.
struct Action {
  ActionKind kind = ActionKind::Invalid;
  Direction direction = Direction::Up;
  uint32_t target = 0;
  ActionIndex raw = -1;

  static Action head_towards(Direction direction, ActionIndex raw = -1) {
    return Action{ActionKind::HeadTowards, direction, 0, raw};
  }

  static Action pick_up(PassengerId passenger, ActionIndex raw = -1) {
    return Action{ActionKind::PickUpPassenger, Direction::Up, passenger, raw};
  }

  static Action drop_off(PassengerId passenger, ActionIndex raw = -1) {
    return Action{ActionKind::DropOffPassenger, Direction::Up, passenger, raw};
  }

  static Action charge(StationId station, ActionIndex raw = -1) {
    return Action{ActionKind::ChargeBattery, Direction::Up, station, raw};
  }

  static Action invalid(ActionIndex raw) {
    return Action{ActionKind::Invalid, Direction::Up, 0, raw};
  }

  bool operator==(const Action& other) const = default;

  std::string to_string() const {
    switch (kind) {
      case ActionKind::HeadTowards:
        return "head_towards(" + direction_name(direction) + ")";
      case ActionKind::PickUpPassenger:
        return "pick_up(" + std::to_string(target) + ")";
      case ActionKind::DropOffPassenger:
        return "drop_off(" + std::to_string(target) + ")";
      case ActionKind::ChargeBattery:
        return "charge(" + std::to_string(target) + ")";
      case ActionKind::Invalid:
        return "invalid(" + std::to_string(raw) + ")";
    }
    return "unknown";
  }
};

#endif  // PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_ACTIONS_ACTION_HPP_
