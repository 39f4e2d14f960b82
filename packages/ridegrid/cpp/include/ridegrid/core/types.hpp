#ifndef PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_CORE_TYPES_HPP_
#define PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_CORE_TYPES_HPP_

#include <cstdint>
#include <stdexcept>
#include <string>

using GridCoord = uint16_t;  // this sets the maximum number of roads, sections and slots
using CarId = uint32_t;
using PassengerId = uint32_t;
using StationId = uint32_t;
using TickCount = uint32_t;
using ActionIndex = int32_t;
using Distance = uint32_t;

// (0, 0) is the top-left corner. Down and Right point towards positive coordinates.
enum class Direction : uint8_t {
  Up = 0,
  Down = 1,
  Left = 2,
  Right = 3
};

constexpr uint8_t DirectionCount = 4;

enum class Orientation : uint8_t {
  Horizontal = 0,
  Vertical = 1
};

// What a car does when it reaches the end of a road section.
enum class Decision : uint8_t {
  GoStraight = 0,
  TurnLeft = 1,
  TurnRight = 2
};

inline Orientation orientation_of(Direction direction) {
  return (direction == Direction::Left || direction == Direction::Right) ? Orientation::Horizontal
                                                                          : Orientation::Vertical;
}

inline bool is_towards_positive(Direction direction) {
  return direction == Direction::Down || direction == Direction::Right;
}

inline Direction turn_clockwise(Direction direction) {
  switch (direction) {
    case Direction::Up:
      return Direction::Right;
    case Direction::Right:
      return Direction::Down;
    case Direction::Down:
      return Direction::Left;
    case Direction::Left:
      return Direction::Up;
  }
  throw std::invalid_argument("Unknown direction");
}

inline Direction turn_counterclockwise(Direction direction) {
  switch (direction) {
    case Direction::Up:
      return Direction::Left;
    case Direction::Left:
      return Direction::Down;
    case Direction::Down:
      return Direction::Right;
    case Direction::Right:
      return Direction::Up;
  }
  throw std::invalid_argument("Unknown direction");
}

inline Direction opposite(Direction direction) {
  switch (direction) {
    case Direction::Up:
      return Direction::Down;
    case Direction::Down:
      return Direction::Up;
    case Direction::Left:
      return Direction::Right;
    case Direction::Right:
      return Direction::Left;
  }
  throw std::invalid_argument("Unknown direction");
}

inline std::string direction_name(Direction direction) {
  switch (direction) {
    case Direction::Up:
      return "up";
    case Direction::Down:
      return "down";
    case Direction::Left:
      return "left";
    case Direction::Right:
      return "right";
  }
  return "unknown";
}

inline std::string decision_name(Decision decision) {
  switch (decision) {
    case Decision::GoStraight:
      return "straight";
    case Decision::TurnLeft:
      return "left";
    case Decision::TurnRight:
      return "right";
  }
  return "unknown";
}

#endif  // PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_CORE_TYPES_HPP_
