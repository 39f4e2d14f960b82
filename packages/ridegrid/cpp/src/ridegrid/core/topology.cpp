#include "core/topology.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace {

constexpr Direction kLaneOrder[DirectionCount] = {Direction::Up, Direction::Down, Direction::Left, Direction::Right};
constexpr Decision kDecisionOrder[3] = {Decision::GoStraight, Decision::TurnLeft, Decision::TurnRight};

}  // namespace

std::string RoadSection::to_string() const {
  return direction_name(direction) + " road " + std::to_string(road_index) + " section " +
         std::to_string(section_index);
}

std::string GridPosition::to_string() const {
  return section().to_string() + " slot " + std::to_string(position_in_section);
}

Topology::Topology(const TopologyConfig& config) : _config(config) {
  if (config.horizontal_roads < 2 || config.vertical_roads < 2) {
    throw std::invalid_argument("Topology needs at least two horizontal and two vertical roads, got " +
                                std::to_string(config.horizontal_roads) + "x" +
                                std::to_string(config.vertical_roads));
  }
  if (config.horizontal_section_slots == 0 || config.vertical_section_slots == 0) {
    throw std::invalid_argument("Road sections need at least one slot");
  }

  for (Direction direction : kLaneOrder) {
    Orientation orientation = orientation_of(direction);
    size_t lanes = static_cast<size_t>(road_count(orientation)) * sections_per_road(orientation);
    _section_count += lanes;
    _slot_count += lanes * section_length(direction);
  }

  if (!is_strongly_connected()) {
    throw std::invalid_argument("Road network " + std::to_string(config.horizontal_roads) + "x" +
                                std::to_string(config.vertical_roads) +
                                " splits into one-way loops that cannot reach each other");
  }
}

bool Topology::is_strongly_connected() const {
  // Every section must be reachable from section 0 along the lanes and in reverse.
  std::vector<std::vector<size_t>> forward(_section_count);
  std::vector<std::vector<size_t>> backward(_section_count);
  for (size_t id = 0; id < _section_count; ++id) {
    RoadSection section = section_at(id);
    for (Decision decision : possible_decisions(section)) {
      size_t next = section_id(*take_decision(section, decision));
      forward[id].push_back(next);
      backward[next].push_back(id);
    }
  }

  for (const auto* edges : {&forward, &backward}) {
    std::vector<bool> seen(_section_count, false);
    std::vector<size_t> stack = {0};
    seen[0] = true;
    size_t reached = 1;
    while (!stack.empty()) {
      size_t id = stack.back();
      stack.pop_back();
      for (size_t next : (*edges)[id]) {
        if (!seen[next]) {
          seen[next] = true;
          ++reached;
          stack.push_back(next);
        }
      }
    }
    if (reached != _section_count) return false;
  }
  return true;
}

GridCoord Topology::section_length(Direction direction) const {
  return orientation_of(direction) == Orientation::Horizontal ? _config.horizontal_section_slots
                                                               : _config.vertical_section_slots;
}

GridCoord Topology::road_count(Orientation orientation) const {
  return orientation == Orientation::Horizontal ? _config.horizontal_roads : _config.vertical_roads;
}

GridCoord Topology::sections_per_road(Orientation orientation) const {
  // Roads of one orientation are cut into sections by the roads of the other orientation.
  return orientation == Orientation::Horizontal ? static_cast<GridCoord>(_config.vertical_roads - 1)
                                                : static_cast<GridCoord>(_config.horizontal_roads - 1);
}

bool Topology::is_valid(const RoadSection& section) const {
  Orientation orientation = orientation_of(section.direction);
  return section.road_index < road_count(orientation) && section.section_index < sections_per_road(orientation);
}

bool Topology::is_valid(const GridPosition& position) const {
  return is_valid(position.section()) && position.position_in_section < section_length(position.direction);
}

void Topology::check(const GridPosition& position) const {
  if (!is_valid(position)) {
    throw std::out_of_range("Invalid grid position: " + position.to_string());
  }
}

size_t Topology::lane_offset(Direction direction) const {
  size_t offset = 0;
  for (Direction lane : kLaneOrder) {
    if (lane == direction) break;
    Orientation orientation = orientation_of(lane);
    offset += static_cast<size_t>(road_count(orientation)) * sections_per_road(orientation);
  }
  return offset;
}

size_t Topology::lane_slot_offset(Direction direction) const {
  size_t offset = 0;
  for (Direction lane : kLaneOrder) {
    if (lane == direction) break;
    Orientation orientation = orientation_of(lane);
    offset += static_cast<size_t>(road_count(orientation)) * sections_per_road(orientation) * section_length(lane);
  }
  return offset;
}

size_t Topology::section_id(const RoadSection& section) const {
  if (!is_valid(section)) {
    throw std::out_of_range("Invalid road section: " + section.to_string());
  }
  Orientation orientation = orientation_of(section.direction);
  return lane_offset(section.direction) + static_cast<size_t>(section.road_index) * sections_per_road(orientation) +
         section.section_index;
}

RoadSection Topology::section_at(size_t id) const {
  if (id >= _section_count) {
    throw std::out_of_range("Section id " + std::to_string(id) + " out of range");
  }
  for (Direction lane : kLaneOrder) {
    Orientation orientation = orientation_of(lane);
    size_t per_road = sections_per_road(orientation);
    size_t lanes = road_count(orientation) * per_road;
    if (id < lanes) {
      return RoadSection{lane, static_cast<GridCoord>(id / per_road), static_cast<GridCoord>(id % per_road)};
    }
    id -= lanes;
  }
  throw std::out_of_range("Section id out of range");
}

size_t Topology::slot_id(const GridPosition& position) const {
  check(position);
  Orientation orientation = orientation_of(position.direction);
  size_t lane_index =
      static_cast<size_t>(position.road_index) * sections_per_road(orientation) + position.section_index;
  return lane_slot_offset(position.direction) + lane_index * section_length(position.direction) +
         position.position_in_section;
}

GridPosition Topology::position_at(size_t id) const {
  if (id >= _slot_count) {
    throw std::out_of_range("Slot id " + std::to_string(id) + " out of range");
  }
  for (Direction lane : kLaneOrder) {
    Orientation orientation = orientation_of(lane);
    size_t per_road = sections_per_road(orientation);
    size_t length = section_length(lane);
    size_t slots = road_count(orientation) * per_road * length;
    if (id < slots) {
      size_t lane_index = id / length;
      return GridPosition(lane,
                          static_cast<GridCoord>(lane_index / per_road),
                          static_cast<GridCoord>(lane_index % per_road),
                          static_cast<GridCoord>(id % length));
    }
    id -= slots;
  }
  throw std::out_of_range("Slot id out of range");
}

bool Topology::is_at_intersection(const GridPosition& position) const {
  return position.position_in_section + 1 == section_length(position.direction);
}

std::vector<Decision> Topology::possible_decisions(const RoadSection& section) const {
  std::vector<Decision> decisions;
  for (Decision decision : kDecisionOrder) {
    if (take_decision(section, decision).has_value()) {
      decisions.push_back(decision);
    }
  }
  return decisions;
}

std::optional<RoadSection> Topology::take_decision(const RoadSection& section, Decision decision) const {
  int road = section.road_index;
  int section_index = section.section_index;
  Direction direction = section.direction;

  if (decision == Decision::GoStraight) {
    section_index += is_towards_positive(direction) ? 1 : -1;
  } else {
    Direction turned = decision == Decision::TurnRight ? turn_clockwise(direction) : turn_counterclockwise(direction);
    // The crossing road sits at the far end of the current section.
    int new_road = section_index + (is_towards_positive(direction) ? 1 : 0);
    int new_section = road + (is_towards_positive(turned) ? 0 : -1);
    direction = turned;
    road = new_road;
    section_index = new_section;
  }

  if (road < 0 || section_index < 0 || road > std::numeric_limits<GridCoord>::max() ||
      section_index > std::numeric_limits<GridCoord>::max()) {
    return std::nullopt;
  }
  RoadSection next{direction, static_cast<GridCoord>(road), static_cast<GridCoord>(section_index)};
  if (!is_valid(next)) {
    return std::nullopt;
  }
  return next;
}

std::optional<Decision> Topology::decision_to(const RoadSection& from, const RoadSection& to) const {
  for (Decision decision : kDecisionOrder) {
    auto next = take_decision(from, decision);
    if (next.has_value() && *next == to) {
      return decision;
    }
  }
  return std::nullopt;
}

std::pair<float, float> Topology::checkerboard_coords(const RoadSection& section) const {
  if (orientation_of(section.direction) == Orientation::Horizontal) {
    return {static_cast<float>(section.section_index) + 0.5f, static_cast<float>(section.road_index)};
  }
  return {static_cast<float>(section.road_index), static_cast<float>(section.section_index) + 0.5f};
}

GridPosition Topology::other_side_of_road(const GridPosition& position) const {
  check(position);
  GridCoord length = section_length(position.direction);
  return GridPosition(opposite(position.direction),
                      position.road_index,
                      position.section_index,
                      static_cast<GridCoord>(length - 1 - position.position_in_section));
}

Topology::EdgePoint Topology::edge_point(const GridPosition& position) const {
  check(position);
  GridCoord length = section_length(position.direction);
  GridCoord offset = is_towards_positive(position.direction)
                         ? static_cast<GridCoord>(position.position_in_section + 1)
                         : static_cast<GridCoord>(length - 1 - position.position_in_section);
  return EdgePoint{orientation_of(position.direction), position.road_index, position.section_index, offset};
}

Distance Topology::distance(const GridPosition& a, const GridPosition& b) const {
  EdgePoint pa = edge_point(a);
  EdgePoint pb = edge_point(b);

  if (pa.orientation == pb.orientation && pa.road == pb.road && pa.section == pb.section) {
    return static_cast<Distance>(std::abs(static_cast<int>(pa.offset) - static_cast<int>(pb.offset)));
  }

  struct Endpoint {
    int64_t x;
    int64_t y;
    int64_t cost;
  };

  auto endpoints = [this](const EdgePoint& p) {
    int64_t length = p.orientation == Orientation::Horizontal ? _config.horizontal_section_slots
                                                              : _config.vertical_section_slots;
    if (p.orientation == Orientation::Horizontal) {
      return std::pair<Endpoint, Endpoint>{{p.section, p.road, p.offset}, {p.section + 1, p.road, length - p.offset}};
    }
    return std::pair<Endpoint, Endpoint>{{p.road, p.section, p.offset}, {p.road, p.section + 1, length - p.offset}};
  };

  auto [a_low, a_high] = endpoints(pa);
  auto [b_low, b_high] = endpoints(pb);

  int64_t best = std::numeric_limits<int64_t>::max();
  for (const Endpoint& ea : {a_low, a_high}) {
    for (const Endpoint& eb : {b_low, b_high}) {
      int64_t lattice = std::abs(ea.x - eb.x) * _config.horizontal_section_slots +
                        std::abs(ea.y - eb.y) * _config.vertical_section_slots;
      best = std::min(best, ea.cost + lattice + eb.cost);
    }
  }
  return static_cast<Distance>(best);
}

Area Topology::wrap_area(const Area& area) const {
  float max_x = static_cast<float>(_config.vertical_roads) - 1.0f;
  float max_y = static_cast<float>(_config.horizontal_roads) - 1.0f;
  auto wrap = [](float coord, float max) { return std::signbit(coord) ? max + coord : coord; };
  return Area{wrap(area.x1, max_x), wrap(area.y1, max_y), wrap(area.x2, max_x), wrap(area.y2, max_y)};
}

std::vector<RoadSection> Topology::sections_in_area(const Area& area) const {
  Area wrapped = wrap_area(area);
  std::vector<RoadSection> sections;
  for (size_t id = 0; id < _section_count; ++id) {
    RoadSection section = section_at(id);
    auto [x, y] = checkerboard_coords(section);
    if (x >= wrapped.x1 && x <= wrapped.x2 && y >= wrapped.y1 && y <= wrapped.y2) {
      sections.push_back(section);
    }
  }
  return sections;
}

std::vector<GridPosition> Topology::positions_in_area(const Area& area) const {
  std::vector<GridPosition> positions;
  for (const RoadSection& section : sections_in_area(area)) {
    GridCoord length = section_length(section.direction);
    for (GridCoord slot = 0; slot < length; ++slot) {
      positions.emplace_back(section, slot);
    }
  }
  return positions;
}
