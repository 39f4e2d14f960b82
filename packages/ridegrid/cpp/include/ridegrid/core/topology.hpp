#ifndef PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_CORE_TOPOLOGY_HPP_
#define PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_CORE_TOPOLOGY_HPP_

#include <compare>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/types.hpp"

struct TopologyConfig {
  GridCoord horizontal_roads = 10;
  GridCoord vertical_roads = 15;
  // Slots per section along horizontal and vertical roads. The last slot of a section is the intersection.
  GridCoord horizontal_section_slots = 5;
  GridCoord vertical_section_slots = 5;
};

// One lane of a road between two neighbouring intersections.
struct RoadSection {
  Direction direction = Direction::Right;
  GridCoord road_index = 0;
  GridCoord section_index = 0;

  bool operator==(const RoadSection& other) const = default;
  auto operator<=>(const RoadSection& other) const = default;

  std::string to_string() const;
};

struct GridPosition {
  Direction direction = Direction::Right;
  GridCoord road_index = 0;
  GridCoord section_index = 0;
  GridCoord position_in_section = 0;

  GridPosition() = default;
  GridPosition(Direction direction, GridCoord road_index, GridCoord section_index, GridCoord position_in_section)
      : direction(direction),
        road_index(road_index),
        section_index(section_index),
        position_in_section(position_in_section) {}
  GridPosition(const RoadSection& section, GridCoord position_in_section)
      : direction(section.direction),
        road_index(section.road_index),
        section_index(section.section_index),
        position_in_section(position_in_section) {}

  RoadSection section() const {
    return RoadSection{direction, road_index, section_index};
  }

  bool operator==(const GridPosition& other) const = default;
  auto operator<=>(const GridPosition& other) const = default;

  std::string to_string() const;
};

// Inclusive rectangle in checkerboard coordinates (x1, y1, x2, y2). Negative values count from the far edge.
struct Area {
  float x1 = 0.0f;
  float y1 = 0.0f;
  float x2 = 0.0f;
  float y2 = 0.0f;

  bool operator==(const Area& other) const = default;
};

// Static Manhattan road network. Horizontal roads carry Left/Right lanes and are split into
// (vertical_roads - 1) sections; vertical roads carry Up/Down lanes and are split into
// (horizontal_roads - 1) sections.
class Topology {
public:
  explicit Topology(const TopologyConfig& config);

  const TopologyConfig& config() const {
    return _config;
  }

  // (width, height) counted in roads.
  std::pair<GridCoord, GridCoord> dimensions() const {
    return {_config.vertical_roads, _config.horizontal_roads};
  }

  GridCoord section_length(Direction direction) const;
  GridCoord road_count(Orientation orientation) const;
  GridCoord sections_per_road(Orientation orientation) const;

  bool is_valid(const RoadSection& section) const;
  bool is_valid(const GridPosition& position) const;
  // Throws std::out_of_range for positions outside the network.
  void check(const GridPosition& position) const;

  size_t section_count() const {
    return _section_count;
  }
  size_t slot_count() const {
    return _slot_count;
  }

  // Dense indices used for lookup tables. Lanes are ordered Up, Down, Left, Right.
  size_t section_id(const RoadSection& section) const;
  RoadSection section_at(size_t id) const;
  size_t slot_id(const GridPosition& position) const;
  GridPosition position_at(size_t id) const;

  bool is_at_intersection(const GridPosition& position) const;

  // True when every lane section can reach every other one. The constructor rejects networks where it does not
  // hold (a 2x2 network is two separate one-way loops).
  bool is_strongly_connected() const;

  std::vector<Decision> possible_decisions(const RoadSection& section) const;
  std::optional<RoadSection> take_decision(const RoadSection& section, Decision decision) const;
  std::optional<Decision> decision_to(const RoadSection& from, const RoadSection& to) const;

  // (x, y) of a section on the road lattice; the coordinate along the section sits halfway between roads.
  std::pair<float, float> checkerboard_coords(const RoadSection& section) const;

  GridPosition other_side_of_road(const GridPosition& position) const;

  // Shortest path in slots over the undirected physical road graph. Lanes are one-way for cars, so travel time
  // is computed separately by Pathfinder and can exceed this value.
  Distance distance(const GridPosition& a, const GridPosition& b) const;

  Area wrap_area(const Area& area) const;
  std::vector<RoadSection> sections_in_area(const Area& area) const;
  std::vector<GridPosition> positions_in_area(const Area& area) const;

private:
  struct EdgePoint {
    Orientation orientation;
    GridCoord road;
    GridCoord section;
    GridCoord offset;  // slots from the low-coordinate intersection of the edge
  };

  EdgePoint edge_point(const GridPosition& position) const;
  size_t lane_offset(Direction direction) const;
  size_t lane_slot_offset(Direction direction) const;

  TopologyConfig _config;
  size_t _section_count = 0;
  size_t _slot_count = 0;
};

#endif  // PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_CORE_TOPOLOGY_HPP_
