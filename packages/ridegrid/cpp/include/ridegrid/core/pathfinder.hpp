#ifndef PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_CORE_PATHFINDER_HPP_
#define PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_CORE_PATHFINDER_HPP_

#include <memory>
#include <optional>
#include <vector>

#include "core/topology.hpp"
#include "core/types.hpp"

// Routes cars along one-way lanes. Every move advances a car by one slot; leaving the last slot of a section puts
// the car on the first slot of the next one. Route tables are computed per source section on first use.
class Pathfinder {
public:
  explicit Pathfinder(const Topology& topology);

  Pathfinder(const Pathfinder&) = delete;
  Pathfinder& operator=(const Pathfinder&) = delete;

  // Minimum number of moves for a car at `from` to stand on `to`.
  Distance travel_ticks(const GridPosition& from, const GridPosition& to) const;

  // Decision to take at the end of the current section to follow a shortest route. Empty when `to` lies ahead in
  // the current section.
  std::optional<Decision> next_decision(const GridPosition& from, const GridPosition& to) const;

private:
  struct RouteTable {
    // Moves from the last slot of the source section to the first slot of each section.
    std::vector<Distance> entry_cost;
    std::vector<Decision> first_decision;
  };

  const RouteTable& routes_from(const RoadSection& section) const;
  bool reached_in_section(const GridPosition& from, const GridPosition& to) const;

  const Topology& _topology;
  mutable std::vector<std::unique_ptr<RouteTable>> _routes;
};

#endif  // PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_CORE_PATHFINDER_HPP_
