#include "core/pathfinder.hpp"

#include <functional>
#include <limits>
#include <queue>
#include <stdexcept>
#include <utility>

namespace {

constexpr Distance kUnreachable = std::numeric_limits<Distance>::max();

}  // namespace

Pathfinder::Pathfinder(const Topology& topology) : _topology(topology), _routes(topology.section_count()) {}

bool Pathfinder::reached_in_section(const GridPosition& from, const GridPosition& to) const {
  return from.section() == to.section() && to.position_in_section >= from.position_in_section;
}

const Pathfinder::RouteTable& Pathfinder::routes_from(const RoadSection& source) const {
  size_t source_id = _topology.section_id(source);
  auto& cached = _routes[source_id];
  if (cached) {
    return *cached;
  }

  auto table = std::make_unique<RouteTable>();
  table->entry_cost.assign(_topology.section_count(), kUnreachable);
  table->first_decision.assign(_topology.section_count(), Decision::GoStraight);

  using QueueEntry = std::pair<Distance, size_t>;
  std::priority_queue<QueueEntry, std::vector<QueueEntry>, std::greater<QueueEntry>> queue;

  for (Decision decision : _topology.possible_decisions(source)) {
    size_t next_id = _topology.section_id(*_topology.take_decision(source, decision));
    if (table->entry_cost[next_id] > 1) {
      table->entry_cost[next_id] = 1;
      table->first_decision[next_id] = decision;
      queue.emplace(1, next_id);
    }
  }

  while (!queue.empty()) {
    auto [cost, section_id] = queue.top();
    queue.pop();
    if (cost > table->entry_cost[section_id]) continue;

    RoadSection section = _topology.section_at(section_id);
    Distance leave_cost = cost + _topology.section_length(section.direction);
    for (Decision decision : _topology.possible_decisions(section)) {
      size_t next_id = _topology.section_id(*_topology.take_decision(section, decision));
      if (leave_cost < table->entry_cost[next_id]) {
        table->entry_cost[next_id] = leave_cost;
        table->first_decision[next_id] = table->first_decision[section_id];
        queue.emplace(leave_cost, next_id);
      }
    }
  }

  cached = std::move(table);
  return *cached;
}

Distance Pathfinder::travel_ticks(const GridPosition& from, const GridPosition& to) const {
  _topology.check(from);
  _topology.check(to);
  if (reached_in_section(from, to)) {
    return to.position_in_section - from.position_in_section;
  }

  const RouteTable& routes = routes_from(from.section());
  Distance entry = routes.entry_cost[_topology.section_id(to.section())];
  if (entry == kUnreachable) {
    throw std::runtime_error("No route from " + from.to_string() + " to " + to.to_string());
  }
  Distance to_section_end = _topology.section_length(from.direction) - 1 - from.position_in_section;
  return to_section_end + entry + to.position_in_section;
}

std::optional<Decision> Pathfinder::next_decision(const GridPosition& from, const GridPosition& to) const {
  _topology.check(from);
  _topology.check(to);
  if (reached_in_section(from, to)) {
    return std::nullopt;
  }

  const RouteTable& routes = routes_from(from.section());
  size_t target_id = _topology.section_id(to.section());
  if (routes.entry_cost[target_id] == kUnreachable) {
    throw std::runtime_error("No route from " + from.to_string() + " to " + to.to_string());
  }
  return routes.first_decision[target_id];
}
