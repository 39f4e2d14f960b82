#ifndef PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_ACTIONS_HEAD_TOWARDS_HPP_
#define PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_ACTIONS_HEAD_TOWARDS_HPP_

#include <stdexcept>
#include <string>

#include "actions/action_handler.hpp"
#include "core/topology.hpp"

class HeadTowards : public ActionHandler {
public:
  HeadTowards() : ActionHandler("head_towards") {}

  // Picks the next section whose checkerboard coordinate lies furthest in `direction`. Ties keep the earlier
  // decision in the order straight, left, right.
  static Decision choose_decision(const Topology& topology, const RoadSection& section, Direction direction) {
    auto decisions = topology.possible_decisions(section);
    if (decisions.empty()) {
      throw std::logic_error("Dead end at " + section.to_string());
    }

    Decision best = decisions.front();
    float best_score = score(topology, *topology.take_decision(section, best), direction);
    for (size_t i = 1; i < decisions.size(); ++i) {
      float candidate = score(topology, *topology.take_decision(section, decisions[i]), direction);
      if (candidate > best_score) {
        best = decisions[i];
        best_score = candidate;
      }
    }
    return best;
  }

protected:
  bool _handle_action(Car& /*actor*/, const Action& /*action*/) override {
    return true;
  }

private:
  static float score(const Topology& topology, const RoadSection& section, Direction direction) {
    auto [x, y] = topology.checkerboard_coords(section);
    switch (direction) {
      case Direction::Up:
        return -y;
      case Direction::Down:
        return y;
      case Direction::Left:
        return -x;
      case Direction::Right:
        return x;
    }
    return 0.0f;
  }
};

#endif  // PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_ACTIONS_HEAD_TOWARDS_HPP_
