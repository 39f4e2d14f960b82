#include "supervisors/npc_policy.hpp"

#include <algorithm>
#include <stdexcept>

#include "objects/car.hpp"

NpcPolicy::NpcPolicy(const Topology& topology, const std::string& name) : topology_(topology), name_(name) {}

Decision NpcPolicy::decide(const Car& car, std::mt19937& rng) {
  auto options = topology_.possible_decisions(car.position.section());
  if (options.empty()) {
    throw std::logic_error("Dead end at " + car.position.to_string());
  }

  Decision decision = get_recommended_decision(car, options, rng);
  if (std::find(options.begin(), options.end(), decision) == options.end()) {
    throw std::logic_error(name_ + " chose unavailable decision " + decision_name(decision) + " at " +
                           car.position.to_string());
  }
  return decision;
}

Decision RandomTurnsPolicy::get_recommended_decision(const Car& /*car*/,
                                                     const std::vector<Decision>& options,
                                                     std::mt19937& rng) {
  std::uniform_int_distribution<size_t> pick(0, options.size() - 1);
  return options[pick(rng)];
}
