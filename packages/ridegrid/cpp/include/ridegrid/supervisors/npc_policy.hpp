#ifndef PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_SUPERVISORS_NPC_POLICY_HPP_
#define PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_SUPERVISORS_NPC_POLICY_HPP_

#include <random>
#include <string>
#include <vector>

#include "core/topology.hpp"
#include "core/types.hpp"

class Car;

// Drives NPC cars. The engine asks for a decision whenever an NPC reaches the end of a section.
class NpcPolicy {
public:
  NpcPolicy(const Topology& topology, const std::string& name);

  virtual ~NpcPolicy() = default;

  // Always returns one of the decisions available at the car's section.
  Decision decide(const Car& car, std::mt19937& rng);

  const std::string& name() const {
    return name_;
  }

protected:
  // Subclasses must implement this to pick among the available decisions (never empty)
  virtual Decision get_recommended_decision(const Car& car,
                                            const std::vector<Decision>& options,
                                            std::mt19937& rng) = 0;

  const Topology& topology_;
  std::string name_;
};

// Picks uniformly among the available decisions.
class RandomTurnsPolicy : public NpcPolicy {
public:
  explicit RandomTurnsPolicy(const Topology& topology) : NpcPolicy(topology, "random_turns") {}

protected:
  Decision get_recommended_decision(const Car& car, const std::vector<Decision>& options, std::mt19937& rng) override;
};

#endif  // PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_SUPERVISORS_NPC_POLICY_HPP_
