#ifndef PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_SYSTEMS_PASSENGER_SPAWNER_HPP_
#define PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_SYSTEMS_PASSENGER_SPAWNER_HPP_

#include <random>
#include <vector>

#include "config/ridegrid_config.hpp"
#include "core/topology.hpp"
#include "core/world.hpp"
#include "systems/grid_state.hpp"
#include "systems/stats_tracker.hpp"

// Spawns passengers from a base stream covering the whole grid plus one stream per passenger event.
// Every stream draws at most one passenger per tick.
class PassengerSpawner {
public:
  static constexpr unsigned int MaxPlacementAttempts = 1000;

  PassengerSpawner(const GridConfig& config, const Topology& topology);

  // Places the configured initial passengers, inside the first event active at tick 0 if there is one.
  void spawn_initial(World& world, std::mt19937& rng, StatsTracker& stats, TickEvents& events);

  void tick(World& world, TickCount tick, std::mt19937& rng, StatsTracker& stats, TickEvents& events);

private:
  struct EventRegion {
    const PassengerEventConfig* config;
    std::vector<GridPosition> origins;
    std::vector<GridPosition> destinations;
  };

  // Empty pools mean the whole grid.
  bool try_spawn(World& world,
                 const std::vector<GridPosition>& origins,
                 const std::vector<GridPosition>& destinations,
                 TickCount tick,
                 std::mt19937& rng,
                 StatsTracker& stats,
                 TickEvents& events);
  GridPosition sample(const std::vector<GridPosition>& pool, std::mt19937& rng) const;

  const GridConfig& _config;
  const Topology& _topology;
  std::vector<EventRegion> _regions;
};

#endif  // PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_SYSTEMS_PASSENGER_SPAWNER_HPP_
