#ifndef PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_ENV_RIDEGRID_ENGINE_HPP_
#define PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_ENV_RIDEGRID_ENGINE_HPP_

#include <memory>
#include <optional>
#include <random>
#include <utility>
#include <vector>

#include "actions/action.hpp"
#include "config/ridegrid_config.hpp"
#include "core/topology.hpp"
#include "core/types.hpp"
#include "env/car_callback.hpp"
#include "systems/grid_state.hpp"

class Pathfinder;
class World;
class TrafficLights;
class PassengerSpawner;
class NpcPolicy;
class StatsTracker;
class ActionHandler;
class Car;
class Passenger;

namespace ridegrid::env {

// Runs one episode. Each tick asks every agent callback for an action, resolves all cars in ascending id order,
// spawns passengers and reports the transition back to the callbacks. Everything random draws from one generator
// seeded at construction.
class RideGridEngine {
public:
  RideGridEngine(const GridConfig& config, std::vector<std::shared_ptr<CarCallback>> callbacks, unsigned int seed);
  ~RideGridEngine();

  RideGridEngine(const RideGridEngine&) = delete;
  RideGridEngine& operator=(const RideGridEngine&) = delete;

  void tick();

  std::pair<GridCoord, GridCoord> grid_dimensions() const {
    return _topology->dimensions();
  }

  Distance calculate_distance(const GridPosition& a, const GridPosition& b) const;
  Distance travel_ticks(const GridPosition& from, const GridPosition& to) const;

  // Snapshot of the world as seen by `car` right now.
  GridState state_for(CarId car) const;

  size_t total_passenger_count() const;

  size_t num_agents() const {
    return _callbacks.size();
  }

  TickCount ticks_passed() const {
    return _ticks_passed;
  }

  const std::vector<bool>& action_success() const {
    return _action_success;
  }

  const TickEvents& tick_events() const {
    return _tick_events;
  }

  const GridConfig& config() const {
    return _config;
  }

  unsigned int seed() const {
    return _seed;
  }

  // Seed for the next episode, drawn from this episode's generator.
  unsigned int next_episode_seed();

  const Topology& topology() const {
    return *_topology;
  }
  const World& world() const;
  const TrafficLights& traffic_lights() const;
  StatsTracker& stats();
  const StatsTracker& episode_stats() const;

private:
  void place_cars();
  void resolve_actions(const std::vector<Action>& actions);
  void move_cars();
  void move_car(Car& car, const std::vector<std::optional<CarId>>& start_occupancy);
  std::optional<GridPosition> navigation_target(const Car& car) const;
  Decision decide_at_intersection(Car& car, const std::optional<GridPosition>& target);
  void update_batteries();
  void tow_cars();
  void charge_cars();
  void pick_up_passengers();
  void drop_off_passengers();
  void record_tick_stats();
  void log_tick(const std::vector<Action>& actions) const;

  GridState build_state(const Car& car) const;
  CarView car_view(const Car& car, const Car& observer) const;
  PassengerView passenger_view(const Passenger& passenger, const Car& observer) const;

  GridConfig _config;
  std::unique_ptr<Topology> _topology;
  std::unique_ptr<Pathfinder> _pathfinder;
  std::unique_ptr<World> _world;
  std::unique_ptr<TrafficLights> _traffic_lights;
  std::unique_ptr<PassengerSpawner> _spawner;
  std::unique_ptr<NpcPolicy> _npc_policy;
  std::unique_ptr<StatsTracker> _stats;

  // Indexed by ActionKind; Invalid has no handler.
  std::vector<std::unique_ptr<ActionHandler>> _action_handlers;
  std::vector<std::shared_ptr<CarCallback>> _callbacks;
  std::vector<bool> _action_success;

  TickEvents _tick_events;
  TickCount _ticks_passed = 0;

  std::mt19937 _rng;
  unsigned int _seed = 0;
};

}  // namespace ridegrid::env

#endif  // PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_ENV_RIDEGRID_ENGINE_HPP_
