#include "systems/passenger_spawner.hpp"

#include <stdexcept>
#include <utility>

namespace {

// Always consumes one draw so the random stream does not depend on the rate.
bool roll(std::mt19937& rng, float rate) {
  std::uniform_real_distribution<float> chance(0.0f, 1.0f);
  return chance(rng) < rate || rate >= 1.0f;
}

}  // namespace

PassengerSpawner::PassengerSpawner(const GridConfig& config, const Topology& topology)
    : _config(config), _topology(topology), _regions() {
  for (const PassengerEventConfig& event : config.passenger_events) {
    EventRegion region{&event, topology.positions_in_area(event.start_area),
                       topology.positions_in_area(event.destination_area)};
    if (region.origins.empty() || region.destinations.empty()) {
      throw std::invalid_argument("Passenger event '" + event.name + "' covers no road section");
    }
    _regions.push_back(std::move(region));
  }
}

GridPosition PassengerSpawner::sample(const std::vector<GridPosition>& pool, std::mt19937& rng) const {
  if (pool.empty()) {
    std::uniform_int_distribution<size_t> dist(0, _topology.slot_count() - 1);
    return _topology.position_at(dist(rng));
  }
  std::uniform_int_distribution<size_t> dist(0, pool.size() - 1);
  return pool[dist(rng)];
}

bool PassengerSpawner::try_spawn(World& world,
                                 const std::vector<GridPosition>& origins,
                                 const std::vector<GridPosition>& destinations,
                                 TickCount tick,
                                 std::mt19937& rng,
                                 StatsTracker& stats,
                                 TickEvents& events) {
  if (world.idle_passenger_count() >= _config.max_passengers) {
    stats.incr("passenger.spawn_skipped");
    return false;
  }

  for (unsigned int attempt = 0; attempt < MaxPlacementAttempts; ++attempt) {
    GridPosition origin = sample(origins, rng);
    GridPosition destination = sample(destinations, rng);
    if (origin == destination || world.has_idle_passenger_at(origin) || world.is_station_entrance(origin)) {
      continue;
    }
    Passenger& passenger = world.add_passenger(origin, destination, tick);
    events.passenger_spawned.push_back(PassengerSpawnedEvent{passenger.id, origin, destination});
    stats.incr("passenger.spawned");
    return true;
  }

  stats.incr("passenger.spawn_skipped");
  return false;
}

void PassengerSpawner::spawn_initial(World& world, std::mt19937& rng, StatsTracker& stats, TickEvents& events) {
  const EventRegion* initial_region = nullptr;
  for (const EventRegion& region : _regions) {
    if (region.config->is_active(0)) {
      initial_region = &region;
      break;
    }
  }

  static const std::vector<GridPosition> kWholeGrid;
  for (unsigned int i = 0; i < _config.initial_passenger_count; ++i) {
    if (initial_region != nullptr) {
      try_spawn(world, initial_region->origins, initial_region->destinations, 0, rng, stats, events);
    } else {
      try_spawn(world, kWholeGrid, kWholeGrid, 0, rng, stats, events);
    }
  }
}

void PassengerSpawner::tick(World& world, TickCount tick, std::mt19937& rng, StatsTracker& stats, TickEvents& events) {
  static const std::vector<GridPosition> kWholeGrid;

  if (roll(rng, _config.passenger_spawn_rate)) {
    try_spawn(world, kWholeGrid, kWholeGrid, tick, rng, stats, events);
  }

  for (const EventRegion& region : _regions) {
    if (!region.config->is_active(tick)) continue;
    if (roll(rng, region.config->spawn_rate)) {
      if (try_spawn(world, region.origins, region.destinations, tick, rng, stats, events)) {
        stats.incr("passenger_event." + region.config->name + ".spawned");
      }
    }
  }
}
