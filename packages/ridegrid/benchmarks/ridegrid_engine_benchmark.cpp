#include <benchmark/benchmark.h>

#include <memory>
#include <string>
#include <vector>

#include "config/ridegrid_config.hpp"
#include "env/nearest_passenger_callback.hpp"
#include "env/ridegrid_engine.hpp"

// Helper: a busy city with agents, background traffic, stations and a commuter event
GridConfig CreateBenchmarkConfig(unsigned int num_agents) {
  GridConfig cfg;
  cfg.topology.horizontal_roads = 10;
  cfg.topology.vertical_roads = 15;
  cfg.agent_car_count = num_agents;
  cfg.npc_car_count = 20;
  cfg.passengers_per_car = 2;
  cfg.initial_passenger_count = 10;
  cfg.max_passengers = 30;
  cfg.passenger_spawn_rate = 0.2f;
  cfg.discharge_rate = 0.002f;
  cfg.charge_rate = 0.05f;
  cfg.charging_station_capacity = 2;
  cfg.charging_stations = {GridPosition(Direction::Right, 2, 3, 1), GridPosition(Direction::Down, 8, 5, 2)};
  cfg.car_radius = 5;
  cfg.passenger_radius = 5;
  cfg.deterministic_mode = true;

  PassengerEventConfig rush_hour;
  rush_hour.name = "rush_hour";
  rush_hour.start_area = Area{0.0f, 0.0f, 4.0f, 4.0f};
  rush_hour.destination_area = Area{-5.0f, -5.0f, -1.0f, -1.0f};
  rush_hour.spawn_rate = 0.1f;
  rush_hour.start_tick = 200;
  rush_hour.end_tick = 600;
  cfg.passenger_events.push_back(rush_hour);
  return cfg;
}

class RideGridBenchmark : public benchmark::Fixture {
public:
  void SetUp(const ::benchmark::State&) override {
    num_agents = 8;
    std::vector<std::shared_ptr<ridegrid::env::CarCallback>> callbacks;
    for (unsigned int i = 0; i < num_agents; ++i) {
      callbacks.push_back(std::make_shared<ridegrid::env::NearestPassengerCallback>());
    }
    try {
      engine = std::make_unique<ridegrid::env::RideGridEngine>(CreateBenchmarkConfig(num_agents), callbacks, 42);
    } catch (const std::exception& e) {
      setup_error = std::string("Failed to create engine: ") + e.what();
      return;
    }
    setup_error.clear();
  }

  void TearDown(const ::benchmark::State&) override {
    engine.reset();
  }

protected:
  std::unique_ptr<ridegrid::env::RideGridEngine> engine;
  unsigned int num_agents{};
  std::string setup_error;
};

BENCHMARK_F(RideGridBenchmark, Tick)(benchmark::State& state) {
  if (!setup_error.empty()) {
    state.SkipWithError(setup_error.c_str());
    return;
  }

  for (auto _ : state) {
    engine->tick();
  }

  if (state.iterations() > 0) {
    state.counters[std::string("tick_rate")] =
        benchmark::Counter(static_cast<double>(state.iterations()), benchmark::Counter::kIsRate);
    state.counters[std::string("agent_rate")] = benchmark::Counter(
        static_cast<double>(state.iterations()) * static_cast<double>(num_agents), benchmark::Counter::kIsRate);
  }
}

int main(int argc, char** argv) {
  ::benchmark::Initialize(&argc, argv);
  ::benchmark::RunSpecifiedBenchmarks();
  ::benchmark::Shutdown();
  return 0;
}
