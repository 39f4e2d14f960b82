#include <gtest/gtest.h>

#include <memory>
#include <set>
#include <string>
#include <vector>

#include "core/topology.hpp"
#include "core/world.hpp"
#include "env/nearest_passenger_callback.hpp"
#include "env/ridegrid_engine.hpp"
#include "systems/stats_tracker.hpp"
#include "test_utils.hpp"

using ridegrid::env::CarCallback;
using ridegrid::env::NearestPassengerCallback;
using ridegrid::env::RideGridEngine;

class RideGridEngineTest : public ::testing::Test {
protected:
  void SetUp() override {
    cfg = test_utils::create_small_config();
  }

  // Two agents and some background traffic competing for passengers and a single station.
  GridConfig busy_config() const {
    GridConfig busy = test_utils::create_small_config();
    busy.agent_car_count = 2;
    busy.npc_car_count = 3;
    busy.passengers_per_car = 2;
    busy.initial_passenger_count = 3;
    busy.max_passengers = 6;
    busy.passenger_spawn_rate = 0.2f;
    busy.discharge_rate = 0.01f;
    busy.charge_rate = 0.1f;
    busy.charging_station_capacity = 1;
    busy.charging_stations = {GridPosition(Direction::Right, 1, 0, 1)};
    busy.traffic_light_toggle_ticks = 7;
    return busy;
  }

  std::vector<std::shared_ptr<CarCallback>> nearest_drivers(unsigned int count) const {
    std::vector<std::shared_ptr<CarCallback>> callbacks;
    for (unsigned int i = 0; i < count; ++i) {
      callbacks.push_back(std::make_shared<NearestPassengerCallback>());
    }
    return callbacks;
  }

  void expect_consistent_world(const RideGridEngine& engine) const {
    const World& world = engine.world();
    const Topology& topology = engine.topology();

    size_t idle = 0;
    for (const auto& [id, passenger] : world.passengers()) {
      size_t carriers = 0;
      for (const auto& car : world.cars()) {
        if (car->carries(id)) carriers++;
      }
      if (passenger.is_idle()) {
        idle++;
        EXPECT_EQ(0u, carriers) << "idle passenger " << id << " is riding";
      } else {
        EXPECT_EQ(1u, carriers) << "passenger " << id;
        EXPECT_TRUE(world.car(*passenger.car).carries(id));
      }
    }
    EXPECT_LE(idle, engine.config().max_passengers);
    EXPECT_EQ(world.passengers().size(), engine.total_passenger_count());

    std::set<size_t> occupied;
    for (const auto& car : world.cars()) {
      EXPECT_LE(car->passengers.size(), car->passenger_capacity);
      for (PassengerId id : car->passengers) {
        EXPECT_NE(nullptr, world.find_passenger(id));
      }
      EXPECT_GE(car->battery, 0.0f);
      EXPECT_LE(car->battery, 1.0f);

      size_t slot = topology.slot_id(car->position);
      if (car->is_parked()) {
        EXPECT_NE(car->id, world.occupancy()[slot].value_or(car->id + 1));
        EXPECT_TRUE(world.find_station(*car->station)->contains(car->id));
      } else {
        EXPECT_EQ(car->id, *world.occupancy()[slot]);
        EXPECT_TRUE(occupied.insert(slot).second) << "two cars on " << car->position.to_string();
      }
    }
    for (const ChargingStation& station : world.stations()) {
      EXPECT_LE(station.occupants.size(), station.capacity);
    }
  }

  GridConfig cfg;
};

TEST_F(RideGridEngineTest, RejectsWrongCallbackCount) {
  cfg.agent_car_count = 2;
  EXPECT_THROW(RideGridEngine(cfg, nearest_drivers(1), 0), std::invalid_argument);
}

TEST_F(RideGridEngineTest, RejectsNullCallback) {
  std::vector<std::shared_ptr<CarCallback>> callbacks = {nullptr};
  EXPECT_THROW(RideGridEngine(cfg, callbacks, 0), std::invalid_argument);
}

TEST_F(RideGridEngineTest, RejectsInvalidConfig) {
  cfg.passenger_spawn_rate = 2.0f;
  EXPECT_THROW(RideGridEngine(cfg, nearest_drivers(1), 0), std::invalid_argument);
}

TEST_F(RideGridEngineTest, Queries) {
  cfg.npc_car_count = 2;
  RideGridEngine engine(cfg, nearest_drivers(1), 9);

  auto [width, height] = engine.grid_dimensions();
  EXPECT_EQ(3, width);
  EXPECT_EQ(3, height);
  EXPECT_EQ(1u, engine.num_agents());
  EXPECT_EQ(9u, engine.seed());
  EXPECT_EQ(0u, engine.ticks_passed());
  EXPECT_EQ(3u, engine.world().cars().size());
  EXPECT_EQ(CarType::Agent, engine.world().car(0).type);
  EXPECT_EQ(CarType::Npc, engine.world().car(2).type);

  GridPosition a(Direction::Right, 0, 0, 0);
  GridPosition b(Direction::Right, 0, 1, 0);
  EXPECT_EQ(3u, engine.calculate_distance(a, b));
  EXPECT_EQ(engine.calculate_distance(a, b), engine.calculate_distance(b, a));
  EXPECT_EQ(3u, engine.travel_ticks(a, b));
}

TEST_F(RideGridEngineTest, DeliversSinglePassenger) {
  cfg.initial_passenger_count = 1;
  cfg.max_passengers = 1;
  auto driver = std::make_shared<test_utils::CountingCallback>();
  RideGridEngine engine(cfg, {driver}, 5);
  ASSERT_EQ(1u, engine.total_passenger_count());

  for (int i = 0; i < 500 && engine.total_passenger_count() > 0; ++i) {
    engine.tick();
  }

  EXPECT_EQ(0u, engine.total_passenger_count());
  EXPECT_EQ(1u, driver->picked_up);
  EXPECT_EQ(1u, driver->dropped_off);
  EXPECT_EQ(engine.ticks_passed(), driver->transitions());
  EXPECT_FLOAT_EQ(1.0f, engine.episode_stats().get("passenger.picked_up"));
  EXPECT_FLOAT_EQ(1.0f, engine.episode_stats().get("passenger.dropped_off"));
  ASSERT_EQ(1u, engine.tick_events().car_dropped_off_passenger.size());
  EXPECT_EQ(engine.ticks_passed() - 1, engine.tick_events().car_dropped_off_passenger[0].ticks_since_request);
}

TEST_F(RideGridEngineTest, FirstPickUpRequestWins) {
  cfg.agent_car_count = 2;
  cfg.initial_passenger_count = 1;
  // Both drivers chase the only passenger for the whole run.
  auto greedy = [](const GridState&) { return Action::pick_up(0); };
  std::vector<std::shared_ptr<CarCallback>> callbacks = {std::make_shared<test_utils::ScriptedCallback>(greedy),
                                                         std::make_shared<test_utils::ScriptedCallback>(greedy)};
  RideGridEngine engine(cfg, callbacks, 3);
  engine.tick();

  ASSERT_EQ(2u, engine.action_success().size());
  EXPECT_TRUE(engine.action_success()[0]);
  EXPECT_FALSE(engine.action_success()[1]);
  EXPECT_FLOAT_EQ(1.0f, engine.episode_stats().get("action.pick_up_passenger.conflict"));
  EXPECT_FALSE(engine.state_for(1).action_valid);

  // The loser is never granted the passenger and drives on the way it faces.
  size_t moves = 0;
  for (int i = 0; i < 10; ++i) {
    const Car& loser = engine.world().car(1);
    Direction heading = loser.position.direction;
    GridPosition before = loser.position;
    engine.tick();

    EXPECT_FALSE(engine.action_success()[1]) << "tick " << i;
    ASSERT_TRUE(loser.active_action.has_value());
    EXPECT_EQ(Action::head_towards(heading), *loser.active_action);
    EXPECT_TRUE(loser.passengers.empty());
    if (loser.position != before) moves++;
  }
  EXPECT_GT(moves, 0u);
  expect_consistent_world(engine);
}

TEST_F(RideGridEngineTest, DropOffAwayFromDestinationIsReportedInvalid) {
  cfg.initial_passenger_count = 1;
  cfg.max_passengers = 1;
  auto driver = std::make_shared<test_utils::ScriptedCallback>([](const GridState& state) {
    if (!state.pov_car.passengers.empty()) return Action::drop_off(state.pov_car.passengers.front().id);
    if (!state.idle_passengers.empty()) return Action::pick_up(state.idle_passengers.front().id);
    return Action::head_towards(state.pov_car.position.direction);
  });
  RideGridEngine engine(cfg, {driver}, 5);
  ASSERT_EQ(1u, engine.total_passenger_count());
  const Passenger& passenger = engine.world().passengers().begin()->second;
  const Distance trip = engine.travel_ticks(passenger.origin, passenger.destination);

  size_t early_requests = 0;
  for (int i = 0; i < 500 && engine.total_passenger_count() > 0; ++i) {
    engine.tick();
    bool requested_drop_off = !driver->transitions.back().first.pov_car.passengers.empty();
    if (requested_drop_off && !engine.action_success()[0]) {
      early_requests++;
      GridState state = engine.state_for(0);
      EXPECT_FALSE(state.action_valid);
      // Not downgraded: the car keeps heading for the destination.
      ASSERT_TRUE(state.pov_car.active_action.has_value());
      EXPECT_EQ(ActionKind::DropOffPassenger, state.pov_car.active_action->kind);
      ASSERT_EQ(1u, state.pov_car.passengers.size());
      EXPECT_TRUE(state.events.car_dropped_off_passenger.empty());
    }
  }

  EXPECT_EQ(0u, engine.total_passenger_count());
  EXPECT_EQ(trip - 1, early_requests);
  EXPECT_FLOAT_EQ(static_cast<float>(early_requests),
                  engine.episode_stats().get("action.drop_off_passenger.not_at_destination"));
  EXPECT_FLOAT_EQ(1.0f, engine.episode_stats().get("passenger.dropped_off"));
}

TEST_F(RideGridEngineTest, UndecodableActionKeepsCarMoving) {
  auto driver = std::make_shared<test_utils::ScriptedCallback>([](const GridState&) { return Action::invalid(99); });
  RideGridEngine engine(cfg, {driver}, 1);
  GridPosition start = engine.world().car(0).position;
  engine.tick();

  EXPECT_FALSE(engine.action_success()[0]);
  EXPECT_FLOAT_EQ(1.0f, engine.episode_stats().get("action.undecodable"));
  EXPECT_FLOAT_EQ(1.0f, engine.episode_stats().get("action.invalid"));

  GridState state = engine.state_for(0);
  EXPECT_FALSE(state.action_valid);
  ASSERT_TRUE(state.pov_car.active_action.has_value());
  EXPECT_EQ(ActionKind::HeadTowards, state.pov_car.active_action->kind);
  ASSERT_EQ(1u, state.pov_car.recent_actions.size());
  EXPECT_EQ(Action::invalid(99), state.pov_car.recent_actions.front());
  EXPECT_NE(start, state.pov_car.position);
}

TEST_F(RideGridEngineTest, CallbackExceptionsPropagate) {
  RideGridEngine engine(cfg, {std::make_shared<test_utils::ThrowingCallback>()}, 0);
  EXPECT_THROW(engine.tick(), std::runtime_error);
}

TEST_F(RideGridEngineTest, TransitionsBracketEachTick) {
  auto driver = test_utils::keep_going();
  RideGridEngine engine(cfg, {driver}, 2);
  for (int i = 0; i < 3; ++i) {
    engine.tick();
  }

  ASSERT_EQ(3u, driver->transitions.size());
  for (TickCount i = 0; i < 3; ++i) {
    EXPECT_EQ(i, driver->transitions[i].first.ticks_passed);
    EXPECT_EQ(i + 1, driver->transitions[i].second.ticks_passed);
  }
  EXPECT_FLOAT_EQ(3.0f, engine.episode_stats().get("tick"));
  EXPECT_FLOAT_EQ(3.0f, engine.episode_stats().get("ticks_with_passengers.0"));
}

TEST_F(RideGridEngineTest, OutOfBatteryCarIsTowedAndRecharged) {
  cfg.discharge_rate = 0.5f;
  cfg.initial_battery = 0.5f;
  cfg.charge_rate = 0.25f;
  cfg.charging_station_capacity = 1;
  cfg.charging_stations = {GridPosition(Direction::Right, 1, 0, 1)};
  auto driver = test_utils::keep_going();
  RideGridEngine engine(cfg, {driver}, 4);
  const GridPosition entrance = cfg.charging_stations[0];

  engine.tick();
  GridState state = engine.state_for(0);
  EXPECT_TRUE(state.pov_car.out_of_battery);
  ASSERT_TRUE(state.pov_car.station.has_value());
  EXPECT_EQ(0u, *state.pov_car.station);
  EXPECT_EQ(entrance, state.pov_car.position);
  EXPECT_FLOAT_EQ(0.25f, state.pov_car.battery);
  ASSERT_EQ(1u, driver->transitions.back().second.events.car_out_of_battery.size());
  EXPECT_FLOAT_EQ(1.0f, engine.episode_stats().get("car.towed"));

  engine.tick();
  EXPECT_FALSE(engine.action_success()[0]);
  engine.tick();
  state = engine.state_for(0);
  EXPECT_EQ(2u, state.pov_car.ticks_since_out_of_battery);
  EXPECT_FLOAT_EQ(0.75f, state.pov_car.battery);

  engine.tick();
  state = engine.state_for(0);
  EXPECT_FALSE(state.pov_car.out_of_battery);
  EXPECT_FLOAT_EQ(1.0f, state.pov_car.battery);
  EXPECT_TRUE(state.pov_car.station.has_value());
  EXPECT_FLOAT_EQ(1.0f, engine.episode_stats().get("car.recharged"));

  engine.tick();
  state = engine.state_for(0);
  EXPECT_TRUE(engine.action_success()[0]);
  EXPECT_FALSE(state.pov_car.station.has_value());
  EXPECT_EQ(entrance, state.pov_car.position);
  EXPECT_FLOAT_EQ(0.5f, state.pov_car.battery);
  EXPECT_FLOAT_EQ(1.0f, engine.episode_stats().get("charging_station.left"));
  expect_consistent_world(engine);
}

TEST_F(RideGridEngineTest, CarDrivesToStationAndChargesUntilFull) {
  cfg.discharge_rate = 0.01f;
  cfg.initial_battery = 0.5f;
  cfg.charge_rate = 0.25f;
  cfg.charging_station_capacity = 1;
  cfg.charging_stations = {GridPosition(Direction::Right, 1, 0, 1)};
  auto driver = std::make_shared<test_utils::ScriptedCallback>([](const GridState& state) {
    if (state.pov_car.battery < 1.0f) return Action::charge(0);
    return Action::head_towards(state.pov_car.position.direction);
  });
  RideGridEngine engine(cfg, {driver}, 11);
  const Car& car = engine.world().car(0);
  const ChargingStation& station = engine.world().stations().front();

  for (int i = 0; i < 100 && !car.is_parked(); ++i) {
    engine.tick();
    EXPECT_TRUE(engine.action_success()[0]);
  }
  ASSERT_TRUE(car.is_parked());
  EXPECT_EQ(0u, *car.station);
  EXPECT_TRUE(station.contains(car.id));
  EXPECT_TRUE(station.is_entrance(car.position, engine.topology()));
  EXPECT_FALSE(engine.world().is_occupied(car.position));
  EXPECT_FLOAT_EQ(1.0f, engine.episode_stats().get("charging_station.entered"));
  EXPECT_FALSE(car.out_of_battery);

  for (int i = 0; i < 10 && car.battery < 1.0f; ++i) {
    engine.tick();
    EXPECT_TRUE(car.is_parked());
  }
  EXPECT_FLOAT_EQ(1.0f, car.battery);
  EXPECT_TRUE(car.is_parked());
  // A full battery completes the charge.
  EXPECT_FALSE(car.active_action.has_value());

  GridPosition parked_at = car.position;
  engine.tick();
  EXPECT_TRUE(engine.action_success()[0]);
  EXPECT_FALSE(car.is_parked());
  EXPECT_TRUE(station.occupants.empty());
  EXPECT_EQ(parked_at, car.position);
  EXPECT_FLOAT_EQ(1.0f, engine.episode_stats().get("charging_station.left"));
  EXPECT_FLOAT_EQ(1.0f, engine.episode_stats().get("charging_station.entered"));
  expect_consistent_world(engine);
}

TEST_F(RideGridEngineTest, ChargeAtFullStationIsRejected) {
  cfg.agent_car_count = 2;
  cfg.discharge_rate = 0.01f;
  cfg.initial_battery = 0.5f;
  cfg.charge_rate = 0.01f;
  cfg.charging_station_capacity = 1;
  cfg.charging_stations = {GridPosition(Direction::Right, 1, 0, 1)};
  auto charger = [](const GridState& state) {
    if (state.pov_car.battery < 1.0f) return Action::charge(0);
    return Action::head_towards(state.pov_car.position.direction);
  };
  std::vector<std::shared_ptr<CarCallback>> callbacks = {std::make_shared<test_utils::ScriptedCallback>(charger),
                                                         std::make_shared<test_utils::ScriptedCallback>(charger)};
  RideGridEngine engine(cfg, callbacks, 13);
  const ChargingStation& station = engine.world().stations().front();

  for (int i = 0; i < 100 && station.has_space(); ++i) {
    engine.tick();
  }
  ASSERT_FALSE(station.has_space());
  const CarId parked = station.occupants.front();
  const CarId other = parked == 0 ? 1 : 0;

  for (int i = 0; i < 5; ++i) {
    const Car& car = engine.world().car(other);
    Direction heading = car.position.direction;
    engine.tick();

    EXPECT_TRUE(engine.action_success()[parked]);
    EXPECT_FALSE(engine.action_success()[other]);
    ASSERT_TRUE(car.active_action.has_value());
    EXPECT_EQ(Action::head_towards(heading), *car.active_action);
    EXPECT_FALSE(car.is_parked());
    EXPECT_EQ(1u, station.occupants.size());
    EXPECT_TRUE(engine.world().car(parked).is_parked());
  }
  EXPECT_GE(engine.episode_stats().get("action.charge_battery.failed"), 5.0f);
  EXPECT_FLOAT_EQ(1.0f, engine.episode_stats().get("charging_station.entered"));
  expect_consistent_world(engine);
}

TEST_F(RideGridEngineTest, OutOfBatteryCarWithoutStationStaysPut) {
  cfg.discharge_rate = 0.5f;
  cfg.initial_battery = 0.5f;
  RideGridEngine engine(cfg, {test_utils::keep_going()}, 6);

  engine.tick();
  GridPosition stranded = engine.world().car(0).position;
  ASSERT_TRUE(engine.world().car(0).out_of_battery);

  for (int i = 0; i < 5; ++i) {
    engine.tick();
    EXPECT_FALSE(engine.action_success()[0]);
    EXPECT_EQ(stranded, engine.world().car(0).position);
    EXPECT_FLOAT_EQ(0.0f, engine.world().car(0).battery);
  }
  EXPECT_EQ(5u, engine.world().car(0).ticks_since_out_of_battery);
  EXPECT_FLOAT_EQ(1.0f, engine.episode_stats().get("car.out_of_battery"));
}

TEST_F(RideGridEngineTest, NpcCarsNeverDischarge) {
  cfg.npc_car_count = 2;
  cfg.discharge_rate = 0.01f;
  cfg.initial_battery = 0.5f;
  RideGridEngine engine(cfg, {test_utils::keep_going()}, 8);
  for (int i = 0; i < 20; ++i) {
    engine.tick();
  }
  EXPECT_FLOAT_EQ(0.5f, engine.world().car(1).battery);
  EXPECT_FLOAT_EQ(0.5f, engine.world().car(2).battery);
  EXPECT_LT(engine.world().car(0).battery, 0.5f);
}

TEST_F(RideGridEngineTest, RedLightHoldsVerticalTraffic) {
  cfg.traffic_light_toggle_ticks = 1000;
  RideGridEngine engine(cfg, {test_utils::keep_going()}, 10);
  for (int i = 0; i < 50; ++i) {
    engine.tick();
  }
  const Car& car = engine.world().car(0);
  EXPECT_EQ(Orientation::Vertical, orientation_of(car.position.direction));
  EXPECT_TRUE(engine.topology().is_at_intersection(car.position));
}

TEST_F(RideGridEngineTest, SnapshotsAreWindowedAndSorted) {
  cfg.npc_car_count = 4;
  cfg.car_radius = 2;
  cfg.passenger_radius = 2;
  cfg.initial_passenger_count = 5;
  cfg.max_passengers = 5;
  RideGridEngine engine(cfg, {test_utils::keep_going()}, 12);

  GridState state = engine.state_for(0);
  EXPECT_EQ(3, state.width);
  EXPECT_EQ(3, state.height);
  EXPECT_EQ(0u, state.pov_car.id);
  EXPECT_EQ(0u, state.pov_car.distance);
  EXPECT_EQ(5u, state.total_passenger_count);

  ASSERT_EQ(2u, state.other_cars.size());
  EXPECT_LE(state.other_cars[0].distance, state.other_cars[1].distance);
  for (const CarView& other : state.other_cars) {
    EXPECT_NE(0u, other.id);
    EXPECT_EQ(engine.calculate_distance(state.pov_car.position, other.position), other.distance);
  }

  ASSERT_EQ(2u, state.idle_passengers.size());
  EXPECT_LE(state.idle_passengers[0].travel_ticks, state.idle_passengers[1].travel_ticks);
  for (const PassengerView& passenger : state.idle_passengers) {
    EXPECT_EQ(engine.travel_ticks(state.pov_car.position, passenger.origin), passenger.travel_ticks);
    EXPECT_FALSE(passenger.car.has_value());
  }
}

TEST_F(RideGridEngineTest, SameSeedSameEpisode) {
  GridConfig busy = busy_config();
  RideGridEngine first(busy, nearest_drivers(2), 123);
  RideGridEngine second(busy, nearest_drivers(2), 123);

  for (int i = 0; i < 100; ++i) {
    first.tick();
    second.tick();
    ASSERT_EQ(first.state_for(0).dump(), second.state_for(0).dump()) << "diverged at tick " << i;
    ASSERT_EQ(first.state_for(1).dump(), second.state_for(1).dump()) << "diverged at tick " << i;
  }
  EXPECT_EQ(first.episode_stats().csv_header(), second.episode_stats().csv_header());
  EXPECT_EQ(first.episode_stats().csv_row(), second.episode_stats().csv_row());
  EXPECT_EQ(first.next_episode_seed(), second.next_episode_seed());
}

TEST_F(RideGridEngineTest, WorldStaysConsistent) {
  GridConfig busy = busy_config();
  RideGridEngine engine(busy, nearest_drivers(2), 77);
  expect_consistent_world(engine);
  for (int i = 0; i < 300; ++i) {
    engine.tick();
    expect_consistent_world(engine);
    if (HasFailure()) {
      FAIL() << "inconsistent after tick " << engine.ticks_passed();
    }
  }
  EXPECT_GT(engine.episode_stats().get("passenger.spawned"), 0.0f);
}

TEST_F(RideGridEngineTest, VerboseModeLogsEveryTick) {
  cfg.verbose = true;
  RideGridEngine engine(cfg, {test_utils::keep_going()}, 0);

  testing::internal::CaptureStdout();
  engine.tick();
  std::string output = testing::internal::GetCapturedStdout();

  EXPECT_NE(std::string::npos, output.find("Tick: 1"));
  EXPECT_NE(std::string::npos, output.find("car 0: head_towards("));
}
