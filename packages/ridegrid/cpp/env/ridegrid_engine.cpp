#include "env/ridegrid_engine.hpp"

#include <algorithm>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

#include "actions/action_handler.hpp"
#include "actions/charge_battery.hpp"
#include "actions/drop_off_passenger.hpp"
#include "actions/head_towards.hpp"
#include "actions/pick_up_passenger.hpp"
#include "core/pathfinder.hpp"
#include "core/traffic_lights.hpp"
#include "core/world.hpp"
#include "objects/car.hpp"
#include "objects/charging_station.hpp"
#include "objects/passenger.hpp"
#include "supervisors/npc_policy.hpp"
#include "systems/passenger_spawner.hpp"
#include "systems/stats_tracker.hpp"

namespace ridegrid::env {

namespace {

unsigned int resolve_seed(const GridConfig& config, unsigned int seed) {
  if (config.deterministic_mode) {
    return seed;
  }
  std::random_device device;
  return device();
}

}  // namespace

RideGridEngine::RideGridEngine(const GridConfig& config,
                               std::vector<std::shared_ptr<CarCallback>> callbacks,
                               unsigned int seed)
    : _config(config),
      _topology(nullptr),
      _pathfinder(nullptr),
      _world(nullptr),
      _traffic_lights(nullptr),
      _spawner(nullptr),
      _npc_policy(nullptr),
      _stats(nullptr),
      _action_handlers(),
      _callbacks(std::move(callbacks)),
      _action_success(),
      _tick_events(),
      _ticks_passed(0),
      _rng(),
      _seed(resolve_seed(config, seed)) {
  validate_config(_config);

  if (_callbacks.size() != _config.agent_car_count) {
    throw std::invalid_argument("Expected " + std::to_string(_config.agent_car_count) + " car callbacks, got " +
                                std::to_string(_callbacks.size()));
  }
  for (size_t i = 0; i < _callbacks.size(); ++i) {
    if (!_callbacks[i]) {
      throw std::invalid_argument("Car callback " + std::to_string(i) + " is null");
    }
  }

  _rng.seed(_seed);

  _topology = std::make_unique<Topology>(_config.topology);
  _pathfinder = std::make_unique<Pathfinder>(*_topology);
  _world = std::make_unique<World>(*_topology);
  _traffic_lights = std::make_unique<TrafficLights>(_config.traffic_light_toggle_ticks);
  _spawner = std::make_unique<PassengerSpawner>(_config, *_topology);
  _npc_policy = std::make_unique<RandomTurnsPolicy>(*_topology);
  _stats = std::make_unique<StatsTracker>();

  for (const GridPosition& entrance : _config.charging_stations) {
    _world->add_station(entrance, _config.charging_station_capacity, _config.charge_rate);
  }

  _action_handlers.resize(ActionKindCount);
  _action_handlers[static_cast<size_t>(ActionKind::HeadTowards)] = std::make_unique<HeadTowards>();
  _action_handlers[static_cast<size_t>(ActionKind::PickUpPassenger)] = std::make_unique<PickUpPassenger>();
  _action_handlers[static_cast<size_t>(ActionKind::DropOffPassenger)] = std::make_unique<DropOffPassenger>();
  _action_handlers[static_cast<size_t>(ActionKind::ChargeBattery)] = std::make_unique<ChargeBattery>();
  for (auto& handler : _action_handlers) {
    if (handler) {
      handler->init(_world.get(), _stats.get());
    }
  }

  _action_success.assign(_config.agent_car_count, true);

  place_cars();
  _spawner->spawn_initial(*_world, _rng, *_stats, _tick_events);
}

RideGridEngine::~RideGridEngine() = default;

const World& RideGridEngine::world() const {
  return *_world;
}

const TrafficLights& RideGridEngine::traffic_lights() const {
  return *_traffic_lights;
}

StatsTracker& RideGridEngine::stats() {
  return *_stats;
}

const StatsTracker& RideGridEngine::episode_stats() const {
  return *_stats;
}

Distance RideGridEngine::calculate_distance(const GridPosition& a, const GridPosition& b) const {
  return _topology->distance(a, b);
}

Distance RideGridEngine::travel_ticks(const GridPosition& from, const GridPosition& to) const {
  return _pathfinder->travel_ticks(from, to);
}

size_t RideGridEngine::total_passenger_count() const {
  return _world->passengers().size();
}

unsigned int RideGridEngine::next_episode_seed() {
  return static_cast<unsigned int>(_rng());
}

GridState RideGridEngine::state_for(CarId car) const {
  return build_state(_world->car(car));
}

void RideGridEngine::place_cars() {
  std::vector<size_t> free_slots(_topology->slot_count());
  for (size_t i = 0; i < free_slots.size(); ++i) {
    free_slots[i] = i;
  }

  const unsigned int total = _config.agent_car_count + _config.npc_car_count;
  const float battery = _config.effective_initial_battery();
  for (unsigned int i = 0; i < total; ++i) {
    std::uniform_int_distribution<size_t> pick(0, free_slots.size() - 1);
    size_t index = pick(_rng);
    GridPosition position = _topology->position_at(free_slots[index]);
    free_slots[index] = free_slots.back();
    free_slots.pop_back();

    // Agents take ids 0..agent_car_count-1, matching their callback index.
    CarType type = i < _config.agent_car_count ? CarType::Agent : CarType::Npc;
    _world->add_car(type, position, battery, _config.passengers_per_car);
  }
}

void RideGridEngine::tick() {
  _world->begin_tick();
  _tick_events.clear();
  for (const auto& car : _world->cars()) {
    car->moved_this_tick = false;
  }

  std::vector<GridState> old_states;
  old_states.reserve(_callbacks.size());
  for (CarId id = 0; id < _callbacks.size(); ++id) {
    old_states.push_back(build_state(_world->car(id)));
  }

  std::vector<Action> actions;
  actions.reserve(_callbacks.size());
  for (CarId id = 0; id < _callbacks.size(); ++id) {
    actions.push_back(_callbacks[id]->get_action(old_states[id]));
  }

  _traffic_lights->tick();
  resolve_actions(actions);
  move_cars();
  update_batteries();
  tow_cars();
  charge_cars();
  pick_up_passengers();
  drop_off_passengers();
  _spawner->tick(*_world, _ticks_passed, _rng, *_stats, _tick_events);

  _ticks_passed += 1;
  record_tick_stats();

  if (_config.verbose) {
    log_tick(actions);
  }

  for (CarId id = 0; id < _callbacks.size(); ++id) {
    GridState new_state = build_state(_world->car(id));
    _callbacks[id]->transition_happened(old_states[id], new_state);
  }
}

void RideGridEngine::resolve_actions(const std::vector<Action>& actions) {
  for (CarId id = 0; id < actions.size(); ++id) {
    Car& car = _world->car(id);
    const Action& action = actions[id];
    car.record_action(action);

    bool accepted = false;
    if (action.kind != ActionKind::Invalid) {
      accepted = _action_handlers[static_cast<size_t>(action.kind)]->handle_action(car, action);
    } else {
      _stats->incr("action.undecodable");
    }

    if (accepted) {
      car.active_action = action;
    } else if (car.out_of_battery) {
      car.active_action.reset();
    } else {
      // Rejected actions keep the car going the way it faces.
      _stats->incr("action.invalid");
      car.active_action = Action::head_towards(car.position.direction, action.raw);
    }
    car.last_action_valid = accepted;
    _action_success[id] = accepted;
  }
}

void RideGridEngine::move_cars() {
  // Cars may not enter a slot that was occupied when movement started, even if it has been vacated since.
  const std::vector<std::optional<CarId>> start_occupancy = _world->occupancy();
  for (const auto& car : _world->cars()) {
    move_car(*car, start_occupancy);
  }
}

std::optional<GridPosition> RideGridEngine::navigation_target(const Car& car) const {
  if (!car.active_action.has_value()) {
    return std::nullopt;
  }
  const Action& action = *car.active_action;
  switch (action.kind) {
    case ActionKind::PickUpPassenger: {
      const Passenger* passenger = _world->find_passenger(action.target);
      if (passenger != nullptr) return passenger->origin;
      return std::nullopt;
    }
    case ActionKind::DropOffPassenger: {
      const Passenger* passenger = _world->find_passenger(action.target);
      if (passenger != nullptr) return passenger->destination;
      return std::nullopt;
    }
    case ActionKind::ChargeBattery: {
      const ChargingStation* station = _world->find_station(action.target);
      if (station == nullptr) return std::nullopt;
      if (station->is_entrance(car.position, *_topology)) return car.position;
      // Either lane at the entrance will do; take the quicker one.
      GridPosition near_side = station->entrance;
      GridPosition far_side = _topology->other_side_of_road(near_side);
      return _pathfinder->travel_ticks(car.position, far_side) < _pathfinder->travel_ticks(car.position, near_side)
                 ? far_side
                 : near_side;
    }
    case ActionKind::HeadTowards:
    case ActionKind::Invalid:
      return std::nullopt;
  }
  return std::nullopt;
}

Decision RideGridEngine::decide_at_intersection(Car& car, const std::optional<GridPosition>& target) {
  if (!car.is_agent()) {
    return _npc_policy->decide(car, _rng);
  }

  if (target.has_value()) {
    auto decision = _pathfinder->next_decision(car.position, *target);
    if (decision.has_value()) return *decision;
  }

  Direction heading = car.position.direction;
  if (car.active_action.has_value() && car.active_action->kind == ActionKind::HeadTowards) {
    heading = car.active_action->direction;
  }
  return HeadTowards::choose_decision(*_topology, car.position.section(), heading);
}

void RideGridEngine::move_car(Car& car, const std::vector<std::optional<CarId>>& start_occupancy) {
  if (car.out_of_battery) {
    return;
  }

  if (car.is_parked()) {
    const auto& action = car.active_action;
    bool keep_charging = action.has_value() && action->kind == ActionKind::ChargeBattery &&
                         action->target == *car.station && car.battery < 1.0f;
    if (keep_charging) {
      return;
    }
    size_t slot = _topology->slot_id(car.position);
    if (start_occupancy[slot].has_value() || _world->occupancy()[slot].has_value()) {
      return;
    }
    _world->unpark_car(car, car.position);
    car.moved_this_tick = true;
    _stats->incr("charging_station.left");
    return;
  }

  std::optional<GridPosition> target = navigation_target(car);
  if (target.has_value() && car.position == *target) {
    if (car.active_action->kind == ActionKind::ChargeBattery) {
      ChargingStation* station = _world->find_station(car.active_action->target);
      if (station != nullptr && station->has_space()) {
        _world->park_car(car, *station);
        _stats->incr("charging_station.entered");
      }
    }
    // Arrived; wait here for the pick-up or drop-off.
    return;
  }

  GridPosition next;
  if (!_topology->is_at_intersection(car.position)) {
    next = car.position;
    next.position_in_section += 1;
  } else {
    if (!_traffic_lights->is_green(car.position.direction)) {
      return;
    }
    Decision decision = decide_at_intersection(car, target);
    next = GridPosition(*_topology->take_decision(car.position.section(), decision), 0);
  }

  size_t slot = _topology->slot_id(next);
  if (start_occupancy[slot].has_value() || _world->occupancy()[slot].has_value()) {
    _stats->incr("car.blocked");
    return;
  }
  _world->move_car(car, next);
  car.moved_this_tick = true;
}

void RideGridEngine::update_batteries() {
  for (const auto& car_ptr : _world->cars()) {
    Car& car = *car_ptr;
    if (!car.is_agent()) continue;

    if (car.out_of_battery) {
      if (car.ticks_since_out_of_battery < std::numeric_limits<unsigned int>::max()) {
        car.ticks_since_out_of_battery += 1;
      }
      continue;
    }

    if (car.moved_this_tick) {
      car.discharge(_config.discharge_rate);
    }
    if (car.battery <= 0.0f && !car.is_parked()) {
      car.out_of_battery = true;
      car.ticks_since_out_of_battery = 0;
      car.active_action.reset();
      _tick_events.car_out_of_battery.push_back(CarOutOfBatteryEvent{car.id});
      _stats->incr("car.out_of_battery");
    }
  }
}

void RideGridEngine::tow_cars() {
  for (const auto& car_ptr : _world->cars()) {
    Car& car = *car_ptr;
    if (!car.out_of_battery || car.is_parked()) continue;

    ChargingStation* nearest = nullptr;
    Distance best = std::numeric_limits<Distance>::max();
    for (ChargingStation& station : _world->stations()) {
      if (!station.has_space()) continue;
      Distance distance = _topology->distance(car.position, station.entrance);
      if (distance < best) {
        best = distance;
        nearest = &station;
      }
    }
    if (nearest == nullptr) continue;

    _world->park_car(car, *nearest);
    car.position = nearest->entrance;
    _stats->incr("car.towed");
  }
}

void RideGridEngine::charge_cars() {
  for (const auto& car_ptr : _world->cars()) {
    Car& car = *car_ptr;
    if (!car.is_parked()) continue;

    const ChargingStation* station = _world->find_station(*car.station);
    car.charge(station->charge_rate);
    if (car.battery >= 1.0f) {
      if (car.out_of_battery) {
        car.out_of_battery = false;
        _stats->incr("car.recharged");
      }
      if (car.active_action.has_value() && car.active_action->kind == ActionKind::ChargeBattery) {
        car.active_action.reset();
      }
    }
  }
}

void RideGridEngine::pick_up_passengers() {
  for (const auto& car_ptr : _world->cars()) {
    Car& car = *car_ptr;
    if (car.is_parked() || !car.active_action.has_value() ||
        car.active_action->kind != ActionKind::PickUpPassenger) {
      continue;
    }
    Passenger* passenger = _world->find_passenger(car.active_action->target);
    if (passenger == nullptr || !passenger->is_idle() || !car.has_free_seat()) continue;
    if (car.position != passenger->origin) continue;

    _world->board(car, *passenger);
    _tick_events.car_picked_up_passenger.push_back(PassengerPickedUpEvent{car.id, passenger->id});
    _stats->incr("passenger.picked_up");
    car.active_action.reset();
  }
}

void RideGridEngine::drop_off_passengers() {
  for (const auto& car_ptr : _world->cars()) {
    Car& car = *car_ptr;
    if (!car.active_action.has_value() || car.active_action->kind != ActionKind::DropOffPassenger) {
      continue;
    }
    const Passenger* passenger = _world->find_passenger(car.active_action->target);
    if (passenger == nullptr || !car.carries(passenger->id)) continue;

    if (car.is_parked() || car.position != passenger->destination) {
      // Still on the way: nothing dropped this tick, which the driver sees as an invalid action.
      _stats->incr("action.drop_off_passenger.not_at_destination");
      car.last_action_valid = false;
      _action_success[car.id] = false;
      continue;
    }

    PassengerDroppedOffEvent event{car.id, passenger->id, passenger->ticks_since_request(_ticks_passed)};
    _world->drop_off(car, passenger->id);
    _tick_events.car_dropped_off_passenger.push_back(event);
    _stats->incr("passenger.dropped_off");
    car.active_action.reset();
  }
}

void RideGridEngine::record_tick_stats() {
  _stats->incr("tick");
  for (CarId id = 0; id < _callbacks.size(); ++id) {
    _stats->incr("ticks_with_passengers." + std::to_string(_world->car(id).passengers.size()));
  }
}

void RideGridEngine::log_tick(const std::vector<Action>& actions) const {
  std::cout << "Tick: " << _ticks_passed;
  for (CarId id = 0; id < actions.size(); ++id) {
    std::cout << " | car " << id << ": " << actions[id].to_string() << (_action_success[id] ? "" : " (invalid)");
  }
  std::cout << " | spawned=" << _tick_events.passenger_spawned.size()
            << " picked_up=" << _tick_events.car_picked_up_passenger.size()
            << " dropped_off=" << _tick_events.car_dropped_off_passenger.size()
            << " out_of_battery=" << _tick_events.car_out_of_battery.size() << std::endl;
}

PassengerView RideGridEngine::passenger_view(const Passenger& passenger, const Car& observer) const {
  PassengerView view;
  view.id = passenger.id;
  view.origin = passenger.origin;
  view.destination = passenger.destination;
  view.ticks_since_request = passenger.ticks_since_request(_ticks_passed);
  view.car = passenger.car;
  view.travel_ticks = _pathfinder->travel_ticks(observer.position,
                                                passenger.is_idle() ? passenger.origin : passenger.destination);
  view.trip_ticks = _pathfinder->travel_ticks(passenger.origin, passenger.destination);
  return view;
}

CarView RideGridEngine::car_view(const Car& car, const Car& observer) const {
  CarView view;
  view.id = car.id;
  view.type = car.type;
  view.position = car.position;
  view.station = car.station;
  view.battery = car.battery;
  for (PassengerId id : car.passengers) {
    const Passenger* passenger = _world->find_passenger(id);
    if (passenger != nullptr) {
      view.passengers.push_back(passenger_view(*passenger, car));
    }
  }
  view.recent_actions.assign(car.recent_actions.begin(), car.recent_actions.end());
  view.active_action = car.active_action;
  view.out_of_battery = car.out_of_battery;
  view.ticks_since_out_of_battery = car.ticks_since_out_of_battery;
  view.distance = _topology->distance(observer.position, car.position);
  return view;
}

GridState RideGridEngine::build_state(const Car& car) const {
  GridState state;
  auto [width, height] = _topology->dimensions();
  state.width = width;
  state.height = height;
  state.pov_car = car_view(car, car);

  for (const auto& other : _world->cars()) {
    if (other->id == car.id) continue;
    state.other_cars.push_back(car_view(*other, car));
  }
  std::sort(state.other_cars.begin(), state.other_cars.end(), [](const CarView& a, const CarView& b) {
    return a.distance != b.distance ? a.distance < b.distance : a.id < b.id;
  });
  if (state.other_cars.size() > _config.car_radius) {
    state.other_cars.resize(_config.car_radius);
  }

  for (const auto& [id, passenger] : _world->passengers()) {
    if (passenger.is_idle()) {
      state.idle_passengers.push_back(passenger_view(passenger, car));
    }
  }
  std::sort(state.idle_passengers.begin(),
            state.idle_passengers.end(),
            [](const PassengerView& a, const PassengerView& b) {
              return a.travel_ticks != b.travel_ticks ? a.travel_ticks < b.travel_ticks : a.id < b.id;
            });
  if (state.idle_passengers.size() > _config.passenger_radius) {
    state.idle_passengers.resize(_config.passenger_radius);
  }

  for (const ChargingStation& station : _world->stations()) {
    StationView view;
    view.id = station.id;
    view.entrance = station.entrance;
    view.capacity = station.capacity;
    view.occupant_count = static_cast<unsigned int>(station.occupants.size());
    view.distance = _topology->distance(car.position, station.entrance);
    GridPosition far_side = _topology->other_side_of_road(station.entrance);
    view.travel_ticks = std::min(_pathfinder->travel_ticks(car.position, station.entrance),
                                 _pathfinder->travel_ticks(car.position, far_side));
    state.charging_stations.push_back(view);
  }
  std::sort(state.charging_stations.begin(),
            state.charging_stations.end(),
            [](const StationView& a, const StationView& b) {
              return a.distance != b.distance ? a.distance < b.distance : a.id < b.id;
            });

  state.events = _tick_events;
  state.ticks_passed = _ticks_passed;
  state.can_turn = !car.is_parked() && _topology->is_at_intersection(car.position) &&
                   _topology->possible_decisions(car.position.section()).size() > 1;
  state.action_valid = car.last_action_valid;
  state.total_passenger_count = _world->passengers().size();
  return state;
}

}  // namespace ridegrid::env
