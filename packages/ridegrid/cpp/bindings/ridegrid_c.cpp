#include "bindings/ridegrid_c.hpp"

#include <pybind11/operators.h>

#include <stdexcept>
#include <utility>

#include "actions/action_space.hpp"
#include "core/topology.hpp"
#include "systems/stats_tracker.hpp"

namespace {

std::vector<std::shared_ptr<ridegrid::env::CarCallback>> callbacks_from_list(const py::list& callbacks) {
  std::vector<std::shared_ptr<ridegrid::env::CarCallback>> result;
  result.reserve(callbacks.size());
  for (const auto& item : callbacks) {
    if (item.is_none()) {
      throw std::invalid_argument("Car callbacks must not be None");
    }
    result.push_back(item.cast<std::shared_ptr<ridegrid::env::CarCallback>>());
  }
  return result;
}

void bind_enums(py::module& m) {
  py::enum_<Direction>(m, "Direction")
      .value("Up", Direction::Up)
      .value("Down", Direction::Down)
      .value("Left", Direction::Left)
      .value("Right", Direction::Right);

  py::enum_<Decision>(m, "Decision")
      .value("GoStraight", Decision::GoStraight)
      .value("TurnLeft", Decision::TurnLeft)
      .value("TurnRight", Decision::TurnRight);

  py::enum_<CarType>(m, "CarType").value("Agent", CarType::Agent).value("Npc", CarType::Npc);

  py::enum_<ActionKind>(m, "ActionKind")
      .value("HeadTowards", ActionKind::HeadTowards)
      .value("PickUpPassenger", ActionKind::PickUpPassenger)
      .value("DropOffPassenger", ActionKind::DropOffPassenger)
      .value("ChargeBattery", ActionKind::ChargeBattery)
      .value("Invalid", ActionKind::Invalid);
}

void bind_positions(py::module& m) {
  py::class_<RoadSection>(m, "RoadSection")
      .def(py::init<>())
      .def(py::init([](Direction direction, GridCoord road_index, GridCoord section_index) {
             return RoadSection{direction, road_index, section_index};
           }),
           py::arg("direction"),
           py::arg("road_index"),
           py::arg("section_index"))
      .def_readwrite("direction", &RoadSection::direction)
      .def_readwrite("road_index", &RoadSection::road_index)
      .def_readwrite("section_index", &RoadSection::section_index)
      .def(py::self == py::self)
      .def("__repr__", &RoadSection::to_string);

  py::class_<GridPosition>(m, "GridPosition")
      .def(py::init<>())
      .def(py::init<Direction, GridCoord, GridCoord, GridCoord>(),
           py::arg("direction"),
           py::arg("road_index"),
           py::arg("section_index"),
           py::arg("position_in_section"))
      .def_readwrite("direction", &GridPosition::direction)
      .def_readwrite("road_index", &GridPosition::road_index)
      .def_readwrite("section_index", &GridPosition::section_index)
      .def_readwrite("position_in_section", &GridPosition::position_in_section)
      .def("section", &GridPosition::section)
      .def(py::self == py::self)
      .def("__repr__", &GridPosition::to_string);

  py::class_<Area>(m, "Area")
      .def(py::init<>())
      .def(py::init([](float x1, float y1, float x2, float y2) { return Area{x1, y1, x2, y2}; }),
           py::arg("x1"),
           py::arg("y1"),
           py::arg("x2"),
           py::arg("y2"))
      .def_readwrite("x1", &Area::x1)
      .def_readwrite("y1", &Area::y1)
      .def_readwrite("x2", &Area::x2)
      .def_readwrite("y2", &Area::y2);
}

void bind_grid_config(py::module& m) {
  py::class_<TopologyConfig>(m, "TopologyConfig")
      .def(py::init<>())
      .def_readwrite("horizontal_roads", &TopologyConfig::horizontal_roads)
      .def_readwrite("vertical_roads", &TopologyConfig::vertical_roads)
      .def_readwrite("horizontal_section_slots", &TopologyConfig::horizontal_section_slots)
      .def_readwrite("vertical_section_slots", &TopologyConfig::vertical_section_slots);

  py::class_<PassengerEventConfig>(m, "PassengerEventConfig")
      .def(py::init<>())
      .def_readwrite("name", &PassengerEventConfig::name)
      .def_readwrite("start_area", &PassengerEventConfig::start_area)
      .def_readwrite("destination_area", &PassengerEventConfig::destination_area)
      .def_readwrite("spawn_rate", &PassengerEventConfig::spawn_rate)
      .def_readwrite("start_tick", &PassengerEventConfig::start_tick)
      .def_readwrite("end_tick", &PassengerEventConfig::end_tick)
      .def("is_active", &PassengerEventConfig::is_active, py::arg("tick"));

  py::class_<GridConfig>(m, "GridConfig")
      .def(py::init<>())
      .def_readwrite("topology", &GridConfig::topology)
      .def_readwrite("traffic_light_toggle_ticks", &GridConfig::traffic_light_toggle_ticks)
      .def_readwrite("initial_passenger_count", &GridConfig::initial_passenger_count)
      .def_readwrite("passenger_spawn_rate", &GridConfig::passenger_spawn_rate)
      .def_readwrite("max_passengers", &GridConfig::max_passengers)
      .def_readwrite("agent_car_count", &GridConfig::agent_car_count)
      .def_readwrite("npc_car_count", &GridConfig::npc_car_count)
      .def_readwrite("passengers_per_car", &GridConfig::passengers_per_car)
      .def_readwrite("discharge_rate", &GridConfig::discharge_rate)
      .def_readwrite("initial_battery", &GridConfig::initial_battery)
      .def_readwrite("charge_rate", &GridConfig::charge_rate)
      .def_readwrite("charging_stations", &GridConfig::charging_stations)
      .def_readwrite("charging_station_capacity", &GridConfig::charging_station_capacity)
      .def_readwrite("car_radius", &GridConfig::car_radius)
      .def_readwrite("passenger_radius", &GridConfig::passenger_radius)
      .def_readwrite("passenger_events", &GridConfig::passenger_events)
      .def_readwrite("deterministic_mode", &GridConfig::deterministic_mode)
      .def_readwrite("verbose", &GridConfig::verbose)
      .def("validate", [](const GridConfig& config) { validate_config(config); });
}

void bind_action(py::module& m) {
  py::class_<Action>(m, "Action")
      .def(py::init<>())
      .def_static("head_towards", &Action::head_towards, py::arg("direction"), py::arg("raw") = -1)
      .def_static("pick_up", &Action::pick_up, py::arg("passenger"), py::arg("raw") = -1)
      .def_static("drop_off", &Action::drop_off, py::arg("passenger"), py::arg("raw") = -1)
      .def_static("charge", &Action::charge, py::arg("station"), py::arg("raw") = -1)
      .def_readwrite("kind", &Action::kind)
      .def_readwrite("direction", &Action::direction)
      .def_readwrite("target", &Action::target)
      .def_readwrite("raw", &Action::raw)
      .def(py::self == py::self)
      .def("__repr__", &Action::to_string);

  py::class_<ActionSpace>(m, "ActionSpace")
      .def(py::init<unsigned int, unsigned int>(), py::arg("passengers_per_car"), py::arg("passenger_radius"))
      .def_property_readonly("size", &ActionSpace::size)
      .def("decode", &ActionSpace::decode, py::arg("state"), py::arg("index"))
      .def("mask", &ActionSpace::mask, py::arg("state"))
      .def("head_towards_index", &ActionSpace::head_towards_index, py::arg("direction"))
      .def("action_names", &ActionSpace::action_names);
}

void bind_grid_state(py::module& m) {
  py::class_<PassengerSpawnedEvent>(m, "PassengerSpawnedEvent")
      .def_readonly("passenger", &PassengerSpawnedEvent::passenger)
      .def_readonly("origin", &PassengerSpawnedEvent::origin)
      .def_readonly("destination", &PassengerSpawnedEvent::destination);
  py::class_<PassengerPickedUpEvent>(m, "PassengerPickedUpEvent")
      .def_readonly("car", &PassengerPickedUpEvent::car)
      .def_readonly("passenger", &PassengerPickedUpEvent::passenger);
  py::class_<PassengerDroppedOffEvent>(m, "PassengerDroppedOffEvent")
      .def_readonly("car", &PassengerDroppedOffEvent::car)
      .def_readonly("passenger", &PassengerDroppedOffEvent::passenger)
      .def_readonly("ticks_since_request", &PassengerDroppedOffEvent::ticks_since_request);
  py::class_<CarOutOfBatteryEvent>(m, "CarOutOfBatteryEvent").def_readonly("car", &CarOutOfBatteryEvent::car);

  py::class_<TickEvents>(m, "TickEvents")
      .def_readonly("passenger_spawned", &TickEvents::passenger_spawned)
      .def_readonly("car_picked_up_passenger", &TickEvents::car_picked_up_passenger)
      .def_readonly("car_dropped_off_passenger", &TickEvents::car_dropped_off_passenger)
      .def_readonly("car_out_of_battery", &TickEvents::car_out_of_battery);

  py::class_<PassengerView>(m, "PassengerView")
      .def_readonly("id", &PassengerView::id)
      .def_readonly("origin", &PassengerView::origin)
      .def_readonly("destination", &PassengerView::destination)
      .def_readonly("ticks_since_request", &PassengerView::ticks_since_request)
      .def_readonly("car", &PassengerView::car)
      .def_readonly("travel_ticks", &PassengerView::travel_ticks)
      .def_readonly("trip_ticks", &PassengerView::trip_ticks);

  py::class_<CarView>(m, "CarView")
      .def_readonly("id", &CarView::id)
      .def_readonly("type", &CarView::type)
      .def_readonly("position", &CarView::position)
      .def_readonly("station", &CarView::station)
      .def_readonly("battery", &CarView::battery)
      .def_readonly("passengers", &CarView::passengers)
      .def_readonly("recent_actions", &CarView::recent_actions)
      .def_readonly("active_action", &CarView::active_action)
      .def_readonly("out_of_battery", &CarView::out_of_battery)
      .def_readonly("ticks_since_out_of_battery", &CarView::ticks_since_out_of_battery)
      .def_readonly("distance", &CarView::distance);

  py::class_<StationView>(m, "StationView")
      .def_readonly("id", &StationView::id)
      .def_readonly("entrance", &StationView::entrance)
      .def_readonly("capacity", &StationView::capacity)
      .def_readonly("occupant_count", &StationView::occupant_count)
      .def_readonly("distance", &StationView::distance)
      .def_readonly("travel_ticks", &StationView::travel_ticks);

  py::class_<GridState>(m, "GridState")
      .def_readonly("width", &GridState::width)
      .def_readonly("height", &GridState::height)
      .def_readonly("pov_car", &GridState::pov_car)
      .def_readonly("other_cars", &GridState::other_cars)
      .def_readonly("idle_passengers", &GridState::idle_passengers)
      .def_readonly("charging_stations", &GridState::charging_stations)
      .def_readonly("events", &GridState::events)
      .def_readonly("ticks_passed", &GridState::ticks_passed)
      .def_readonly("can_turn", &GridState::can_turn)
      .def_readonly("action_valid", &GridState::action_valid)
      .def_readonly("total_passenger_count", &GridState::total_passenger_count)
      .def("dump", &GridState::dump);
}

}  // namespace

RideGrid::RideGrid(const GridConfig& cfg, py::list callbacks, unsigned int seed)
    : _config(cfg), _py_callbacks(std::move(callbacks)), _callbacks(callbacks_from_list(_py_callbacks)), _engine() {
  _engine = std::make_unique<ridegrid::env::RideGridEngine>(_config, _callbacks, seed);
}

RideGrid::~RideGrid() = default;

void RideGrid::tick() {
  _engine->tick();
}

void RideGrid::reset(std::optional<unsigned int> seed) {
  unsigned int next_seed = seed.has_value() ? *seed : _engine->next_episode_seed();
  _engine = std::make_unique<ridegrid::env::RideGridEngine>(_config, _callbacks, next_seed);
}

py::tuple RideGrid::grid_dimensions() const {
  auto [width, height] = _engine->grid_dimensions();
  return py::make_tuple(width, height);
}

Distance RideGrid::calculate_distance(const GridPosition& a, const GridPosition& b) const {
  return _engine->calculate_distance(a, b);
}

Distance RideGrid::travel_ticks(const GridPosition& from, const GridPosition& to) const {
  return _engine->travel_ticks(from, to);
}

GridState RideGrid::state_for(CarId car) const {
  return _engine->state_for(car);
}

size_t RideGrid::total_passenger_count() const {
  return _engine->total_passenger_count();
}

TickCount RideGrid::ticks_passed() const {
  return _engine->ticks_passed();
}

unsigned int RideGrid::seed() const {
  return _engine->seed();
}

py::dict RideGrid::get_episode_stats() const {
  py::dict stats;
  stats["game"] = py::cast(_engine->episode_stats().to_dict());
  stats["ticks"] = py::int_(_engine->ticks_passed());
  return stats;
}

py::list RideGrid::action_success_py() const {
  return py::cast(_engine->action_success());
}

// Pybind11 module definition
PYBIND11_MODULE(ridegrid_c, m) {
  m.doc() = "RideGrid traffic simulation";

  bind_enums(m);
  bind_positions(m);
  bind_grid_config(m);
  bind_action(m);
  bind_grid_state(m);

  py::class_<ridegrid::env::CarCallback, PyCarCallback, std::shared_ptr<ridegrid::env::CarCallback>>(m,
                                                                                                    "CarCallback")
      .def(py::init<>())
      .def("get_action", &ridegrid::env::CarCallback::get_action, py::arg("state"))
      .def("transition_happened",
           &ridegrid::env::CarCallback::transition_happened,
           py::arg("old_state"),
           py::arg("new_state"));

  py::class_<RideGrid>(m, "RideGrid")
      .def(py::init<const GridConfig&, py::list, unsigned int>(),
           py::arg("config"),
           py::arg("callbacks"),
           py::arg("seed") = 0)
      .def("tick", &RideGrid::tick)
      .def("reset", &RideGrid::reset, py::arg("seed") = py::none())
      .def("grid_dimensions", &RideGrid::grid_dimensions)
      .def("calculate_distance", &RideGrid::calculate_distance, py::arg("a"), py::arg("b"))
      .def("travel_ticks", &RideGrid::travel_ticks, py::arg("from"), py::arg("to"))
      .def("state_for", &RideGrid::state_for, py::arg("car"))
      .def("total_passenger_count", &RideGrid::total_passenger_count)
      .def("get_episode_stats", &RideGrid::get_episode_stats)
      .def("action_success", &RideGrid::action_success_py)
      .def_property_readonly("ticks_passed", &RideGrid::ticks_passed)
      .def_property_readonly("seed", &RideGrid::seed)
      .def_property_readonly("config", &RideGrid::config);
}
