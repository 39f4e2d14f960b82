#include "config/config_json.hpp"

#include <fstream>
#include <initializer_list>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

void reject_unknown_keys(const json& object, std::initializer_list<const char*> allowed, const std::string& where) {
  if (!object.is_object()) {
    throw std::invalid_argument(where + " must be a JSON object");
  }
  std::set<std::string> known(allowed.begin(), allowed.end());
  for (const auto& [key, value] : object.items()) {
    if (!known.contains(key)) {
      throw std::invalid_argument("Unknown key '" + key + "' in " + where);
    }
  }
}

unsigned int read_unsigned(const json& object, const char* key, unsigned int fallback) {
  if (!object.contains(key)) return fallback;
  const json& value = object[key];
  if (!value.is_number_unsigned() || value.get<uint64_t>() > std::numeric_limits<unsigned int>::max()) {
    throw std::invalid_argument(std::string("'") + key + "' must be a non-negative integer");
  }
  return value.get<unsigned int>();
}

GridCoord read_coord(const json& object, const char* key, GridCoord fallback) {
  unsigned int value = read_unsigned(object, key, fallback);
  if (value > std::numeric_limits<GridCoord>::max()) {
    throw std::invalid_argument(std::string("'") + key + "' is too large");
  }
  return static_cast<GridCoord>(value);
}

float read_float(const json& object, const char* key, float fallback) {
  if (!object.contains(key)) return fallback;
  const json& value = object[key];
  if (!value.is_number()) {
    throw std::invalid_argument(std::string("'") + key + "' must be a number");
  }
  return value.get<float>();
}

bool read_bool(const json& object, const char* key, bool fallback) {
  if (!object.contains(key)) return fallback;
  const json& value = object[key];
  if (!value.is_boolean()) {
    throw std::invalid_argument(std::string("'") + key + "' must be true or false");
  }
  return value.get<bool>();
}

Area area_from_json(const json& value, const std::string& where) {
  if (!value.is_array() || value.size() != 4) {
    throw std::invalid_argument(where + " must be an array [x1, y1, x2, y2]");
  }
  for (const json& coord : value) {
    if (!coord.is_number()) {
      throw std::invalid_argument(where + " must contain numbers");
    }
  }
  return Area{value[0].get<float>(), value[1].get<float>(), value[2].get<float>(), value[3].get<float>()};
}

PassengerEventConfig passenger_event_from_json(const json& value) {
  reject_unknown_keys(value, {"name", "start_area", "destination_area", "spawn_rate", "start_tick", "end_tick"},
                      "passenger event");
  PassengerEventConfig event;
  if (!value.contains("name") || !value["name"].is_string()) {
    throw std::invalid_argument("Passenger event needs a string 'name'");
  }
  event.name = value["name"].get<std::string>();
  const std::string where = "passenger event '" + event.name + "'";
  if (!value.contains("start_area") || !value.contains("destination_area")) {
    throw std::invalid_argument(where + " needs 'start_area' and 'destination_area'");
  }
  event.start_area = area_from_json(value["start_area"], where + " start_area");
  event.destination_area = area_from_json(value["destination_area"], where + " destination_area");
  event.spawn_rate = read_float(value, "spawn_rate", 0.0f);
  if (value.contains("start_tick")) event.start_tick = read_unsigned(value, "start_tick", 0);
  if (value.contains("end_tick")) event.end_tick = read_unsigned(value, "end_tick", 0);
  return event;
}

}  // namespace

Direction direction_from_string(const std::string& name) {
  if (name == "up") return Direction::Up;
  if (name == "down") return Direction::Down;
  if (name == "left") return Direction::Left;
  if (name == "right") return Direction::Right;
  throw std::invalid_argument("Unknown direction '" + name + "'");
}

GridPosition grid_position_from_json(const json& value) {
  reject_unknown_keys(value, {"direction", "road", "section", "position"}, "grid position");
  if (!value.contains("direction") || !value["direction"].is_string()) {
    throw std::invalid_argument("Grid position needs a string 'direction'");
  }
  return GridPosition(direction_from_string(value["direction"].get<std::string>()),
                      read_coord(value, "road", 0),
                      read_coord(value, "section", 0),
                      read_coord(value, "position", 0));
}

json grid_position_to_json(const GridPosition& position) {
  return json{{"direction", direction_name(position.direction)},
              {"road", position.road_index},
              {"section", position.section_index},
              {"position", position.position_in_section}};
}

GridConfig grid_config_from_json(const json& cfg) {
  reject_unknown_keys(cfg,
                      {"topology",
                       "traffic_light_toggle_ticks",
                       "initial_passenger_count",
                       "passenger_spawn_rate",
                       "max_passengers",
                       "agent_car_count",
                       "npc_car_count",
                       "passengers_per_car",
                       "discharge_rate",
                       "initial_battery",
                       "charge_rate",
                       "charging_stations",
                       "charging_station_capacity",
                       "car_radius",
                       "passenger_radius",
                       "passenger_events",
                       "deterministic_mode",
                       "verbose"},
                      "grid config");

  GridConfig config;
  if (cfg.contains("topology")) {
    const json& topology = cfg["topology"];
    reject_unknown_keys(
        topology,
        {"horizontal_roads", "vertical_roads", "horizontal_section_slots", "vertical_section_slots"},
        "topology");
    config.topology.horizontal_roads = read_coord(topology, "horizontal_roads", config.topology.horizontal_roads);
    config.topology.vertical_roads = read_coord(topology, "vertical_roads", config.topology.vertical_roads);
    config.topology.horizontal_section_slots =
        read_coord(topology, "horizontal_section_slots", config.topology.horizontal_section_slots);
    config.topology.vertical_section_slots =
        read_coord(topology, "vertical_section_slots", config.topology.vertical_section_slots);
  }

  config.traffic_light_toggle_ticks =
      read_unsigned(cfg, "traffic_light_toggle_ticks", config.traffic_light_toggle_ticks);
  config.initial_passenger_count = read_unsigned(cfg, "initial_passenger_count", config.initial_passenger_count);
  config.passenger_spawn_rate = read_float(cfg, "passenger_spawn_rate", config.passenger_spawn_rate);
  config.max_passengers = read_unsigned(cfg, "max_passengers", config.max_passengers);
  config.agent_car_count = read_unsigned(cfg, "agent_car_count", config.agent_car_count);
  config.npc_car_count = read_unsigned(cfg, "npc_car_count", config.npc_car_count);
  config.passengers_per_car = read_unsigned(cfg, "passengers_per_car", config.passengers_per_car);
  config.discharge_rate = read_float(cfg, "discharge_rate", config.discharge_rate);
  if (cfg.contains("initial_battery")) {
    config.initial_battery = read_float(cfg, "initial_battery", 0.0f);
  }
  config.charge_rate = read_float(cfg, "charge_rate", config.charge_rate);
  config.charging_station_capacity =
      read_unsigned(cfg, "charging_station_capacity", config.charging_station_capacity);
  config.car_radius = read_unsigned(cfg, "car_radius", config.car_radius);
  config.passenger_radius = read_unsigned(cfg, "passenger_radius", config.passenger_radius);
  config.deterministic_mode = read_bool(cfg, "deterministic_mode", config.deterministic_mode);
  config.verbose = read_bool(cfg, "verbose", config.verbose);

  if (cfg.contains("charging_stations")) {
    if (!cfg["charging_stations"].is_array()) {
      throw std::invalid_argument("'charging_stations' must be an array");
    }
    for (const json& station : cfg["charging_stations"]) {
      config.charging_stations.push_back(grid_position_from_json(station));
    }
  }

  if (cfg.contains("passenger_events")) {
    if (!cfg["passenger_events"].is_array()) {
      throw std::invalid_argument("'passenger_events' must be an array");
    }
    for (const json& event : cfg["passenger_events"]) {
      config.passenger_events.push_back(passenger_event_from_json(event));
    }
  }

  validate_config(config);
  return config;
}

GridConfig parse_grid_config(const std::string& config_json) {
  json cfg;
  try {
    cfg = json::parse(config_json);
  } catch (const json::parse_error& e) {
    throw std::invalid_argument(std::string("Malformed grid config: ") + e.what());
  }
  return grid_config_from_json(cfg);
}

GridConfig load_grid_config(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    throw std::invalid_argument("Cannot open grid config " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse_grid_config(buffer.str());
}

json grid_config_to_json(const GridConfig& config) {
  json cfg;
  cfg["topology"] = {{"horizontal_roads", config.topology.horizontal_roads},
                     {"vertical_roads", config.topology.vertical_roads},
                     {"horizontal_section_slots", config.topology.horizontal_section_slots},
                     {"vertical_section_slots", config.topology.vertical_section_slots}};
  cfg["traffic_light_toggle_ticks"] = config.traffic_light_toggle_ticks;
  cfg["initial_passenger_count"] = config.initial_passenger_count;
  cfg["passenger_spawn_rate"] = config.passenger_spawn_rate;
  cfg["max_passengers"] = config.max_passengers;
  cfg["agent_car_count"] = config.agent_car_count;
  cfg["npc_car_count"] = config.npc_car_count;
  cfg["passengers_per_car"] = config.passengers_per_car;
  cfg["discharge_rate"] = config.discharge_rate;
  if (config.initial_battery.has_value()) {
    cfg["initial_battery"] = *config.initial_battery;
  }
  cfg["charge_rate"] = config.charge_rate;
  cfg["charging_station_capacity"] = config.charging_station_capacity;
  cfg["car_radius"] = config.car_radius;
  cfg["passenger_radius"] = config.passenger_radius;
  cfg["deterministic_mode"] = config.deterministic_mode;
  cfg["verbose"] = config.verbose;

  cfg["charging_stations"] = json::array();
  for (const GridPosition& station : config.charging_stations) {
    cfg["charging_stations"].push_back(grid_position_to_json(station));
  }

  cfg["passenger_events"] = json::array();
  for (const PassengerEventConfig& event : config.passenger_events) {
    json event_json = {
        {"name", event.name},
        {"start_area", {event.start_area.x1, event.start_area.y1, event.start_area.x2, event.start_area.y2}},
        {"destination_area",
         {event.destination_area.x1, event.destination_area.y1, event.destination_area.x2, event.destination_area.y2}},
        {"spawn_rate", event.spawn_rate}};
    if (event.start_tick.has_value()) event_json["start_tick"] = *event.start_tick;
    if (event.end_tick.has_value()) event_json["end_tick"] = *event.end_tick;
    cfg["passenger_events"].push_back(event_json);
  }
  return cfg;
}

std::string episode_stats_json(const StatsTracker& stats) {
  json stats_json = json::object();
  for (const std::string& key : stats.keys()) {
    stats_json[key] = stats.get(key);
  }
  return stats_json.dump();
}
