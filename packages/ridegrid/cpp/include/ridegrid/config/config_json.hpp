#ifndef PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_CONFIG_CONFIG_JSON_HPP_
#define PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_CONFIG_CONFIG_JSON_HPP_

#include <nlohmann/json.hpp>

#include <string>

#include "config/ridegrid_config.hpp"
#include "core/topology.hpp"
#include "systems/stats_tracker.hpp"

// JSON form of GridConfig. Keys mirror the struct fields; positions are objects
// {"direction": "right", "road": 1, "section": 2, "position": 0} and areas are [x1, y1, x2, y2].
// Unknown keys and malformed values raise std::invalid_argument.
GridConfig grid_config_from_json(const nlohmann::json& cfg);
GridConfig parse_grid_config(const std::string& config_json);
GridConfig load_grid_config(const std::string& path);

nlohmann::json grid_config_to_json(const GridConfig& config);

Direction direction_from_string(const std::string& name);
GridPosition grid_position_from_json(const nlohmann::json& value);
nlohmann::json grid_position_to_json(const GridPosition& position);

std::string episode_stats_json(const StatsTracker& stats);

#endif  // PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_CONFIG_CONFIG_JSON_HPP_
