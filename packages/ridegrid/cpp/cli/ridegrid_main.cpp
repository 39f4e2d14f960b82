#include <exception>
#include <iostream>
#include <memory>
#include <vector>

#include "cli/run_args.hpp"
#include "config/config_json.hpp"
#include "env/nearest_passenger_callback.hpp"
#include "env/ridegrid_engine.hpp"
#include "systems/stats_tracker.hpp"

int main(int argc, char** argv) {
  try {
    ridegrid::cli::ParsedArgs args = ridegrid::cli::ParseArgs(argc, argv);
    if (args.help) {
      std::cout << ridegrid::cli::Usage(argv[0]);
      return 0;
    }

    GridConfig config = load_grid_config(args.config_path);
    if (args.seed.has_value()) {
      config.deterministic_mode = true;
    }

    std::vector<std::shared_ptr<ridegrid::env::CarCallback>> callbacks;
    for (unsigned int i = 0; i < config.agent_car_count; ++i) {
      callbacks.push_back(std::make_shared<ridegrid::env::NearestPassengerCallback>());
    }

    ridegrid::env::RideGridEngine engine(config, callbacks, args.seed.value_or(0));
    for (TickCount tick = 0; tick < args.ticks; ++tick) {
      engine.tick();
    }

    const StatsTracker& stats = engine.episode_stats();
    if (args.csv) {
      std::cout << stats.csv_header() << "\n" << stats.csv_row() << std::endl;
    } else {
      std::cout << "seed=" << engine.seed() << " ticks=" << engine.ticks_passed()
                << " waiting=" << engine.total_passenger_count() << std::endl;
      std::cout << episode_stats_json(stats) << std::endl;
    }
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "Fatal error: " << ex.what() << std::endl;
    return 1;
  }
}
