#ifndef PACKAGES_RIDEGRID_CPP_BINDINGS_RIDEGRID_C_HPP_
#define PACKAGES_RIDEGRID_CPP_BINDINGS_RIDEGRID_C_HPP_

#define PYBIND11_DETAILED_ERROR_MESSAGES

#if defined(_WIN32)
#define RIDEGRID_API __declspec(dllexport)
#else
#define RIDEGRID_API __attribute__((visibility("default")))
#endif

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <optional>
#include <vector>

#include "actions/action.hpp"
#include "config/ridegrid_config.hpp"
#include "core/types.hpp"
#include "env/car_callback.hpp"
#include "env/ridegrid_engine.hpp"
#include "systems/grid_state.hpp"

namespace py = pybind11;

// Lets Python classes implement CarCallback.
class PyCarCallback : public ridegrid::env::CarCallback {
public:
  using ridegrid::env::CarCallback::CarCallback;

  Action get_action(const GridState& state) override {
    PYBIND11_OVERRIDE_PURE(Action, ridegrid::env::CarCallback, get_action, state);
  }

  void transition_happened(const GridState& old_state, const GridState& new_state) override {
    PYBIND11_OVERRIDE_PURE(void, ridegrid::env::CarCallback, transition_happened, old_state, new_state);
  }
};

// Python-facing episode driver. reset() discards the engine and builds a fresh one, continuing the random stream
// unless a seed is given.
class RIDEGRID_API RideGrid {
public:
  RideGrid(const GridConfig& cfg, py::list callbacks, unsigned int seed);
  ~RideGrid();

  void tick();
  void reset(std::optional<unsigned int> seed);

  py::tuple grid_dimensions() const;
  Distance calculate_distance(const GridPosition& a, const GridPosition& b) const;
  Distance travel_ticks(const GridPosition& from, const GridPosition& to) const;
  GridState state_for(CarId car) const;
  size_t total_passenger_count() const;
  TickCount ticks_passed() const;
  unsigned int seed() const;
  py::dict get_episode_stats() const;
  py::list action_success_py() const;
  const GridConfig& config() const {
    return _config;
  }

private:
  GridConfig _config;
  // Keeps the Python side of every callback alive as long as the engine holds it.
  py::list _py_callbacks;
  std::vector<std::shared_ptr<ridegrid::env::CarCallback>> _callbacks;
  std::unique_ptr<ridegrid::env::RideGridEngine> _engine;
};

#endif  // PACKAGES_RIDEGRID_CPP_BINDINGS_RIDEGRID_C_HPP_
