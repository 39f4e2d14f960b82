#ifndef PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_CORE_TRAFFIC_LIGHTS_HPP_
#define PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_CORE_TRAFFIC_LIGHTS_HPP_

#include "core/types.hpp"

// Signals shared by every intersection. Horizontal lanes start green and vertical lanes red; both flip every
// `toggle_ticks` ticks. A period of zero keeps every light green.
class TrafficLights {
public:
  explicit TrafficLights(unsigned int toggle_ticks) : _toggle_ticks(toggle_ticks) {}

  void tick() {
    if (_toggle_ticks == 0) return;
    _ticks_since_toggle += 1;
    if (_ticks_since_toggle >= _toggle_ticks) {
      _horizontal_green = !_horizontal_green;
      _ticks_since_toggle = 0;
    }
  }

  bool is_green(Direction direction) const {
    if (_toggle_ticks == 0) return true;
    bool horizontal = orientation_of(direction) == Orientation::Horizontal;
    return horizontal == _horizontal_green;
  }

  unsigned int toggle_ticks() const {
    return _toggle_ticks;
  }

private:
  unsigned int _toggle_ticks;
  unsigned int _ticks_since_toggle = 0;
  bool _horizontal_green = true;
};

#endif  // PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_CORE_TRAFFIC_LIGHTS_HPP_
