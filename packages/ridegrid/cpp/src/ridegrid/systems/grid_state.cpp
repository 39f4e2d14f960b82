#include "systems/grid_state.hpp"

#include <iomanip>
#include <sstream>

namespace {

void write_position(std::ostringstream& out, const GridPosition& position) {
  out << static_cast<int>(position.direction) << ':' << position.road_index << ':' << position.section_index << ':'
      << position.position_in_section;
}

void write_passenger(std::ostringstream& out, const PassengerView& passenger) {
  out << "passenger " << passenger.id << " origin=";
  write_position(out, passenger.origin);
  out << " destination=";
  write_position(out, passenger.destination);
  out << " waited=" << passenger.ticks_since_request << " car=";
  if (passenger.car.has_value()) {
    out << *passenger.car;
  } else {
    out << '-';
  }
  out << " travel=" << passenger.travel_ticks << " trip=" << passenger.trip_ticks << '\n';
}

void write_car(std::ostringstream& out, const CarView& car) {
  out << "car " << car.id << ' ' << car_type_name(car.type) << " at=";
  write_position(out, car.position);
  out << " station=";
  if (car.station.has_value()) {
    out << *car.station;
  } else {
    out << '-';
  }
  out << " battery=" << car.battery << " out_of_battery=" << car.out_of_battery << '/'
      << car.ticks_since_out_of_battery << " distance=" << car.distance << " active=";
  out << (car.active_action.has_value() ? car.active_action->to_string() : "-");
  out << " recent=";
  for (const Action& action : car.recent_actions) {
    out << action.to_string() << ';';
  }
  out << '\n';
  for (const PassengerView& passenger : car.passengers) {
    out << "  ";
    write_passenger(out, passenger);
  }
}

}  // namespace

std::string GridState::dump() const {
  std::ostringstream out;
  out << std::fixed << std::setprecision(6);
  out << "tick " << ticks_passed << " size " << width << 'x' << height << " can_turn=" << can_turn
      << " action_valid=" << action_valid << " passengers=" << total_passenger_count << '\n';
  out << "pov ";
  write_car(out, pov_car);
  for (const CarView& car : other_cars) {
    out << "other ";
    write_car(out, car);
  }
  for (const PassengerView& passenger : idle_passengers) {
    out << "idle ";
    write_passenger(out, passenger);
  }
  for (const StationView& station : charging_stations) {
    out << "station " << station.id << " entrance=";
    write_position(out, station.entrance);
    out << " occupants=" << station.occupant_count << '/' << station.capacity << " distance=" << station.distance
        << " travel=" << station.travel_ticks << '\n';
  }
  for (const auto& event : events.passenger_spawned) {
    out << "event spawned " << event.passenger << " origin=";
    write_position(out, event.origin);
    out << " destination=";
    write_position(out, event.destination);
    out << '\n';
  }
  for (const auto& event : events.car_picked_up_passenger) {
    out << "event picked_up car=" << event.car << " passenger=" << event.passenger << '\n';
  }
  for (const auto& event : events.car_dropped_off_passenger) {
    out << "event dropped_off car=" << event.car << " passenger=" << event.passenger
        << " waited=" << event.ticks_since_request << '\n';
  }
  for (const auto& event : events.car_out_of_battery) {
    out << "event out_of_battery car=" << event.car << '\n';
  }
  return out.str();
}
