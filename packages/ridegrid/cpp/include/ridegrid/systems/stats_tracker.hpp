#ifndef PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_SYSTEMS_STATS_TRACKER_HPP_
#define PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_SYSTEMS_STATS_TRACKER_HPP_

#include <algorithm>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

class StatsTracker {
private:
  std::unordered_map<std::string, float> _stats;

  // Test class needs access for testing
  friend class StatsTrackerTest;

public:
  StatsTracker() : _stats() {}

  void add(const std::string& key, float amount) {
    _stats[key] += amount;
  }

  // Increment by 1 (convenience method)
  void incr(const std::string& key) {
    add(key, 1);
  }

  void set(const std::string& key, float value) {
    _stats[key] = value;
  }

  float get(const std::string& key) const {
    auto it = _stats.find(key);
    if (it == _stats.end()) {
      return 0.0f;
    }
    return it->second;
  }

  // Convert to map for Python API
  const std::unordered_map<std::string, float>& to_dict() const {
    return _stats;
  }

  std::vector<std::string> keys() const {
    std::vector<std::string> result;
    result.reserve(_stats.size());
    for (const auto& [key, value] : _stats) {
      result.push_back(key);
    }
    std::sort(result.begin(), result.end());
    return result;
  }

  // CSV export with keys in sorted order, so header and row line up.
  std::string csv_header() const {
    std::ostringstream out;
    const auto sorted = keys();
    for (size_t i = 0; i < sorted.size(); ++i) {
      if (i > 0) out << ',';
      out << sorted[i];
    }
    return out.str();
  }

  std::string csv_row() const {
    std::ostringstream out;
    const auto sorted = keys();
    for (size_t i = 0; i < sorted.size(); ++i) {
      if (i > 0) out << ',';
      out << get(sorted[i]);
    }
    return out.str();
  }

  // Reset all statistics
  void reset() {
    _stats.clear();
  }
};

#endif  // PACKAGES_RIDEGRID_CPP_INCLUDE_RIDEGRID_SYSTEMS_STATS_TRACKER_HPP_
