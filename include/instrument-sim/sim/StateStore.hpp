#pragma once
#include "instrument-sim/export.h"

#include <cstddef>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace instsim {
namespace sim {

/// Flat, dot-addressable key/value store holding the live state of one
/// simulated instrument. Owned by exactly one SimulationBackend; copies are
/// used to stage the mutations of a single action.
class INSTRUMENT_SIM_API StateStore {
public:
  StateStore() = default;
  explicit StateStore(const nlohmann::json &initial_state);

  /// Replace the contents with `initial_state`, nested maps flattened to
  /// dotted keys (`{ch1: {volt: 1}}` becomes `ch1.volt`)
  void seed(const nlohmann::json &initial_state);

  /// nullptr when the key is absent
  const nlohmann::json *find(const std::string &key) const;

  bool contains(const std::string &key) const;

  void set(const std::string &key, nlohmann::json value);

  /// Numeric accumulate; an absent key counts as zero. Throws
  /// SimulationError when the current value is not numeric.
  const nlohmann::json &add(const std::string &key,
                            const nlohmann::json &delta);

  /// Value rendered as response text, empty when absent
  std::string get_string(const std::string &key) const;

  std::size_t size() const { return values_.size(); }
  bool empty() const { return values_.empty(); }

  std::vector<std::string> keys() const;

  /// Flat JSON object of the current contents
  nlohmann::json snapshot() const;

private:
  static void flatten(const nlohmann::json &node, const std::string &prefix,
                      std::map<std::string, nlohmann::json> &out);

  std::map<std::string, nlohmann::json> values_;
};

} // namespace sim
} // namespace instsim
