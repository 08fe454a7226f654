#include "instrument-sim/sim/StateStore.hpp"
#include "instrument-sim/Errors.hpp"
#include "instrument-sim/sim/Expression.hpp"

namespace instsim {
namespace sim {

StateStore::StateStore(const nlohmann::json &initial_state) {
  seed(initial_state);
}

void StateStore::seed(const nlohmann::json &initial_state) {
  values_.clear();
  if (initial_state.is_null())
    return;
  if (!initial_state.is_object()) {
    throw SimulationError("initial_state must be a map");
  }
  flatten(initial_state, "", values_);
}

void StateStore::flatten(const nlohmann::json &node, const std::string &prefix,
                         std::map<std::string, nlohmann::json> &out) {
  for (auto &[key, value] : node.items()) {
    std::string full_key = prefix.empty() ? key : prefix + "." + key;
    if (value.is_object()) {
      flatten(value, full_key, out);
    } else {
      out[full_key] = value;
    }
  }
}

const nlohmann::json *StateStore::find(const std::string &key) const {
  auto it = values_.find(key);
  if (it == values_.end())
    return nullptr;
  return &it->second;
}

bool StateStore::contains(const std::string &key) const {
  return values_.count(key) > 0;
}

void StateStore::set(const std::string &key, nlohmann::json value) {
  values_[key] = std::move(value);
}

const nlohmann::json &StateStore::add(const std::string &key,
                                      const nlohmann::json &delta) {
  nlohmann::json current = 0;
  auto it = values_.find(key);
  if (it != values_.end()) {
    if (it->second.is_number()) {
      current = it->second;
    } else if (it->second.is_string()) {
      auto parsed = parse_number(it->second.get<std::string>());
      if (!parsed) {
        throw SimulationError("state key '" + key + "' holds non-numeric '" +
                              it->second.get<std::string>() + "'");
      }
      current = *parsed;
    } else {
      throw SimulationError("state key '" + key + "' is not numeric");
    }
  }

  nlohmann::json result;
  if (current.is_number_integer() && delta.is_number_integer()) {
    result = checked_add(current.get<int64_t>(), delta.get<int64_t>());
  } else {
    result = current.get<double>() + delta.get<double>();
  }
  auto &slot = values_[key];
  slot = std::move(result);
  return slot;
}

std::string StateStore::get_string(const std::string &key) const {
  const auto *value = find(key);
  if (!value)
    return "";
  return format_value(*value);
}

std::vector<std::string> StateStore::keys() const {
  std::vector<std::string> out;
  out.reserve(values_.size());
  for (const auto &[key, _] : values_) {
    out.push_back(key);
  }
  return out;
}

nlohmann::json StateStore::snapshot() const {
  nlohmann::json j = nlohmann::json::object();
  for (const auto &[key, value] : values_) {
    j[key] = value;
  }
  return j;
}

} // namespace sim
} // namespace instsim
