#pragma once
#include "instrument-sim/export.h"

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace instsim {
namespace sim {

class StateStore;

/// Everything an expression may read during one evaluation. Nothing else
/// (files, processes, the host environment) is reachable from the grammar.
struct EvalContext {
  const StateStore &state;
  const std::vector<std::string> &captures; // bound as g1..gn
  std::mt19937_64 &rng;
};

namespace detail {
class Node;
}

/// Compiled expression over a closed grammar: literals, arithmetic,
/// comparisons, boolean logic, `c ? a : b`, state and capture references and
/// an allow-listed function table (math, random, statistics, datetime).
///
/// Compilation rejects syntax errors, unknown names and unknown functions
/// with SimulationError. Evaluation failures are rethrown as SimulationError
/// naming the expression source.
class INSTRUMENT_SIM_API Expression {
public:
  static std::shared_ptr<const Expression> compile(const std::string &source);

  ~Expression();

  nlohmann::json evaluate(const EvalContext &ctx) const;

  /// Evaluate and reduce to a boolean (see truthy())
  bool evaluate_condition(const EvalContext &ctx) const;

  const std::string &source() const { return source_; }

  /// Names callable from an expression, sorted
  static std::vector<std::string> function_names();

private:
  Expression(std::string source, std::unique_ptr<detail::Node> root);

  std::string source_;
  std::unique_ptr<detail::Node> root_;
};

/// Parse text that is entirely a number. Integers stay integers.
INSTRUMENT_SIM_API std::optional<nlohmann::json>
parse_number(const std::string &text);

/// Boolean reading of a value. Strings "", "0", "false", "off" and "no"
/// (any case) are false so that instrument-style state reads naturally.
INSTRUMENT_SIM_API bool truthy(const nlohmann::json &value);

/// 64-bit integer arithmetic; SimulationError on overflow
INSTRUMENT_SIM_API int64_t checked_add(int64_t a, int64_t b);
INSTRUMENT_SIM_API int64_t checked_sub(int64_t a, int64_t b);
INSTRUMENT_SIM_API int64_t checked_mul(int64_t a, int64_t b);

/// Truncates toward zero; SimulationError when the value is NaN, infinite
/// or outside the int64 range
INSTRUMENT_SIM_API int64_t to_int64(double value);

/// Render a value as response text: strings verbatim, booleans as 1/0,
/// floating point with a decimal point, lists comma separated.
INSTRUMENT_SIM_API std::string format_value(const nlohmann::json &value);

} // namespace sim
} // namespace instsim
