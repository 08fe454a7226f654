#pragma once
#include "instrument-sim/export.h"
#include "instrument-sim/sim/Expression.hpp"

#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace instsim {
namespace profile {

/// Fixed value, returned as-is
struct LiteralValue {
  nlohmann::json value;
};

/// Text with `$1..$n` placeholders filled from the dispatch captures
struct TemplateValue {
  std::string text;
};

/// `expr:` entry, compiled once at load time
struct DynamicValue {
  std::shared_ptr<const sim::Expression> expression;
};

/// Value-producing field of an action (set value, inc/dec delta, response)
using ScalarEntry = std::variant<LiteralValue, TemplateValue, DynamicValue>;

/// Map-valued response entry. Fields run in the order
/// set, inc/dec, get, response; the delay is applied last.
struct ActionMap {
  std::optional<double> delay_seconds;
  std::vector<std::pair<std::string, ScalarEntry>> set;
  std::vector<std::pair<std::string, ScalarEntry>> inc;
  std::vector<std::pair<std::string, ScalarEntry>> dec;
  std::optional<std::string> get;
  std::optional<ScalarEntry> response;
};

using ResponseEntry =
    std::variant<LiteralValue, TemplateValue, DynamicValue, ActionMap>;

/// Conditional instrument error raised after a command matching `pattern`
struct ErrorSpec {
  std::string pattern;
  std::regex matcher;
  std::shared_ptr<const sim::Expression> condition;
  int code{0};
  std::string message;
};

/// A compiled simulation profile
struct Profile {
  std::string source_path;
  std::string model;
  std::optional<std::string> identification;
  nlohmann::json initial_state = nlohmann::json::object();
  std::map<std::string, ResponseEntry> scpi;
  std::vector<ErrorSpec> errors;
};

/// Fill `$1..$n` in `text` from `captures`; out-of-range indices are left
/// verbatim
INSTRUMENT_SIM_API std::string
substitute_captures(const std::string &text,
                    const std::vector<std::string> &captures);

/// True when `text` holds at least one `$<digit>` placeholder
INSTRUMENT_SIM_API bool has_placeholders(const std::string &text);

} // namespace profile
} // namespace instsim
