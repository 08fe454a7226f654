#include "instrument-sim/types.hpp"

#include <algorithm>
#include <cctype>

namespace instsim {

std::string to_string(CommandKind kind) {
  switch (kind) {
  case CommandKind::Write:
    return "write";
  case CommandKind::Query:
    return "query";
  case CommandKind::QueryRaw:
    return "query_raw";
  }
  return "unknown";
}

std::optional<CommandKind> command_kind_from_string(const std::string &name) {
  if (name == "write")
    return CommandKind::Write;
  if (name == "query")
    return CommandKind::Query;
  if (name == "query_raw")
    return CommandKind::QueryRaw;
  return std::nullopt;
}

std::string trim(const std::string &text) {
  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  auto begin = std::find_if_not(text.begin(), text.end(), is_space);
  auto end = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
  if (begin >= end)
    return {};
  return std::string(begin, end);
}

std::string to_upper(const std::string &text) {
  std::string out = text;
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return out;
}

} // namespace instsim
