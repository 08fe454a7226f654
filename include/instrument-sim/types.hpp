#pragma once
#include "instrument-sim/export.h"

#include <optional>
#include <string>
#include <vector>

namespace instsim {

/// Kind of backend call recorded in a session log
enum class CommandKind { Write, Query, QueryRaw };

/// "write", "query" or "query_raw"
INSTRUMENT_SIM_API std::string to_string(CommandKind kind);

/// Parse a recorded kind; returns nullopt for unknown names
INSTRUMENT_SIM_API std::optional<CommandKind>
command_kind_from_string(const std::string &name);

/// One recorded backend interaction
struct SessionLogEntry {
  CommandKind kind{CommandKind::Write};
  std::string command;
  std::optional<std::string> response;
  double timestamp{0.0}; // seconds since the recording started
};

using SessionLogEntries = std::vector<SessionLogEntry>;

/// Strip leading and trailing whitespace (SCPI terminators included)
INSTRUMENT_SIM_API std::string trim(const std::string &text);

/// ASCII upper-case copy
INSTRUMENT_SIM_API std::string to_upper(const std::string &text);

} // namespace instsim
