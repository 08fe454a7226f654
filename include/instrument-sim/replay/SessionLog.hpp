#pragma once
#include "instrument-sim/export.h"
#include "instrument-sim/types.hpp"

#include <cstddef>
#include <filesystem>
#include <initializer_list>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace instsim {
namespace replay {

/// One instrument's recorded session
struct SessionRecord {
  std::string profile;
  SessionLogEntries log;
};

/// A session file: instrument alias -> { profile, log }
///
/// ```yaml
/// psu:
///   profile: acme/psu
///   log:
///     - { kind: query, command: "*IDN?", response: "ACME,PSU,1,1.0", timestamp: 0.01 }
/// ```
class INSTRUMENT_SIM_API SessionFile {
public:
  SessionFile() = default;

  /// Throws ProfileError when the file is missing or malformed
  static SessionFile load(const std::filesystem::path &path);

  /// Log entries of one alias. Entries may use `kind` or the older `type`.
  static SessionLogEntries parse_log(const nlohmann::json &node,
                                     const std::string &source);

  void save(const std::filesystem::path &path) const;

  bool has(const std::string &alias) const;

  /// Throws ProfileError for an unknown alias
  const SessionRecord &get(const std::string &alias) const;

  void put(const std::string &alias, SessionRecord record);

  std::vector<std::string> aliases() const;

  const std::string &source() const { return source_; }

private:
  std::map<std::string, SessionRecord> records_;
  std::string source_;
};

/// Strict position in a recorded log. Only a call that matches the entry at
/// the cursor advances it; any divergence throws ReplayMismatchError and
/// leaves the position unchanged.
class INSTRUMENT_SIM_API ReplayCursor {
public:
  explicit ReplayCursor(SessionLogEntries log);

  /// Check the entry at the cursor against a `kind` call of `command`, with
  /// `accepted` listing the recorded kinds that satisfy it, then advance
  const SessionLogEntry &consume(CommandKind kind, const std::string &command,
                                 std::initializer_list<CommandKind> accepted);

  std::size_t position() const { return position_; }
  std::size_t size() const { return log_.size(); }
  bool finished() const { return position_ >= log_.size(); }
  const SessionLogEntries &log() const { return log_; }

private:
  SessionLogEntries log_;
  std::size_t position_{0};
};

} // namespace replay
} // namespace instsim
