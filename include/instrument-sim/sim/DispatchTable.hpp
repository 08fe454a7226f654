#pragma once
#include "instrument-sim/export.h"
#include "instrument-sim/profile/Profile.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace instsim {
namespace sim {

/// How a profile `scpi` key is matched
enum class KeyKind {
  Exact, // case-insensitive literal
  Glob,  // `*` and `$n` become capture groups, everything else literal
  Regex  // `re:` prefix, ECMAScript syntax
};

/// Compiled non-exact rule
struct PatternRule {
  std::string key;
  KeyKind kind{KeyKind::Glob};
  std::regex matcher;
  profile::ResponseEntry entry;
  std::size_t wildcards{0};
  std::size_t literal_length{0};
};

struct DispatchMatch {
  const profile::ResponseEntry *entry{nullptr};
  std::vector<std::string> captures;
  std::string key;
  bool exact{false};
};

/// Two-tier command lookup built once from a profile: an upper-cased exact
/// map, then pattern rules ordered by specificity (fewer wildcards, then
/// longer literal text, then key text). An exact hit always wins.
class INSTRUMENT_SIM_API DispatchTable {
public:
  DispatchTable() = default;
  /// `source` names the profile file in ProfileError for a bad pattern
  explicit DispatchTable(
      const std::map<std::string, profile::ResponseEntry> &scpi,
      const std::string &source = "");

  static KeyKind classify(const std::string &key);

  /// Regex source for a glob key, matched against the whole command.
  /// Optional outputs receive the wildcard and literal character counts.
  static std::string glob_to_regex(const std::string &key,
                                   std::size_t *wildcards = nullptr,
                                   std::size_t *literal_length = nullptr);

  /// Command is trimmed; nullopt when nothing in the profile matches
  std::optional<DispatchMatch> lookup(const std::string &command) const;

  bool has_exact(const std::string &command) const;

  const std::vector<PatternRule> &pattern_rules() const {
    return pattern_rules_;
  }
  std::size_t exact_count() const { return exact_.size(); }

private:
  std::unordered_map<std::string, profile::ResponseEntry> exact_;
  std::vector<PatternRule> pattern_rules_;
};

} // namespace sim
} // namespace instsim
