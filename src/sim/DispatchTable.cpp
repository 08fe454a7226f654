#include "instrument-sim/sim/DispatchTable.hpp"
#include "instrument-sim/Errors.hpp"
#include "instrument-sim/Logger.hpp"
#include "instrument-sim/types.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace instsim {
namespace sim {

namespace {

const std::string kRegexPrefix = "re:";

bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

/// `*` at position 0 followed by a letter is an IEEE 488.2 common command
/// (`*IDN?`, `*RST`), not a wildcard
bool is_common_command_star(const std::string &key, std::size_t i) {
  return i == 0 && key.size() > 1 &&
         std::isalpha(static_cast<unsigned char>(key[1])) != 0;
}

std::size_t regex_literal_length(const std::string &pattern) {
  static const char *kMeta = "\\^$.|?*+()[]{}";
  std::size_t n = 0;
  for (char c : pattern) {
    if (std::strchr(kMeta, c) == nullptr)
      ++n;
  }
  return n;
}

} // namespace

KeyKind DispatchTable::classify(const std::string &key) {
  if (key.compare(0, kRegexPrefix.size(), kRegexPrefix) == 0)
    return KeyKind::Regex;
  for (std::size_t i = 0; i < key.size(); ++i) {
    if (key[i] == '*' && !is_common_command_star(key, i))
      return KeyKind::Glob;
    if (key[i] == '$' && i + 1 < key.size() && is_digit(key[i + 1]))
      return KeyKind::Glob;
  }
  return KeyKind::Exact;
}

std::string DispatchTable::glob_to_regex(const std::string &key,
                                         std::size_t *wildcards,
                                         std::size_t *literal_length) {
  static const char *kMeta = "\\^$.|?*+()[]{}";
  std::string out;
  std::size_t groups = 0;
  std::size_t literal = 0;
  for (std::size_t i = 0; i < key.size(); ++i) {
    char c = key[i];
    if (c == '*' && !is_common_command_star(key, i)) {
      out += "(.*)";
      ++groups;
      continue;
    }
    if (c == '$' && i + 1 < key.size() && is_digit(key[i + 1])) {
      while (i + 1 < key.size() && is_digit(key[i + 1]))
        ++i;
      out += "(.*)";
      ++groups;
      continue;
    }
    if (std::strchr(kMeta, c) != nullptr)
      out += '\\';
    out += c;
    ++literal;
  }
  if (wildcards)
    *wildcards = groups;
  if (literal_length)
    *literal_length = literal;
  return out;
}

DispatchTable::DispatchTable(
    const std::map<std::string, profile::ResponseEntry> &scpi,
    const std::string &source) {
  for (const auto &[raw_key, entry] : scpi) {
    std::string key = trim(raw_key);
    KeyKind kind = classify(key);

    if (kind == KeyKind::Exact) {
      auto [it, inserted] = exact_.insert_or_assign(to_upper(key), entry);
      if (!inserted) {
        LOG_WARN("DISPATCH", "BUILD",
                 "Exact key '{}' differs from another key only by case; "
                 "keeping the later one",
                 key);
      }
      continue;
    }

    PatternRule rule;
    rule.key = key;
    rule.kind = kind;
    rule.entry = entry;
    std::string pattern;
    if (kind == KeyKind::Regex) {
      pattern = key.substr(kRegexPrefix.size());
      rule.literal_length = regex_literal_length(pattern);
    } else {
      pattern = glob_to_regex(key, &rule.wildcards, &rule.literal_length);
    }
    try {
      rule.matcher =
          std::regex(pattern, std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error &ex) {
      throw ProfileError(source,
                         "scpi '" + key + "': invalid pattern: " + ex.what());
    }
    if (kind == KeyKind::Regex)
      rule.wildcards = std::max<std::size_t>(1, rule.matcher.mark_count());
    pattern_rules_.push_back(std::move(rule));
  }

  std::stable_sort(pattern_rules_.begin(), pattern_rules_.end(),
                   [](const PatternRule &a, const PatternRule &b) {
                     if (a.wildcards != b.wildcards)
                       return a.wildcards < b.wildcards;
                     if (a.literal_length != b.literal_length)
                       return a.literal_length > b.literal_length;
                     return a.key < b.key;
                   });

  LOG_DEBUG("DISPATCH", "BUILD", "{} exact keys, {} pattern rules",
            exact_.size(), pattern_rules_.size());
}

std::optional<DispatchMatch>
DispatchTable::lookup(const std::string &command) const {
  std::string cmd = trim(command);

  auto it = exact_.find(to_upper(cmd));
  if (it != exact_.end()) {
    DispatchMatch match;
    match.entry = &it->second;
    match.key = it->first;
    match.exact = true;
    return match;
  }

  for (const auto &rule : pattern_rules_) {
    std::smatch m;
    if (std::regex_match(cmd, m, rule.matcher)) {
      DispatchMatch match;
      match.entry = &rule.entry;
      match.key = rule.key;
      for (std::size_t i = 1; i < m.size(); ++i) {
        match.captures.push_back(m[i].matched ? m[i].str() : std::string());
      }
      return match;
    }
  }
  return std::nullopt;
}

bool DispatchTable::has_exact(const std::string &command) const {
  return exact_.count(to_upper(trim(command))) > 0;
}

} // namespace sim
} // namespace instsim
