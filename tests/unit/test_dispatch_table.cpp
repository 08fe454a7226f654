#include "instrument-sim/Errors.hpp"
#include "instrument-sim/sim/DispatchTable.hpp"

#include <gtest/gtest.h>

using namespace instsim;
using namespace instsim::sim;

namespace {

profile::ResponseEntry literal(const std::string &text) {
  return profile::LiteralValue{text};
}

std::map<std::string, profile::ResponseEntry>
entries(std::initializer_list<std::string> keys) {
  std::map<std::string, profile::ResponseEntry> out;
  for (const auto &key : keys)
    out.emplace(key, literal(key));
  return out;
}

std::string literal_text(const DispatchMatch &match) {
  return std::get<profile::LiteralValue>(*match.entry).value.get<std::string>();
}

} // namespace

TEST(DispatchTable, ClassifyKeys) {
  EXPECT_EQ(DispatchTable::classify("*IDN?"), KeyKind::Exact);
  EXPECT_EQ(DispatchTable::classify("*RST"), KeyKind::Exact);
  EXPECT_EQ(DispatchTable::classify("MEAS:VOLT?"), KeyKind::Exact);
  EXPECT_EQ(DispatchTable::classify("CALC:FUNC(1).VAL?"), KeyKind::Exact);
  EXPECT_EQ(DispatchTable::classify(":VOLT $1"), KeyKind::Glob);
  EXPECT_EQ(DispatchTable::classify("SOUR*:VOLT?"), KeyKind::Glob);
  EXPECT_EQ(DispatchTable::classify("*"), KeyKind::Glob);
  EXPECT_EQ(DispatchTable::classify("re:CONF:(.*)"), KeyKind::Regex);
}

TEST(DispatchTable, GlobToRegexEscapesLiterals) {
  std::size_t wildcards = 0;
  std::size_t literal_length = 0;
  EXPECT_EQ(DispatchTable::glob_to_regex(":VOLT $1", &wildcards,
                                         &literal_length),
            ":VOLT (.*)");
  EXPECT_EQ(wildcards, 1u);
  EXPECT_EQ(literal_length, 6u);

  EXPECT_EQ(DispatchTable::glob_to_regex("SOUR*:VOLT?"), "SOUR(.*):VOLT\\?");
  EXPECT_EQ(DispatchTable::glob_to_regex("A.B $12"), "A\\.B (.*)");
}

TEST(DispatchTable, ExactLookupIsCaseInsensitiveAndTrimmed) {
  DispatchTable table(entries({"*IDN?", "MEAS:VOLT?"}));
  EXPECT_EQ(table.exact_count(), 2u);

  auto match = table.lookup("  *idn?\n");
  ASSERT_TRUE(match);
  EXPECT_TRUE(match->exact);
  EXPECT_EQ(literal_text(*match), "*IDN?");
  EXPECT_TRUE(match->captures.empty());
  EXPECT_TRUE(table.has_exact("meas:volt?"));
}

TEST(DispatchTable, ExactOutranksPattern) {
  DispatchTable table(entries({":VOLT?", ":VOLT*", "re::VOLT.*"}));

  auto match = table.lookup(":VOLT?");
  ASSERT_TRUE(match);
  EXPECT_TRUE(match->exact);
  EXPECT_EQ(match->key, ":VOLT?");
}

TEST(DispatchTable, PatternsOrderedBySpecificity) {
  DispatchTable table(entries({"*:*", "MEAS:*", "MEAS:VOLT:*"}));

  const auto &rules = table.pattern_rules();
  ASSERT_EQ(rules.size(), 3u);
  EXPECT_EQ(rules[0].key, "MEAS:VOLT:*");
  EXPECT_EQ(rules[1].key, "MEAS:*");
  EXPECT_EQ(rules[2].key, "*:*");

  auto match = table.lookup("MEAS:VOLT:DC?");
  ASSERT_TRUE(match);
  EXPECT_EQ(match->key, "MEAS:VOLT:*");
  ASSERT_EQ(match->captures.size(), 1u);
  EXPECT_EQ(match->captures[0], "DC?");

  match = table.lookup("MEAS:CURR?");
  ASSERT_TRUE(match);
  EXPECT_EQ(match->key, "MEAS:*");

  match = table.lookup("SYST:BEEP");
  ASSERT_TRUE(match);
  EXPECT_EQ(match->key, "*:*");
}

TEST(DispatchTable, OrderStableAcrossBuilds) {
  auto scpi = entries({"B*", "A*", "C $1", "re:D.*", "LONGER*", "X*Y*"});
  DispatchTable first(scpi);
  DispatchTable second(scpi);

  ASSERT_EQ(first.pattern_rules().size(), second.pattern_rules().size());
  for (std::size_t i = 0; i < first.pattern_rules().size(); ++i) {
    EXPECT_EQ(first.pattern_rules()[i].key, second.pattern_rules()[i].key);
  }
}

TEST(DispatchTable, PlaceholderCapturesInOrder) {
  DispatchTable table(entries({"APPL $1,$2"}));
  auto match = table.lookup("APPL 3.3,0.5");
  ASSERT_TRUE(match);
  EXPECT_FALSE(match->exact);
  ASSERT_EQ(match->captures.size(), 2u);
  EXPECT_EQ(match->captures[0], "3.3");
  EXPECT_EQ(match->captures[1], "0.5");
}

TEST(DispatchTable, RegexKeysKeepUserGroups) {
  DispatchTable table(entries({"re:CONF:(VOLT|CURR):(AC|DC)"}));
  auto match = table.lookup("conf:volt:dc");
  ASSERT_TRUE(match);
  ASSERT_EQ(match->captures.size(), 2u);
  EXPECT_EQ(match->captures[0], "volt");
  EXPECT_EQ(match->captures[1], "dc");

  EXPECT_FALSE(table.lookup("CONF:RES:DC"));
}

TEST(DispatchTable, GlobMatchesWholeCommandOnly) {
  DispatchTable table(entries({"A.B*"}));
  EXPECT_TRUE(table.lookup("A.B1"));
  EXPECT_FALSE(table.lookup("AXB1"));
  EXPECT_FALSE(table.lookup("XA.B1"));
}

TEST(DispatchTable, NoMatch) {
  DispatchTable table(entries({"*IDN?", ":VOLT $1"}));
  EXPECT_FALSE(table.lookup(":CURR 1"));
}

TEST(DispatchTable, InvalidRegexIsProfileError) {
  EXPECT_THROW(DispatchTable(entries({"re:(["})), ProfileError);
  try {
    DispatchTable table(entries({"re:(["}), "bench/psu.yaml");
    FAIL() << "expected ProfileError";
  } catch (const ProfileError &ex) {
    EXPECT_EQ(ex.path(), "bench/psu.yaml");
    EXPECT_NE(std::string(ex.what()).find("re:(["), std::string::npos);
  }
}
