#include "../test_utils/TestFixtures.hpp"
#include "instrument-sim/Errors.hpp"
#include "instrument-sim/replay/SessionLog.hpp"

#include <gtest/gtest.h>

using namespace instsim;
using namespace instsim::replay;
using namespace instsim::test;
using json = nlohmann::json;

class SessionFileTest : public SimulationTest {};

TEST_F(SessionFileTest, LoadsAllAliases) {
  auto file = SessionFile::load(data_dir_ / "sessions" / "bench.yaml");
  auto aliases = file.aliases();
  ASSERT_EQ(aliases.size(), 2u);
  EXPECT_EQ(aliases[0], "dmm");
  EXPECT_EQ(aliases[1], "psu");
  EXPECT_TRUE(file.has("psu"));
  EXPECT_FALSE(file.has("scope"));

  const auto &psu = file.get("psu");
  EXPECT_EQ(psu.profile, "acme/psu");
  ASSERT_EQ(psu.log.size(), 4u);
  EXPECT_EQ(psu.log[0].kind, CommandKind::Query);
  EXPECT_EQ(psu.log[1].kind, CommandKind::Write);
  EXPECT_FALSE(psu.log[1].response);
  EXPECT_EQ(psu.log[3].kind, CommandKind::QueryRaw);
  EXPECT_DOUBLE_EQ(psu.log[2].timestamp, 0.003);
}

TEST_F(SessionFileTest, UnknownAliasIsProfileError) {
  auto file = SessionFile::load(data_dir_ / "sessions" / "bench.yaml");
  EXPECT_THROW(file.get("scope"), ProfileError);
}

TEST_F(SessionFileTest, UnknownKindIsRejected) {
  EXPECT_THROW(SessionFile::load(data_dir_ / "sessions" / "broken_kind.yaml"),
               ProfileError);
}

TEST_F(SessionFileTest, ParseLogValidatesEntries) {
  EXPECT_TRUE(SessionFile::parse_log(nullptr, "inline").empty());
  EXPECT_THROW(SessionFile::parse_log(json::object(), "inline"), ProfileError);
  EXPECT_THROW(SessionFile::parse_log(json::parse(R"([{"kind": "write"}])"),
                                      "inline"),
               ProfileError);
  EXPECT_THROW(SessionFile::parse_log(json::parse(R"([{"command": "*RST"}])"),
                                      "inline"),
               ProfileError);
  EXPECT_THROW(
      SessionFile::parse_log(
          json::parse(R"([{"kind": "write", "command": "*RST", "timestamp": "soon"}])"),
          "inline"),
      ProfileError);
}

TEST_F(SessionFileTest, SaveKeepsResponsesVerbatim) {
  SessionFile file;
  SessionRecord record;
  record.profile = "acme/dmm";
  record.log.push_back({CommandKind::Query, "MEAS:VOLT:DC?",
                        std::string("+9.99749200E-01"), 0.25});
  record.log.push_back({CommandKind::Write, "CONF:VOLT:DC 10,0.001",
                        std::nullopt, 0.5});
  record.log.push_back({CommandKind::Query, "FETC?", std::string("0001"), 0.75});
  record.log.push_back({CommandKind::Query, "*OPC?", std::string(""), 1.0});
  file.put("dmm", record);

  auto path = scratch_dir_ / "nested" / "session.yaml";
  file.save(path);
  ASSERT_TRUE(std::filesystem::exists(path));

  auto loaded = SessionFile::load(path);
  const auto &log = loaded.get("dmm").log;
  ASSERT_EQ(log.size(), 4u);
  EXPECT_EQ(loaded.get("dmm").profile, "acme/dmm");
  EXPECT_EQ(*log[0].response, "+9.99749200E-01");
  EXPECT_EQ(log[1].command, "CONF:VOLT:DC 10,0.001");
  EXPECT_FALSE(log[1].response);
  EXPECT_EQ(*log[2].response, "0001");
  ASSERT_TRUE(log[3].response);
  EXPECT_EQ(*log[3].response, "");
  EXPECT_DOUBLE_EQ(log[1].timestamp, 0.5);
}

TEST_F(SessionFileTest, RawResponsesKeepEveryByte) {
  const std::string bytes("#14\x01\xff\n \n\0", 9);
  SessionFile file;
  SessionRecord record;
  record.profile = "acme/scope";
  record.log.push_back({CommandKind::QueryRaw, "CURV?", bytes, 0.1});
  record.log.push_back({CommandKind::QueryRaw, "CURV?", std::string(), 0.2});
  file.put("scope", record);

  auto path = scratch_dir_ / "raw.yaml";
  file.save(path);

  auto loaded = SessionFile::load(path);
  const auto &log = loaded.get("scope").log;
  ASSERT_EQ(log.size(), 2u);
  ASSERT_TRUE(log[0].response);
  EXPECT_EQ(log[0].response->size(), 9u);
  EXPECT_EQ(*log[0].response, bytes);
  ASSERT_TRUE(log[1].response);
  EXPECT_EQ(*log[1].response, "");
}

TEST_F(SessionFileTest, EncodedResponsesAreValidated) {
  auto log = SessionFile::parse_log(json::parse(R"([{"kind": "query_raw",
      "command": "CURV?", "response": "AAH/", "encoding": "base64"}])"),
                                    "inline");
  ASSERT_EQ(log.size(), 1u);
  EXPECT_EQ(*log[0].response, std::string("\0\x01\xff", 3));

  EXPECT_THROW(SessionFile::parse_log(json::parse(R"([{"kind": "query_raw",
      "command": "CURV?", "response": "AAH/", "encoding": "hex"}])"),
                                      "inline"),
               ProfileError);
  EXPECT_THROW(SessionFile::parse_log(json::parse(R"([{"kind": "query_raw",
      "command": "CURV?", "response": "%%%%", "encoding": "base64"}])"),
                                      "inline"),
               ProfileError);
}

TEST_F(SessionFileTest, PutReplacesAlias) {
  SessionFile file;
  file.put("psu", SessionRecord{"a", {}});
  file.put("psu", SessionRecord{"b", {}});
  EXPECT_EQ(file.aliases().size(), 1u);
  EXPECT_EQ(file.get("psu").profile, "b");
}

TEST(ReplayCursor, ConsumesInOrder) {
  ReplayCursor cursor({{CommandKind::Write, "*RST", std::nullopt, 0.0},
                       {CommandKind::Query, "*IDN?", std::string("X"), 0.1}});
  EXPECT_EQ(cursor.size(), 2u);
  cursor.consume(CommandKind::Write, "*RST", {CommandKind::Write});
  const auto &entry =
      cursor.consume(CommandKind::Query, "*IDN?", {CommandKind::Query});
  EXPECT_EQ(*entry.response, "X");
  EXPECT_TRUE(cursor.finished());
  EXPECT_THROW(cursor.consume(CommandKind::Query, "*IDN?", {CommandKind::Query}),
               ReplayMismatchError);
  EXPECT_EQ(cursor.position(), 2u);
}
