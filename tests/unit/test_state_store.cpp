#include "instrument-sim/Errors.hpp"
#include "instrument-sim/sim/StateStore.hpp"

#include <gtest/gtest.h>
#include <limits>

using namespace instsim;
using namespace instsim::sim;
using json = nlohmann::json;

TEST(StateStore, SeedFlattensNestedMaps) {
  StateStore store(json::parse(R"({
    "voltage": "0.0",
    "ch1": {"volt": 1, "curr": {"limit": 2}},
    "readings": [1, 2]
  })"));

  EXPECT_EQ(store.size(), 4u);
  EXPECT_TRUE(store.contains("voltage"));
  EXPECT_TRUE(store.contains("ch1.volt"));
  EXPECT_TRUE(store.contains("ch1.curr.limit"));
  EXPECT_FALSE(store.contains("ch1"));
  ASSERT_NE(store.find("readings"), nullptr);
  EXPECT_TRUE(store.find("readings")->is_array());
}

TEST(StateStore, SeedReplacesContents) {
  StateStore store(json::parse(R"({"a": 1})"));
  store.seed(json::parse(R"({"b": 2})"));
  EXPECT_FALSE(store.contains("a"));
  EXPECT_TRUE(store.contains("b"));

  store.seed(nullptr);
  EXPECT_TRUE(store.empty());
}

TEST(StateStore, SeedRejectsNonMap) {
  StateStore store;
  EXPECT_THROW(store.seed(json::array({1, 2})), SimulationError);
}

TEST(StateStore, SetThenGetReturnsLatestValue) {
  StateStore store;
  store.set("voltage", "1.0");
  store.set("voltage", "5.0");
  EXPECT_EQ(store.get_string("voltage"), "5.0");
  EXPECT_EQ(store.get_string("absent"), "");
}

TEST(StateStore, AddTreatsAbsentKeyAsZero) {
  StateStore store;
  const json &value = store.add("count", 1);
  EXPECT_TRUE(value.is_number_integer());
  EXPECT_EQ(value.get<int64_t>(), 1);
  store.add("count", 2);
  EXPECT_EQ(store.get_string("count"), "3");
}

TEST(StateStore, AddParsesNumericStrings) {
  StateStore store(json::parse(R"({"voltage": "1.5", "samples": "4"})"));
  store.add("voltage", 0.5);
  EXPECT_EQ(store.get_string("voltage"), "2.0");
  store.add("samples", -1);
  EXPECT_EQ(store.get_string("samples"), "3");
}

TEST(StateStore, AddRejectsNonNumericValue) {
  StateStore store(json::parse(R"({"mode": "AUTO", "list": [1]})"));
  EXPECT_THROW(store.add("mode", 1), SimulationError);
  EXPECT_THROW(store.add("list", 1), SimulationError);
  EXPECT_EQ(store.get_string("mode"), "AUTO");
}

TEST(StateStore, AddOverflowLeavesValueUnchanged) {
  StateStore store;
  store.set("count", std::numeric_limits<int64_t>::max());
  EXPECT_THROW(store.add("count", 1), SimulationError);
  EXPECT_EQ(store.get_string("count"), "9223372036854775807");
  store.add("count", -1);
  EXPECT_EQ(store.get_string("count"), "9223372036854775806");
}

TEST(StateStore, GetStringFormatsValues) {
  StateStore store;
  store.set("flag", true);
  store.set("level", 2.0);
  store.set("items", json::array({1, 2, 3}));
  EXPECT_EQ(store.get_string("flag"), "1");
  EXPECT_EQ(store.get_string("level"), "2.0");
  EXPECT_EQ(store.get_string("items"), "1,2,3");
}

TEST(StateStore, SnapshotAndKeys) {
  StateStore store(json::parse(R"({"b": 1, "a": {"x": 2}})"));
  auto keys = store.keys();
  ASSERT_EQ(keys.size(), 2u);
  EXPECT_EQ(keys[0], "a.x");
  EXPECT_EQ(keys[1], "b");

  json snap = store.snapshot();
  EXPECT_EQ(snap["a.x"], 2);
  EXPECT_EQ(snap["b"], 1);
}

TEST(StateStore, CopiesAreIndependent) {
  StateStore store(json::parse(R"({"v": 1})"));
  StateStore staged = store;
  staged.set("v", 2);
  EXPECT_EQ(store.get_string("v"), "1");
  EXPECT_EQ(staged.get_string("v"), "2");
}
