#include "../test_utils/MockBackend.hpp"
#include "../test_utils/TestFixtures.hpp"
#include "instrument-sim/Errors.hpp"
#include "instrument-sim/backend/BackendFactory.hpp"
#include "instrument-sim/replay/ReplayBackend.hpp"
#include "instrument-sim/replay/SessionRecordingBackend.hpp"
#include "instrument-sim/sim/SimulationBackend.hpp"

#include <gtest/gtest.h>

using namespace instsim;
using namespace instsim::test;

namespace {

// Drives the same command sequence against any backend
std::vector<std::string> run_bench(InstrumentBackend &psu,
                                   InstrumentBackend &dmm) {
  std::vector<std::string> responses;
  responses.push_back(psu.query("*IDN?"));
  psu.write(":VOLT 4.2");
  psu.write("OUTP ON");
  responses.push_back(psu.query("MEAS:VOLT?"));
  responses.push_back(dmm.query("MEAS:NOISE?"));
  responses.push_back(dmm.query("READ?"));
  dmm.write("RANG 5000");
  responses.push_back(dmm.query("SYST:ERR?"));
  auto raw = dmm.query_raw("MEAS:GAUSS?");
  responses.emplace_back(raw.begin(), raw.end());
  return responses;
}

} // namespace

class RecordReplayTest : public IntegrationTest {};

TEST_F(RecordReplayTest, ReplayReproducesRecordedSession) {
  auto session = scratch_dir_ / "bench_session.yaml";

  std::vector<std::string> recorded;
  {
    replay::SessionRecordingBackend psu(
        std::make_unique<sim::SimulationBackend>("acme/psu", options()), "psu",
        "acme/psu", session);
    replay::SessionRecordingBackend dmm(
        std::make_unique<sim::SimulationBackend>("acme/dmm", options()), "dmm",
        "acme/dmm", session);
    recorded = run_bench(psu, dmm);
    psu.close();
    dmm.close();
  }
  EXPECT_EQ(recorded[0], "ACME,SIM,0001,1.0");
  EXPECT_EQ(recorded[1], "4.2");
  EXPECT_EQ(recorded[4], "-224,\"Illegal parameter value\"");

  auto psu = replay::ReplayBackend::from_session_file(session, "psu");
  auto dmm = replay::ReplayBackend::from_session_file(session, "dmm");
  EXPECT_EQ(psu->profile_key(), "acme/psu");
  EXPECT_EQ(run_bench(*psu, *dmm), recorded);
  EXPECT_TRUE(psu->finished());
  EXPECT_TRUE(dmm->finished());
}

TEST_F(RecordReplayTest, DivergentReplayStopsAtFirstMismatch) {
  auto session = scratch_dir_ / "psu_session.yaml";
  {
    replay::SessionRecordingBackend psu(
        std::make_unique<sim::SimulationBackend>("acme/psu", options()), "psu",
        "acme/psu", session);
    psu.write(":VOLT 5.0");
    psu.query(":VOLT?");
    psu.close();
  }

  auto psu = replay::ReplayBackend::from_session_file(session, "psu");
  psu->write(":VOLT 5.0");
  try {
    psu->query(":CURR?");
    FAIL() << "expected ReplayMismatchError";
  } catch (const ReplayMismatchError &ex) {
    EXPECT_EQ(ex.log_index(), 1u);
    EXPECT_EQ(ex.expected_command(), ":VOLT?");
  }
  EXPECT_EQ(psu->query(":VOLT?"), "5.0");
}

TEST_F(RecordReplayTest, BinaryBlockReplaysByteForByte) {
  auto session = scratch_dir_ / "scope_session.yaml";
  const std::string block("\x23\x31\x34\x01\xff\x0a\x20\x0a\x00", 9);

  std::vector<uint8_t> recorded;
  {
    auto mock = std::make_unique<MockBackend>("scope");
    mock->set_response("CURV?", block);
    replay::SessionRecordingBackend scope(std::move(mock), "scope",
                                          "acme/scope", session);
    recorded = scope.query_raw("CURV?");
    scope.close();
  }
  ASSERT_EQ(recorded.size(), 9u);

  auto scope = replay::ReplayBackend::from_session_file(session, "scope");
  auto replayed = scope->query_raw("CURV?");
  EXPECT_EQ(replayed, recorded);
  EXPECT_EQ(replayed.back(), 0x00);
  EXPECT_EQ(replayed[4], 0xff);
  EXPECT_TRUE(scope->finished());
}

TEST_F(RecordReplayTest, FactoryRecordsThenReplays) {
  auto session = (scratch_dir_ / "factory_session.yaml").string();

  BackendConfig sim_cfg;
  sim_cfg.name = "psu";
  sim_cfg.profile = "acme/psu";
  sim_cfg.profile_root = (data_dir_ / "profiles").string();
  sim_cfg.apply_user_override = false;
  sim_cfg.seed = 7;
  sim_cfg.record_to = session;

  std::string idn;
  {
    auto backend = create_backend(sim_cfg);
    backend->write("APPL 9,0.1");
    idn = backend->query("*IDN?");
    backend->close();
  }

  BackendConfig replay_cfg;
  replay_cfg.name = "psu";
  replay_cfg.mode = BackendMode::Replay;
  replay_cfg.session = session;
  auto backend = create_backend(replay_cfg);
  backend->write("APPL 9,0.1");
  EXPECT_EQ(backend->query("*IDN?"), idn);
}
