#include "TestFixtures.hpp"
#include "instrument-sim/Logger.hpp"

#include <fstream>

namespace fs = std::filesystem;

namespace instsim {
namespace test {

fs::path test_data_dir() {
#ifdef INSTRUMENT_SIM_TEST_DATA_DIR
  return fs::path(INSTRUMENT_SIM_TEST_DATA_DIR);
#else
  return fs::current_path() / "tests" / "data";
#endif
}

fs::path test_profile(const std::string &relative) {
  return test_data_dir() / "profiles" / relative;
}

void SimulationTest::SetUp() {
  InstrumentLogger::instance().init("test.log", spdlog::level::debug);
  data_dir_ = test_data_dir();

  const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
  scratch_dir_ = fs::temp_directory_path() / "instrument_sim_tests" /
                 (std::string(info->test_suite_name()) + "." + info->name());
  fs::remove_all(scratch_dir_);
  fs::create_directories(scratch_dir_);
}

void SimulationTest::TearDown() {
  std::error_code ec;
  fs::remove_all(scratch_dir_, ec);
}

sim::SimulationOptions SimulationTest::options() const {
  sim::SimulationOptions opts;
  opts.seed = 42;
  opts.packaged_root = data_dir_ / "profiles";
  opts.override_root = data_dir_ / "overrides";
  opts.apply_user_override = false;
  return opts;
}

fs::path SimulationTest::write_file(const std::string &relative,
                                    const std::string &content) const {
  fs::path path = scratch_dir_ / relative;
  fs::create_directories(path.parent_path());
  std::ofstream out(path);
  out << content;
  return path;
}

void IntegrationTest::SetUp() {
  SimulationTest::SetUp();
  InstrumentLogger::instance().init("integration_test.log",
                                    spdlog::level::debug);
}

} // namespace test
} // namespace instsim
