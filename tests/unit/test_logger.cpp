#include "../test_utils/TestFixtures.hpp"
#include "instrument-sim/Logger.hpp"

#include <gtest/gtest.h>

using namespace instsim;
using namespace instsim::test;

class LoggerTest : public SimulationTest {};

TEST_F(LoggerTest, ShutdownThenInitRecreatesLogger) {
  auto &logger = InstrumentLogger::instance();
  EXPECT_TRUE(logger.is_initialized());

  logger.shutdown();
  EXPECT_FALSE(logger.is_initialized());
  // logging without a logger is dropped
  EXPECT_NO_THROW(logger.info("psu", "TEST", "value {}", 1));

  logger.init("test.log", spdlog::level::debug);
  EXPECT_TRUE(logger.is_initialized());
  EXPECT_NO_THROW(logger.debug("psu", "TEST", "value {}", 2));
}
