#include <gtest/gtest.h>

#include <spdlog/spdlog.h>

#include "mocap-kin/src/Kinematics/KinematicsSolver.hpp"
#include "mocap-kin/src/Utils/Logging.hpp"

using namespace mocap_kin;

TEST(LoggingTest, SharedLoggerIsReused)
{
  auto first = getOrCreateLogger("mocap-kin-logging-test");
  auto second = getOrCreateLogger("mocap-kin-logging-test");

  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first, second);
  EXPECT_EQ(spdlog::get("mocap-kin-logging-test"), first);

  spdlog::drop("mocap-kin-logging-test");
}

TEST(LoggingTest, NullLoggerIsNotRegistered)
{
  auto logger = makeNullLogger("mocap-kin-null-test");

  ASSERT_NE(logger, nullptr);
  EXPECT_EQ(spdlog::get("mocap-kin-null-test"), nullptr);
  EXPECT_NO_THROW(logger->warn("discarded {}", 42));
}

TEST(LoggingTest, SolverFallsBackToDefaultLogger)
{
  const KinematicsSolver solver;
  EXPECT_NE(spdlog::get(kDefaultLoggerName), nullptr);
}
