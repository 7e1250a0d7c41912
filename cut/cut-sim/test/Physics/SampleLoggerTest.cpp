// Ticket: 0006_rigid_body_plant

#include "cut-sim/src/Physics/SampleLogger.hpp"

#include <gtest/gtest.h>
#include <Eigen/Dense>
#include <stdexcept>

namespace cut_sim
{

namespace
{

Eigen::VectorXd scalar(double value)
{
  return Eigen::VectorXd::Constant(1, value);
}

}  // namespace

TEST(SampleLoggerTest, RecordKeepsOneSamplePerPeriod)
{
  SampleLogger logger{10.0};

  for (int i = 0; i <= 100; ++i)
  {
    const double t = 0.01 * i;
    logger.record(t, scalar(t));
  }

  EXPECT_EQ(logger.size(), 11u);
  const SampledTrajectory log = logger.trajectory();
  EXPECT_DOUBLE_EQ(log.startTime(), 0.0);
  EXPECT_NEAR(log.endTime(), 1.0, 1e-9);
}

TEST(SampleLoggerTest, ForceRecordAlwaysKeepsTheSample)
{
  SampleLogger logger{1.0};

  logger.record(0.0, scalar(0.0));
  logger.record(0.3, scalar(0.3));
  logger.forceRecord(0.3, scalar(0.3));

  EXPECT_EQ(logger.size(), 2u);
  EXPECT_DOUBLE_EQ(logger.trajectory().endTime(), 0.3);
}

TEST(SampleLoggerTest, ForceRecordReplacesSampleAtSameTime)
{
  SampleLogger logger{10.0};

  logger.forceRecord(1.0, scalar(1.0));
  logger.forceRecord(1.0, scalar(2.0));

  EXPECT_EQ(logger.size(), 1u);
  EXPECT_DOUBLE_EQ(logger.trajectory().lastSample()[0], 2.0);
}

TEST(SampleLoggerTest, EmptyLoggerHasNoTrajectory)
{
  SampleLogger logger{10.0};

  EXPECT_TRUE(logger.empty());
  EXPECT_THROW(static_cast<void>(logger.trajectory()), std::invalid_argument);
}

TEST(SampleLoggerTest, RejectsNonPositiveRate)
{
  EXPECT_THROW(SampleLogger{0.0}, std::invalid_argument);
  EXPECT_THROW(SampleLogger{-1.0}, std::invalid_argument);
}

}  // namespace cut_sim
