// Ticket: 0005_cutting_guard

#include "cut-sim/src/Physics/CuttingGuard.hpp"

#include <gtest/gtest.h>
#include <Eigen/Dense>
#include <stdexcept>

namespace cut_sim
{

namespace
{

BladeContact pressing(size_t body, double downwardForce)
{
  return BladeContact{body, Eigen::Vector3d{0.1, 0.5, 0.45}, Eigen::Vector3d{0.0, 0.0, -downwardForce}};
}

}  // namespace

TEST(CuttingGuardTest, StrongestQualifyingContactCuts)
{
  CuttingGuard guard{CuttingGuard::Config{}, std::nullopt};

  const auto event = guard.check(2.0, {pressing(3, 12.0), pressing(5, 40.0), pressing(7, 4.0)});

  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->bodyIndex, 5u);
  EXPECT_DOUBLE_EQ(event->time, 2.0);
  EXPECT_TRUE(event->cutPoint.isApprox(Eigen::Vector3d{0.1, 0.5, 0.45}));
  EXPECT_TRUE(event->cutNormal.isApprox(Eigen::Vector3d::UnitX()));
}

TEST(CuttingGuardTest, WeakOrWrongWayContactDoesNotCut)
{
  CuttingGuard guard{CuttingGuard::Config{}, std::nullopt};

  EXPECT_FALSE(guard.check(1.0, {}).has_value());
  EXPECT_FALSE(guard.check(1.0, {pressing(0, 9.0)}).has_value());
  EXPECT_FALSE(guard.check(1.0, {pressing(0, -50.0)}).has_value());
  EXPECT_TRUE(guard.check(1.0, {pressing(0, 10.0)}).has_value());
}

TEST(CuttingGuardTest, RefractoryPeriodFollowsPreviousCut)
{
  CuttingGuard::Config config;
  config.refractoryPeriod = 0.5;
  CuttingGuard guard{config, 3.0};

  EXPECT_FALSE(guard.check(3.2, {pressing(0, 50.0)}).has_value());
  EXPECT_FALSE(guard.check(3.49, {pressing(0, 50.0)}).has_value());
  EXPECT_TRUE(guard.check(3.5, {pressing(0, 50.0)}).has_value());
}

TEST(CuttingGuardTest, DirectionsAreNormalized)
{
  CuttingGuard::Config config;
  config.cutDirection = Eigen::Vector3d{0.0, 0.0, -5.0};
  config.cutNormal = Eigen::Vector3d{0.0, 3.0, 0.0};
  CuttingGuard guard{config, std::nullopt};

  const auto event = guard.check(0.0, {pressing(0, 10.0)});

  ASSERT_TRUE(event.has_value());
  EXPECT_TRUE(event->cutNormal.isApprox(Eigen::Vector3d::UnitY()));
}

TEST(CuttingGuardTest, RejectsZeroDirections)
{
  CuttingGuard::Config config;
  config.cutNormal = Eigen::Vector3d::Zero();

  EXPECT_THROW((CuttingGuard{config, std::nullopt}), std::invalid_argument);
}

}  // namespace cut_sim
