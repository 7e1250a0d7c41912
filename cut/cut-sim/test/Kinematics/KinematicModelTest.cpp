// Ticket: 0002_kinematic_model

#include "cut-sim/src/Kinematics/KinematicModel.hpp"

#include <gtest/gtest.h>
#include <Eigen/Dense>
#include <numbers>
#include <stdexcept>
#include <type_traits>

#include "cut-sim/test/Helpers/TestModels.hpp"

namespace cut_sim
{

TEST(KinematicModelTest, LayoutCountsJointCoordinates)
{
  auto arm = test::makePlanarArm();

  EXPECT_EQ(arm->bodyCount(), 4u);
  EXPECT_EQ(arm->positionCount(), 3);
  EXPECT_EQ(arm->velocityCount(), 3);
  EXPECT_EQ(arm->stateSize(), 6);
  EXPECT_EQ(arm->jointPositionIndex("joint_1"), 0);
  EXPECT_EQ(arm->jointPositionIndex("joint_2"), 1);
  EXPECT_EQ(arm->jointPositionIndex("slider_joint"), 2);

  auto boxes = test::makeBoxModel(2);
  EXPECT_EQ(boxes->positionCount(), 12);
  EXPECT_EQ(boxes->positionStart(1), 6);
}

TEST(KinematicModelTest, ForwardKinematicsOfPlanarArm)
{
  auto arm = test::makePlanarArm();
  Eigen::VectorXd q{3};
  q << std::numbers::pi / 2.0, -std::numbers::pi / 2.0, 0.2;

  const Eigen::Vector3d tip = arm->framePose(q, "tip").translation();

  // Link 1 points along +y, link 2 turns back to +x
  EXPECT_TRUE(tip.isApprox(Eigen::Vector3d{0.4, 0.4, 0.1}, 1e-12));

  const auto transforms = arm->forwardKinematics(q);
  EXPECT_TRUE(transforms[3].translation().isApprox(Eigen::Vector3d{0.2, 1.0, 0.0}, 1e-12));
}

TEST(KinematicModelTest, FloatingJointUsesPositionAndRpy)
{
  auto boxes = test::makeBoxModel(1);
  Eigen::VectorXd q{6};
  q << 1.0, 2.0, 3.0, 0.0, 0.0, std::numbers::pi / 2.0;

  const Eigen::Isometry3d pose = boxes->forwardKinematics(q)[0];

  EXPECT_TRUE(pose.translation().isApprox(Eigen::Vector3d{1.0, 2.0, 3.0}));
  EXPECT_TRUE((pose.linear() * Eigen::Vector3d::UnitX())
                .isApprox(Eigen::Vector3d::UnitY(), 1e-12));
}

TEST(KinematicModelTest, SplitPositionIndicesKeepsControlledOrder)
{
  auto arm = test::makePlanarArm();

  const auto [controlled, held] = arm->splitPositionIndices({"joint_2", "joint_1"});

  ASSERT_EQ(controlled.size(), 2u);
  EXPECT_EQ(controlled[0], 1);
  EXPECT_EQ(controlled[1], 0);
  ASSERT_EQ(held.size(), 1u);
  EXPECT_EQ(held[0], 2);
}

TEST(KinematicModelTest, SplitPositionIndicesRejectsBadNames)
{
  auto arm = test::makePlanarArm();

  EXPECT_THROW(static_cast<void>(arm->splitPositionIndices({"joint_9"})),
               std::invalid_argument);
  EXPECT_THROW(static_cast<void>(arm->splitPositionIndices({"joint_1", "joint_1"})),
               std::invalid_argument);
}

TEST(KinematicModelTest, ClampToLimits)
{
  auto arm = test::makePlanarArm();
  Eigen::VectorXd q{3};
  q << 3.0, -3.0, 0.1;

  const Eigen::VectorXd clamped = arm->clampToLimits(q);

  EXPECT_DOUBLE_EQ(clamped[0], 2.5);
  EXPECT_DOUBLE_EQ(clamped[1], -2.5);
  EXPECT_DOUBLE_EQ(clamped[2], 0.1);
}

TEST(KinematicModelTest, AdjacencyCoversParentChildAndSiblings)
{
  auto arm = test::makePlanarArm();

  EXPECT_TRUE(arm->areAdjacent(0, 1));
  EXPECT_TRUE(arm->areAdjacent(2, 1));
  EXPECT_FALSE(arm->areAdjacent(0, 2));
  // Two bodies hanging off the world are not adjacent
  EXPECT_FALSE(arm->areAdjacent(0, 3));
}

TEST(KinematicModelTest, ValidateStateChecksLength)
{
  auto arm = test::makePlanarArm();

  EXPECT_NO_THROW(arm->validateState(StateVector::Zero(6)));
  EXPECT_THROW(arm->validateState(StateVector::Zero(3)), std::invalid_argument);
}

TEST(KinematicModelTest, LookupsThrowForUnknownNames)
{
  auto arm = test::makePlanarArm();

  EXPECT_FALSE(arm->findBody("nope").has_value());
  EXPECT_THROW(static_cast<void>(arm->bodyIndex("nope")), std::invalid_argument);
  EXPECT_THROW(static_cast<void>(arm->frame("nope")), std::invalid_argument);
  EXPECT_THROW(static_cast<void>(arm->jointPositionIndex("base_weld")),
               std::invalid_argument);
}

TEST(KinematicModelBuilderTest, RejectsInvalidBodies)
{
  KinematicModelBuilder builder;
  Body box;
  box.name = "box";
  builder.addBody(box);

  EXPECT_THROW(builder.addBody(box), std::invalid_argument);

  Body orphan;
  orphan.name = "orphan";
  orphan.parent = 5;
  EXPECT_THROW(builder.addBody(orphan), std::invalid_argument);

  Body floating;
  floating.name = "floating";
  floating.parent = 0;
  floating.joint.type = JointType::Floating;
  EXPECT_THROW(builder.addBody(floating), std::invalid_argument);
}

TEST(KinematicModelBuilderTest, DerivedModelLeavesBaseUntouched)
{
  auto base = test::makeBoxModel(1);
  KinematicModelBuilder builder{*base};
  Body extra;
  extra.name = "extra";
  extra.joint.type = JointType::Floating;
  builder.addBody(extra);

  auto derived = builder.build();

  EXPECT_EQ(base->bodyCount(), 1u);
  EXPECT_EQ(derived->bodyCount(), 2u);
  EXPECT_EQ(derived->positionCount(), 12);
}

TEST(KinematicModelBuilderTest, OnlyTheBuilderCreatesModels)
{
  static_assert(!std::is_default_constructible_v<KinematicModel::BuildKey>);

  auto first = KinematicModelBuilder{}.build();
  auto second = KinematicModelBuilder{*test::makePlanarArm()}.build();

  EXPECT_EQ(first.use_count(), 1);
  EXPECT_EQ(first->bodyCount(), 0u);
  EXPECT_EQ(first->positionCount(), 0);
  EXPECT_EQ(second->bodyCount(), 4u);
  EXPECT_EQ(second->positionCount(), 3);
  EXPECT_NO_THROW(static_cast<void>(second->frame("tip")));
}

}  // namespace cut_sim
