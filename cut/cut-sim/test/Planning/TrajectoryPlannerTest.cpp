// Ticket: 0003_trajectory_planner

#include "cut-sim/src/Planning/TrajectoryPlanner.hpp"

#include <gtest/gtest.h>
#include <Eigen/Dense>
#include <limits>
#include <memory>
#include <stdexcept>
#include <variant>

#include "cut-sim/test/Helpers/FakeCollaborators.hpp"
#include "cut-sim/test/Helpers/TestModels.hpp"
#include "cut-utils/src/Logging.hpp"

namespace cut_sim
{

namespace
{

/// Returns a knot matrix with one column too many
class MalformedKinematicsSolver : public KinematicsSolver
{
public:
  [[nodiscard]] KinematicsSolution solve(const TrajectoryProblem& problem) override
  {
    return KinematicsSolution{
      Eigen::MatrixXd::Zero(problem.seed.rows(), problem.seed.cols() + 1),
      solver_status::kSuccess};
  }
};

/**
 * @brief Returns the seed with every whole-span posture box pushed to its
 * edges, alternating lower and upper from knot to knot
 */
class BoxEdgeKinematicsSolver : public KinematicsSolver
{
public:
  [[nodiscard]] KinematicsSolution solve(const TrajectoryProblem& problem) override
  {
    Eigen::MatrixXd knots = problem.seed;
    for (const auto& constraint : problem.constraints)
    {
      const auto* posture = std::get_if<PostureConstraint>(&constraint);
      if (posture == nullptr || !posture->span.isActiveAt(problem.knotTimes.front()) ||
          !posture->span.isActiveAt(problem.knotTimes.back()))
      {
        continue;
      }
      for (Eigen::Index k = 0; k < knots.cols(); ++k)
      {
        for (size_t i = 0; i < posture->indices.size(); ++i)
        {
          const auto row = static_cast<Eigen::Index>(i);
          knots(posture->indices[i], k) =
            k % 2 == 0 ? posture->lower[row] : posture->upper[row];
        }
      }
    }
    return KinematicsSolution{knots, solver_status::kSuccess};
  }
};

EndEffectorPose pose(double x, double y, double z, double yaw)
{
  return EndEffectorPose{Eigen::Vector3d{x, y, z}, Eigen::Vector3d{0.0, 0.0, yaw}};
}

}  // namespace

class TrajectoryPlannerTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    model_ = test::makePlanarArm();
    solver_ = std::make_shared<test::RecordingKinematicsSolver>();
    planner_ = std::make_unique<TrajectoryPlanner>(
      solver_, cut_utils::makeNullLogger("planner_test"), test::planarArmPlannerConfig());
    q0_ = Eigen::Vector3d{0.1, 0.2, 0.3};
  }

  std::shared_ptr<const KinematicModel> model_;
  std::shared_ptr<test::RecordingKinematicsSolver> solver_;
  std::unique_ptr<TrajectoryPlanner> planner_;
  Eigen::VectorXd q0_;
};

// ============================================================================
// planToPosture
// ============================================================================

TEST_F(TrajectoryPlannerTest, PlanToPosture_SpansStartToStartPlusDuration)
{
  const auto result = planner_->planToPosture(
    model_, q0_, Eigen::Vector2d{0.5, -0.4}, {"joint_1", "joint_2"}, 5, 2.0, 3.0);

  EXPECT_TRUE(result.nominal());
  EXPECT_DOUBLE_EQ(result.value.startTime(), 3.0);
  EXPECT_DOUBLE_EQ(result.value.endTime(), 5.0);
  EXPECT_TRUE(result.value.value(3.0).isApprox(q0_, 1e-12));
  EXPECT_TRUE(result.value.value(5.0).isApprox(Eigen::Vector3d{0.5, -0.4, 0.3}, 1e-12));
  EXPECT_NEAR(result.value.derivative(3.0).norm(), 0.0, 1e-12);
  EXPECT_NEAR(result.value.derivative(5.0).norm(), 0.0, 1e-12);
}

TEST_F(TrajectoryPlannerTest, PlanToPosture_HeldJointsStayWithinTolerance)
{
  const auto result = planner_->planToPosture(
    model_, q0_, Eigen::Vector2d{0.5, -0.4}, {"joint_1", "joint_2"}, 6, 1.5);

  for (int i = 0; i <= 30; ++i)
  {
    const double t = 0.05 * i;
    EXPECT_NEAR(result.value.value(t)[2], 0.3, planner_->config().postureTolerance);
  }
}

TEST(TrajectoryPlannerBandTest, PlanToPosture_HeldJointsStayInBandBetweenKnots)
{
  auto model = test::makePlanarArm();
  TrajectoryPlanner planner{std::make_shared<BoxEdgeKinematicsSolver>(),
                            cut_utils::makeNullLogger("planner_test"),
                            test::planarArmPlannerConfig()};
  const double tol = planner.config().postureTolerance;

  // The slider starts past its 0.5 limit and is held around the clipped value
  const Eigen::VectorXd q0 = Eigen::Vector3d{0.1, 0.2, 0.7};
  const auto result = planner.planToPosture(
    model, q0, Eigen::Vector2d{0.5, -0.4}, {"joint_1", "joint_2"}, 7, 1.5, 2.0);

  EXPECT_NEAR(result.value.samples()(2, 0), 0.5 - tol, 1e-12);
  EXPECT_NEAR(result.value.samples()(2, 1), 0.5 + tol, 1e-12);

  for (int i = 0; i <= 600; ++i)
  {
    const double t = 2.0 + 1.5 * i / 600.0;
    const double held = result.value.value(t)[2];
    EXPECT_GE(held, 0.5 - tol - 1e-12) << "t = " << t;
    EXPECT_LE(held, 0.5 + tol + 1e-12) << "t = " << t;
  }
}

TEST_F(TrajectoryPlannerTest, PlanToPosture_BuildsHeldStartAndTargetBoxes)
{
  static_cast<void>(planner_->planToPosture(
    model_, q0_, Eigen::Vector2d{0.5, -0.4}, {"joint_1", "joint_2"}, 4, 3.0));

  ASSERT_EQ(solver_->problems.size(), 1u);
  const TrajectoryProblem& problem = solver_->problems.front();
  ASSERT_EQ(problem.constraints.size(), 3u);
  EXPECT_EQ(problem.knotTimes, (std::vector<double>{0.0, 1.0, 2.0, 3.0}));

  const auto& held = std::get<PostureConstraint>(problem.constraints[0]);
  EXPECT_EQ(held.indices, (std::vector<Eigen::Index>{2}));
  EXPECT_NEAR(held.lower[0], 0.29, 1e-12);
  EXPECT_NEAR(held.upper[0], 0.31, 1e-12);
  EXPECT_EQ(held.span.start, -std::numeric_limits<double>::infinity());

  const auto& start = std::get<PostureConstraint>(problem.constraints[1]);
  EXPECT_EQ(start.indices, (std::vector<Eigen::Index>{0, 1}));
  EXPECT_DOUBLE_EQ(start.span.start, 0.0);
  EXPECT_DOUBLE_EQ(start.span.end, 0.0);
  EXPECT_NEAR(start.lower[0], 0.09, 1e-12);

  const auto& target = std::get<PostureConstraint>(problem.constraints[2]);
  EXPECT_DOUBLE_EQ(target.span.start, 3.0);
  EXPECT_NEAR(target.upper[1], -0.39, 1e-12);

  // Nominal is the full target, seed interpolates toward it
  EXPECT_TRUE(problem.nominal.col(0).isApprox(Eigen::Vector3d{0.5, -0.4, 0.3}));
  EXPECT_TRUE(problem.seed.col(0).isApprox(q0_));
  EXPECT_TRUE(problem.seed.col(3).isApprox(problem.nominal.col(3)));
}

TEST_F(TrajectoryPlannerTest, PlanToPosture_ClipsTargetToJointLimits)
{
  const auto result = planner_->planToPosture(
    model_, q0_, Eigen::Vector2d{3.0, -4.0}, {"joint_1", "joint_2"}, 3, 1.0);

  EXPECT_TRUE(result.value.value(1.0).isApprox(Eigen::Vector3d{2.5, -2.5, 0.3}, 1e-12));
}

TEST_F(TrajectoryPlannerTest, PlanToPosture_SingleControlledJoint)
{
  const auto result =
    planner_->planToPosture(model_, q0_, Eigen::VectorXd::Constant(1, -0.2), {"slider_joint"}, 3, 1.0);

  const Eigen::VectorXd end = result.value.value(1.0);
  EXPECT_NEAR(end[0], 0.1, 1e-12);
  EXPECT_NEAR(end[1], 0.2, 1e-12);
  EXPECT_NEAR(end[2], -0.2, 1e-12);
}

TEST_F(TrajectoryPlannerTest, PlanToPosture_SurfacesSolverStatus)
{
  solver_->setStatus(solver_status::kInfeasible);

  const auto result = planner_->planToPosture(
    model_, q0_, Eigen::Vector2d{0.5, -0.4}, {"joint_1", "joint_2"}, 4, 1.0);

  EXPECT_EQ(result.status, solver_status::kInfeasible);
  EXPECT_FALSE(result.nominal());
  EXPECT_DOUBLE_EQ(result.value.endTime(), 1.0);
}

TEST_F(TrajectoryPlannerTest, PlanToPosture_RejectsMalformedArguments)
{
  const Eigen::Vector2d target{0.5, -0.4};
  const std::vector<std::string> joints{"joint_1", "joint_2"};

  EXPECT_THROW(static_cast<void>(planner_->planToPosture(nullptr, q0_, target, joints, 4, 1.0)),
               std::invalid_argument);
  EXPECT_THROW(static_cast<void>(planner_->planToPosture(
                 model_, Eigen::Vector2d{0.0, 0.0}, target, joints, 4, 1.0)),
               std::invalid_argument);
  EXPECT_THROW(static_cast<void>(planner_->planToPosture(
                 model_, q0_, Eigen::Vector3d::Zero(), joints, 4, 1.0)),
               std::invalid_argument);
  EXPECT_THROW(static_cast<void>(planner_->planToPosture(model_, q0_, target, joints, 1, 1.0)),
               std::invalid_argument);
  EXPECT_THROW(static_cast<void>(planner_->planToPosture(model_, q0_, target, joints, 4, 0.0)),
               std::invalid_argument);
  EXPECT_THROW(static_cast<void>(planner_->planToPosture(
                 model_, q0_, target, {"joint_1", "no_such_joint"}, 4, 1.0)),
               std::invalid_argument);
  EXPECT_TRUE(solver_->problems.empty());
}

TEST_F(TrajectoryPlannerTest, PlanToPosture_MalformedSolverOutputThrows)
{
  TrajectoryPlanner planner{std::make_shared<MalformedKinematicsSolver>(),
                            cut_utils::makeNullLogger("planner_test")};

  EXPECT_THROW(static_cast<void>(planner.planToPosture(
                 model_, q0_, Eigen::Vector2d{0.5, -0.4}, {"joint_1", "joint_2"}, 4, 1.0)),
               std::runtime_error);
}

TEST_F(TrajectoryPlannerTest, Construction_RejectsNullCollaborators)
{
  EXPECT_THROW((TrajectoryPlanner{nullptr, cut_utils::makeNullLogger("planner_test")}),
               std::invalid_argument);
  EXPECT_THROW((TrajectoryPlanner{solver_, nullptr}), std::invalid_argument);
}

// ============================================================================
// planToEndEffectorPose
// ============================================================================

TEST_F(TrajectoryPlannerTest, PlanToEndEffectorPose_SingleKnotProblem)
{
  const Eigen::VectorXd seed = Eigen::Vector3d{0.0, 1.0, 0.3};

  const auto result =
    planner_->planToEndEffectorPose(model_, q0_, pose(0.4, 0.4, 0.1, 1.5), seed);

  ASSERT_EQ(solver_->problems.size(), 1u);
  const TrajectoryProblem& problem = solver_->problems.front();
  EXPECT_EQ(problem.knotTimes, (std::vector<double>{0.0}));
  ASSERT_EQ(problem.constraints.size(), 4u);
  EXPECT_EQ(std::get<PostureConstraint>(problem.constraints[0]).indices,
            (std::vector<Eigen::Index>{2}));

  const auto& position = std::get<WorldPositionConstraint>(problem.constraints[1]);
  EXPECT_EQ(position.frame, "tip");
  EXPECT_TRUE((0.5 * (position.lower + position.upper)).isApprox(Eigen::Vector3d{0.4, 0.4, 0.1}));
  EXPECT_NEAR(position.upper.x() - position.lower.x(), 0.02, 1e-12);

  const auto& euler = std::get<WorldEulerConstraint>(problem.constraints[2]);
  EXPECT_NEAR(0.5 * (euler.lower.z() + euler.upper.z()), 1.5, 1e-12);

  EXPECT_DOUBLE_EQ(std::get<MinDistanceConstraint>(problem.constraints[3]).minDistance, 0.01);

  EXPECT_TRUE(problem.seed.col(0).isApprox(seed));
  EXPECT_TRUE(problem.nominal.col(0).isApprox(q0_));
  EXPECT_TRUE(result.value.isApprox(seed));
}

TEST_F(TrajectoryPlannerTest, PlanToEndEffectorPose_SeedDefaultsToStart)
{
  const auto result = planner_->planToEndEffectorPose(model_, q0_, pose(0.4, 0.4, 0.1, 1.5));

  EXPECT_TRUE(result.value.isApprox(q0_));
}

TEST_F(TrajectoryPlannerTest, PlanToEndEffectorPose_UnknownFrameThrows)
{
  TrajectoryPlanner::Config config = test::planarArmPlannerConfig();
  config.endEffectorFrame = "no_such_frame";
  TrajectoryPlanner planner{solver_, cut_utils::makeNullLogger("planner_test"), config};

  EXPECT_THROW(static_cast<void>(planner.planToEndEffectorPose(model_, q0_, pose(0.4, 0.4, 0.1, 0.0))),
               std::invalid_argument);
}

// ============================================================================
// planMultiTargetTrajectory
// ============================================================================

TEST_F(TrajectoryPlannerTest, PlanMultiTarget_RampsFromReachToGrasp)
{
  const EndEffectorPose reach = pose(0.4, 0.4, 0.2, 0.0);
  const EndEffectorPose grasp = pose(0.4, 0.4, 0.1, 1.0);

  const auto result =
    planner_->planMultiTargetTrajectory(model_, q0_, reach, grasp, 5, 2.0, 4.0, 10.0);

  EXPECT_DOUBLE_EQ(result.value.startTime(), 10.0);
  EXPECT_DOUBLE_EQ(result.value.endTime(), 14.0);

  const TrajectoryProblem& problem = solver_->problems.front();
  // held, start, then a position and an Euler box at knots 2, 3 and 4
  ASSERT_EQ(problem.constraints.size(), 8u);

  const auto& firstPosition = std::get<WorldPositionConstraint>(problem.constraints[2]);
  EXPECT_DOUBLE_EQ(firstPosition.span.start, 2.0);
  EXPECT_TRUE((0.5 * (firstPosition.lower + firstPosition.upper)).isApprox(reach.position));

  const auto& midEuler = std::get<WorldEulerConstraint>(problem.constraints[5]);
  EXPECT_DOUBLE_EQ(midEuler.span.start, 3.0);
  EXPECT_NEAR(0.5 * (midEuler.lower.z() + midEuler.upper.z()), 0.5, 1e-12);
  EXPECT_NEAR(midEuler.upper.z() - midEuler.lower.z(), 0.1, 1e-12);

  const auto& lastPosition = std::get<WorldPositionConstraint>(problem.constraints[6]);
  EXPECT_DOUBLE_EQ(lastPosition.span.start, 4.0);
  EXPECT_TRUE((0.5 * (lastPosition.lower + lastPosition.upper)).isApprox(grasp.position));
}

TEST_F(TrajectoryPlannerTest, PlanMultiTarget_ReachAtGraspTargetsGraspPose)
{
  const EndEffectorPose reach = pose(0.4, 0.4, 0.2, 0.0);
  const EndEffectorPose grasp = pose(0.4, 0.4, 0.1, 1.0);

  static_cast<void>(planner_->planMultiTargetTrajectory(model_, q0_, reach, grasp, 4, 3.0, 3.0));

  const TrajectoryProblem& problem = solver_->problems.front();
  ASSERT_EQ(problem.constraints.size(), 4u);
  const auto& position = std::get<WorldPositionConstraint>(problem.constraints[2]);
  EXPECT_TRUE((0.5 * (position.lower + position.upper)).isApprox(grasp.position));
  const auto& euler = std::get<WorldEulerConstraint>(problem.constraints[3]);
  EXPECT_NEAR(0.5 * (euler.lower.z() + euler.upper.z()), 1.0, 1e-12);
}

TEST_F(TrajectoryPlannerTest, PlanMultiTarget_RejectsReachOutsideSpan)
{
  const EndEffectorPose target = pose(0.4, 0.4, 0.1, 0.0);

  EXPECT_THROW(static_cast<void>(planner_->planMultiTargetTrajectory(
                 model_, q0_, target, target, 4, 3.5, 3.0)),
               std::invalid_argument);
  EXPECT_THROW(static_cast<void>(planner_->planMultiTargetTrajectory(
                 model_, q0_, target, target, 4, -0.1, 3.0)),
               std::invalid_argument);
}

// ============================================================================
// Knot helpers
// ============================================================================

TEST(TrajectoryPlannerKnotTest, KnotTimesAreEvenlySpaced)
{
  EXPECT_EQ(TrajectoryPlanner::knotTimes(3, 2.0), (std::vector<double>{0.0, 1.0, 2.0}));
  EXPECT_EQ(TrajectoryPlanner::knotTimes(2, 0.5), (std::vector<double>{0.0, 0.5}));
  EXPECT_THROW(static_cast<void>(TrajectoryPlanner::knotTimes(1, 1.0)), std::invalid_argument);
  EXPECT_THROW(static_cast<void>(TrajectoryPlanner::knotTimes(3, -1.0)), std::invalid_argument);
}

TEST(TrajectoryPlannerKnotTest, NearestKnotPrefersEarliestOnTie)
{
  const std::vector<double> knots{0.0, 1.0, 2.0};

  EXPECT_EQ(TrajectoryPlanner::nearestKnot(knots, 0.5), 0u);
  EXPECT_EQ(TrajectoryPlanner::nearestKnot(knots, 0.6), 1u);
  EXPECT_EQ(TrajectoryPlanner::nearestKnot(knots, 5.0), 2u);
}

TEST(TrajectoryPlannerKnotTest, RampFactorSaturates)
{
  EXPECT_DOUBLE_EQ(TrajectoryPlanner::rampFactor(1, 1, 5), 0.0);
  EXPECT_DOUBLE_EQ(TrajectoryPlanner::rampFactor(3, 1, 5), 0.5);
  EXPECT_DOUBLE_EQ(TrajectoryPlanner::rampFactor(5, 1, 5), 1.0);
  EXPECT_DOUBLE_EQ(TrajectoryPlanner::rampFactor(4, 4, 4), 1.0);
}

}  // namespace cut_sim
