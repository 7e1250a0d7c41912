// Ticket: 0003_trajectory_planner

#include "cut-sim/src/Planning/NLoptKinematicsSolver.hpp"

#include <gtest/gtest.h>
#include <Eigen/Dense>
#include <numbers>
#include <stdexcept>
#include <utility>

#include "cut-sim/src/Kinematics/RotationUtils.hpp"
#include "cut-sim/src/Planning/TrajectoryPlanner.hpp"
#include "cut-sim/test/Helpers/TestModels.hpp"
#include "cut-utils/src/Logging.hpp"

namespace cut_sim
{

namespace
{

bool isAcceptedStatus(int status)
{
  return status == solver_status::kSuccess ||
         status == solver_status::kAccuracyNotAchieved;
}

TrajectoryProblem postureProblem(std::shared_ptr<const KinematicModel> model,
                                 double lower,
                                 double upper)
{
  TrajectoryProblem problem;
  problem.model = std::move(model);
  problem.knotTimes = {0.0, 1.0};
  problem.seed = Eigen::MatrixXd::Zero(3, 2);
  problem.nominal = Eigen::MatrixXd::Zero(3, 2);
  problem.constraints.emplace_back(PostureConstraint{
    {0}, Eigen::VectorXd::Constant(1, lower), Eigen::VectorXd::Constant(1, upper), TimeSpan::at(1.0)});
  return problem;
}

}  // namespace

TEST(NLoptKinematicsSolverTest, SeparationPairsSkipAdjacentAndGeometryFreeBodies)
{
  auto arm = test::makePlanarArm();

  const auto pairs = NLoptKinematicsSolver::separationPairs(*arm);

  // base/link_1 and link_1/link_2 are adjacent, the slider has no geometry
  ASSERT_EQ(pairs.size(), 1u);
  EXPECT_EQ(pairs.front(), (std::pair<size_t, size_t>{0, 2}));
}

TEST(NLoptKinematicsSolverTest, SeparationPairsExcludeFloatingBodies)
{
  auto boxes = test::makeBoxModel(3);

  EXPECT_TRUE(NLoptKinematicsSolver::separationPairs(*boxes).empty());
}

TEST(NLoptKinematicsSolverTest, PostureBoxesBecomeVariableBounds)
{
  NLoptKinematicsSolver solver;

  const KinematicsSolution solution =
    solver.solve(postureProblem(test::makePlanarArm(), 0.4, 0.5));

  EXPECT_TRUE(isAcceptedStatus(solution.status));
  EXPECT_GE(solution.knots(0, 1), 0.4 - 1e-9);
  EXPECT_LE(solution.knots(0, 1), 0.5 + 1e-9);
}

TEST(NLoptKinematicsSolverTest, EmptyBoundIntersectionIsInfeasible)
{
  NLoptKinematicsSolver solver;
  TrajectoryProblem problem = postureProblem(test::makePlanarArm(), 0.4, 0.5);
  problem.constraints.emplace_back(PostureConstraint{
    {0}, Eigen::VectorXd::Constant(1, 1.0), Eigen::VectorXd::Constant(1, 1.1), TimeSpan{}});

  const KinematicsSolution solution = solver.solve(problem);

  EXPECT_EQ(solution.status, solver_status::kInfeasible);
  EXPECT_EQ(solution.knots.rows(), 3);
  EXPECT_EQ(solution.knots.cols(), 2);
}

TEST(NLoptKinematicsSolverTest, RejectsMalformedProblems)
{
  NLoptKinematicsSolver solver;

  TrajectoryProblem noModel = postureProblem(test::makePlanarArm(), 0.0, 0.1);
  noModel.model.reset();
  EXPECT_THROW(static_cast<void>(solver.solve(noModel)), std::invalid_argument);

  TrajectoryProblem badSeed = postureProblem(test::makePlanarArm(), 0.0, 0.1);
  badSeed.seed = Eigen::MatrixXd::Zero(2, 2);
  EXPECT_THROW(static_cast<void>(solver.solve(badSeed)), std::invalid_argument);

  TrajectoryProblem badFrame = postureProblem(test::makePlanarArm(), 0.0, 0.1);
  badFrame.constraints.emplace_back(WorldPositionConstraint{
    "no_such_frame", Eigen::Vector3d::Zero(), Eigen::Vector3d::Ones(), TimeSpan{}});
  EXPECT_THROW(static_cast<void>(solver.solve(badFrame)), std::invalid_argument);
}

TEST(NLoptKinematicsSolverTest, PlannerReachesPlanarPose)
{
  auto arm = test::makePlanarArm();
  TrajectoryPlanner planner{std::make_shared<NLoptKinematicsSolver>(),
                            cut_utils::makeNullLogger("nlopt_test"),
                            test::planarArmPlannerConfig()};
  const Eigen::VectorXd q0 = Eigen::Vector3d{0.1, 1.2, 0.0};
  const EndEffectorPose target{Eigen::Vector3d{0.4, 0.4, 0.1},
                               Eigen::Vector3d{0.0, 0.0, std::numbers::pi / 2.0}};

  const auto result = planner.planToEndEffectorPose(arm, q0, target);

  ASSERT_TRUE(isAcceptedStatus(result.status));
  const Eigen::Isometry3d tip = arm->framePose(result.value, "tip");
  EXPECT_TRUE(((tip.translation() - target.position).array().abs() <= 0.01 + 1e-6).all());
  EXPECT_NEAR(rotationToRpy(tip.linear()).z(), std::numbers::pi / 2.0, 0.01 + 1e-6);
  EXPECT_NEAR(result.value[2], 0.0, 0.01 + 1e-6);
}

TEST(NLoptKinematicsSolverTest, IdenticalProblemsGiveIdenticalPlans)
{
  auto arm = test::makePlanarArm();
  TrajectoryPlanner planner{std::make_shared<NLoptKinematicsSolver>(),
                            cut_utils::makeNullLogger("nlopt_test"),
                            test::planarArmPlannerConfig()};
  const Eigen::VectorXd q0 = Eigen::Vector3d{0.1, 0.2, 0.0};

  const auto first = planner.planToPosture(
    arm, q0, Eigen::Vector2d{0.8, -0.6}, {"joint_1", "joint_2"}, 6, 2.0);
  const auto second = planner.planToPosture(
    arm, q0, Eigen::Vector2d{0.8, -0.6}, {"joint_1", "joint_2"}, 6, 2.0);

  EXPECT_EQ(first.status, second.status);
  EXPECT_EQ(first.value.samples(), second.value.samples());
  EXPECT_EQ(first.value.breaks(), second.value.breaks());
}

TEST(NLoptKinematicsSolverTest, IdenticalPoseQueriesGiveIdenticalPostures)
{
  auto arm = test::makePlanarArm();
  TrajectoryPlanner planner{std::make_shared<NLoptKinematicsSolver>(),
                            cut_utils::makeNullLogger("nlopt_test"),
                            test::planarArmPlannerConfig()};
  const Eigen::VectorXd q0 = Eigen::Vector3d{0.1, 1.2, 0.0};
  const Eigen::VectorXd seed = Eigen::Vector3d{0.3, 1.0, 0.0};
  const EndEffectorPose target{Eigen::Vector3d{0.4, 0.4, 0.1},
                               Eigen::Vector3d{0.0, 0.0, std::numbers::pi / 2.0}};

  const auto first = planner.planToEndEffectorPose(arm, q0, target, seed);
  const auto second = planner.planToEndEffectorPose(arm, q0, target, seed);

  EXPECT_EQ(first.status, second.status);
  ASSERT_EQ(first.value.size(), second.value.size());
  for (Eigen::Index i = 0; i < first.value.size(); ++i)
  {
    EXPECT_EQ(first.value[i], second.value[i]) << "joint " << i;
  }
}

TEST(NLoptKinematicsSolverTest, HeldJointStaysInBandOverWholePlan)
{
  auto arm = test::makePlanarArm();
  TrajectoryPlanner planner{std::make_shared<NLoptKinematicsSolver>(),
                            cut_utils::makeNullLogger("nlopt_test"),
                            test::planarArmPlannerConfig()};
  const double tol = planner.config().postureTolerance;

  // Slider starts beyond its 0.5 limit
  const Eigen::VectorXd q0 = Eigen::Vector3d{0.1, 0.2, 0.7};
  const auto result = planner.planToPosture(
    arm, q0, Eigen::Vector2d{0.8, -0.6}, {"joint_1", "joint_2"}, 6, 2.0);

  ASSERT_TRUE(isAcceptedStatus(result.status));
  for (int i = 0; i <= 400; ++i)
  {
    const double t = 2.0 * i / 400.0;
    const double held = result.value.value(t)[2];
    EXPECT_GE(held, 0.5 - tol - 1e-6) << "t = " << t;
    EXPECT_LE(held, 0.5 + 1e-9) << "t = " << t;
  }
  EXPECT_NEAR(result.value.value(2.0)[0], 0.8, tol + 1e-6);
  EXPECT_NEAR(result.value.value(2.0)[1], -0.6, tol + 1e-6);
}

}  // namespace cut_sim
