// Ticket: 0003_trajectory_planner
//
// Benchmarks for the constrained planner on the full experiment world. Every
// iteration runs one complete NLopt SLSQP solve.

#include <benchmark/benchmark.h>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <memory>
#include <vector>

#include "cut-sim/src/Kinematics/RotationUtils.hpp"
#include "cut-sim/src/Planning/NLoptKinematicsSolver.hpp"
#include "cut-sim/src/Planning/TrajectoryPlanner.hpp"
#include "cut-sim/src/World/ExperimentWorldBuilder.hpp"

using namespace cut_sim;

// ============================================================================
// Helpers
// ============================================================================

namespace
{

constexpr std::uint32_t kSeed = 7;
constexpr double kMoveDuration = 2.5;  // [s]

struct BenchSetup
{
  ExperimentWorld world;
  TrajectoryPlanner planner;
  Eigen::VectorXd q0;

  BenchSetup()
    : world{ExperimentWorldBuilder{kSeed}.build()},
      planner{std::make_shared<NLoptKinematicsSolver>(),
              std::make_shared<spdlog::logger>(
                "bench", std::make_shared<spdlog::sinks::null_sink_mt>())},
      q0{world.model->positions(world.initialState)}
  {
  }

  [[nodiscard]] EndEffectorPose homePose() const
  {
    const Eigen::Isometry3d pose =
      world.model->framePose(q0, planner.config().endEffectorFrame);
    return EndEffectorPose{pose.translation(), rotationToRpy(pose.linear())};
  }
};

}  // namespace

/**
 * @brief Rest-to-rest arm move, knot count from the range argument
 */
static void BM_PlanToPosture(benchmark::State& state)
{
  BenchSetup setup;
  const auto knots = static_cast<int>(state.range(0));
  Eigen::VectorXd target = Eigen::VectorXd::Zero(7);
  target << 0.3, 0.4, 0.0, -1.5, 0.0, 1.2, 0.2;

  for (auto _ : state)
  {
    auto result = setup.planner.planToPosture(setup.world.model,
                                              setup.q0,
                                              target,
                                              setup.planner.config().armJoints,
                                              knots,
                                              kMoveDuration);
    benchmark::DoNotOptimize(result.status);
  }
}
BENCHMARK(BM_PlanToPosture)
  ->Arg(4)
  ->Arg(6)
  ->Arg(12);

/**
 * @brief Single-instant inverse kinematics 5 cm below the home pose
 */
static void BM_PlanToEndEffectorPose(benchmark::State& state)
{
  BenchSetup setup;
  EndEffectorPose target = setup.homePose();
  target.position.z() -= 0.05;

  for (auto _ : state)
  {
    auto result = setup.planner.planToEndEffectorPose(setup.world.model, setup.q0, target);
    benchmark::DoNotOptimize(result.status);
  }
}
BENCHMARK(BM_PlanToEndEffectorPose);

/**
 * @brief Reach-then-grasp approach over eight knots
 */
static void BM_PlanMultiTarget(benchmark::State& state)
{
  BenchSetup setup;
  EndEffectorPose grasp = setup.homePose();
  grasp.position.z() -= 0.1;
  EndEffectorPose reach = grasp;
  reach.position.z() += 0.05;

  for (auto _ : state)
  {
    auto result = setup.planner.planMultiTargetTrajectory(
      setup.world.model, setup.q0, reach, grasp, 8, 2.0, 4.0);
    benchmark::DoNotOptimize(result.status);
  }
}
BENCHMARK(BM_PlanMultiTarget);

BENCHMARK_MAIN();
