// Ticket: 0003_trajectory_planner

#include "cut-sim/src/Planning/TrajectoryPlanner.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace cut_sim
{

namespace
{

PostureConstraint boxAround(const std::vector<Eigen::Index>& indices,
                            const Eigen::VectorXd& q,
                            double tolerance,
                            TimeSpan span)
{
  Eigen::VectorXd center(static_cast<Eigen::Index>(indices.size()));
  for (size_t i = 0; i < indices.size(); ++i)
  {
    center[static_cast<Eigen::Index>(i)] = q[indices[i]];
  }
  return PostureConstraint{indices,
                           (center.array() - tolerance).matrix(),
                           (center.array() + tolerance).matrix(),
                           span};
}

void addPoseTarget(std::vector<Constraint>& constraints,
                   const std::string& frame,
                   const EndEffectorPose& pose,
                   double positionTolerance,
                   double orientationTolerance,
                   TimeSpan span)
{
  const Eigen::Vector3d dp = Eigen::Vector3d::Constant(positionTolerance);
  const Eigen::Vector3d dr = Eigen::Vector3d::Constant(orientationTolerance);
  constraints.emplace_back(
    WorldPositionConstraint{frame, pose.position - dp, pose.position + dp, span});
  constraints.emplace_back(
    WorldEulerConstraint{frame, pose.rpy - dr, pose.rpy + dr, span});
}

}  // namespace

TrajectoryPlanner::TrajectoryPlanner(std::shared_ptr<KinematicsSolver> solver,
                                     std::shared_ptr<spdlog::logger> logger)
  : TrajectoryPlanner{std::move(solver), std::move(logger), Config{}}
{
}

TrajectoryPlanner::TrajectoryPlanner(std::shared_ptr<KinematicsSolver> solver,
                                     std::shared_ptr<spdlog::logger> logger,
                                     Config config)
  : solver_{std::move(solver)},
    logger_{std::move(logger)},
    config_{std::move(config)}
{
  if (!solver_)
  {
    throw std::invalid_argument("TrajectoryPlanner: solver must not be null");
  }
  if (!logger_)
  {
    throw std::invalid_argument("TrajectoryPlanner: logger must not be null");
  }
}

std::vector<double> TrajectoryPlanner::knotTimes(int knotCount, double duration)
{
  if (knotCount < 2)
  {
    throw std::invalid_argument("TrajectoryPlanner: knotCount must be at least 2");
  }
  if (!(duration > 0.0) || !std::isfinite(duration))
  {
    throw std::invalid_argument("TrajectoryPlanner: duration must be positive");
  }
  std::vector<double> times(static_cast<size_t>(knotCount));
  const double dt = duration / static_cast<double>(knotCount - 1);
  for (int k = 0; k < knotCount; ++k)
  {
    times[static_cast<size_t>(k)] = dt * static_cast<double>(k);
  }
  times.back() = duration;
  return times;
}

size_t TrajectoryPlanner::nearestKnot(const std::vector<double>& knots,
                                      double time)
{
  if (knots.empty())
  {
    throw std::invalid_argument("TrajectoryPlanner: no knots");
  }
  size_t best = 0;
  for (size_t k = 1; k < knots.size(); ++k)
  {
    if (std::abs(knots[k] - time) < std::abs(knots[best] - time))
    {
      best = k;
    }
  }
  return best;
}

double TrajectoryPlanner::rampFactor(size_t knot, size_t reachKnot, size_t lastKnot)
{
  if (knot <= reachKnot)
  {
    return reachKnot >= lastKnot ? 1.0 : 0.0;
  }
  if (knot >= lastKnot)
  {
    return 1.0;
  }
  return static_cast<double>(knot - reachKnot) /
         static_cast<double>(lastKnot - reachKnot);
}

void TrajectoryPlanner::checkPosture(const KinematicModel& model,
                                     const Eigen::VectorXd& q) const
{
  if (q.size() != model.positionCount())
  {
    throw std::invalid_argument("TrajectoryPlanner: posture has " +
                                std::to_string(q.size()) +
                                " entries, model expects " +
                                std::to_string(model.positionCount()));
  }
}

void TrajectoryPlanner::report(const char* operation, int status) const
{
  if (status == kNominalSuccess)
  {
    logger_->debug("TrajectoryPlanner::{}: solved", operation);
  }
  else
  {
    logger_->warn(
      "TrajectoryPlanner::{}: solver returned status {}, result is best-effort",
      operation,
      status);
  }
}

PlanResult<PchipTrajectory> TrajectoryPlanner::planToPosture(
  const std::shared_ptr<const KinematicModel>& model,
  const Eigen::VectorXd& q0,
  const Eigen::VectorXd& qfTargetSubset,
  const std::vector<std::string>& controlledJoints,
  int knotCount,
  double duration,
  double startTime) const
{
  if (!model)
  {
    throw std::invalid_argument("TrajectoryPlanner::planToPosture: null model");
  }
  checkPosture(*model, q0);
  if (qfTargetSubset.size() != static_cast<Eigen::Index>(controlledJoints.size()))
  {
    throw std::invalid_argument(
      "TrajectoryPlanner::planToPosture: one target value per controlled joint "
      "required");
  }
  const std::vector<double> times = knotTimes(knotCount, duration);
  const auto [controlled, held] = model->splitPositionIndices(controlledJoints);

  const Eigen::VectorXd start = model->clampToLimits(q0);
  Eigen::VectorXd target = start;
  for (size_t i = 0; i < controlled.size(); ++i)
  {
    target[controlled[i]] = qfTargetSubset[static_cast<Eigen::Index>(i)];
  }
  target = model->clampToLimits(target);

  const double tol = config_.postureTolerance;
  TrajectoryProblem problem;
  problem.model = model;
  problem.knotTimes = times;
  problem.constraints.emplace_back(boxAround(held, start, tol, TimeSpan{}));
  problem.constraints.emplace_back(
    boxAround(controlled, start, tol, TimeSpan::at(times.front())));
  problem.constraints.emplace_back(
    boxAround(controlled, target, tol, TimeSpan::at(times.back())));

  const auto knots = static_cast<Eigen::Index>(times.size());
  problem.seed.resize(model->positionCount(), knots);
  problem.nominal.resize(model->positionCount(), knots);
  for (Eigen::Index k = 0; k < knots; ++k)
  {
    const double s = times[static_cast<size_t>(k)] / duration;
    problem.seed.col(k) = start + s * (target - start);
    problem.nominal.col(k) = target;
  }

  KinematicsSolution solution = solver_->solve(problem);
  if (solution.knots.rows() != model->positionCount() ||
      solution.knots.cols() != knots)
  {
    throw std::runtime_error(
      "TrajectoryPlanner::planToPosture: solver returned malformed knots");
  }
  report("planToPosture", solution.status);

  PchipTrajectory trajectory{times, std::move(solution.knots), true};
  return PlanResult<PchipTrajectory>{trajectory.shifted(startTime),
                                     solution.status};
}

PlanResult<Eigen::VectorXd> TrajectoryPlanner::planToEndEffectorPose(
  const std::shared_ptr<const KinematicModel>& model,
  const Eigen::VectorXd& q0,
  const EndEffectorPose& target,
  const std::optional<Eigen::VectorXd>& seed) const
{
  if (!model)
  {
    throw std::invalid_argument(
      "TrajectoryPlanner::planToEndEffectorPose: null model");
  }
  checkPosture(*model, q0);
  if (seed)
  {
    checkPosture(*model, *seed);
  }
  static_cast<void>(model->frame(config_.endEffectorFrame));
  const std::vector<Eigen::Index> held =
    model->splitPositionIndices(config_.armJoints).second;

  const Eigen::VectorXd start = model->clampToLimits(q0);

  TrajectoryProblem problem;
  problem.model = model;
  problem.knotTimes = {0.0};
  problem.constraints.emplace_back(
    boxAround(held, start, config_.postureTolerance, TimeSpan{}));
  addPoseTarget(problem.constraints,
                config_.endEffectorFrame,
                target,
                config_.positionTolerance,
                config_.orientationTolerance,
                TimeSpan{});
  problem.constraints.emplace_back(MinDistanceConstraint{config_.minDistance});
  problem.seed = seed ? *seed : start;
  problem.nominal = start;

  const KinematicsSolution solution = solver_->solve(problem);
  if (solution.knots.rows() != model->positionCount() ||
      solution.knots.cols() != 1)
  {
    throw std::runtime_error(
      "TrajectoryPlanner::planToEndEffectorPose: solver returned malformed knots");
  }
  report("planToEndEffectorPose", solution.status);
  return PlanResult<Eigen::VectorXd>{solution.knots.col(0), solution.status};
}

PlanResult<PchipTrajectory> TrajectoryPlanner::planMultiTargetTrajectory(
  const std::shared_ptr<const KinematicModel>& model,
  const Eigen::VectorXd& q0,
  const EndEffectorPose& reachPose,
  const EndEffectorPose& graspPose,
  int knotCount,
  double reachTime,
  double graspTime,
  double startTime) const
{
  if (!model)
  {
    throw std::invalid_argument(
      "TrajectoryPlanner::planMultiTargetTrajectory: null model");
  }
  checkPosture(*model, q0);
  const std::vector<double> times = knotTimes(knotCount, graspTime);
  if (reachTime < 0.0 || reachTime > graspTime)
  {
    throw std::invalid_argument(
      "TrajectoryPlanner::planMultiTargetTrajectory: reachTime must lie in "
      "[0, graspTime]");
  }
  static_cast<void>(model->frame(config_.endEffectorFrame));
  const auto [controlled, held] = model->splitPositionIndices(config_.armJoints);

  const Eigen::VectorXd start = model->clampToLimits(q0);
  const double tol = config_.postureTolerance;

  TrajectoryProblem problem;
  problem.model = model;
  problem.knotTimes = times;
  problem.constraints.emplace_back(boxAround(held, start, tol, TimeSpan{}));
  problem.constraints.emplace_back(
    boxAround(controlled, start, tol, TimeSpan::at(times.front())));

  const size_t reachKnot = nearestKnot(times, reachTime);
  const size_t lastKnot = times.size() - 1;
  for (size_t k = reachKnot; k <= lastKnot; ++k)
  {
    const double s = rampFactor(k, reachKnot, lastKnot);
    addPoseTarget(problem.constraints,
                  config_.endEffectorFrame,
                  EndEffectorPose::lerp(reachPose, graspPose, s),
                  config_.positionTolerance,
                  config_.rampOrientationTolerance,
                  TimeSpan::at(times[k]));
  }

  const auto knots = static_cast<Eigen::Index>(times.size());
  problem.seed = start.replicate(1, knots);
  problem.nominal = problem.seed;

  KinematicsSolution solution = solver_->solve(problem);
  if (solution.knots.rows() != model->positionCount() ||
      solution.knots.cols() != knots)
  {
    throw std::runtime_error(
      "TrajectoryPlanner::planMultiTargetTrajectory: solver returned malformed "
      "knots");
  }
  report("planMultiTargetTrajectory", solution.status);

  PchipTrajectory trajectory{times, std::move(solution.knots), true};
  return PlanResult<PchipTrajectory>{trajectory.shifted(startTime),
                                     solution.status};
}

}  // namespace cut_sim
