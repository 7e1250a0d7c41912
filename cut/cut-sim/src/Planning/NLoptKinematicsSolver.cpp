// Ticket: 0003_trajectory_planner

#include "cut-sim/src/Planning/NLoptKinematicsSolver.hpp"

#include <nlopt.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <stdexcept>
#include <string>

#include "cut-sim/src/Kinematics/RotationUtils.hpp"

namespace cut_sim
{

namespace
{

/// Residual rows evaluated on one knot posture
using KnotResidual = std::function<Eigen::VectorXd(const Eigen::VectorXd&)>;

Eigen::VectorXd knotPosture(const double* x, size_t knot, Eigen::Index nq)
{
  return Eigen::Map<const Eigen::VectorXd>(x + knot * static_cast<size_t>(nq), nq);
}

/**
 * Fill result rows and, if requested, the forward-difference Jacobian with
 * respect to the knot's own variables. grad is m x n row-major.
 */
void evaluateKnotRows(const KnotResidual& residual,
                      unsigned m,
                      double* result,
                      unsigned n,
                      const double* x,
                      double* grad,
                      size_t knot,
                      Eigen::Index nq,
                      double step)
{
  const Eigen::VectorXd q = knotPosture(x, knot, nq);
  const Eigen::VectorXd r = residual(q);
  for (unsigned i = 0; i < m; ++i)
  {
    result[i] = r[static_cast<Eigen::Index>(i)];
  }

  if (grad == nullptr)
  {
    return;
  }

  std::fill(grad, grad + static_cast<size_t>(m) * n, 0.0);
  const size_t offset = knot * static_cast<size_t>(nq);
  Eigen::VectorXd perturbed = q;
  for (Eigen::Index j = 0; j < nq; ++j)
  {
    perturbed[j] = q[j] + step;
    const Eigen::VectorXd rp = residual(perturbed);
    perturbed[j] = q[j];
    for (unsigned i = 0; i < m; ++i)
    {
      grad[static_cast<size_t>(i) * n + offset + static_cast<size_t>(j)] =
        (rp[static_cast<Eigen::Index>(i)] - r[static_cast<Eigen::Index>(i)]) /
        step;
    }
  }
}

bool isArticulated(const KinematicModel& model, size_t index)
{
  int current = static_cast<int>(index);
  while (current != Body::kWorld)
  {
    const Body& body = model.body(static_cast<size_t>(current));
    if (body.joint.type == JointType::Revolute ||
        body.joint.type == JointType::Prismatic)
    {
      return true;
    }
    current = body.parent;
  }
  return false;
}

void checkBox(const Eigen::Vector3d& lower,
              const Eigen::Vector3d& upper,
              const std::string& frame)
{
  if (!lower.allFinite() || !upper.allFinite() ||
      (lower.array() > upper.array()).any())
  {
    throw std::invalid_argument(
      "NLoptKinematicsSolver: malformed pose box on frame '" + frame + "'");
  }
}

}  // namespace

struct NLoptKinematicsSolver::SolveContext
{
  const KinematicModel* model;
  Eigen::Index nq;
  size_t knotCount;
  const Eigen::MatrixXd* nominal;
  double nominalWeight;
  double smoothnessWeight;
  double step;
  std::vector<std::pair<size_t, size_t>> pairs;
  double minDistance;
};

struct NLoptKinematicsSolver::PoseData
{
  const SolveContext* context;
  size_t knot;
  const Frame* frame;
  bool orientation;
  Eigen::Vector3d center;
  Eigen::Vector3d halfWidth;

  /// Two rows per axis: (v - c) - h <= 0 and -(v - c) - h <= 0
  [[nodiscard]] Eigen::VectorXd residual(const Eigen::VectorXd& q) const
  {
    const Eigen::Isometry3d pose = context->model->framePose(q, *frame);
    Eigen::Vector3d delta;
    if (orientation)
    {
      delta = wrapAngles(rotationToRpy(pose.linear()) - center);
    }
    else
    {
      delta = pose.translation() - center;
    }
    Eigen::VectorXd rows(6);
    rows.head<3>() = delta - halfWidth;
    rows.tail<3>() = -delta - halfWidth;
    return rows;
  }
};

struct NLoptKinematicsSolver::DistanceData
{
  const SolveContext* context;
  size_t knot;

  [[nodiscard]] Eigen::VectorXd residual(const Eigen::VectorXd& q) const
  {
    const KinematicModel& model = *context->model;
    const auto transforms = model.forwardKinematics(q);
    Eigen::VectorXd rows(static_cast<Eigen::Index>(context->pairs.size()));
    for (size_t p = 0; p < context->pairs.size(); ++p)
    {
      const auto [a, b] = context->pairs[p];
      const double radiusA = model.body(a).halfExtents.minCoeff();
      const double radiusB = model.body(b).halfExtents.minCoeff();
      const double centers =
        (transforms[a].translation() - transforms[b].translation()).norm();
      rows[static_cast<Eigen::Index>(p)] =
        context->minDistance - (centers - radiusA - radiusB);
    }
    return rows;
  }
};

NLoptKinematicsSolver::NLoptKinematicsSolver()
  : config_{}
{
}

NLoptKinematicsSolver::NLoptKinematicsSolver(Config config)
  : config_{config}
{
}

std::vector<std::pair<size_t, size_t>> NLoptKinematicsSolver::separationPairs(
  const KinematicModel& model)
{
  std::vector<std::pair<size_t, size_t>> pairs;
  const size_t count = model.bodyCount();
  std::vector<bool> articulated(count);
  for (size_t i = 0; i < count; ++i)
  {
    articulated[i] = isArticulated(model, i);
  }

  for (size_t i = 0; i < count; ++i)
  {
    const Body& a = model.body(i);
    if (!a.hasGeometry() || a.joint.type == JointType::Floating)
    {
      continue;
    }
    for (size_t j = i + 1; j < count; ++j)
    {
      const Body& b = model.body(j);
      if (!b.hasGeometry() || b.joint.type == JointType::Floating)
      {
        continue;
      }
      if (!articulated[i] && !articulated[j])
      {
        continue;
      }
      if (model.areAdjacent(i, j))
      {
        continue;
      }
      pairs.emplace_back(i, j);
    }
  }
  return pairs;
}

KinematicsSolution NLoptKinematicsSolver::solve(const TrajectoryProblem& problem)
{
  if (!problem.model)
  {
    throw std::invalid_argument("NLoptKinematicsSolver: problem has no model");
  }
  const KinematicModel& model = *problem.model;
  const Eigen::Index nq = model.positionCount();
  const size_t knotCount = problem.knotTimes.size();
  const auto knots = static_cast<Eigen::Index>(knotCount);

  if (knotCount == 0)
  {
    throw std::invalid_argument("NLoptKinematicsSolver: no knots");
  }
  if (problem.seed.rows() != nq || problem.seed.cols() != knots)
  {
    throw std::invalid_argument("NLoptKinematicsSolver: seed dimension mismatch");
  }
  if (problem.nominal.rows() != nq || problem.nominal.cols() != knots)
  {
    throw std::invalid_argument(
      "NLoptKinematicsSolver: nominal dimension mismatch");
  }

  const size_t numVars = knotCount * static_cast<size_t>(nq);

  // Variable bounds: joint limits intersected with posture constraints
  std::vector<double> lowerBounds(numVars);
  std::vector<double> upperBounds(numVars);
  const Eigen::VectorXd jointLower = model.lowerLimits();
  const Eigen::VectorXd jointUpper = model.upperLimits();
  for (size_t k = 0; k < knotCount; ++k)
  {
    for (Eigen::Index j = 0; j < nq; ++j)
    {
      const size_t v = k * static_cast<size_t>(nq) + static_cast<size_t>(j);
      lowerBounds[v] = std::isinf(jointLower[j]) ? -HUGE_VAL : jointLower[j];
      upperBounds[v] = std::isinf(jointUpper[j]) ? HUGE_VAL : jointUpper[j];
    }
  }

  double minDistance = -1.0;
  for (const auto& constraint : problem.constraints)
  {
    if (const auto* posture = std::get_if<PostureConstraint>(&constraint))
    {
      const auto count = static_cast<Eigen::Index>(posture->indices.size());
      if (posture->lower.size() != count || posture->upper.size() != count)
      {
        throw std::invalid_argument(
          "NLoptKinematicsSolver: posture bound size mismatch");
      }
      for (size_t k = 0; k < knotCount; ++k)
      {
        if (!posture->span.isActiveAt(problem.knotTimes[k]))
        {
          continue;
        }
        for (Eigen::Index i = 0; i < count; ++i)
        {
          const Eigen::Index j = posture->indices[static_cast<size_t>(i)];
          if (j < 0 || j >= nq)
          {
            throw std::invalid_argument(
              "NLoptKinematicsSolver: posture index out of range");
          }
          const size_t v = k * static_cast<size_t>(nq) + static_cast<size_t>(j);
          lowerBounds[v] = std::max(lowerBounds[v], posture->lower[i]);
          upperBounds[v] = std::min(upperBounds[v], posture->upper[i]);
        }
      }
    }
    else if (const auto* distance = std::get_if<MinDistanceConstraint>(&constraint))
    {
      minDistance = std::max(minDistance, distance->minDistance);
    }
  }

  // Seed clamped into the bounds
  std::vector<double> x(numVars);
  for (size_t k = 0; k < knotCount; ++k)
  {
    for (Eigen::Index j = 0; j < nq; ++j)
    {
      const size_t v = k * static_cast<size_t>(nq) + static_cast<size_t>(j);
      const double value = problem.seed(j, static_cast<Eigen::Index>(k));
      x[v] = std::min(std::max(value, lowerBounds[v]), upperBounds[v]);
    }
  }

  auto toKnots = [&](const std::vector<double>& values)
  {
    Eigen::MatrixXd result(nq, knots);
    for (size_t k = 0; k < knotCount; ++k)
    {
      result.col(static_cast<Eigen::Index>(k)) = knotPosture(values.data(), k, nq);
    }
    return result;
  };

  for (size_t v = 0; v < numVars; ++v)
  {
    if (lowerBounds[v] > upperBounds[v])
    {
      spdlog::debug("NLoptKinematicsSolver: empty bounds on variable {}", v);
      return KinematicsSolution{toKnots(x), solver_status::kInfeasible};
    }
  }

  SolveContext context{&model,
                       nq,
                       knotCount,
                       &problem.nominal,
                       config_.nominalWeight,
                       config_.smoothnessWeight,
                       config_.finiteDifferenceStep,
                       {},
                       minDistance};
  if (minDistance >= 0.0)
  {
    context.pairs = separationPairs(model);
  }

  // Pose rows, one block of six per (constraint, active knot)
  std::vector<PoseData> poseData;
  for (const auto& constraint : problem.constraints)
  {
    const Frame* frame = nullptr;
    bool orientation = false;
    Eigen::Vector3d lower;
    Eigen::Vector3d upper;
    TimeSpan span;
    if (const auto* position = std::get_if<WorldPositionConstraint>(&constraint))
    {
      frame = &model.frame(position->frame);
      checkBox(position->lower, position->upper, position->frame);
      lower = position->lower;
      upper = position->upper;
      span = position->span;
    }
    else if (const auto* euler = std::get_if<WorldEulerConstraint>(&constraint))
    {
      frame = &model.frame(euler->frame);
      checkBox(euler->lower, euler->upper, euler->frame);
      orientation = true;
      lower = euler->lower;
      upper = euler->upper;
      span = euler->span;
    }
    else
    {
      continue;
    }

    for (size_t k = 0; k < knotCount; ++k)
    {
      if (span.isActiveAt(problem.knotTimes[k]))
      {
        poseData.push_back(PoseData{&context,
                                    k,
                                    frame,
                                    orientation,
                                    0.5 * (lower + upper),
                                    0.5 * (upper - lower)});
      }
    }
  }

  std::vector<DistanceData> distanceData;
  if (!context.pairs.empty())
  {
    distanceData.reserve(knotCount);
    for (size_t k = 0; k < knotCount; ++k)
    {
      distanceData.push_back(DistanceData{&context, k});
    }
  }

  auto maxViolation = [&](const std::vector<double>& values)
  {
    double worst = 0.0;
    for (const auto& data : poseData)
    {
      worst = std::max(worst,
                       data.residual(knotPosture(values.data(), data.knot, nq))
                         .maxCoeff());
    }
    for (const auto& data : distanceData)
    {
      worst = std::max(worst,
                       data.residual(knotPosture(values.data(), data.knot, nq))
                         .maxCoeff());
    }
    return worst;
  };

  if (numVars == 0)
  {
    return KinematicsSolution{toKnots(x), solver_status::kSuccess};
  }

  nlopt::opt opt{nlopt::LD_SLSQP, static_cast<unsigned>(numVars)};
  opt.set_min_objective(objective, &context);
  opt.set_lower_bounds(lowerBounds);
  opt.set_upper_bounds(upperBounds);

  for (auto& data : poseData)
  {
    opt.add_inequality_mconstraint(
      poseConstraint, &data, std::vector<double>(6, config_.constraintTolerance));
  }
  for (auto& data : distanceData)
  {
    opt.add_inequality_mconstraint(
      distanceConstraint,
      &data,
      std::vector<double>(context.pairs.size(), config_.constraintTolerance));
  }

  opt.set_ftol_rel(config_.relativeTolerance);
  opt.set_xtol_rel(config_.relativeTolerance);
  opt.set_maxeval(config_.maxEvaluations);

  double finalObjective = std::numeric_limits<double>::quiet_NaN();
  nlopt::result result{};
  try
  {
    result = opt.optimize(x, finalObjective);
  }
  catch (const nlopt::roundoff_limited&)
  {
    const bool feasible = maxViolation(x) <= config_.feasibilityTolerance;
    return KinematicsSolution{toKnots(x),
                              feasible ? solver_status::kAccuracyNotAchieved
                                       : solver_status::kInfeasible};
  }
  catch (const std::invalid_argument& e)
  {
    throw std::runtime_error(
      std::string("NLoptKinematicsSolver: invalid problem setup: ") + e.what());
  }
  catch (const std::runtime_error& e)
  {
    spdlog::warn("NLoptKinematicsSolver: optimization failed: {}", e.what());
    return KinematicsSolution{toKnots(x), solver_status::kSolverError};
  }

  if (result == nlopt::MAXEVAL_REACHED || result == nlopt::MAXTIME_REACHED)
  {
    return KinematicsSolution{toKnots(x), solver_status::kIterationLimit};
  }

  const bool feasible = maxViolation(x) <= config_.feasibilityTolerance;
  return KinematicsSolution{
    toKnots(x), feasible ? solver_status::kSuccess : solver_status::kInfeasible};
}

double NLoptKinematicsSolver::objective(const std::vector<double>& x,
                                        std::vector<double>& grad,
                                        void* data)
{
  const auto* context = static_cast<const SolveContext*>(data);
  const Eigen::Index nq = context->nq;
  const auto knots = static_cast<Eigen::Index>(context->knotCount);
  const Eigen::Map<const Eigen::MatrixXd> q(x.data(), nq, knots);
  const Eigen::MatrixXd& nominal = *context->nominal;

  const Eigen::MatrixXd tracking = q - nominal;
  double f = 0.5 * context->nominalWeight * tracking.squaredNorm();

  Eigen::MatrixXd gradient = context->nominalWeight * tracking;
  for (Eigen::Index k = 1; k + 1 < knots; ++k)
  {
    const Eigen::VectorXd accel = q.col(k - 1) - 2.0 * q.col(k) + q.col(k + 1);
    f += 0.5 * context->smoothnessWeight * accel.squaredNorm();
    gradient.col(k - 1) += context->smoothnessWeight * accel;
    gradient.col(k) -= 2.0 * context->smoothnessWeight * accel;
    gradient.col(k + 1) += context->smoothnessWeight * accel;
  }

  if (!grad.empty())
  {
    Eigen::Map<Eigen::MatrixXd>(grad.data(), nq, knots) = gradient;
  }
  return f;
}

void NLoptKinematicsSolver::poseConstraint(unsigned m,
                                           double* result,
                                           unsigned n,
                                           const double* x,
                                           double* grad,
                                           void* data)
{
  const auto* pose = static_cast<const PoseData*>(data);
  evaluateKnotRows([pose](const Eigen::VectorXd& q) { return pose->residual(q); },
                   m,
                   result,
                   n,
                   x,
                   grad,
                   pose->knot,
                   pose->context->nq,
                   pose->context->step);
}

void NLoptKinematicsSolver::distanceConstraint(unsigned m,
                                               double* result,
                                               unsigned n,
                                               const double* x,
                                               double* grad,
                                               void* data)
{
  const auto* distance = static_cast<const DistanceData*>(data);
  evaluateKnotRows(
    [distance](const Eigen::VectorXd& q) { return distance->residual(q); },
    m,
    result,
    n,
    x,
    grad,
    distance->knot,
    distance->context->nq,
    distance->context->step);
}

}  // namespace cut_sim
