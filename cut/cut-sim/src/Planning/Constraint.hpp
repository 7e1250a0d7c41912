// Ticket: 0003_trajectory_planner

#ifndef CUT_SIM_PLANNING_CONSTRAINT_HPP
#define CUT_SIM_PLANNING_CONSTRAINT_HPP

#include <Eigen/Dense>

#include <limits>
#include <string>
#include <variant>
#include <vector>

namespace cut_sim
{

/**
 * @brief Closed time interval during which a constraint binds
 *
 * The default span covers every knot of the problem.
 */
struct TimeSpan
{
  double start{-std::numeric_limits<double>::infinity()};
  double end{std::numeric_limits<double>::infinity()};

  static TimeSpan at(double t)
  {
    return TimeSpan{t, t};
  }

  [[nodiscard]] bool isActiveAt(double t, double eps = 1e-9) const
  {
    return t >= start - eps && t <= end + eps;
  }
};

/// Bounds on a subset of generalized positions
struct PostureConstraint
{
  std::vector<Eigen::Index> indices;
  Eigen::VectorXd lower;
  Eigen::VectorXd upper;
  TimeSpan span;
};

/// Box on a frame origin in world coordinates
struct WorldPositionConstraint
{
  std::string frame;
  Eigen::Vector3d lower{Eigen::Vector3d::Zero()};
  Eigen::Vector3d upper{Eigen::Vector3d::Zero()};
  TimeSpan span;
};

/// Box on a frame orientation as world roll/pitch/yaw
struct WorldEulerConstraint
{
  std::string frame;
  Eigen::Vector3d lower{Eigen::Vector3d::Zero()};
  Eigen::Vector3d upper{Eigen::Vector3d::Zero()};
  TimeSpan span;
};

/// Minimum separation between every pair of non-adjacent bodies with geometry
struct MinDistanceConstraint
{
  double minDistance{0.0};
};

using Constraint = std::variant<PostureConstraint,
                                WorldPositionConstraint,
                                WorldEulerConstraint,
                                MinDistanceConstraint>;

}  // namespace cut_sim

#endif  // CUT_SIM_PLANNING_CONSTRAINT_HPP
