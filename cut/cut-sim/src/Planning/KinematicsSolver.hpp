// Ticket: 0003_trajectory_planner

#ifndef CUT_SIM_PLANNING_KINEMATICS_SOLVER_HPP
#define CUT_SIM_PLANNING_KINEMATICS_SOLVER_HPP

#include <Eigen/Dense>

#include <memory>
#include <vector>

#include "cut-sim/src/Kinematics/KinematicModel.hpp"
#include "cut-sim/src/Planning/Constraint.hpp"

namespace cut_sim
{

/// Solver status codes surfaced unchanged through PlanResult
namespace solver_status
{
inline constexpr int kSuccess = 1;
inline constexpr int kAccuracyNotAchieved = 3;
inline constexpr int kInfeasible = 13;
inline constexpr int kIterationLimit = 31;
inline constexpr int kSolverError = 100;
}  // namespace solver_status

/**
 * @brief Constrained inverse-kinematics problem over a set of knots
 *
 * Decision variables are the generalized positions at each knot time.
 * @c seed and @c nominal are positionCount() x knotTimes.size().
 */
struct TrajectoryProblem
{
  std::shared_ptr<const KinematicModel> model;
  std::vector<double> knotTimes;
  Eigen::MatrixXd seed;
  Eigen::MatrixXd nominal;
  std::vector<Constraint> constraints;
};

struct KinematicsSolution
{
  Eigen::MatrixXd knots;  ///< positionCount() x knot count
  int status{solver_status::kSolverError};
};

/**
 * @brief Boundary to a constrained nonlinear IK solver
 *
 * Implementations must be deterministic for identical problems. A failed
 * solve is reported through the status code together with the solver's best
 * knots; only malformed problems throw.
 *
 * @ticket 0003_trajectory_planner
 */
class KinematicsSolver
{
public:
  virtual ~KinematicsSolver() = default;

  /**
   * @throws std::invalid_argument for inconsistent problem dimensions
   */
  [[nodiscard]] virtual KinematicsSolution solve(
    const TrajectoryProblem& problem) = 0;

protected:
  KinematicsSolver() = default;
  KinematicsSolver(const KinematicsSolver&) = default;
  KinematicsSolver& operator=(const KinematicsSolver&) = default;
  KinematicsSolver(KinematicsSolver&&) noexcept = default;
  KinematicsSolver& operator=(KinematicsSolver&&) noexcept = default;
};

}  // namespace cut_sim

#endif  // CUT_SIM_PLANNING_KINEMATICS_SOLVER_HPP
