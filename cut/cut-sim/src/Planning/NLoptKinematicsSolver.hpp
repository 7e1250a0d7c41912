// Ticket: 0003_trajectory_planner

#ifndef CUT_SIM_PLANNING_NLOPT_KINEMATICS_SOLVER_HPP
#define CUT_SIM_PLANNING_NLOPT_KINEMATICS_SOLVER_HPP

#include <Eigen/Dense>

#include <utility>
#include <vector>

#include "cut-sim/src/Planning/KinematicsSolver.hpp"

namespace cut_sim
{

/**
 * @brief SLSQP inverse kinematics over stacked knot postures
 *
 * Solves:
 *   minimize  (wN/2) sum_k |q_k - nominal_k|^2
 *           + (wS/2) sum_k |q_{k-1} - 2 q_k + q_{k+1}|^2
 *   subject to joint limits and posture constraints (variable bounds),
 *              world position / Euler boxes on frames (inequalities),
 *              minimum separation between bodies (inequalities)
 *
 * Posture constraints and joint limits are intersected into per-knot variable
 * bounds; an empty intersection is reported as infeasible without calling the
 * optimizer. Pose and separation constraints are evaluated per knot with a
 * forward-difference Jacobian over that knot's variables.
 *
 * Separation uses the inscribed sphere of each box (radius = smallest half
 * extent) and covers every non-adjacent pair with geometry in which neither
 * body is floating and at least one body is moved by a revolute or prismatic
 * joint. Free objects are left to the contact model.
 *
 * Status mapping:
 * - 1: optimizer converged and every constraint holds within tolerance
 * - 3: optimizer stopped on round-off with constraints satisfied
 * - 13: constraints violated at the returned point, or inconsistent bounds
 * - 31: evaluation limit reached
 * - 100: any other optimizer failure; knots are the clamped seed
 *
 * @ticket 0003_trajectory_planner
 */
class NLoptKinematicsSolver : public KinematicsSolver
{
public:
  struct Config
  {
    double nominalWeight{1e-2};
    double smoothnessWeight{1.0};
    int maxEvaluations{500};
    double relativeTolerance{1e-8};
    double constraintTolerance{1e-8};
    double feasibilityTolerance{1e-5};  ///< Accepted violation when classifying
    double finiteDifferenceStep{1e-7};  ///< [rad] or [m]
  };

  NLoptKinematicsSolver();
  explicit NLoptKinematicsSolver(Config config);

  ~NLoptKinematicsSolver() override = default;

  /**
   * @throws std::invalid_argument for a null model, mismatched seed/nominal
   * dimensions, malformed constraints or unknown frame names
   * @throws std::runtime_error if NLopt rejects the problem setup
   */
  [[nodiscard]] KinematicsSolution solve(const TrajectoryProblem& problem) override;

  [[nodiscard]] const Config& config() const
  {
    return config_;
  }

  // Rule of Zero
  NLoptKinematicsSolver(const NLoptKinematicsSolver&) = default;
  NLoptKinematicsSolver& operator=(const NLoptKinematicsSolver&) = default;
  NLoptKinematicsSolver(NLoptKinematicsSolver&&) noexcept = default;
  NLoptKinematicsSolver& operator=(NLoptKinematicsSolver&&) noexcept = default;

  /**
   * @brief Body pairs subject to a minimum separation constraint
   */
  [[nodiscard]] static std::vector<std::pair<size_t, size_t>> separationPairs(
    const KinematicModel& model);

private:
  struct SolveContext;
  struct PoseData;
  struct DistanceData;

  static double objective(const std::vector<double>& x,
                          std::vector<double>& grad,
                          void* data);

  static void poseConstraint(unsigned m,
                             double* result,
                             unsigned n,
                             const double* x,
                             double* grad,
                             void* data);

  static void distanceConstraint(unsigned m,
                                 double* result,
                                 unsigned n,
                                 const double* x,
                                 double* grad,
                                 void* data);

  Config config_;
};

}  // namespace cut_sim

#endif  // CUT_SIM_PLANNING_NLOPT_KINEMATICS_SOLVER_HPP
