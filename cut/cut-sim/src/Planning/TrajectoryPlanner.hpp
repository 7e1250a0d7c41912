// Ticket: 0003_trajectory_planner

#ifndef CUT_SIM_PLANNING_TRAJECTORY_PLANNER_HPP
#define CUT_SIM_PLANNING_TRAJECTORY_PLANNER_HPP

#include <Eigen/Dense>
#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cut-sim/src/DataTypes/EndEffectorPose.hpp"
#include "cut-sim/src/Kinematics/KinematicModel.hpp"
#include "cut-sim/src/Planning/KinematicsSolver.hpp"
#include "cut-sim/src/Trajectory/PchipTrajectory.hpp"

namespace cut_sim
{

/**
 * @brief Planner output together with the solver's status code
 *
 * The value is always the solver's best answer. Only status ==
 * TrajectoryPlanner::kNominalSuccess marks it as trustworthy; the caller
 * decides what to do with anything else.
 */
template <typename T>
struct PlanResult
{
  T value;
  int status{solver_status::kSolverError};

  [[nodiscard]] bool nominal() const
  {
    return status == solver_status::kSuccess;
  }
};

/**
 * @brief Joint-space trajectory planning with held/controlled joint subsets
 *
 * Every operation splits the model's positions into a controlled subset
 * (the joints being driven) and a held subset (everything else, boxed to its
 * starting value within Config::postureTolerance). Targets are tolerance
 * boxes, never equalities. Constraints are imposed at knot instants only.
 *
 * Non-nominal solves are logged at warn level and returned unchanged.
 *
 * @ticket 0003_trajectory_planner
 */
class TrajectoryPlanner
{
public:
  static constexpr int kNominalSuccess = solver_status::kSuccess;

  struct Config
  {
    double postureTolerance{0.01};         ///< Held and pinned joints [rad] or [m]
    double positionTolerance{0.01};        ///< End-effector position box [m]
    double orientationTolerance{0.01};     ///< Single-pose Euler box [rad]
    double rampOrientationTolerance{0.05}; ///< Multi-target Euler box [rad]
    double minDistance{0.01};              ///< Single-pose separation [m]
    std::string endEffectorFrame{"iiwa_frame_ee"};
    std::vector<std::string> armJoints{"iiwa_joint_1",
                                       "iiwa_joint_2",
                                       "iiwa_joint_3",
                                       "iiwa_joint_4",
                                       "iiwa_joint_5",
                                       "iiwa_joint_6",
                                       "iiwa_joint_7"};
  };

  TrajectoryPlanner(std::shared_ptr<KinematicsSolver> solver,
                    std::shared_ptr<spdlog::logger> logger);

  TrajectoryPlanner(std::shared_ptr<KinematicsSolver> solver,
                    std::shared_ptr<spdlog::logger> logger,
                    Config config);

  /**
   * @brief Plan a rest-to-rest move of selected joints to a target posture
   *
   * Knots are evenly spaced over [0, duration]. Held joints are boxed to q0
   * for the whole span; controlled joints are boxed to q0 at the first knot
   * and to the target at the last. q0 and the target are clipped to the joint
   * limits first. The seed is the knot-wise linear interpolation from q0 to
   * the full target posture, the nominal is the full target at every knot.
   * The knots are interpolated with a shape-preserving cubic with zero end
   * velocity and the result is shifted to start at @p startTime.
   *
   * @param model Live kinematic model
   * @param q0 Full starting posture (positionCount())
   * @param qfTargetSubset Target values, one per entry of @p controlledJoints
   * @param controlledJoints Names of one-dof joints to drive
   * @param knotCount Number of knots, at least 2
   * @param duration Move duration [s], positive
   * @param startTime Absolute start of the returned trajectory [s]
   * @throws std::invalid_argument for malformed arguments
   */
  [[nodiscard]] PlanResult<PchipTrajectory> planToPosture(
    const std::shared_ptr<const KinematicModel>& model,
    const Eigen::VectorXd& q0,
    const Eigen::VectorXd& qfTargetSubset,
    const std::vector<std::string>& controlledJoints,
    int knotCount,
    double duration,
    double startTime = 0.0) const;

  /**
   * @brief Single-instant inverse kinematics for the end-effector frame
   *
   * Arm joints are controlled, everything else is held. The frame position
   * and roll/pitch/yaw must fall within their tolerance boxes around
   * @p target and non-adjacent bodies must stay Config::minDistance apart.
   * Seed and nominal are q0 unless @p seed is given.
   *
   * @throws std::invalid_argument for malformed arguments or an unknown
   * end-effector frame
   */
  [[nodiscard]] PlanResult<Eigen::VectorXd> planToEndEffectorPose(
    const std::shared_ptr<const KinematicModel>& model,
    const Eigen::VectorXd& q0,
    const EndEffectorPose& target,
    const std::optional<Eigen::VectorXd>& seed = std::nullopt) const;

  /**
   * @brief Plan a reach-then-grasp arm motion through a ramp of pose targets
   *
   * Knots are evenly spaced over [0, graspTime]. From the knot nearest
   * @p reachTime through the last knot the end-effector target is
   * lerp(reachPose, graspPose, s) with s advancing by knot index and
   * saturating at 1. Seed and nominal are q0 at every knot.
   *
   * @throws std::invalid_argument for malformed arguments, including
   * reachTime outside [0, graspTime]
   */
  [[nodiscard]] PlanResult<PchipTrajectory> planMultiTargetTrajectory(
    const std::shared_ptr<const KinematicModel>& model,
    const Eigen::VectorXd& q0,
    const EndEffectorPose& reachPose,
    const EndEffectorPose& graspPose,
    int knotCount,
    double reachTime,
    double graspTime,
    double startTime = 0.0) const;

  /// Evenly spaced knot times over [0, duration]
  [[nodiscard]] static std::vector<double> knotTimes(int knotCount,
                                                     double duration);

  /// Index of the knot nearest @p time (earliest on ties)
  [[nodiscard]] static size_t nearestKnot(const std::vector<double>& knots,
                                          double time);

  /// Ramp parameter of @p knot, 0 at @p reachKnot and 1 at @p lastKnot
  [[nodiscard]] static double rampFactor(size_t knot,
                                         size_t reachKnot,
                                         size_t lastKnot);

  [[nodiscard]] const Config& config() const
  {
    return config_;
  }

private:
  void checkPosture(const KinematicModel& model, const Eigen::VectorXd& q) const;

  void report(const char* operation, int status) const;

  std::shared_ptr<KinematicsSolver> solver_;
  std::shared_ptr<spdlog::logger> logger_;
  Config config_;
};

}  // namespace cut_sim

#endif  // CUT_SIM_PLANNING_TRAJECTORY_PLANNER_HPP
