// Ticket: 0008_task_state_machine

#ifndef CUT_SIM_TASK_PICK_AND_CUT_STATE_MACHINE_HPP
#define CUT_SIM_TASK_PICK_AND_CUT_STATE_MACHINE_HPP

#include <Eigen/Dense>
#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "cut-sim/src/DataTypes/EndEffectorPose.hpp"
#include "cut-sim/src/Kinematics/RobotLayout.hpp"
#include "cut-sim/src/Planning/TrajectoryPlanner.hpp"
#include "cut-sim/src/Task/TaskStateMachine.hpp"
#include "cut-sim/src/Trajectory/PchipTrajectory.hpp"

namespace cut_sim
{

/**
 * @brief Pick one object after another, cut it on the guillotine, drop it
 *
 * Phase graph:
 *   Approach -> Grasp -> Lift -> PositionOverBlade -> Cut -> Release ->
 *   Retreat -> (Approach on the next object | Done)
 *
 * Arm motions are re-planned on every phase entry from the observed posture.
 * A non-nominal plan is retried once (the multi-target approach falls back to
 * IK plus a posture move, a posture move doubles its knot count, an IK solve
 * restarts from the home posture); if the retry is not nominal either, the
 * best available plan is executed and a warning is logged.
 *
 * Created on a model where the active object no longer exists (it was just
 * cut), the machine starts at Release.
 *
 * @ticket 0008_task_state_machine
 */
class PickAndCutStateMachine : public TaskStateMachine
{
public:
  enum class Phase
  {
    Approach,
    Grasp,
    Lift,
    PositionOverBlade,
    Cut,
    Release,
    Retreat,
    Done
  };

  struct Config
  {
    RobotLayout layout;
    std::vector<double> homePosture{0.0, 0.6, 0.0, -1.75, 0.0, 1.0, 0.0};
    double gripperOpen{0.1};          // [m]
    double gripperClosed{0.04};       // [m]
    double knifeUp{0.0};              // [m]
    double knifeDown{-0.2};           // [m]
    double approachHeight{0.12};      // [m] above the object for the reach pose
    double reachTime{2.0};            // [s] after phase entry
    double graspTime{4.0};            // [s] after phase entry
    int approachKnots{8};
    double graspDuration{1.0};        // [s]
    double liftHeight{0.2};           // [m]
    double moveDuration{2.5};         // [s]
    int moveKnots{6};
    double bladeCutOffset{0.045};     // [m] blade plane ahead of the grasp point along x
    double bladeClearance{0.02};      // [m] gap under the raised blade edge
    double cutDuration{3.0};          // [s]
    double releaseDuration{1.0};      // [s]
  };

  PickAndCutStateMachine(std::shared_ptr<const KinematicModel> model,
                         std::shared_ptr<const TrajectoryPlanner> planner,
                         Config config,
                         std::shared_ptr<spdlog::logger> logger,
                         TaskProgress progress);

  ~PickAndCutStateMachine() override = default;

  void update(double t, const StateVector& x) override;

  [[nodiscard]] Setpoints setpoints(double t) const override;

  [[nodiscard]] std::string_view phase() const override
  {
    return phaseName(phase_);
  }

  [[nodiscard]] Phase currentPhase() const
  {
    return phase_;
  }

  [[nodiscard]] bool isComplete() const override
  {
    return phase_ == Phase::Done;
  }

  [[nodiscard]] const TaskProgress& progress() const override
  {
    return progress_;
  }

  [[nodiscard]] static std::string_view phaseName(Phase phase);

  PickAndCutStateMachine(const PickAndCutStateMachine&) = delete;
  PickAndCutStateMachine& operator=(const PickAndCutStateMachine&) = delete;
  PickAndCutStateMachine(PickAndCutStateMachine&&) noexcept = default;
  PickAndCutStateMachine& operator=(PickAndCutStateMachine&&) noexcept = default;

private:
  void selectNextObject();
  void enterPhase(double t, const StateVector& x);
  [[nodiscard]] Phase nextPhase() const;

  [[nodiscard]] Eigen::VectorXd armSubset(const Eigen::VectorXd& q) const;
  [[nodiscard]] Eigen::Isometry3d objectPose(const Eigen::VectorXd& q) const;
  [[nodiscard]] EndEffectorPose overBladePose(const Eigen::VectorXd& q) const;

  /// IK for the pose followed by a posture move, with one retry each
  [[nodiscard]] PchipTrajectory planArmTo(const EndEffectorPose& pose,
                                          const Eigen::VectorXd& q,
                                          double t) const;

  /// Posture move of the arm joints, retried once with twice the knots
  [[nodiscard]] PchipTrajectory planArmPosture(const Eigen::VectorXd& armTarget,
                                               const Eigen::VectorXd& q,
                                               double t) const;

  [[nodiscard]] double phaseFraction(double t, double duration) const;

  std::shared_ptr<const KinematicModel> model_;
  std::shared_ptr<const TrajectoryPlanner> planner_;
  Config config_;
  std::shared_ptr<spdlog::logger> logger_;
  TaskProgress progress_;

  std::vector<Eigen::Index> armIndices_;
  Phase phase_{Phase::Approach};
  bool entered_{false};
  double phaseStart_{0.0};
  double phaseEnd_{0.0};
  std::optional<PchipTrajectory> armPlan_;
  Eigen::VectorXd holdPosture_;
};

/**
 * @brief Creates PickAndCutStateMachine instances sharing one planner
 */
class PickAndCutTaskFactory : public TaskStateMachineFactory
{
public:
  PickAndCutTaskFactory(std::shared_ptr<const TrajectoryPlanner> planner,
                        PickAndCutStateMachine::Config config,
                        std::shared_ptr<spdlog::logger> logger);

  [[nodiscard]] std::unique_ptr<TaskStateMachine> create(
    std::shared_ptr<const KinematicModel> model,
    const TaskProgress& progress) override;

private:
  std::shared_ptr<const TrajectoryPlanner> planner_;
  PickAndCutStateMachine::Config config_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace cut_sim

#endif  // CUT_SIM_TASK_PICK_AND_CUT_STATE_MACHINE_HPP
