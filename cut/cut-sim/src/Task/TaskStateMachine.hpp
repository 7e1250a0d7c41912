// Ticket: 0008_task_state_machine

#ifndef CUT_SIM_TASK_TASK_STATE_MACHINE_HPP
#define CUT_SIM_TASK_TASK_STATE_MACHINE_HPP

#include <Eigen/Dense>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cut-sim/src/DataTypes/StateVector.hpp"
#include "cut-sim/src/Kinematics/KinematicModel.hpp"

namespace cut_sim
{

/**
 * @brief Targets streamed to the joint controllers
 *
 * An empty armPosition means "hold wherever the arm is".
 */
struct Setpoints
{
  std::optional<Eigen::VectorXd> armPosition;
  Eigen::VectorXd armVelocity;  ///< Same size as armPosition, or empty for zero
  double gripperOpening{0.1};   ///< Finger gap [m]
  double knifePosition{0.0};    ///< Knife joint position [m]
};

/**
 * @brief High-level task progress, the only task state kept across a cut
 *
 * activeObject is the body name of the object being worked on; if the live
 * model no longer has a body of that name, the object has been cut.
 * finishedObjects holds lineage roots: the name an object was spawned with,
 * shared by every piece cut from it.
 */
struct TaskProgress
{
  std::optional<std::string> activeObject;
  std::vector<std::string> finishedObjects;
  size_t objectsPicked{0};

  [[nodiscard]] bool isFinished(std::string_view lineageRoot) const
  {
    for (const auto& name : finishedObjects)
    {
      if (name == lineageRoot)
      {
        return true;
      }
    }
    return false;
  }
};

/// Name an object was spawned with: "obj_1.a.b" -> "obj_1"
[[nodiscard]] inline std::string lineageRoot(std::string_view bodyName)
{
  return std::string{bodyName.substr(0, bodyName.find('.'))};
}

/**
 * @brief Policy that decides what the manipulator, gripper and knife pursue
 *
 * One instance is bound to one segment's model. After a cut it is discarded
 * and a new instance is created on the new model from the carried
 * TaskProgress alone.
 *
 * @ticket 0008_task_state_machine
 */
class TaskStateMachine
{
public:
  virtual ~TaskStateMachine() = default;

  /**
   * @brief Observe the plant at a decision point and advance the phase
   * @param t Simulation time [s]
   * @param x Full state on the bound model
   */
  virtual void update(double t, const StateVector& x) = 0;

  /// Current setpoints; valid after the first update()
  [[nodiscard]] virtual Setpoints setpoints(double t) const = 0;

  [[nodiscard]] virtual std::string_view phase() const = 0;

  [[nodiscard]] virtual bool isComplete() const = 0;

  [[nodiscard]] virtual const TaskProgress& progress() const = 0;

protected:
  TaskStateMachine() = default;
  TaskStateMachine(const TaskStateMachine&) = default;
  TaskStateMachine& operator=(const TaskStateMachine&) = default;
  TaskStateMachine(TaskStateMachine&&) noexcept = default;
  TaskStateMachine& operator=(TaskStateMachine&&) noexcept = default;
};

/**
 * @brief Creates a task state machine bound to a model
 */
class TaskStateMachineFactory
{
public:
  virtual ~TaskStateMachineFactory() = default;

  [[nodiscard]] virtual std::unique_ptr<TaskStateMachine> create(
    std::shared_ptr<const KinematicModel> model,
    const TaskProgress& progress) = 0;

protected:
  TaskStateMachineFactory() = default;
  TaskStateMachineFactory(const TaskStateMachineFactory&) = default;
  TaskStateMachineFactory& operator=(const TaskStateMachineFactory&) = default;
  TaskStateMachineFactory(TaskStateMachineFactory&&) noexcept = default;
  TaskStateMachineFactory& operator=(TaskStateMachineFactory&&) noexcept = default;
};

}  // namespace cut_sim

#endif  // CUT_SIM_TASK_TASK_STATE_MACHINE_HPP
