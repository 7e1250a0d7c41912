// Ticket: 0006_rigid_body_plant

#ifndef CUT_SIM_PHYSICS_RIGID_BODY_SIMULATION_HPP
#define CUT_SIM_PHYSICS_RIGID_BODY_SIMULATION_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>

#include "cut-sim/src/Kinematics/RobotLayout.hpp"
#include "cut-sim/src/Physics/CuttingGuard.hpp"
#include "cut-sim/src/Physics/JointController.hpp"
#include "cut-sim/src/Physics/RigidBodyPlant.hpp"
#include "cut-sim/src/Physics/SampleLogger.hpp"
#include "cut-sim/src/Physics/Simulation.hpp"

namespace cut_sim
{

/**
 * @brief Simulation of a RigidBodyPlant driven by a task state machine
 *
 * Every fixed timestep: stream setpoints from the task, compute PD efforts
 * for the arm, gripper and knife, evaluate the plant, let the cutting guard
 * inspect the blade contacts, then integrate. The task is updated every
 * decisionPeriod. A guard hit stops the advance before integrating, so the
 * cut time and state are the ones the guard saw.
 *
 * Logged effort rows are the controlled joints in controller order: arm
 * joints, left finger, right finger, knife.
 *
 * @ticket 0006_rigid_body_plant
 */
class RigidBodySimulation : public Simulation
{
public:
  struct Config
  {
    RobotLayout layout;
    RigidBodyPlant::Config plant;
    CuttingGuard::Config guard;
    JointController::Gains armGains{200.0, 40.0, 300.0};
    JointController::Gains gripperGains{400.0, 40.0, 60.0};
    JointController::Gains knifeGains{800.0, 80.0, 150.0};
    double timestep{5e-4};        // [s]
    double decisionPeriod{0.01};  // [s]
    double logRate{60.0};         // [Hz]
  };

  /**
   * @param model Model the simulation is bound to
   * @param task Task policy, or nullptr to run without control effort
   * @param config Plant, controller and logging parameters; empty layout
   * names disable the matching controller
   * @param lastCutTime Previous cut in this run, for the guard
   * @param progress Progress reported when there is no task
   * @param logger Segment logger
   * @throws std::invalid_argument for a non-positive timestep or names that
   * do not resolve on the model
   */
  RigidBodySimulation(std::shared_ptr<const KinematicModel> model,
                      std::unique_ptr<TaskStateMachine> task,
                      Config config,
                      std::optional<double> lastCutTime,
                      TaskProgress progress,
                      std::shared_ptr<spdlog::logger> logger);

  ~RigidBodySimulation() override = default;

  void initialize(const StateVector& x, double t) override;

  [[nodiscard]] AdvanceResult advanceTo(double tEnd) override;

  [[nodiscard]] const StateVector& state() const override
  {
    return state_;
  }

  [[nodiscard]] double time() const override
  {
    return time_;
  }

  [[nodiscard]] SampledTrajectory stateLog() const override
  {
    return stateLogger_.trajectory();
  }

  [[nodiscard]] SampledTrajectory effortLog() const override
  {
    return effortLogger_.trajectory();
  }

  [[nodiscard]] TaskProgress taskProgress() const override;

  RigidBodySimulation(const RigidBodySimulation&) = delete;
  RigidBodySimulation& operator=(const RigidBodySimulation&) = delete;
  RigidBodySimulation(RigidBodySimulation&&) = delete;
  RigidBodySimulation& operator=(RigidBodySimulation&&) = delete;

private:
  /// Generalized efforts from the current setpoints; fills lastEffort_
  [[nodiscard]] Eigen::VectorXd controlEffort(double t);

  void logSample(bool force);

  std::shared_ptr<const KinematicModel> model_;
  std::unique_ptr<TaskStateMachine> task_;
  Config config_;
  TaskProgress initialProgress_;
  std::shared_ptr<spdlog::logger> logger_;

  RigidBodyPlant plant_;
  CuttingGuard guard_;
  std::optional<JointController> armController_;
  std::optional<JointController> gripperController_;
  std::optional<JointController> knifeController_;

  SampleLogger stateLogger_;
  SampleLogger effortLogger_;

  StateVector state_;
  double time_{0.0};
  double nextDecision_{0.0};
  bool initialized_{false};
  Eigen::VectorXd lastEffort_;
};

/**
 * @brief Builds a RigidBodySimulation plus a fresh task state machine per
 * segment
 */
class RigidBodySimulationFactory : public SimulationFactory
{
public:
  RigidBodySimulationFactory(std::shared_ptr<TaskStateMachineFactory> taskFactory,
                             RigidBodySimulation::Config config,
                             std::shared_ptr<spdlog::logger> logger);

  [[nodiscard]] std::unique_ptr<Simulation> build(
    std::shared_ptr<const KinematicModel> model,
    const SegmentContext& context) override;

private:
  std::shared_ptr<TaskStateMachineFactory> taskFactory_;
  RigidBodySimulation::Config config_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace cut_sim

#endif  // CUT_SIM_PHYSICS_RIGID_BODY_SIMULATION_HPP
